// modules/compiler/graph_compiler.cpp
#include "modules/compiler/graph_compiler.h"
#include "core/types/errors.h"
#include "common/utils/string_utils.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <deque>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace agentgraph {

namespace {

std::string did_you_mean(const std::string& name, const std::vector<std::string>& candidates) {
    if (auto hint = closest_match(name, candidates)) {
        return " (did you mean '" + *hint + "'?)";
    }
    return "";
}

} // namespace

const CompiledNode& CompiledGraph::node(const NodeId& id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        throw std::out_of_range("No compiled node '" + id + "'");
    }
    return it->second;
}

std::shared_ptr<const CompiledGraph> GraphCompiler::compile(const WorkflowSpec& spec) {
    GraphCompiler compiler(std::make_shared<const WorkflowSpec>(spec));
    return compiler.run();
}

GraphCompiler::GraphCompiler(std::shared_ptr<const WorkflowSpec> spec)
    : spec_(std::move(spec)), graph_(new CompiledGraph()) {}

std::shared_ptr<const CompiledGraph> GraphCompiler::run() {
    graph_->spec_ = spec_;
    graph_->schema_ = StateSchema::build(spec_->state);

    check_nodes();
    check_edges();
    build_adjacency();
    check_acyclic();
    check_reachability();
    compile_nodes();
    compile_loops();
    compile_fan_outs();

    spdlog::info("Compiled workflow '{}': {} nodes, {} edges",
                 spec_->flow.name, node_ids_.size(), spec_->edges.size());
    return graph_;
}

// --- 节点 ---

void GraphCompiler::check_nodes() {
    if (spec_->nodes.empty()) {
        throw GraphStructureError("workflow declares no nodes");
    }
    const StateSchema& schema = *graph_->schema_;
    std::vector<std::string> state_fields;
    for (const auto& f : schema.fields()) state_fields.push_back(f.name);

    for (const auto& decl : spec_->nodes) {
        const NodeId& id = decl.id;
        if (!is_identifier(id)) {
            throw GraphStructureError("node id must be a valid identifier", id);
        }
        if (id == START || id == END) {
            throw GraphStructureError("'" + id + "' is a reserved node id", id);
        }
        if (!decls_.emplace(id, &decl).second) {
            throw GraphStructureError("duplicate node id", id);
        }
        node_ids_.push_back(id);

        if (decl.prompt.empty() && !decl.code) {
            throw GraphStructureError("node needs a prompt or a code block", id);
        }
        if (decl.outputs.empty()) {
            throw GraphStructureError("node declares no outputs", id);
        }

        CompiledNode compiled;
        compiled.decl = &decl;
        compiled.validator = OutputValidator::build(decl.output_schema, id);

        for (const auto& out : decl.outputs) {
            if (!schema.field(out)) {
                throw GraphStructureError("output '" + out + "' is not a declared state field" +
                                          did_you_mean(out, state_fields), id);
            }
        }

        const auto& fields = compiled.validator.fields();
        if (compiled.validator.is_wrapped()) {
            if (decl.outputs.size() != 1) {
                throw SchemaBuildError(id + ".outputs",
                                       "a '" + decl.output_schema.type + "' output schema maps to exactly one state field, got " +
                                       std::to_string(decl.outputs.size()));
            }
            const StateField* target = schema.field(decl.outputs.front());
            if (!fields.front().type.same_shape(target->type)) {
                throw SchemaBuildError(id + ".outputs." + target->name,
                                       "output type " + fields.front().type.to_string() +
                                       " does not match state type " + target->type.to_string());
            }
        } else {
            std::set<std::string> declared;
            for (const auto& f : fields) declared.insert(f.name);
            std::set<std::string> outputs(decl.outputs.begin(), decl.outputs.end());
            if (declared != outputs) {
                throw SchemaBuildError(id + ".outputs", "output schema fields must match the node's outputs exactly");
            }
            for (const auto& f : fields) {
                const StateField* target = schema.field(f.name);
                if (!f.type.same_shape(target->type)) {
                    throw SchemaBuildError(id + ".outputs." + f.name,
                                           "output type " + f.type.to_string() +
                                           " does not match state type " + target->type.to_string());
                }
            }
        }

        graph_->nodes_.emplace(id, std::move(compiled));
        graph_->order_.push_back(id);
    }
}

// --- 边 ---

void GraphCompiler::check_target(const NodeId& target, const NodeId& owner, bool allow_end) const {
    if (target == START) {
        throw GraphStructureError("START cannot be an edge target", owner);
    }
    if (target == END) {
        if (!allow_end) {
            throw GraphStructureError("END is not a valid target here", owner);
        }
        return;
    }
    if (!decls_.count(target)) {
        throw GraphStructureError("edge references unknown node '" + target + "'" +
                                  did_you_mean(target, node_ids_), owner);
    }
}

void GraphCompiler::check_edges() {
    int start_edges = 0;
    for (const auto& edge : spec_->edges) {
        const NodeId& source = edge_source(edge);
        if (source == END) {
            throw GraphStructureError("END cannot have outgoing edges");
        }
        if (source == START) {
            if (std::holds_alternative<LoopEdge>(edge)) {
                throw GraphStructureError("a loop cannot start at START");
            }
            ++start_edges;
        } else if (!decls_.count(source)) {
            throw GraphStructureError("edge source '" + source + "' is not a declared node" +
                                      did_you_mean(source, node_ids_));
        }
        if (!outgoing_.emplace(source, &edge).second) {
            throw GraphStructureError("multiple outgoing edges; use conditional routes or a parallel edge", source);
        }

        std::visit([&](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, LinearEdge>) {
                check_target(e.to, source, true);
            } else if constexpr (std::is_same_v<T, ConditionalEdge>) {
                if (e.routes.empty()) {
                    throw GraphStructureError("conditional edge declares no routes", source);
                }
                for (const auto& route : e.routes) {
                    check_target(route.target, source, true);
                }
                if (!e.default_target) {
                    throw GraphStructureError("conditional routes require a default route", source);
                }
                check_target(*e.default_target, source, true);
            } else if constexpr (std::is_same_v<T, LoopEdge>) {
                if (e.max_iterations <= 0 || e.max_iterations > kMaxLoopIterations) {
                    throw GraphStructureError("max_iterations must be between 1 and " +
                                              std::to_string(kMaxLoopIterations), source);
                }
                if (trim(e.until).empty()) {
                    throw GraphStructureError("loop requires an until predicate", source);
                }
                check_target(e.reenter.value_or(e.node), source, false);
                check_target(e.exit_to, source, true);
            } else if constexpr (std::is_same_v<T, ParallelEdge>) {
                if (e.targets.size() < 2) {
                    throw GraphStructureError("parallel edge needs at least two targets", source);
                }
                std::set<NodeId> seen;
                for (const auto& target : e.targets) {
                    check_target(target, source, false);
                    if (!seen.insert(target).second) {
                        throw GraphStructureError("parallel target '" + target + "' listed twice", source);
                    }
                }
                check_target(e.join, source, false);
                if (seen.count(e.join) || e.join == source) {
                    throw GraphStructureError("join node '" + e.join + "' cannot also be a branch target", source);
                }
            }
        }, edge);
    }
    if (start_edges != 1) {
        throw GraphStructureError("exactly one edge from START is required, found " + std::to_string(start_edges));
    }
}

void GraphCompiler::build_adjacency() {
    forward_[START];
    for (const auto& id : node_ids_) forward_[id];

    for (const auto& [source, edge] : outgoing_) {
        std::visit([&, src = source](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, LinearEdge>) {
                forward_[src].push_back(e.to);
            } else if constexpr (std::is_same_v<T, ConditionalEdge>) {
                for (const auto& route : e.routes) forward_[src].push_back(route.target);
                forward_[src].push_back(*e.default_target);
            } else if constexpr (std::is_same_v<T, LoopEdge>) {
                forward_[src].push_back(e.exit_to);
                back_edges_[src].push_back(e.reenter.value_or(e.node));
            } else if constexpr (std::is_same_v<T, ParallelEdge>) {
                for (const auto& target : e.targets) {
                    forward_[src].push_back(target);
                    if (!outgoing_.count(target)) {
                        implicit_join_[target] = e.join;
                        forward_[target].push_back(e.join);
                    }
                }
            }
        }, *edge);
    }

    for (const auto& id : node_ids_) {
        if (!outgoing_.count(id) && !implicit_join_.count(id)) {
            throw GraphStructureError("node has no outgoing edge; add an edge to END or another node", id);
        }
    }
}

void GraphCompiler::check_acyclic() const {
    enum class Mark { White, Gray, Black };
    std::map<NodeId, Mark> marks;
    std::vector<NodeId> stack;

    std::function<void(const NodeId&)> visit = [&](const NodeId& id) {
        marks[id] = Mark::Gray;
        stack.push_back(id);
        auto it = forward_.find(id);
        if (it != forward_.end()) {
            for (const auto& next : it->second) {
                if (next == END) continue;
                Mark m = marks.count(next) ? marks[next] : Mark::White;
                if (m == Mark::Gray) {
                    auto begin = std::find(stack.begin(), stack.end(), next);
                    std::string path;
                    for (auto s = begin; s != stack.end(); ++s) path += *s + " -> ";
                    path += next;
                    throw GraphStructureError("cycle outside a declared loop: " + path, next);
                }
                if (m == Mark::White) visit(next);
            }
        }
        stack.pop_back();
        marks[id] = Mark::Black;
    };

    visit(START);
    for (const auto& id : node_ids_) {
        if (!marks.count(id)) visit(id);
    }
}

void GraphCompiler::check_reachability() const {
    // 正向：START 可达
    std::set<NodeId> reached{START};
    std::deque<NodeId> queue{START};
    while (!queue.empty()) {
        NodeId id = queue.front();
        queue.pop_front();
        std::vector<NodeId> next;
        if (auto it = forward_.find(id); it != forward_.end()) next = it->second;
        if (auto it = back_edges_.find(id); it != back_edges_.end()) {
            next.insert(next.end(), it->second.begin(), it->second.end());
        }
        for (const auto& n : next) {
            if (reached.insert(n).second) queue.push_back(n);
        }
    }
    for (const auto& id : node_ids_) {
        if (!reached.count(id)) {
            throw GraphStructureError("node is not reachable from START", id);
        }
    }

    // 反向：能到达 END
    std::map<NodeId, std::vector<NodeId>> reverse;
    for (const auto& [src, targets] : forward_) {
        for (const auto& t : targets) reverse[t].push_back(src);
    }
    for (const auto& [src, targets] : back_edges_) {
        for (const auto& t : targets) reverse[t].push_back(src);
    }
    std::set<NodeId> terminates{END};
    queue.assign({END});
    while (!queue.empty()) {
        NodeId id = queue.front();
        queue.pop_front();
        for (const auto& prev : reverse[id]) {
            if (terminates.insert(prev).second) queue.push_back(prev);
        }
    }
    for (const auto& id : node_ids_) {
        if (!terminates.count(id)) {
            throw GraphStructureError("node has no path to END", id);
        }
    }
}

// --- 转移 ---

Predicate GraphCompiler::compile_predicate(const std::string& source, const NodeId& owner) const {
    try {
        Predicate predicate = Predicate::parse(source);
        const StateSchema& schema = *graph_->schema_;
        for (const auto& path : predicate.referenced_paths()) {
            if (!schema.has_path(path)) {
                throw GraphStructureError("predicate '" + source + "' references unknown state path '" + path + "'" +
                                          did_you_mean(path, schema.field_paths()), owner);
            }
        }
        return predicate;
    } catch (const PredicateError& e) {
        throw GraphStructureError(e.what(), owner);
    }
}

Transition GraphCompiler::compile_transition(const EdgeDeclaration& edge) {
    const NodeId& source = edge_source(edge);
    return std::visit([&](const auto& e) -> Transition {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, LinearEdge>) {
            return NextTransition{e.to};
        } else if constexpr (std::is_same_v<T, ConditionalEdge>) {
            BranchTransition branch;
            for (const auto& route : e.routes) {
                branch.routes.emplace_back(compile_predicate(route.predicate, source), route.target);
            }
            branch.default_target = *e.default_target;
            return branch;
        } else if constexpr (std::is_same_v<T, LoopEdge>) {
            return LoopTransition{e.reenter.value_or(e.node), e.max_iterations,
                                  compile_predicate(e.until, source), e.exit_to};
        } else {
            return FanOutTransition{e.targets, e.join, {}};
        }
    }, edge);
}

Transition& GraphCompiler::transition_of(const NodeId& source) {
    if (source == START) return graph_->entry_;
    return graph_->nodes_.at(source).transition;
}

void GraphCompiler::compile_nodes() {
    graph_->entry_ = compile_transition(*outgoing_.at(START));
    for (const auto& id : node_ids_) {
        if (auto it = implicit_join_.find(id); it != implicit_join_.end()) {
            transition_of(id) = NextTransition{it->second};
        } else {
            transition_of(id) = compile_transition(*outgoing_.at(id));
        }
    }
}

std::set<NodeId> GraphCompiler::collect_until(const NodeId& start, const NodeId& stop,
                                              bool& reaches_stop, bool& reaches_end) const {
    std::set<NodeId> visited{start};
    std::deque<NodeId> queue{start};
    reaches_stop = false;
    reaches_end = false;
    while (!queue.empty()) {
        NodeId id = queue.front();
        queue.pop_front();
        std::vector<NodeId> next;
        if (auto it = forward_.find(id); it != forward_.end()) next = it->second;
        if (auto it = back_edges_.find(id); it != back_edges_.end()) {
            next.insert(next.end(), it->second.begin(), it->second.end());
        }
        for (const auto& n : next) {
            if (n == stop) { reaches_stop = true; continue; }
            if (n == END) { reaches_end = true; continue; }
            if (visited.insert(n).second) queue.push_back(n);
        }
    }
    return visited;
}

void GraphCompiler::compile_loops() {
    std::map<NodeId, size_t> body_size;
    for (const auto& [source, edge] : outgoing_) {
        const auto* loop = std::get_if<LoopEdge>(edge);
        if (!loop) continue;
        const NodeId& tail = loop->node;
        const NodeId head = loop->reenter.value_or(tail);

        // 循环体：从 head 出发、能回到 tail 的节点
        std::set<NodeId> body{tail};
        if (head != tail) {
            bool reaches_tail = false;
            bool reaches_end = false;
            std::set<NodeId> from_head = collect_until(head, tail, reaches_tail, reaches_end);
            if (!reaches_tail) {
                throw GraphStructureError("loop re-entry node '" + head + "' does not lead back to '" + tail + "'", tail);
            }
            for (const auto& n : from_head) {
                bool back_to_tail = false;
                bool unused = false;
                collect_until(n, tail, back_to_tail, unused);
                if (back_to_tail) body.insert(n);
            }
        }

        for (const auto& n : body) {
            auto& compiled = graph_->nodes_.at(n);
            if (!compiled.loop || body.size() < body_size[*compiled.loop]) {
                compiled.loop = tail;
            }
        }
        body_size[tail] = body.size();
    }
}

void GraphCompiler::compile_fan_outs() {
    for (const auto& [source, edge] : outgoing_) {
        const auto* parallel = std::get_if<ParallelEdge>(edge);
        if (!parallel) continue;

        auto& fan = std::get<FanOutTransition>(transition_of(source));
        fan.branch_outputs.clear();
        std::map<std::string, NodeId> writer;

        for (const auto& target : parallel->targets) {
            bool reaches_join = false;
            bool reaches_end = false;
            std::set<NodeId> branch = collect_until(target, parallel->join, reaches_join, reaches_end);
            if (reaches_end || !reaches_join) {
                throw GraphStructureError("parallel branch '" + target + "' must reach join '" +
                                          parallel->join + "' before END", source);
            }

            std::set<std::string> outputs;
            for (const auto& n : branch) {
                for (const auto& out : decls_.at(n)->outputs) outputs.insert(out);
            }
            for (const auto& out : outputs) {
                auto [it, inserted] = writer.emplace(out, target);
                if (!inserted) {
                    throw GraphStructureError("parallel branches '" + it->second + "' and '" + target +
                                              "' both write state field '" + out + "'", source);
                }
            }
            fan.branch_outputs.emplace_back(outputs.begin(), outputs.end());
        }
    }
}

} // namespace agentgraph
