// modules/scheduler/graph_scheduler.cpp
#include "modules/scheduler/graph_scheduler.h"
#include "core/types/errors.h"
#include <spdlog/spdlog.h>
#include <exception>
#include <future>
#include <optional>
#include <type_traits>
#include <vector>

namespace agentgraph {

GraphScheduler::GraphScheduler(const CompiledGraph& graph, NodeExecutor& executor, ExecutionSession& session)
    : graph_(graph), executor_(executor), session_(session) {}

TypedState GraphScheduler::run(const TypedState& initial) {
    TypedState state = initial;
    WalkState walk_state;
    NodeId first = advance(START, graph_.entry(), state, walk_state);
    return walk(first, END, std::move(state), walk_state);
}

TypedState GraphScheduler::walk(NodeId current, const NodeId& stop, TypedState state, WalkState& walk_state) {
    while (current != stop && current != END) {
        session_.throw_if_cancelled();

        const CompiledNode& node = graph_.node(current);
        std::optional<int> iteration;
        if (node.loop) {
            iteration = walk_state.loop_iterations[*node.loop];
        }

        state = executor_.execute(graph_, node, state, session_, iteration);
        current = advance(current, node.transition, state, walk_state);
    }
    return state;
}

NodeId GraphScheduler::advance(const NodeId& source, const Transition& transition, TypedState& state, WalkState& walk_state) {
    return std::visit([&](const auto& t) -> NodeId {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, NextTransition>) {
            return t.target;
        } else if constexpr (std::is_same_v<T, BranchTransition>) {
            return route(source, t, state);
        } else if constexpr (std::is_same_v<T, LoopTransition>) {
            return loop_back(source, t, state, walk_state);
        } else {
            state = fan_out(source, t, state, walk_state);
            return t.join;
        }
    }, transition);
}

bool GraphScheduler::check(const NodeId& source, const Predicate& predicate, const TypedState& state) const {
    try {
        return predicate.evaluate(state);
    } catch (const PredicateError& e) {
        std::throw_with_nested(NodeExecutionError(source, Phase::Resolve, e.what()));
    } catch (const TemplateResolutionError& e) {
        std::throw_with_nested(NodeExecutionError(source, Phase::Resolve, e.what()));
    }
}

NodeId GraphScheduler::route(const NodeId& source, const BranchTransition& branch, const TypedState& state) {
    for (const auto& [predicate, target] : branch.routes) {
        if (check(source, predicate, state)) {
            spdlog::info("[{}] route {} -> {} ({})", session_.run_id(), source, target, predicate.source());
            return target;
        }
    }
    spdlog::info("[{}] route {} -> {} (default)", session_.run_id(), source, branch.default_target);
    return branch.default_target;
}

NodeId GraphScheduler::loop_back(const NodeId& source, const LoopTransition& loop, const TypedState& state, WalkState& walk_state) {
    int count = ++walk_state.loop_iterations[source];
    bool done = check(source, loop.until, state);
    if (done || count >= loop.max_iterations) {
        walk_state.loop_iterations.erase(source);
        if (done) {
            spdlog::info("[{}] loop at '{}' finished after {} iteration(s)", session_.run_id(), source, count);
        } else {
            spdlog::warn("[{}] loop at '{}' hit max_iterations={}, exiting to {}",
                         session_.run_id(), source, loop.max_iterations, loop.exit_to);
        }
        return loop.exit_to;
    }
    SPDLOG_DEBUG("[{}] loop at '{}' re-entering '{}' (iteration {})", session_.run_id(), source, loop.reenter, count);
    return loop.reenter;
}

TypedState GraphScheduler::fan_out(const NodeId& source, const FanOutTransition& fan, const TypedState& state, const WalkState& walk_state) {
    spdlog::info("[{}] fan-out from '{}' to {} branches, join '{}'", session_.run_id(), source, fan.targets.size(), fan.join);

    std::vector<std::future<TypedState>> branches;
    branches.reserve(fan.targets.size());
    for (const auto& target : fan.targets) {
        // 每个分支使用独立的深拷贝快照
        branches.push_back(std::async(std::launch::async,
            [this, target, join = fan.join, snapshot = state.clone(), branch_walk = walk_state]() mutable {
                return walk(target, join, std::move(snapshot), branch_walk);
            }));
    }

    // 汇合屏障：等待全部分支，不取消兄弟分支
    std::vector<std::optional<TypedState>> results(branches.size());
    std::exception_ptr first_error;
    bool cancelled = false;
    for (size_t i = 0; i < branches.size(); ++i) {
        try {
            results[i] = branches[i].get();
        } catch (const RunCancelledError&) {
            cancelled = true;
        } catch (const std::exception&) {
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (cancelled || session_.is_cancelled()) {
        throw RunCancelledError(session_.run_id());
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }

    // 各分支写入的字段互不相交，逐个合并到派发时的状态
    Value updates = Value::object();
    for (size_t i = 0; i < results.size(); ++i) {
        for (const auto& field : fan.branch_outputs[i]) {
            const Value* branch_value = results[i]->find(field);
            const Value* base_value = state.find(field);
            if (branch_value && (!base_value || *branch_value != *base_value)) {
                updates[field] = *branch_value;
            }
        }
    }
    SPDLOG_DEBUG("[{}] join '{}' merged {} field(s)", session_.run_id(), fan.join, updates.size());
    return state.with_updates(updates);
}

} // namespace agentgraph
