// modules/compiler/compiled_graph.h
#ifndef AGENTGRAPH_MODULES_COMPILER_COMPILED_GRAPH_H
#define AGENTGRAPH_MODULES_COMPILER_COMPILED_GRAPH_H

#include "core/types/value.h"
#include "core/types/workflow.h"
#include "modules/schema/state_schema.h"
#include "modules/schema/output_schema.h"
#include "modules/resolver/predicate.h"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace agentgraph {

// --- 编译后的转移 ---

struct NextTransition {
    NodeId target;
};

struct BranchTransition {
    std::vector<std::pair<Predicate, NodeId>> routes; // 按声明顺序，第一个为真者胜出
    NodeId default_target;
};

struct LoopTransition {
    NodeId reenter;
    int max_iterations = 10;
    Predicate until;
    NodeId exit_to;
};

struct FanOutTransition {
    std::vector<NodeId> targets;
    NodeId join;
    std::vector<std::vector<std::string>> branch_outputs; // 每个分支写入的状态字段，互不相交
};

using Transition = std::variant<NextTransition, BranchTransition, LoopTransition, FanOutTransition>;

struct CompiledNode {
    const NodeDeclaration* decl = nullptr;
    OutputValidator validator;
    Transition transition;
    std::optional<NodeId> loop; // 所在最内层循环（以循环尾节点标识）
};

// 不可变的可执行图；多个运行可并发共享
class CompiledGraph {
public:
    const WorkflowSpec& spec() const { return *spec_; }
    const std::shared_ptr<const StateSchema>& state_schema() const { return schema_; }

    const Transition& entry() const { return entry_; }
    const CompiledNode& node(const NodeId& id) const;
    bool has_node(const NodeId& id) const { return nodes_.count(id) > 0; }
    const std::vector<NodeId>& node_order() const { return order_; }

    const Value& workflow_llm() const { return spec_->llm; }
    const ExecutionDefaults& execution() const { return spec_->execution; }
    const std::string& name() const { return spec_->flow.name; }

    // 由调用方输入构造初始状态，失败抛出 SchemaBuildError
    TypedState initial_state(const Value& inputs) const { return schema_->instantiate(inputs); }

private:
    friend class GraphCompiler;
    CompiledGraph() = default;

    std::shared_ptr<const WorkflowSpec> spec_;
    std::shared_ptr<const StateSchema> schema_;
    Transition entry_;
    std::unordered_map<NodeId, CompiledNode> nodes_;
    std::vector<NodeId> order_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_COMPILER_COMPILED_GRAPH_H
