// modules/compiler/graph_compiler.h
#ifndef AGENTGRAPH_MODULES_COMPILER_GRAPH_COMPILER_H
#define AGENTGRAPH_MODULES_COMPILER_GRAPH_COMPILER_H

#include "modules/compiler/compiled_graph.h"
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace agentgraph {

// 把声明的边集编译为可执行图。所有结构校验在此一次完成：
// 违规抛出 GraphStructureError，schema 问题抛出 SchemaBuildError
class GraphCompiler {
public:
    static constexpr int kMaxLoopIterations = 100;

    static std::shared_ptr<const CompiledGraph> compile(const WorkflowSpec& spec);

private:
    explicit GraphCompiler(std::shared_ptr<const WorkflowSpec> spec);

    std::shared_ptr<const CompiledGraph> run();

    void check_nodes();
    void check_edges();
    void build_adjacency();
    void check_acyclic() const;
    void check_reachability() const;
    void compile_nodes();
    void compile_loops();
    void compile_fan_outs();

    Transition compile_transition(const EdgeDeclaration& edge);
    Predicate compile_predicate(const std::string& source, const NodeId& owner) const;
    void check_target(const NodeId& target, const NodeId& owner, bool allow_end) const;

    // 从 start 沿前向边走到 stop 为止（不含 stop）能访问到的节点
    std::set<NodeId> collect_until(const NodeId& start, const NodeId& stop, bool& reaches_stop, bool& reaches_end) const;

    Transition& transition_of(const NodeId& source);

    std::shared_ptr<const WorkflowSpec> spec_;
    std::shared_ptr<CompiledGraph> graph_;
    std::vector<NodeId> node_ids_;
    std::map<NodeId, const NodeDeclaration*> decls_;
    std::map<NodeId, const EdgeDeclaration*> outgoing_;       // 每个源至多一条
    std::map<NodeId, std::vector<NodeId>> forward_;           // 不含循环回边
    std::map<NodeId, std::vector<NodeId>> back_edges_;        // 循环回边
    std::map<NodeId, NodeId> implicit_join_;                  // 无出边的分支节点 -> join
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_COMPILER_GRAPH_COMPILER_H
