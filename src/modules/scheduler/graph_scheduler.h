// modules/scheduler/graph_scheduler.h
#ifndef AGENTGRAPH_MODULES_SCHEDULER_GRAPH_SCHEDULER_H
#define AGENTGRAPH_MODULES_SCHEDULER_GRAPH_SCHEDULER_H

#include "modules/compiler/compiled_graph.h"     // 引入 CompiledGraph, Transition
#include "modules/executor/node_executor.h"      // 引入 NodeExecutor
#include "modules/scheduler/execution_session.h" // 引入 ExecutionSession
#include <map>
#include <string>

namespace agentgraph {

// 沿编译后的转移驱动一次运行。分支共享 session，但各自持有状态快照
class GraphScheduler {
public:
    GraphScheduler(const CompiledGraph& graph, NodeExecutor& executor, ExecutionSession& session);

    // 从 START 执行到 END，返回最终状态
    TypedState run(const TypedState& initial);

private:
    // 每条执行路径的循环计数（以循环尾节点标识）
    struct WalkState {
        std::map<NodeId, int> loop_iterations;
    };

    // 从 current 执行到 stop（不执行 stop）或 END
    TypedState walk(NodeId current, const NodeId& stop, TypedState state, WalkState& walk_state);

    // 应用 source 的转移并返回下一个节点；fan-out 会在此执行分支并合并结果
    NodeId advance(const NodeId& source, const Transition& transition, TypedState& state, WalkState& walk_state);

    NodeId route(const NodeId& source, const BranchTransition& branch, const TypedState& state);
    NodeId loop_back(const NodeId& source, const LoopTransition& loop, const TypedState& state, WalkState& walk_state);
    TypedState fan_out(const NodeId& source, const FanOutTransition& fan, const TypedState& state, const WalkState& walk_state);

    // 谓词求值失败映射为 NodeExecutionError(source, resolve)
    bool check(const NodeId& source, const Predicate& predicate, const TypedState& state) const;

    const CompiledGraph& graph_;
    NodeExecutor& executor_;
    ExecutionSession& session_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_SCHEDULER_GRAPH_SCHEDULER_H
