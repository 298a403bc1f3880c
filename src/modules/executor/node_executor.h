// modules/executor/node_executor.h
#ifndef AGENTGRAPH_MODULES_EXECUTOR_NODE_EXECUTOR_H
#define AGENTGRAPH_MODULES_EXECUTOR_NODE_EXECUTOR_H

#include "common/capabilities.h"            // 引入 LlmCapability, ToolRegistry ...
#include "modules/compiler/compiled_graph.h" // 引入 CompiledGraph, CompiledNode
#include "modules/config/engine_config.h"    // 引入 ExecutorOptions
#include "modules/scheduler/execution_session.h"
#include "core/types/errors.h"
#include <chrono>
#include <optional>
#include <string>

namespace agentgraph {

// 执行单个节点：解析输入 -> 沙箱代码 -> 提示 -> LLM 调用 -> 校验 -> 写回状态。
// 无论成功失败，每次调用恰好提交一条 ExecutionRecord（运行被取消时除外）
class NodeExecutor {
public:
    NodeExecutor(Capabilities capabilities, ExecutorOptions options = {});

    // 返回新的状态；失败抛出 NodeExecutionError（嵌套原因），取消抛出 RunCancelledError
    TypedState execute(const CompiledGraph& graph,
                       const CompiledNode& node,
                       const TypedState& state,
                       ExecutionSession& session,
                       std::optional<int> iteration = std::nullopt);

    // 深度合并：overlay 中的键覆盖 base，object 递归合并
    static Value merge_config(const Value& base, const Value& overlay);

    const ExecutorOptions& options() const { return options_; }

private:
    TypedState run_node(const CompiledGraph& graph,
                        const CompiledNode& node,
                        const TypedState& state,
                        ExecutionSession& session,
                        const Value& config,
                        ExecutionRecord& record,
                        Phase& phase);

    Value invoke_with_retries(const CompiledGraph& graph,
                              const CompiledNode& node,
                              LlmRequest request,
                              ExecutionSession& session,
                              ExecutionRecord& record,
                              Phase& phase);

    Value run_code_block(const CodeBlock& code, const Value& locals, const TypedState& state);

    // 把校验后的记录映射为状态更新
    static Value to_updates(const CompiledNode& node, const Value& validated);

    void commit(ExecutionSession& session, const CompiledNode& node, ExecutionRecord& record,
                std::chrono::steady_clock::time_point started);

    Capabilities caps_;
    ExecutorOptions options_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_EXECUTOR_NODE_EXECUTOR_H
