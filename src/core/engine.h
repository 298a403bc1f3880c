// agentgraph/core/engine.h
#ifndef AGENTGRAPH_CORE_ENGINE_H
#define AGENTGRAPH_CORE_ENGINE_H

#include "common/capabilities.h"
#include "modules/compiler/compiled_graph.h"
#include "modules/config/engine_config.h"
#include "modules/executor/node_executor.h"
#include "modules/scheduler/execution_session.h"
#include "modules/profiler/bottleneck_analyzer.h"
#include "modules/cost/cost_aggregator.h"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace agentgraph {

enum class ExecutionMode { Sync, Async };

// Sync：正常结束时带 final_state；超时时 timed_out 为真并带 handle。
// Async：立即返回 handle
struct ExecutionResult {
    std::string run_id;
    RunStatus status = RunStatus::Ready;
    std::optional<TypedState> final_state;
    std::optional<JobHandle> handle;
    bool timed_out = false;
};

class WorkflowEngine {
public:
    // 读取引擎配置，设置日志级别，接入本地 llama.cpp 模型与内置价格表（定义在 agentgraph_llama 中）
    static std::unique_ptr<WorkflowEngine> from_config(const std::string& config_path);

    WorkflowEngine(Capabilities capabilities, EngineConfig config = {});
    ~WorkflowEngine();

    WorkflowEngine(const WorkflowEngine&) = delete;
    WorkflowEngine& operator=(const WorkflowEngine&) = delete;

    // 编译失败抛出 GraphStructureError / SchemaBuildError
    std::shared_ptr<const CompiledGraph> compile(const WorkflowSpec& spec) const;
    std::shared_ptr<const CompiledGraph> compile_file(const std::string& file_path) const;
    std::shared_ptr<const CompiledGraph> compile_string(const std::string& content) const;

    // 初始状态在调用线程中构造，输入不合法直接抛出 SchemaBuildError。
    // Sync 模式下失败重新抛出 NodeExecutionError
    ExecutionResult execute(std::shared_ptr<const CompiledGraph> graph,
                            const Value& inputs,
                            ExecutionMode mode = ExecutionMode::Sync,
                            std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    RunStatus status(const JobHandle& handle) const { return handle.status(); }
    RunStatus status(const std::string& run_id) const;
    JobHandle handle(const std::string& run_id) const;

    std::vector<ExecutionRecord> trace(const std::string& run_id) const;
    BottleneckSummary bottlenecks(const std::string& run_id, std::optional<double> threshold = std::nullopt) const;
    CostSummary costs(const std::string& run_id) const;

    void cancel(const std::string& run_id);
    std::vector<std::string> runs() const;

    // 丢弃已结束运行的会话与遥测；运行尚未结束时返回 false
    bool forget(const std::string& run_id);
    // 尚未回收的工作线程数
    size_t active_workers() const;

    template <typename Func>
    void register_tool(std::string_view name, Func&& func, std::string description = "") {
        caps_.tools->register_tool(std::string(name), std::forward<Func>(func), std::move(description));
    }

    const EngineConfig& config() const { return config_; }
    ToolRegistry& tools() { return *caps_.tools; }

private:
    struct Run {
        std::shared_ptr<ExecutionSession> session;
        std::shared_ptr<const CompiledGraph> graph;
        std::thread worker;
    };

    std::shared_ptr<ExecutionSession> find_session(const std::string& run_id) const;
    // 调用方持有 runs_mutex_
    void reap_finished_locked();
    std::string next_run_id();
    std::optional<std::chrono::milliseconds> resolve_timeout(const CompiledGraph& graph,
                                                             std::optional<std::chrono::milliseconds> timeout) const;

    Capabilities caps_;
    EngineConfig config_;
    NodeExecutor executor_;

    mutable std::mutex runs_mutex_;
    std::map<std::string, Run> runs_;
    std::vector<std::string> run_order_;
    std::atomic<uint64_t> run_counter_{0};
};

} // namespace agentgraph

#endif // AGENTGRAPH_CORE_ENGINE_H
