// modules/scheduler/execution_session.h
#ifndef AGENTGRAPH_MODULES_SCHEDULER_EXECUTION_SESSION_H
#define AGENTGRAPH_MODULES_SCHEDULER_EXECUTION_SESSION_H

#include "core/types/record.h"
#include "common/capabilities.h"
#include "common/utils/cancellation.h"
#include "modules/schema/state_schema.h"
#include "modules/trace/trace_exporter.h"
#include "modules/profiler/bottleneck_analyzer.h"
#include "modules/cost/cost_aggregator.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace agentgraph {

// ExecutionSession 封装单次运行的全部状态：状态机、取消令牌与遥测。
// 并发分支共享同一个 session；遥测对象按运行隔离，不是全局的
class ExecutionSession {
public:
    ExecutionSession(std::string run_id,
                     PricingCapability* pricing,
                     std::set<std::string> free_providers,
                     PersistenceCapability* persistence,
                     double bottleneck_threshold);

    const std::string& run_id() const { return run_id_; }
    RunStatus status() const { return status_.load(); }
    bool is_done() const;

    // --- 取消 ---
    const CancellationToken& cancel_token() const { return cancel_token_; }
    void request_cancel();
    bool is_cancelled() const { return cancel_token_.is_cancelled(); }
    void throw_if_cancelled() const;

    // 提交一条记录；取消后到达的记录被丢弃并返回 false
    bool commit_record(ExecutionRecord record);

    // --- 状态转移 ---
    void mark_running();
    void finish_completed(TypedState final_state);
    void finish_failed(std::exception_ptr error);
    void finish_cancelled();

    void wait() const;
    bool wait_for(std::chrono::milliseconds timeout) const;

    std::optional<TypedState> final_state() const;
    std::exception_ptr error() const;

    // --- 遥测 ---
    const TraceExporter& trace() const { return trace_; }
    const BottleneckAnalyzer& profiler() const { return profiler_; }
    CostAggregator& costs() { return costs_; }
    const CostAggregator& costs() const { return costs_; }

private:
    void finish(RunStatus status);

    std::string run_id_;
    std::atomic<RunStatus> status_{RunStatus::Ready};
    CancellationToken cancel_token_;
    std::mutex commit_mutex_; // 串行化提交与取消

    TraceExporter trace_;
    BottleneckAnalyzer profiler_;
    CostAggregator costs_;
    PersistenceCapability* persistence_;
    double bottleneck_threshold_;

    mutable std::mutex done_mutex_;
    mutable std::condition_variable done_cv_;
    bool done_ = false;
    std::optional<TypedState> final_state_;
    std::exception_ptr error_;
};

// 异步运行的句柄；同步调用超时后也返回它
class JobHandle {
public:
    explicit JobHandle(std::shared_ptr<ExecutionSession> session) : session_(std::move(session)) {}

    const std::string& run_id() const { return session_->run_id(); }
    RunStatus status() const { return session_->status(); }

    void wait() const { session_->wait(); }
    bool wait_for(std::chrono::milliseconds timeout) const { return session_->wait_for(timeout); }

    // 阻塞直到结束；失败时重新抛出 NodeExecutionError，取消时抛出 RunCancelledError
    TypedState final_state() const;

    void cancel() const { session_->request_cancel(); }

private:
    std::shared_ptr<ExecutionSession> session_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_SCHEDULER_EXECUTION_SESSION_H
