// modules/scheduler/execution_session.cpp
#include "modules/scheduler/execution_session.h"
#include "core/types/errors.h"
#include <spdlog/spdlog.h>

namespace agentgraph {

ExecutionSession::ExecutionSession(std::string run_id,
                                   PricingCapability* pricing,
                                   std::set<std::string> free_providers,
                                   PersistenceCapability* persistence,
                                   double bottleneck_threshold)
    : run_id_(std::move(run_id)),
      trace_(run_id_),
      costs_(pricing, std::move(free_providers)),
      persistence_(persistence),
      bottleneck_threshold_(bottleneck_threshold) {}

bool ExecutionSession::is_done() const {
    std::lock_guard<std::mutex> lock(done_mutex_);
    return done_;
}

void ExecutionSession::request_cancel() {
    {
        std::lock_guard<std::mutex> lock(commit_mutex_);
        if (cancel_token_.is_cancelled()) return;
        cancel_token_.cancel();
    }
    spdlog::info("[{}] cancellation requested", run_id_);
}

void ExecutionSession::throw_if_cancelled() const {
    if (cancel_token_.is_cancelled()) {
        throw RunCancelledError(run_id_);
    }
}

bool ExecutionSession::commit_record(ExecutionRecord record) {
    {
        std::lock_guard<std::mutex> lock(commit_mutex_);
        if (cancel_token_.is_cancelled()) {
            SPDLOG_DEBUG("[{}] dropping record for node '{}' after cancellation", run_id_, record.node_id);
            return false;
        }
        record.run_id = run_id_;
        trace_.append(record);
    }
    profiler_.record(record.node_id, record.duration_ms, record.cost);

    if (persistence_) {
        try {
            persistence_->append_record(run_id_, record);
        } catch (const std::exception& e) {
            spdlog::warn("[{}] persistence failed for node '{}': {}", run_id_, record.node_id, e.what());
        }
    }
    return true;
}

void ExecutionSession::mark_running() {
    status_.store(RunStatus::Running);
    spdlog::info("[{}] run started", run_id_);
}

void ExecutionSession::finish(RunStatus status) {
    status_.store(status);
    if (persistence_) {
        try {
            persistence_->append_summary(run_id_, profiler_.summary(bottleneck_threshold_));
        } catch (const std::exception& e) {
            spdlog::warn("[{}] persistence of summary failed: {}", run_id_, e.what());
        }
    }
    {
        std::lock_guard<std::mutex> lock(done_mutex_);
        done_ = true;
    }
    done_cv_.notify_all();
    spdlog::info("[{}] run {} ({} records)", run_id_, to_string(status), trace_.size());
}

void ExecutionSession::finish_completed(TypedState final_state) {
    RunStatus status;
    {
        // 与 request_cancel 串行：取消先到则运行记为 Cancelled
        std::lock_guard<std::mutex> lock(commit_mutex_);
        status = cancel_token_.is_cancelled() ? RunStatus::Cancelled : RunStatus::Completed;
    }
    if (status == RunStatus::Completed) {
        std::lock_guard<std::mutex> lock(done_mutex_);
        final_state_ = std::move(final_state);
    }
    finish(status);
}

void ExecutionSession::finish_failed(std::exception_ptr error) {
    if (is_cancelled()) {
        finish(RunStatus::Cancelled);
        return;
    }
    {
        std::lock_guard<std::mutex> lock(done_mutex_);
        error_ = error;
    }
    finish(RunStatus::Failed);
}

void ExecutionSession::finish_cancelled() {
    finish(RunStatus::Cancelled);
}

void ExecutionSession::wait() const {
    std::unique_lock<std::mutex> lock(done_mutex_);
    done_cv_.wait(lock, [this] { return done_; });
}

bool ExecutionSession::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(done_mutex_);
    return done_cv_.wait_for(lock, timeout, [this] { return done_; });
}

std::optional<TypedState> ExecutionSession::final_state() const {
    std::lock_guard<std::mutex> lock(done_mutex_);
    return final_state_;
}

std::exception_ptr ExecutionSession::error() const {
    std::lock_guard<std::mutex> lock(done_mutex_);
    return error_;
}

TypedState JobHandle::final_state() const {
    session_->wait();
    switch (session_->status()) {
        case RunStatus::Completed:
            return *session_->final_state();
        case RunStatus::Failed:
            std::rethrow_exception(session_->error());
        default:
            throw RunCancelledError(session_->run_id());
    }
}

} // namespace agentgraph
