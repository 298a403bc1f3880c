// src/core/engine.cpp
#include "core/engine.h"
#include "core/types/errors.h"
#include "modules/compiler/graph_compiler.h"
#include "modules/parser/workflow_parser.h"
#include "modules/scheduler/graph_scheduler.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

namespace agentgraph {

namespace {

Capabilities with_defaults(Capabilities caps) {
    if (!caps.tools) {
        caps.tools = std::make_shared<ToolRegistry>();
    }
    return caps;
}

} // namespace

WorkflowEngine::WorkflowEngine(Capabilities capabilities, EngineConfig config)
    : caps_(with_defaults(std::move(capabilities))),
      config_(std::move(config)),
      executor_(caps_, config_.executor) {}

WorkflowEngine::~WorkflowEngine() {
    std::map<std::string, Run> runs;
    {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        runs.swap(runs_);
    }
    // 引擎销毁时取消仍在运行的任务并等待工作线程退出
    for (auto& [id, run] : runs) {
        if (!run.session->is_done()) {
            run.session->request_cancel();
        }
        if (run.worker.joinable()) {
            run.worker.join();
        }
    }
}

std::shared_ptr<const CompiledGraph> WorkflowEngine::compile(const WorkflowSpec& spec) const {
    return GraphCompiler::compile(spec);
}

std::shared_ptr<const CompiledGraph> WorkflowEngine::compile_file(const std::string& file_path) const {
    return compile(WorkflowParser::parse_from_file(file_path));
}

std::shared_ptr<const CompiledGraph> WorkflowEngine::compile_string(const std::string& content) const {
    return compile(WorkflowParser::parse_from_string(content));
}

std::string WorkflowEngine::next_run_id() {
    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<uint32_t> dist;
    std::ostringstream oss;
    oss << "run-" << ++run_counter_ << "-" << std::hex << std::setw(8) << std::setfill('0') << dist(rng);
    return oss.str();
}

std::optional<std::chrono::milliseconds> WorkflowEngine::resolve_timeout(
    const CompiledGraph& graph, std::optional<std::chrono::milliseconds> timeout) const {
    if (timeout) return timeout;
    if (graph.execution().timeout_sec) {
        return std::chrono::milliseconds(static_cast<int64_t>(*graph.execution().timeout_sec) * 1000);
    }
    return config_.default_timeout;
}

ExecutionResult WorkflowEngine::execute(std::shared_ptr<const CompiledGraph> graph,
                                        const Value& inputs,
                                        ExecutionMode mode,
                                        std::optional<std::chrono::milliseconds> timeout) {
    if (!graph) {
        throw std::invalid_argument("execute() called with a null graph");
    }
    TypedState initial = graph->initial_state(inputs);

    auto session = std::make_shared<ExecutionSession>(
        next_run_id(), caps_.pricing.get(), config_.free_providers,
        caps_.persistence.get(), config_.bottleneck_threshold);
    const std::string run_id = session->run_id();

    {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        reap_finished_locked();
        Run& run = runs_[run_id];
        run.session = session;
        run.graph = graph;
        run_order_.push_back(run_id);
        // 线程在锁内创建，保证析构时能看到它
        run.worker = std::thread([this, session, graph, initial]() {
            session->mark_running();
            try {
                GraphScheduler scheduler(*graph, executor_, *session);
                session->finish_completed(scheduler.run(initial));
            } catch (const RunCancelledError&) {
                session->finish_cancelled();
            } catch (const std::exception& e) {
                spdlog::error("[{}] run failed: {}", session->run_id(), e.what());
                session->finish_failed(std::current_exception());
            }
        });
    }

    ExecutionResult result;
    result.run_id = run_id;

    if (mode == ExecutionMode::Async) {
        result.status = session->status();
        result.handle = JobHandle(session);
        return result;
    }

    auto wait_limit = resolve_timeout(*graph, timeout);
    if (wait_limit) {
        if (!session->wait_for(*wait_limit)) {
            // 超时：运行在后台继续，转为句柄
            spdlog::warn("[{}] sync call timed out after {} ms, returning handle", run_id, wait_limit->count());
            result.status = session->status();
            result.handle = JobHandle(session);
            result.timed_out = true;
            return result;
        }
    } else {
        session->wait();
    }

    result.status = session->status();
    if (result.status == RunStatus::Failed) {
        std::rethrow_exception(session->error());
    }
    result.final_state = session->final_state();
    return result;
}

std::shared_ptr<ExecutionSession> WorkflowEngine::find_session(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        throw RunNotFoundError(run_id);
    }
    return it->second.session;
}

RunStatus WorkflowEngine::status(const std::string& run_id) const {
    return find_session(run_id)->status();
}

JobHandle WorkflowEngine::handle(const std::string& run_id) const {
    return JobHandle(find_session(run_id));
}

std::vector<ExecutionRecord> WorkflowEngine::trace(const std::string& run_id) const {
    return find_session(run_id)->trace().get_records();
}

BottleneckSummary WorkflowEngine::bottlenecks(const std::string& run_id, std::optional<double> threshold) const {
    return find_session(run_id)->profiler().summary(threshold.value_or(config_.bottleneck_threshold));
}

CostSummary WorkflowEngine::costs(const std::string& run_id) const {
    return find_session(run_id)->costs().summary();
}

void WorkflowEngine::cancel(const std::string& run_id) {
    find_session(run_id)->request_cancel();
}

std::vector<std::string> WorkflowEngine::runs() const {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    return run_order_;
}

void WorkflowEngine::reap_finished_locked() {
    // session 在工作线程返回前标记结束，join 只等待线程收尾
    for (auto& [id, run] : runs_) {
        if (run.worker.joinable() && run.session->is_done()) {
            run.worker.join();
        }
    }
    if (config_.max_retained_runs == 0) return;

    size_t excess = runs_.size() >= config_.max_retained_runs ? runs_.size() - config_.max_retained_runs + 1 : 0;
    for (auto it = run_order_.begin(); it != run_order_.end() && excess > 0;) {
        auto run = runs_.find(*it);
        if (run->second.worker.joinable()) {
            ++it;
            continue;
        }
        SPDLOG_DEBUG("[{}] retention limit reached, forgetting run", *it);
        runs_.erase(run);
        it = run_order_.erase(it);
        --excess;
    }
}

bool WorkflowEngine::forget(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        throw RunNotFoundError(run_id);
    }
    if (!it->second.session->is_done()) {
        return false;
    }
    if (it->second.worker.joinable()) {
        it->second.worker.join();
    }
    runs_.erase(it);
    run_order_.erase(std::find(run_order_.begin(), run_order_.end(), run_id));
    return true;
}

size_t WorkflowEngine::active_workers() const {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    size_t count = 0;
    for (const auto& [id, run] : runs_) {
        if (run.worker.joinable()) ++count;
    }
    return count;
}

} // namespace agentgraph
