// tests/fakes.h
#ifndef AGENTGRAPH_TESTS_FAKES_H
#define AGENTGRAPH_TESTS_FAKES_H

#include "common/capabilities.h"
#include "core/types/errors.h"
#include "modules/profiler/bottleneck_analyzer.h"
#include <algorithm>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace agentgraph::testing {

inline LlmResponse respond(Value payload, int64_t input_tokens = 10, int64_t output_tokens = 5) {
    LlmResponse r;
    r.payload = std::move(payload);
    r.usage.input_tokens = input_tokens;
    r.usage.output_tokens = output_tokens;
    return r;
}

// 按节点脚本化的 LLM：每个节点可以注册一个 handler，
// 或一串依次返回的 payload（最后一个重复使用）
class FakeLlm : public LlmCapability {
public:
    using Handler = std::function<LlmResponse(const LlmRequest&)>;

    void on(const std::string& node_id, Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_[node_id] = std::move(handler);
    }

    void script(const std::string& node_id, std::vector<Value> payloads) {
        auto cursor = std::make_shared<size_t>(0);
        on(node_id, [payloads = std::move(payloads), cursor](const LlmRequest&) {
            size_t i = std::min(*cursor, payloads.size() - 1);
            ++*cursor;
            return respond(payloads[i]);
        });
    }

    LlmResponse invoke(const LlmRequest& request) override {
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_[request.node_id] += 1;
            prompts_[request.node_id].push_back(request.prompt);
            configs_[request.node_id] = request.config;
            auto it = handlers_.find(request.node_id);
            if (it == handlers_.end()) {
                throw PermanentCapabilityError("no scripted response for node '" + request.node_id + "'");
            }
            handler = it->second;
        }
        return handler(request);
    }

    int calls(const std::string& node_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(node_id);
        return it == calls_.end() ? 0 : it->second;
    }

    std::vector<std::string> prompts(const std::string& node_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = prompts_.find(node_id);
        return it == prompts_.end() ? std::vector<std::string>{} : it->second;
    }

    Value config(const std::string& node_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = configs_.find(node_id);
        return it == configs_.end() ? Value() : it->second;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Handler> handlers_;
    std::map<std::string, int> calls_;
    std::map<std::string, std::vector<std::string>> prompts_;
    std::map<std::string, Value> configs_;
};

// 每 1K token 固定价格；provider "mystery" 无价格
class FlatPricing : public PricingCapability {
public:
    explicit FlatPricing(double per_1k = 1.0) : per_1k_(per_1k) {}

    double estimate(const std::string& provider, const std::string& model, const TokenUsage& usage) override {
        ++calls;
        if (provider == "mystery") {
            throw UnknownPricingError(provider, model);
        }
        return static_cast<double>(usage.total()) / 1000.0 * per_1k_;
    }

    std::atomic<int> calls{0};

private:
    double per_1k_;
};

class FakeSandbox : public SandboxCapability {
public:
    using Handler = std::function<Value(const std::string&, const Value&, const SandboxLimits&)>;

    explicit FakeSandbox(Handler handler) : handler_(std::move(handler)) {}

    Value run(const std::string& code, const Value& bindings, const SandboxLimits& limits) override {
        last_bindings = bindings;
        return handler_(code, bindings, limits);
    }

    Value last_bindings;

private:
    Handler handler_;
};

class RecordingPersistence : public PersistenceCapability {
public:
    void append_record(const std::string& run_id, const ExecutionRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail) throw std::runtime_error("disk full");
        records.push_back(record);
        run_ids.push_back(run_id);
    }

    void append_summary(const std::string& run_id, const BottleneckSummary& summary) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail) throw std::runtime_error("disk full");
        summaries.push_back(summary);
        run_ids.push_back(run_id);
    }

    size_t record_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records.size();
    }

    bool fail = false;
    std::vector<ExecutionRecord> records;
    std::vector<BottleneckSummary> summaries;
    std::vector<std::string> run_ids;

private:
    mutable std::mutex mutex_;
};

} // namespace agentgraph::testing

#endif // AGENTGRAPH_TESTS_FAKES_H
