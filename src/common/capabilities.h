// common/capabilities.h
#ifndef AGENTGRAPH_COMMON_CAPABILITIES_H
#define AGENTGRAPH_COMMON_CAPABILITIES_H

#include "core/types/value.h"
#include "core/types/record.h"
#include "core/types/workflow.h"
#include "common/utils/cancellation.h"
#include "common/tools/registry.h"
#include <memory>
#include <string>
#include <vector>

namespace agentgraph {

struct BottleneckSummary;

// --- LLM capability ---

struct LlmRequest {
    std::string node_id;
    std::string prompt;
    Value output_schema;              // JSON schema of the expected record
    std::vector<const Tool*> tools;
    Value config = Value::object();   // merged workflow + node configuration
    const CancellationToken* cancel_token = nullptr;
};

struct LlmResponse {
    Value payload;
    TokenUsage usage;
    std::string provider; // 为空时使用配置中的 provider
    std::string model;
};

// invoke() 抛出 TransientCapabilityError（可退避重试）或 PermanentCapabilityError
class LlmCapability {
public:
    virtual ~LlmCapability() = default;
    virtual LlmResponse invoke(const LlmRequest& request) = 0;
};

// --- Pricing capability ---

class PricingCapability {
public:
    virtual ~PricingCapability() = default;
    // 未知 provider/model 抛出 UnknownPricingError
    virtual double estimate(const std::string& provider, const std::string& model, const TokenUsage& usage) = 0;
};

// --- Sandboxed code capability ---

class SandboxCapability {
public:
    virtual ~SandboxCapability() = default;
    // 违反策略时抛出 SafetyError
    virtual Value run(const std::string& code, const Value& bindings, const SandboxLimits& limits) = 0;
};

// --- Persistence capability (optional, append-only) ---

class PersistenceCapability {
public:
    virtual ~PersistenceCapability() = default;
    virtual void append_record(const std::string& run_id, const ExecutionRecord& record) = 0;
    virtual void append_summary(const std::string& run_id, const BottleneckSummary& summary) = 0;
};

// 注入给引擎的外部依赖；llm 与 tools 必需，其余可为空
struct Capabilities {
    std::shared_ptr<LlmCapability> llm;
    std::shared_ptr<ToolRegistry> tools;
    std::shared_ptr<PricingCapability> pricing;
    std::shared_ptr<SandboxCapability> sandbox;
    std::shared_ptr<PersistenceCapability> persistence;
};

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_CAPABILITIES_H
