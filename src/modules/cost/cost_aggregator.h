// modules/cost/cost_aggregator.h
#ifndef AGENTGRAPH_MODULES_COST_COST_AGGREGATOR_H
#define AGENTGRAPH_MODULES_COST_COST_AGGREGATOR_H

#include "common/capabilities.h" // 引入 PricingCapability
#include "core/types/record.h"
#include <nlohmann/json.hpp>
#include <map>
#include <mutex>
#include <set>
#include <string>

namespace agentgraph {

struct CostBucket {
    double cost = 0.0;
    int64_t input_tokens = 0;
    int64_t output_tokens = 0;
    int calls = 0;
};

struct CostSummary {
    double total_cost = 0.0;
    int64_t total_input_tokens = 0;
    int64_t total_output_tokens = 0;
    int calls = 0;
    std::map<std::string, CostBucket> by_provider;
    std::map<std::string, CostBucket> by_provider_model; // "provider/model"
};

void to_json(nlohmann::json& j, const CostBucket& bucket);
void to_json(nlohmann::json& j, const CostSummary& summary);

// 单次运行的成本汇总。定价调用在锁外进行，锁内只做累加
class CostAggregator {
public:
    static constexpr const char* kUnknownProvider = "unknown";

    CostAggregator(PricingCapability* pricing, std::set<std::string> free_providers);

    // 返回本次调用的成本；本地/免费 provider 恒为 0，未知 provider 记入 "unknown"
    // 返回值之外，resolved_provider 给出实际记账的 provider
    double record(const std::string& provider, const std::string& model, const TokenUsage& usage,
                  std::string* resolved_provider = nullptr);

    // 没有 LLM 调用的节点（纯代码节点、调用前失败）记一条零成本条目，不询问定价能力
    std::string record_unpriced(const std::string& provider, const std::string& model);

    CostSummary summary() const;
    bool is_free(const std::string& provider) const;

private:
    void add(const std::string& provider, const std::string& model, double cost, const TokenUsage& usage);

    PricingCapability* pricing_; // 可为 nullptr
    std::set<std::string> free_providers_;
    mutable std::mutex mutex_;
    CostSummary summary_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_COST_COST_AGGREGATOR_H
