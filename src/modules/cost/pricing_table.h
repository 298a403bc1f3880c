// modules/cost/pricing_table.h
#ifndef AGENTGRAPH_MODULES_COST_PRICING_TABLE_H
#define AGENTGRAPH_MODULES_COST_PRICING_TABLE_H

#include "common/capabilities.h" // 引入 PricingCapability
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace agentgraph {

// 由模型名推断 provider：openai | anthropic | google | ollama | unknown
// 支持 "provider/model" 前缀与裸模型名
std::string detect_provider(const std::string& model);

struct ModelPrice {
    double input_per_1k = 0.0;
    double output_per_1k = 0.0;
};

// 静态价格表（每 1K token 美元价格）
class StaticPricingTable : public PricingCapability {
public:
    // 内置 Google Gemini 价格
    StaticPricingTable();

    // JSON 格式：{"provider": {"model": {"input": 0.001, "output": 0.002}}}
    static std::shared_ptr<StaticPricingTable> from_json(const nlohmann::json& j, bool include_defaults = true);

    void set_price(const std::string& provider, const std::string& model, ModelPrice price);

    // 模型名按前缀最长匹配，例如 "gemini-1.5-flash-latest" -> "gemini-1.5-flash"
    double estimate(const std::string& provider, const std::string& model, const TokenUsage& usage) override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::map<std::string, ModelPrice>> prices_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_COST_PRICING_TABLE_H
