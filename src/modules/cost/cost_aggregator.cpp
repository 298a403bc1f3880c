// modules/cost/cost_aggregator.cpp
#include "modules/cost/cost_aggregator.h"
#include "modules/cost/pricing_table.h" // detect_provider
#include "core/types/errors.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace agentgraph {

namespace {

void add_to(CostBucket& bucket, double cost, const TokenUsage& usage) {
    bucket.cost += cost;
    bucket.input_tokens += usage.input_tokens;
    bucket.output_tokens += usage.output_tokens;
    bucket.calls += 1;
}

std::string normalize(std::string provider) {
    std::transform(provider.begin(), provider.end(), provider.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return provider;
}

} // namespace

void to_json(nlohmann::json& j, const CostBucket& bucket) {
    j = nlohmann::json{
        {"cost_usd", bucket.cost},
        {"input_tokens", bucket.input_tokens},
        {"output_tokens", bucket.output_tokens},
        {"total_tokens", bucket.input_tokens + bucket.output_tokens},
        {"calls", bucket.calls}
    };
}

void to_json(nlohmann::json& j, const CostSummary& summary) {
    j = nlohmann::json{
        {"total_cost_usd", summary.total_cost},
        {"total_input_tokens", summary.total_input_tokens},
        {"total_output_tokens", summary.total_output_tokens},
        {"calls", summary.calls},
        {"by_provider", summary.by_provider},
        {"by_provider_model", summary.by_provider_model}
    };
}

CostAggregator::CostAggregator(PricingCapability* pricing, std::set<std::string> free_providers)
    : pricing_(pricing), free_providers_(std::move(free_providers)) {}

bool CostAggregator::is_free(const std::string& provider) const {
    return free_providers_.count(normalize(provider)) > 0;
}

double CostAggregator::record(const std::string& provider, const std::string& model, const TokenUsage& usage,
                              std::string* resolved_provider) {
    std::string p = provider.empty() ? detect_provider(model) : normalize(provider);
    double cost = 0.0;

    if (p == kUnknownProvider) {
        SPDLOG_DEBUG("No provider for model '{}', recording under '{}'", model, kUnknownProvider);
    } else if (is_free(p)) {
        cost = 0.0;
    } else if (pricing_ != nullptr) {
        try {
            cost = pricing_->estimate(p, model, usage);
        } catch (const UnknownPricingError& e) {
            spdlog::warn("{}; recording under '{}'", e.what(), kUnknownProvider);
            p = kUnknownProvider;
            cost = 0.0;
        }
    } else {
        SPDLOG_DEBUG("No pricing capability configured; cost for '{}/{}' recorded as 0", p, model);
    }

    cost = std::round(cost * 1e6) / 1e6;
    add(p, model, cost, usage);
    if (resolved_provider) *resolved_provider = p;
    return cost;
}

std::string CostAggregator::record_unpriced(const std::string& provider, const std::string& model) {
    std::string p = provider.empty() ? detect_provider(model) : normalize(provider);
    add(p, model, 0.0, TokenUsage{});
    return p;
}

void CostAggregator::add(const std::string& provider, const std::string& model, double cost,
                         const TokenUsage& usage) {
    std::lock_guard<std::mutex> lock(mutex_);
    summary_.total_cost += cost;
    summary_.total_input_tokens += usage.input_tokens;
    summary_.total_output_tokens += usage.output_tokens;
    summary_.calls += 1;
    add_to(summary_.by_provider[provider], cost, usage);
    add_to(summary_.by_provider_model[provider + "/" + model], cost, usage);
}

CostSummary CostAggregator::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return summary_;
}

} // namespace agentgraph
