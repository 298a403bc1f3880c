// modules/cost/pricing_table.cpp
#include "modules/cost/pricing_table.h"
#include "core/types/errors.h"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace agentgraph {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string strip_provider_prefix(const std::string& model) {
    auto slash = model.find('/');
    return slash == std::string::npos ? model : model.substr(slash + 1);
}

} // namespace

std::string detect_provider(const std::string& model) {
    const std::string m = to_lower(model);

    auto slash = m.find('/');
    if (slash != std::string::npos) {
        const std::string prefix = m.substr(0, slash);
        if (prefix == "openai" || prefix == "anthropic" || prefix == "google" || prefix == "ollama") {
            return prefix;
        }
        if (prefix == "gemini") return "google";
        if (prefix == "ollama_chat") return "ollama";
    }

    if (m.rfind("gpt-", 0) == 0 || contains(m, "openai")) return "openai";
    if (m.rfind("claude-", 0) == 0 || contains(m, "anthropic")) return "anthropic";
    if (contains(m, "gemini") || contains(m, "google")) return "google";
    for (const char* local : {"llama", "mistral", "qwen", "phi", "gemma", "deepseek"}) {
        if (contains(m, local)) return "ollama";
    }
    return "unknown";
}

StaticPricingTable::StaticPricingTable() {
    auto& google = prices_["google"];
    google["gemini-3-pro"] = {0.002, 0.012};
    google["gemini-3-flash"] = {0.0005, 0.003};
    google["gemini-2.5-pro"] = {0.00125, 0.010};
    google["gemini-2.5-flash"] = {0.0003, 0.0025};
    google["gemini-2.5-flash-lite"] = {0.0001, 0.0004};
    google["gemini-1.5-pro"] = {0.00125, 0.005};
    google["gemini-1.5-flash"] = {0.000075, 0.0003};
    google["gemini-1.5-flash-8b"] = {0.0000375, 0.00015};
    google["gemini-1.0-pro"] = {0.0005, 0.0015};
}

std::shared_ptr<StaticPricingTable> StaticPricingTable::from_json(const nlohmann::json& j, bool include_defaults) {
    auto table = std::make_shared<StaticPricingTable>();
    if (!include_defaults) {
        table->prices_.clear();
    }
    if (!j.is_object()) {
        throw std::invalid_argument("pricing table must be a JSON object");
    }
    for (const auto& [provider, models] : j.items()) {
        if (!models.is_object()) {
            throw std::invalid_argument("pricing for provider '" + provider + "' must be an object");
        }
        for (const auto& [model, price] : models.items()) {
            table->set_price(provider, model, {price.value("input", 0.0), price.value("output", 0.0)});
        }
    }
    return table;
}

void StaticPricingTable::set_price(const std::string& provider, const std::string& model, ModelPrice price) {
    std::lock_guard<std::mutex> lock(mutex_);
    prices_[to_lower(provider)][to_lower(model)] = price;
}

double StaticPricingTable::estimate(const std::string& provider, const std::string& model, const TokenUsage& usage) {
    const std::string p = to_lower(provider);
    const std::string m = to_lower(strip_provider_prefix(model));

    ModelPrice price;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto pit = prices_.find(p);
        if (pit == prices_.end()) {
            throw UnknownPricingError(provider, model);
        }
        const auto& models = pit->second;
        auto exact = models.find(m);
        if (exact != models.end()) {
            price = exact->second;
        } else {
            size_t best_len = 0;
            for (const auto& [name, candidate] : models) {
                if (m.rfind(name, 0) == 0 && name.size() > best_len) {
                    best_len = name.size();
                    price = candidate;
                }
            }
            if (best_len == 0) {
                throw UnknownPricingError(provider, model);
            }
        }
    }

    double cost = (static_cast<double>(usage.input_tokens) / 1000.0) * price.input_per_1k +
                  (static_cast<double>(usage.output_tokens) / 1000.0) * price.output_per_1k;
    return std::round(cost * 1e6) / 1e6;
}

} // namespace agentgraph
