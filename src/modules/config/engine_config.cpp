// modules/config/engine_config.cpp
#include "modules/config/engine_config.h"
#include "core/types/errors.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>

namespace agentgraph {

std::chrono::milliseconds BackoffPolicy::delay(int retry) const {
    double ms = static_cast<double>(initial.count()) * std::pow(multiplier, retry);
    ms = std::min(ms, static_cast<double>(max.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(ms));
}

namespace {

int non_negative_int(const Value& j, const char* key, int fallback) {
    if (!j.contains(key)) return fallback;
    if (!j[key].is_number_integer() || j[key].get<int>() < 0) {
        throw SpecParseError(key, "expected a non-negative integer");
    }
    return j[key].get<int>();
}

} // namespace

EngineConfig EngineConfig::from_json(const Value& j) {
    EngineConfig config;
    if (!j.is_object()) {
        throw SpecParseError("<root>", "engine config must be a JSON object");
    }

    if (j.contains("log_level") && j["log_level"].is_string()) {
        config.log_level = j["log_level"].get<std::string>();
    }

    config.executor.max_validation_retries =
        non_negative_int(j, "max_validation_retries", config.executor.max_validation_retries);
    config.executor.max_transient_retries =
        non_negative_int(j, "max_transient_retries", config.executor.max_transient_retries);

    if (j.contains("backoff")) {
        const auto& b = j["backoff"];
        if (!b.is_object()) throw SpecParseError("backoff", "expected an object");
        auto& policy = config.executor.backoff;
        policy.initial = std::chrono::milliseconds(non_negative_int(b, "initial_ms", static_cast<int>(policy.initial.count())));
        policy.max = std::chrono::milliseconds(non_negative_int(b, "max_ms", static_cast<int>(policy.max.count())));
        if (b.contains("multiplier")) {
            if (!b["multiplier"].is_number() || b["multiplier"].get<double>() < 1.0) {
                throw SpecParseError("backoff.multiplier", "expected a number >= 1");
            }
            policy.multiplier = b["multiplier"].get<double>();
        }
    }

    if (j.contains("bottleneck_threshold")) {
        const auto& t = j["bottleneck_threshold"];
        if (!t.is_number() || t.get<double>() < 0.0 || t.get<double>() > 100.0) {
            throw SpecParseError("bottleneck_threshold", "expected a percentage in [0, 100]");
        }
        config.bottleneck_threshold = t.get<double>();
    }

    if (j.contains("free_providers")) {
        const auto& fp = j["free_providers"];
        if (!fp.is_array()) throw SpecParseError("free_providers", "expected a list of provider names");
        config.free_providers.clear();
        for (const auto& p : fp) {
            if (!p.is_string()) throw SpecParseError("free_providers", "provider names must be strings");
            config.free_providers.insert(p.get<std::string>());
        }
    }

    if (j.contains("default_timeout_ms") && !j["default_timeout_ms"].is_null()) {
        config.default_timeout = std::chrono::milliseconds(non_negative_int(j, "default_timeout_ms", 0));
    }

    config.max_retained_runs = static_cast<size_t>(
        non_negative_int(j, "max_retained_runs", static_cast<int>(config.max_retained_runs)));

    if (j.contains("llama")) {
        if (!j["llama"].is_object()) throw SpecParseError("llama", "expected an object");
        config.llama = j["llama"];
    }
    return config;
}

EngineConfig EngineConfig::load(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        spdlog::warn("Engine config '{}' not found, using defaults", config_path);
        return EngineConfig{};
    }

    Value j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw SpecParseError(config_path, e.what());
    }
    auto config = from_json(j);
    // llama.model_path 相对于配置文件所在目录
    if (config.llama.contains("model_path") && config.llama["model_path"].is_string()) {
        config.llama["config_dir"] = std::filesystem::path(config_path).parent_path().string();
    }
    return config;
}

} // namespace agentgraph
