// modules/config/engine_config.h
#ifndef AGENTGRAPH_MODULES_CONFIG_ENGINE_CONFIG_H
#define AGENTGRAPH_MODULES_CONFIG_ENGINE_CONFIG_H

#include "core/types/value.h"
#include <chrono>
#include <cstddef>
#include <optional>
#include <set>
#include <string>

namespace agentgraph {

struct BackoffPolicy {
    std::chrono::milliseconds initial{200};
    double multiplier = 2.0;
    std::chrono::milliseconds max{5000};

    // 第 n 次重试（从 0 开始）前的等待时间
    std::chrono::milliseconds delay(int retry) const;
};

struct ExecutorOptions {
    int max_validation_retries = 3;
    int max_transient_retries = 3;
    BackoffPolicy backoff;
};

// 引擎配置（JSON）。缺失的文件或键使用默认值
struct EngineConfig {
    std::string log_level = "info";
    ExecutorOptions executor;
    double bottleneck_threshold = 50.0;
    std::set<std::string> free_providers{"ollama", "local", "llama.cpp"};
    std::optional<std::chrono::milliseconds> default_timeout;
    // 保留的已结束运行数上限，超出后最早结束的运行被遗忘；0 表示不限
    size_t max_retained_runs = 1000;
    Value llama = Value::object(); // 交给 LlamaAdapter::Config::from_json

    // 文件不存在时返回默认配置；JSON 格式错误抛出 SpecParseError
    static EngineConfig load(const std::string& config_path = "agentgraph.json");
    static EngineConfig from_json(const Value& j);
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_CONFIG_ENGINE_CONFIG_H
