// core/types/record.h
#ifndef AGENTGRAPH_TYPES_RECORD_H
#define AGENTGRAPH_TYPES_RECORD_H

#include "value.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace agentgraph {

struct TokenUsage {
    int64_t input_tokens = 0;
    int64_t output_tokens = 0;

    int64_t total() const { return input_tokens + output_tokens; }

    TokenUsage& operator+=(const TokenUsage& other) {
        input_tokens += other.input_tokens;
        output_tokens += other.output_tokens;
        return *this;
    }
};

// 每次节点调用产生一条，创建后不可修改
struct ExecutionRecord {
    std::string run_id;
    std::string node_id;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    double duration_ms = 0.0;
    TokenUsage usage;
    std::string provider;
    std::string model;
    double cost = 0.0;
    std::optional<int> iteration;
    int attempts = 0;
    std::optional<std::string> error;

    bool succeeded() const { return !error.has_value(); }
};

// nlohmann ADL 序列化
void to_json(Value& j, const ExecutionRecord& record);

enum class RunStatus { Ready, Running, Completed, Failed, Cancelled };

const char* to_string(RunStatus status);

} // namespace agentgraph

#endif // AGENTGRAPH_TYPES_RECORD_H
