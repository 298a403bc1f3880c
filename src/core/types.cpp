// core/types.cpp
#include "core/types/errors.h"
#include "core/types/record.h"
#include "core/types/workflow.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace agentgraph {

namespace {

std::string format_time(std::chrono::system_clock::time_point tp) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

std::string join_paths(const std::vector<std::string>& paths) {
    std::string out;
    for (size_t i = 0; i < paths.size(); ++i) {
        if (i > 0) out += ", ";
        out += paths[i];
    }
    return out;
}

} // namespace

TemplateResolutionError::TemplateResolutionError(std::string path,
                                                 std::optional<std::string> suggestion,
                                                 std::vector<std::string> valid_paths)
    : Error("Variable '" + path + "' not found in inputs or state" +
            (suggestion ? ". Did you mean '" + *suggestion + "'?" : std::string()) +
            " Available: [" + join_paths(valid_paths) + "]"),
      path_(std::move(path)), suggestion_(std::move(suggestion)), valid_paths_(std::move(valid_paths)) {}

const char* to_string(Phase phase) {
    switch (phase) {
        case Phase::Resolve: return "resolve";
        case Phase::Invoke: return "invoke";
        case Phase::Validate: return "validate";
    }
    return "unknown";
}

const char* to_string(RunStatus status) {
    switch (status) {
        case RunStatus::Ready: return "ready";
        case RunStatus::Running: return "running";
        case RunStatus::Completed: return "completed";
        case RunStatus::Failed: return "failed";
        case RunStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

const NodeId& edge_source(const EdgeDeclaration& edge) {
    return std::visit([](const auto& e) -> const NodeId& {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, LoopEdge>) {
            return e.node;
        } else {
            return e.from;
        }
    }, edge);
}

void to_json(Value& j, const ExecutionRecord& record) {
    j = Value::object();
    j["run_id"] = record.run_id;
    j["node_id"] = record.node_id;
    j["start_time"] = format_time(record.start_time);
    j["end_time"] = format_time(record.end_time);
    j["duration_ms"] = record.duration_ms;
    j["input_tokens"] = record.usage.input_tokens;
    j["output_tokens"] = record.usage.output_tokens;
    j["provider"] = record.provider;
    j["model"] = record.model;
    j["cost"] = record.cost;
    j["iteration"] = record.iteration ? Value(*record.iteration) : Value(nullptr);
    j["attempts"] = record.attempts;
    j["error"] = record.error ? Value(*record.error) : Value(nullptr);
}

} // namespace agentgraph
