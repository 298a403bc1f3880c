// modules/trace/trace_exporter.h
#ifndef AGENTGRAPH_MODULES_TRACE_TRACE_EXPORTER_H
#define AGENTGRAPH_MODULES_TRACE_TRACE_EXPORTER_H

#include "core/types/record.h" // 引入 ExecutionRecord
#include <nlohmann/json.hpp>
#include <mutex>
#include <string>
#include <vector>

namespace agentgraph {

// 单次运行的 ExecutionRecord 集合：只追加，不修改，不删除
class TraceExporter {
public:
    explicit TraceExporter(std::string run_id) : run_id_(std::move(run_id)) {}

    void append(ExecutionRecord record);

    std::vector<ExecutionRecord> get_records() const;
    std::vector<std::string> node_sequence() const;
    size_t size() const;

    nlohmann::json to_json() const;

    const std::string& run_id() const { return run_id_; }

private:
    std::string run_id_;
    mutable std::mutex mutex_;
    std::vector<ExecutionRecord> records_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_TRACE_TRACE_EXPORTER_H
