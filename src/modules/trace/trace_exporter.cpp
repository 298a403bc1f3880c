// modules/trace/trace_exporter.cpp
#include "modules/trace/trace_exporter.h"

namespace agentgraph {

void TraceExporter::append(ExecutionRecord record) {
    record.run_id = run_id_;
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(std::move(record));
}

std::vector<ExecutionRecord> TraceExporter::get_records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

std::vector<std::string> TraceExporter::node_sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(records_.size());
    for (const auto& r : records_) ids.push_back(r.node_id);
    return ids;
}

size_t TraceExporter::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

nlohmann::json TraceExporter::to_json() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : get_records()) {
        arr.push_back(r); // 通过 ADL to_json 序列化
    }
    return arr;
}

} // namespace agentgraph
