// modules/profiler/bottleneck_analyzer.cpp
#include "modules/profiler/bottleneck_analyzer.h"
#include <algorithm>
#include <cmath>

namespace agentgraph {

namespace {

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

} // namespace

void to_json(nlohmann::json& j, const NodeTiming& timing) {
    j = nlohmann::json{
        {"node_id", timing.node_id},
        {"call_count", timing.call_count},
        {"total_duration_ms", timing.total_duration_ms},
        {"avg_duration_ms", timing.avg_duration_ms()},
        {"total_cost", timing.total_cost},
        {"percent_of_total", timing.percent_of_total}
    };
}

void to_json(nlohmann::json& j, const BottleneckSummary& summary) {
    j = nlohmann::json{
        {"total_time_ms", summary.total_time_ms},
        {"total_cost", summary.total_cost},
        {"threshold_percent", summary.threshold_percent},
        {"node_count", summary.nodes.size()},
        {"nodes", summary.nodes},
        {"bottlenecks", summary.bottlenecks},
        {"slowest_node", summary.slowest ? nlohmann::json(summary.slowest->node_id) : nlohmann::json(nullptr)}
    };
}

void BottleneckAnalyzer::record(const std::string& node_id, double duration_ms, double cost) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = index_.try_emplace(node_id, timings_.size());
    if (inserted) {
        NodeTiming timing;
        timing.node_id = node_id;
        timings_.push_back(std::move(timing));
    }
    NodeTiming& timing = timings_[it->second];
    timing.call_count += 1;
    timing.total_duration_ms += duration_ms;
    timing.total_cost += cost;
}

std::vector<NodeTiming> BottleneckAnalyzer::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timings_;
}

double BottleneckAnalyzer::total_time_ms() const {
    double total = 0.0;
    for (const auto& t : snapshot()) total += t.total_duration_ms;
    return total;
}

std::vector<NodeTiming> BottleneckAnalyzer::bottlenecks(double threshold_percent) const {
    auto timings = snapshot();
    double total = 0.0;
    for (const auto& t : timings) total += t.total_duration_ms;

    std::vector<NodeTiming> flagged;
    if (total <= 0.0) {
        return flagged;
    }
    for (auto& t : timings) {
        double percent = t.total_duration_ms / total * 100.0;
        if (percent > threshold_percent) {
            t.percent_of_total = round2(percent);
            flagged.push_back(t);
        }
    }
    std::stable_sort(flagged.begin(), flagged.end(), [](const NodeTiming& a, const NodeTiming& b) {
        return a.total_duration_ms > b.total_duration_ms;
    });
    return flagged;
}

std::optional<NodeTiming> BottleneckAnalyzer::slowest() const {
    auto timings = snapshot();
    if (timings.empty()) {
        return std::nullopt;
    }
    auto it = std::max_element(timings.begin(), timings.end(), [](const NodeTiming& a, const NodeTiming& b) {
        return a.total_duration_ms < b.total_duration_ms;
    });
    return *it;
}

std::optional<NodeTiming> BottleneckAnalyzer::timing(const std::string& node_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(node_id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return timings_[it->second];
}

BottleneckSummary BottleneckAnalyzer::summary(double threshold_percent) const {
    BottleneckSummary summary;
    summary.threshold_percent = threshold_percent;
    summary.nodes = snapshot();
    for (const auto& t : summary.nodes) {
        summary.total_time_ms += t.total_duration_ms;
        summary.total_cost += t.total_cost;
    }
    if (summary.total_time_ms > 0.0) {
        for (auto& t : summary.nodes) {
            t.percent_of_total = round2(t.total_duration_ms / summary.total_time_ms * 100.0);
        }
    }
    summary.bottlenecks = bottlenecks(threshold_percent);
    summary.slowest = slowest();
    if (summary.slowest && summary.total_time_ms > 0.0) {
        summary.slowest->percent_of_total = round2(summary.slowest->total_duration_ms / summary.total_time_ms * 100.0);
    }
    return summary;
}

} // namespace agentgraph
