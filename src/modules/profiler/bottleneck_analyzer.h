// modules/profiler/bottleneck_analyzer.h
#ifndef AGENTGRAPH_MODULES_PROFILER_BOTTLENECK_ANALYZER_H
#define AGENTGRAPH_MODULES_PROFILER_BOTTLENECK_ANALYZER_H

#include <nlohmann/json.hpp>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentgraph {

struct NodeTiming {
    std::string node_id;
    int call_count = 0;
    double total_duration_ms = 0.0;
    double total_cost = 0.0;
    double percent_of_total = 0.0; // 仅在 bottlenecks()/summary() 中填充

    double avg_duration_ms() const { return call_count > 0 ? total_duration_ms / call_count : 0.0; }
};

struct BottleneckSummary {
    double total_time_ms = 0.0;
    double total_cost = 0.0;
    double threshold_percent = 50.0;
    std::vector<NodeTiming> nodes;       // 按首次记录顺序
    std::vector<NodeTiming> bottlenecks; // 占比降序
    std::optional<NodeTiming> slowest;
};

void to_json(nlohmann::json& j, const NodeTiming& timing);
void to_json(nlohmann::json& j, const BottleneckSummary& summary);

// 按 node_id 累加耗时；同一节点的重复调用（循环、重试）进入同一个桶。
// 并行分支并发调用 record()，临界区内只做加法
class BottleneckAnalyzer {
public:
    void record(const std::string& node_id, double duration_ms, double cost = 0.0);

    // 占比严格大于 threshold_percent 的节点，占比降序
    std::vector<NodeTiming> bottlenecks(double threshold_percent = 50.0) const;

    std::optional<NodeTiming> slowest() const;
    std::optional<NodeTiming> timing(const std::string& node_id) const;

    double total_time_ms() const;
    BottleneckSummary summary(double threshold_percent = 50.0) const;

private:
    std::vector<NodeTiming> snapshot() const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<NodeTiming> timings_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_PROFILER_BOTTLENECK_ANALYZER_H
