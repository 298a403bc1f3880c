// tests/test_profiler.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "modules/profiler/bottleneck_analyzer.h"
#include <thread>
#include <vector>

using namespace agentgraph;
using Catch::Approx;

TEST_CASE("Bottlenecks are nodes above the threshold share", "[profiler]") {
    BottleneckAnalyzer profiler;
    profiler.record("A", 100.0);
    profiler.record("B", 200.0);
    profiler.record("C", 50.0);

    auto flagged = profiler.bottlenecks(50.0);
    REQUIRE(flagged.size() == 1);
    REQUIRE(flagged[0].node_id == "B");
    REQUIRE(flagged[0].percent_of_total == Approx(57.14));

    REQUIRE(profiler.slowest()->node_id == "B");
    REQUIRE(profiler.total_time_ms() == Approx(350.0));

    auto lower = profiler.bottlenecks(25.0);
    REQUIRE(lower.size() == 2);
    REQUIRE(lower[0].node_id == "B");
    REQUIRE(lower[1].node_id == "A");
    REQUIRE(lower[1].percent_of_total == Approx(28.57));
}

TEST_CASE("Threshold comparison is strict", "[profiler]") {
    BottleneckAnalyzer profiler;
    profiler.record("A", 100.0);
    profiler.record("B", 100.0);
    REQUIRE(profiler.bottlenecks(50.0).empty());
    REQUIRE(profiler.bottlenecks(49.9).size() == 2);
}

TEST_CASE("A single node owns the whole run", "[profiler]") {
    BottleneckAnalyzer profiler;
    profiler.record("only", 12.5);
    auto flagged = profiler.bottlenecks();
    REQUIRE(flagged.size() == 1);
    REQUIRE(flagged[0].percent_of_total == Approx(100.0));
}

TEST_CASE("Repeated calls accumulate into one bucket", "[profiler]") {
    BottleneckAnalyzer profiler;
    profiler.record("review", 10.0, 0.001);
    profiler.record("review", 30.0, 0.002);
    auto timing = profiler.timing("review");
    REQUIRE(timing);
    REQUIRE(timing->call_count == 2);
    REQUIRE(timing->total_duration_ms == Approx(40.0));
    REQUIRE(timing->avg_duration_ms() == Approx(20.0));
    REQUIRE(timing->total_cost == Approx(0.003));
    REQUIRE_FALSE(profiler.timing("missing"));
}

TEST_CASE("Empty profiler reports nothing", "[profiler]") {
    BottleneckAnalyzer profiler;
    REQUIRE(profiler.bottlenecks().empty());
    REQUIRE_FALSE(profiler.slowest());

    auto summary = profiler.summary();
    REQUIRE(summary.nodes.empty());
    REQUIRE(summary.total_time_ms == 0.0);
    nlohmann::json j = summary;
    REQUIRE(j["slowest_node"].is_null());
}

TEST_CASE("Summary keeps first-seen order and serializes", "[profiler]") {
    BottleneckAnalyzer profiler;
    profiler.record("write", 300.0, 0.01);
    profiler.record("review", 100.0, 0.02);

    auto summary = profiler.summary(60.0);
    REQUIRE(summary.nodes.size() == 2);
    REQUIRE(summary.nodes[0].node_id == "write");
    REQUIRE(summary.nodes[0].percent_of_total == Approx(75.0));
    REQUIRE(summary.total_cost == Approx(0.03));
    REQUIRE(summary.bottlenecks.size() == 1);

    nlohmann::json j = summary;
    REQUIRE(j["slowest_node"] == "write");
    REQUIRE(j["node_count"] == 2);
    REQUIRE(j["threshold_percent"].get<double>() == Approx(60.0));
}

TEST_CASE("Concurrent recording loses no samples", "[profiler]") {
    BottleneckAnalyzer profiler;
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&profiler, t] {
            for (int i = 0; i < 250; ++i) {
                profiler.record("branch_" + std::to_string(t % 2), 1.0);
            }
        });
    }
    for (auto& w : workers) w.join();
    REQUIRE(profiler.timing("branch_0")->call_count == 500);
    REQUIRE(profiler.timing("branch_1")->call_count == 500);
    REQUIRE(profiler.total_time_ms() == Approx(1000.0));
}
