// tests/test_trace_exporter.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/trace/trace_exporter.h"
#include <thread>
#include <vector>

using namespace agentgraph;

namespace {

ExecutionRecord make_record(const std::string& node_id, std::optional<int> iteration = std::nullopt) {
    ExecutionRecord r;
    r.node_id = node_id;
    r.duration_ms = 12.5;
    r.usage.input_tokens = 7;
    r.usage.output_tokens = 3;
    r.provider = "openai";
    r.model = "gpt-4o";
    r.cost = 0.01;
    r.iteration = iteration;
    r.attempts = 1;
    return r;
}

} // namespace

TEST_CASE("Records are stamped with the run id and kept in order", "[trace]") {
    TraceExporter trace("run-1");
    trace.append(make_record("write", 0));
    trace.append(make_record("review", 0));
    trace.append(make_record("write", 1));

    REQUIRE(trace.size() == 3);
    REQUIRE(trace.node_sequence() == std::vector<std::string>{"write", "review", "write"});
    for (const auto& r : trace.get_records()) {
        REQUIRE(r.run_id == "run-1");
    }
}

TEST_CASE("Trace serializes every record field", "[trace]") {
    TraceExporter trace("run-2");
    auto failed = make_record("review");
    failed.error = "invoke: Capability failure: quota";
    trace.append(make_record("write", 2));
    trace.append(failed);

    nlohmann::json j = trace.to_json();
    REQUIRE(j.is_array());
    REQUIRE(j.size() == 2);
    REQUIRE(j[0]["run_id"] == "run-2");
    REQUIRE(j[0]["iteration"] == 2);
    REQUIRE(j[0]["input_tokens"] == 7);
    REQUIRE(j[0]["error"].is_null());
    REQUIRE(j[0]["start_time"].is_string());
    REQUIRE(j[1]["iteration"].is_null());
    REQUIRE(j[1]["error"] == "invoke: Capability failure: quota");
}

TEST_CASE("Concurrent appends keep every record", "[trace]") {
    TraceExporter trace("run-3");
    std::vector<std::thread> branches;
    for (int b = 0; b < 3; ++b) {
        branches.emplace_back([&trace, b] {
            for (int i = 0; i < 100; ++i) {
                trace.append(make_record("branch_" + std::to_string(b)));
            }
        });
    }
    for (auto& t : branches) t.join();
    REQUIRE(trace.size() == 300);
}
