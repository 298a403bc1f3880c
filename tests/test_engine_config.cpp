// tests/test_engine_config.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/config/engine_config.h"
#include "common/utils/logging.h"
#include "core/types/errors.h"
#include <spdlog/spdlog.h>

using namespace agentgraph;
using namespace std::chrono_literals;

namespace {

const std::string kDataDir = AGENTGRAPH_TEST_DATA_DIR;

} // namespace

TEST_CASE("Defaults apply when the config file is missing", "[config]") {
    auto config = EngineConfig::load(kDataDir + "/missing.json");
    REQUIRE(config.log_level == "info");
    REQUIRE(config.executor.max_validation_retries == 3);
    REQUIRE(config.executor.max_transient_retries == 3);
    REQUIRE(config.bottleneck_threshold == 50.0);
    REQUIRE(config.free_providers == std::set<std::string>{"ollama", "local", "llama.cpp"});
    REQUIRE_FALSE(config.default_timeout.has_value());
    REQUIRE(config.max_retained_runs == 1000);
}

TEST_CASE("Config file overrides defaults", "[config]") {
    auto config = EngineConfig::load(kDataDir + "/agentgraph.json");
    REQUIRE(config.log_level == "debug");
    REQUIRE(config.executor.max_validation_retries == 2);
    REQUIRE(config.executor.max_transient_retries == 5);
    REQUIRE(config.executor.backoff.initial == 50ms);
    REQUIRE(config.executor.backoff.max == 400ms);
    REQUIRE(config.bottleneck_threshold == 40.0);
    REQUIRE(config.free_providers == std::set<std::string>{"ollama", "vllm"});
    REQUIRE(config.default_timeout == std::optional<std::chrono::milliseconds>(60000ms));
    REQUIRE(config.max_retained_runs == 16);
    REQUIRE(config.llama["n_ctx"] == 2048);
    REQUIRE(config.llama["config_dir"] == kDataDir);
}

TEST_CASE("Backoff grows geometrically up to the cap", "[config]") {
    BackoffPolicy policy;
    policy.initial = 100ms;
    policy.multiplier = 2.0;
    policy.max = 500ms;
    REQUIRE(policy.delay(0) == 100ms);
    REQUIRE(policy.delay(1) == 200ms);
    REQUIRE(policy.delay(2) == 400ms);
    REQUIRE(policy.delay(3) == 500ms);
}

TEST_CASE("Invalid config values are rejected", "[config]") {
    REQUIRE_THROWS_AS(EngineConfig::load(kDataDir + "/broken.json"), SpecParseError);
    REQUIRE_THROWS_AS(EngineConfig::from_json(Value::array()), SpecParseError);
    REQUIRE_THROWS_AS(EngineConfig::from_json({{"max_transient_retries", -1}}), SpecParseError);
    REQUIRE_THROWS_AS(EngineConfig::from_json({{"max_validation_retries", "three"}}), SpecParseError);
    REQUIRE_THROWS_AS(EngineConfig::from_json({{"bottleneck_threshold", 150}}), SpecParseError);
    REQUIRE_THROWS_AS(EngineConfig::from_json({{"backoff", {{"multiplier", 0.5}}}}), SpecParseError);
    REQUIRE_THROWS_AS(EngineConfig::from_json({{"free_providers", "ollama"}}), SpecParseError);
    REQUIRE_THROWS_AS(EngineConfig::from_json({{"llama", 1}}), SpecParseError);
    REQUIRE_THROWS_AS(EngineConfig::from_json({{"max_retained_runs", -5}}), SpecParseError);
}

TEST_CASE("Log levels map onto spdlog", "[config]") {
    configure_logging("warning");
    REQUIRE(spdlog::get_level() == spdlog::level::warn);
    configure_logging("debug");
    REQUIRE(spdlog::get_level() == spdlog::level::debug);
    configure_logging("chatty");
    REQUIRE(spdlog::get_level() == spdlog::level::info);
    configure_logging("info");
}
