// tests/test_node_executor.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "modules/executor/node_executor.h"
#include "modules/compiler/graph_compiler.h"
#include "modules/parser/workflow_parser.h"
#include "core/types/errors.h"
#include "fakes.h"

using namespace agentgraph;
using namespace agentgraph::testing;
using Catch::Approx;
using Catch::Matchers::ContainsSubstring;

namespace {

const char* kWorkflow = R"(
schema_version: "1.0"
flow:
  name: executor_test
state:
  topic: str
  score: float
  notes: str
  words: int
nodes:
  - id: review
    prompt: "Score the article about {topic}"
    output_schema: float
    outputs: [score]
  - id: count
    inputs:
      text: "{state.topic}"
    code: "len(text.split())"
    sandbox:
      preset: low
      timeout: 5
    output_schema: int
    outputs: [words]
  - id: annotate
    inputs:
      text: "{topic}"
    code: "text.upper()"
    prompt: "Annotate {code_result} ({text})"
    outputs: [notes]
  - id: search
    prompt: "Search for {topic}"
    tools: [web_search]
    outputs: [notes]
edges:
  - from: START
    to: review
  - from: review
    to: count
  - from: count
    to: annotate
  - from: annotate
    to: search
  - from: search
    to: END
config:
  llm:
    provider: openai
    model: gpt-4o
    temperature: 0.2
    options: {seed: 1, top_p: 0.9}
)";

ExecutorOptions fast_options(int transient_retries = 3) {
    ExecutorOptions options;
    options.max_transient_retries = transient_retries;
    options.backoff.initial = std::chrono::milliseconds(1);
    options.backoff.max = std::chrono::milliseconds(2);
    return options;
}

struct Harness {
    explicit Harness(const std::string& yaml = kWorkflow)
        : graph(GraphCompiler::compile(WorkflowParser::parse_from_string(yaml))),
          state(graph->initial_state({{"topic", "rust memory safety"}})) {}

    NodeExecutor executor(ExecutorOptions options = fast_options()) {
        Capabilities caps;
        caps.llm = llm;
        caps.tools = tools;
        caps.sandbox = sandbox;
        return NodeExecutor(caps, options);
    }

    TypedState run(const NodeId& id, ExecutorOptions options = fast_options()) {
        return executor(options).execute(*graph, graph->node(id), state, session);
    }

    std::shared_ptr<const CompiledGraph> graph;
    TypedState state;
    std::shared_ptr<FakeLlm> llm = std::make_shared<FakeLlm>();
    std::shared_ptr<ToolRegistry> tools = std::make_shared<ToolRegistry>();
    std::shared_ptr<FakeSandbox> sandbox;
    FlatPricing pricing{1.0};
    ExecutionSession session{"run-test", &pricing, {"ollama"}, nullptr, 50.0};
};

// 捕获 NodeExecutionError，返回其 phase
Phase failure_phase(Harness& h, const NodeId& id, ExecutorOptions options = fast_options()) {
    try {
        h.run(id, options);
    } catch (const NodeExecutionError& e) {
        REQUIRE(e.node_id() == id);
        return e.phase();
    }
    FAIL("expected NodeExecutionError");
    return Phase::Resolve;
}

} // namespace

TEST_CASE("Successful node writes its outputs and one record", "[executor]") {
    Harness h;
    h.llm->script("review", {0.82});

    auto next = h.run("review");
    REQUIRE(next.values()["score"].get<double>() == Approx(0.82));
    REQUIRE(h.state.values()["score"].is_null());
    REQUIRE(h.llm->prompts("review").front() == "Score the article about rust memory safety");

    auto records = h.session.trace().get_records();
    REQUIRE(records.size() == 1);
    const auto& r = records.front();
    REQUIRE(r.succeeded());
    REQUIRE(r.run_id == "run-test");
    REQUIRE(r.node_id == "review");
    REQUIRE(r.attempts == 1);
    REQUIRE(r.usage.total() == 15);
    REQUIRE(r.provider == "openai");
    REQUIRE(r.model == "gpt-4o");
    REQUIRE(r.cost == Approx(0.015));
    REQUIRE_FALSE(r.iteration.has_value());
    REQUIRE(r.duration_ms >= 0.0);
    REQUIRE(h.session.costs().summary().by_provider_model.count("openai/gpt-4o") == 1);
}

TEST_CASE("Invalid output is retried with a clarification prompt", "[executor]") {
    Harness h;
    h.llm->script("review", {"excellent", Value{{"result", 0.9}}});

    auto next = h.run("review");
    REQUIRE(next.values()["score"].get<double>() == Approx(0.9));
    REQUIRE(h.llm->calls("review") == 2);

    auto prompts = h.llm->prompts("review");
    REQUIRE_THAT(prompts[1], ContainsSubstring("Score the article about rust memory safety"));
    REQUIRE_THAT(prompts[1], ContainsSubstring("was rejected"));
    REQUIRE_THAT(prompts[1], ContainsSubstring("expected float"));

    auto records = h.session.trace().get_records();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].attempts == 2);
    REQUIRE(records[0].usage.input_tokens == 20);
}

TEST_CASE("Validation retries are bounded by the workflow setting", "[executor]") {
    std::string yaml = std::string(kWorkflow) + "  execution:\n    max_retries: 1\n";
    Harness h(yaml);
    h.llm->script("review", {"still not a number"});

    REQUIRE(failure_phase(h, "review") == Phase::Validate);
    REQUIRE(h.llm->calls("review") == 2);

    auto records = h.session.trace().get_records();
    REQUIRE(records.size() == 1);
    REQUIRE_FALSE(records[0].succeeded());
    REQUIRE_THAT(*records[0].error, ContainsSubstring("validate"));
    REQUIRE(records[0].attempts == 2);
}

TEST_CASE("Transient failures back off and retry", "[executor]") {
    Harness h;
    int failures = 0;
    h.llm->on("review", [&failures](const LlmRequest&) {
        if (failures < 2) {
            ++failures;
            throw TransientCapabilityError("rate limited");
        }
        return respond(0.5, 100, 20);
    });

    auto next = h.run("review");
    REQUIRE(next.values()["score"].get<double>() == Approx(0.5));
    REQUIRE(h.llm->calls("review") == 3);
    auto records = h.session.trace().get_records();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].attempts == 3);
    REQUIRE(records[0].usage.total() == 120);
}

TEST_CASE("Exhausted transient retries fail the node in the invoke phase", "[executor]") {
    Harness h;
    h.llm->on("review", [](const LlmRequest&) -> LlmResponse {
        throw TransientCapabilityError("connection reset");
    });

    try {
        h.run("review", fast_options(2));
        FAIL("expected NodeExecutionError");
    } catch (const NodeExecutionError& e) {
        REQUIRE(e.phase() == Phase::Invoke);
        REQUIRE_THAT(e.cause(), ContainsSubstring("connection reset"));
        REQUIRE_THROWS_AS(std::rethrow_if_nested(e), TransientCapabilityError);
    }
    REQUIRE(h.llm->calls("review") == 3);
    REQUIRE(h.session.trace().size() == 1);
}

TEST_CASE("Permanent failures are not retried", "[executor]") {
    Harness h;
    h.llm->on("review", [](const LlmRequest&) -> LlmResponse {
        throw PermanentCapabilityError("invalid api key");
    });
    REQUIRE(failure_phase(h, "review") == Phase::Invoke);
    REQUIRE(h.llm->calls("review") == 1);
    REQUIRE(h.session.trace().size() == 1);
}

TEST_CASE("Code-only nodes run in the sandbox", "[executor]") {
    Harness h;
    SandboxLimits seen;
    h.sandbox = std::make_shared<FakeSandbox>([&seen](const std::string& code, const Value& bindings, const SandboxLimits& limits) {
        seen = limits;
        REQUIRE(code == "len(text.split())");
        return Value(static_cast<int>(bindings["text"].get<std::string>().size() > 0 ? 3 : 0));
    });

    auto next = h.run("count");
    REQUIRE(next.values()["words"] == 3);
    REQUIRE(h.sandbox->last_bindings["text"] == "rust memory safety");
    REQUIRE(h.sandbox->last_bindings["topic"] == "rust memory safety");
    REQUIRE(seen.preset == "low");
    REQUIRE(seen.timeout_sec == 5);
    REQUIRE(h.llm->calls("count") == 0);

    auto records = h.session.trace().get_records();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].attempts == 1);
    REQUIRE(records[0].cost == 0.0);
    REQUIRE(records[0].provider == "local");
    REQUIRE(h.pricing.calls.load() == 0);

    auto costs = h.session.costs().summary();
    REQUIRE(costs.calls == 1);
    REQUIRE(costs.by_provider_model.count("local/sandbox") == 1);
    REQUIRE(costs.total_cost == 0.0);
}

TEST_CASE("Sandbox rejections fail the node", "[executor]") {
    Harness h;
    h.sandbox = std::make_shared<FakeSandbox>([](const std::string&, const Value&, const SandboxLimits&) -> Value {
        throw SafetyError("import of 'os' is not allowed", "import os");
    });
    REQUIRE(failure_phase(h, "count") == Phase::Invoke);
    REQUIRE_THAT(*h.session.trace().get_records()[0].error, ContainsSubstring("not allowed"));
}

TEST_CASE("Code results feed the prompt", "[executor]") {
    Harness h;
    h.sandbox = std::make_shared<FakeSandbox>([](const std::string&, const Value&, const SandboxLimits&) {
        return Value("RUST MEMORY SAFETY");
    });
    h.llm->script("annotate", {"annotated"});

    auto next = h.run("annotate");
    REQUIRE(next.values()["notes"] == "annotated");
    REQUIRE(h.llm->prompts("annotate").front() == "Annotate RUST MEMORY SAFETY (rust memory safety)");
}

TEST_CASE("Node configuration overrides the workflow configuration", "[executor]") {
    std::string yaml = kWorkflow;
    const std::string anchor = "    output_schema: float\n    outputs: [score]\n";
    yaml.replace(yaml.find(anchor), anchor.size(),
                 anchor + "    llm:\n      model: gpt-4o-mini\n      options: {top_p: 0.5}\n");
    Harness h(yaml);
    h.llm->script("review", {0.1});

    h.run("review");
    Value config = h.llm->config("review");
    REQUIRE(config["provider"] == "openai");
    REQUIRE(config["model"] == "gpt-4o-mini");
    REQUIRE(config["temperature"].get<double>() == Approx(0.2));
    REQUIRE(config["options"]["seed"] == 1);
    REQUIRE(config["options"]["top_p"].get<double>() == Approx(0.5));
    REQUIRE(h.session.trace().get_records()[0].model == "gpt-4o-mini");
}

TEST_CASE("Provider reported by the capability is recorded", "[executor]") {
    Harness h;
    h.llm->on("review", [](const LlmRequest&) {
        auto r = respond(0.3);
        r.provider = "ollama";
        r.model = "llama3";
        return r;
    });
    h.run("review");
    auto r = h.session.trace().get_records()[0];
    REQUIRE(r.provider == "ollama");
    REQUIRE(r.model == "llama3");
    REQUIRE(r.cost == 0.0);
    REQUIRE(h.pricing.calls.load() == 0);
}

TEST_CASE("Tools resolve through the registry", "[executor]") {
    SECTION("missing tool fails during resolve") {
        Harness h;
        h.llm->script("search", {"unused"});
        REQUIRE(failure_phase(h, "search") == Phase::Resolve);
        REQUIRE(h.llm->calls("search") == 0);
        REQUIRE(h.session.trace().size() == 1);
        REQUIRE(h.session.costs().summary().calls == 1);
    }
    SECTION("registered tool is passed to the capability") {
        Harness h;
        h.tools->register_tool("web_search", [](const ToolArgs& args) {
            return nlohmann::json{{"hits", args.size()}};
        }, "search the web");
        std::string tool_name;
        h.llm->on("search", [&tool_name](const LlmRequest& request) {
            REQUIRE(request.tools.size() == 1);
            tool_name = request.tools[0]->name;
            return respond("three results");
        });
        auto next = h.run("search");
        REQUIRE(tool_name == "web_search");
        REQUIRE(next.values()["notes"] == "three results");
    }
}

TEST_CASE("Unresolvable prompt placeholders fail during resolve", "[executor]") {
    std::string yaml = kWorkflow;
    const std::string from = "Score the article about {topic}";
    yaml.replace(yaml.find(from), from.size(), "Score the article about {topik}");
    Harness h(yaml);
    h.llm->script("review", {0.5});

    try {
        h.run("review");
        FAIL("expected NodeExecutionError");
    } catch (const NodeExecutionError& e) {
        REQUIRE(e.phase() == Phase::Resolve);
        REQUIRE_THAT(e.cause(), ContainsSubstring("topik"));
        REQUIRE_THAT(e.cause(), ContainsSubstring("topic"));
    }
    REQUIRE(h.llm->calls("review") == 0);

    // 调用前失败也留下一条零成本条目，与记录数一致
    auto costs = h.session.costs().summary();
    REQUIRE(costs.calls == static_cast<int>(h.session.trace().size()));
    REQUIRE(costs.calls == 1);
    REQUIRE(costs.by_provider.count("openai") == 1);
    REQUIRE(costs.total_cost == 0.0);
    REQUIRE(h.pricing.calls.load() == 0);
}

TEST_CASE("Config merge is recursive with the overlay winning", "[executor]") {
    Value base = {{"provider", "openai"}, {"options", {{"seed", 1}, {"top_p", 0.9}}}};
    Value overlay = {{"options", {{"top_p", 0.5}}}, {"model", "gpt-4o"}};
    Value merged = NodeExecutor::merge_config(base, overlay);
    REQUIRE(merged["provider"] == "openai");
    REQUIRE(merged["model"] == "gpt-4o");
    REQUIRE(merged["options"]["seed"] == 1);
    REQUIRE(merged["options"]["top_p"].get<double>() == Approx(0.5));
    REQUIRE(NodeExecutor::merge_config(base, Value()) == base);
}

TEST_CASE("Cancelled nodes commit no record", "[executor]") {
    Harness h;
    h.llm->on("review", [&h](const LlmRequest&) {
        h.session.request_cancel();
        return respond(0.4);
    });
    REQUIRE_THROWS_AS(h.run("review"), RunCancelledError);
    REQUIRE(h.session.trace().size() == 0);
}
