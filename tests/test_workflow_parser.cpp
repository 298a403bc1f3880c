// tests/test_workflow_parser.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "modules/parser/workflow_parser.h"
#include "modules/compiler/graph_compiler.h"
#include "core/types/errors.h"

using namespace agentgraph;
using Catch::Matchers::ContainsSubstring;

namespace {

const std::string kDataDir = AGENTGRAPH_TEST_DATA_DIR;

const char* kMinimal = R"(
flow: {name: minimal}
state:
  topic: str
nodes:
  - id: echo
    prompt: "Echo {topic}"
    outputs: topic
edges:
  - {from: START, to: echo}
  - {from: echo, to: END}
)";

// 断言解析失败，并返回出错位置
std::string parse_error_location(const std::string& yaml) {
    try {
        WorkflowParser::parse_from_string(yaml);
    } catch (const SpecParseError& e) {
        return e.location();
    }
    FAIL("expected SpecParseError");
    return {};
}

std::string with(const std::string& from, const std::string& to) {
    std::string yaml = kMinimal;
    yaml.replace(yaml.find(from), from.size(), to);
    return yaml;
}

} // namespace

TEST_CASE("Workflow file parses into declarations", "[parser]") {
    auto spec = WorkflowParser::parse_from_file(kDataDir + "/review_loop.yaml");

    REQUIRE(spec.schema_version == "1.0");
    REQUIRE(spec.flow.name == "review_loop");
    REQUIRE(spec.flow.version == "2");

    REQUIRE(spec.state.size() == 6);
    REQUIRE(spec.state[0].name == "topic");
    REQUIRE(spec.state[0].required);
    REQUIRE(spec.state[0].description == "Subject of the article");
    REQUIRE(spec.state[1].type == "str");
    REQUIRE(spec.state[4].name == "meta");
    REQUIRE(spec.state[4].schema.size() == 2);
    REQUIRE(spec.state[4].schema[1].default_value == Value(0));
    REQUIRE(spec.state[5].default_value == Value(false));

    REQUIRE(spec.nodes.size() == 3);
    const auto& write = spec.nodes[0];
    REQUIRE(write.inputs.at("subject") == "{topic}");
    REQUIRE_THAT(write.prompt, ContainsSubstring("Write a short article about {subject}."));
    REQUIRE(write.llm->at("temperature") == 0.7);
    REQUIRE(write.output_schema.type == "str");

    const auto& critique = spec.nodes[1];
    REQUIRE(critique.output_schema.type == "object");
    REQUIRE(critique.output_schema.fields.size() == 3);
    REQUIRE(critique.output_schema.fields[1].type == "list[str]");
    REQUIRE(critique.tools == std::vector<std::string>{"word_count", "spell_check"});

    const auto& polish = spec.nodes[2];
    REQUIRE(polish.code);
    REQUIRE(polish.code->code == "draft.strip()");
    REQUIRE(polish.code->limits.preset == "high");
    REQUIRE(polish.code->limits.timeout_sec == 20);
    REQUIRE(polish.code->limits.memory == std::optional<std::string>("256m"));
    REQUIRE(polish.code->limits.cpu == std::optional<double>(0.5));

    REQUIRE(spec.edges.size() == 4);
    const auto& loop = std::get<LoopEdge>(spec.edges[2]);
    REQUIRE(loop.node == "critique");
    REQUIRE(loop.reenter == std::optional<NodeId>("write"));
    REQUIRE(loop.max_iterations == 4);
    REQUIRE(loop.exit_to == "polish");
    REQUIRE(loop.until == "state.approved or state.score >= 0.9");

    REQUIRE(spec.llm["provider"] == "ollama");
    REQUIRE(spec.execution.timeout_sec == 120);
    REQUIRE(spec.execution.max_retries == 2);

    auto graph = GraphCompiler::compile(spec);
    REQUIRE(graph->node("write").loop == std::optional<NodeId>("critique"));
    REQUIRE_FALSE(graph->node("polish").loop.has_value());
}

TEST_CASE("Shorthand forms are accepted", "[parser]") {
    auto spec = WorkflowParser::parse_from_string(kMinimal);
    REQUIRE(spec.schema_version == "1.0");
    REQUIRE(spec.nodes[0].outputs == std::vector<std::string>{"topic"});
    REQUIRE(std::get<LinearEdge>(spec.edges[0]).to == "echo");

    auto loop = WorkflowParser::parse_from_string(with("{from: echo, to: END}",
        "{from: echo, loop: {condition_field: done}}"));
    const auto& edge = std::get<LoopEdge>(loop.edges[1]);
    REQUIRE(edge.until == "state.done");
    REQUIRE(edge.max_iterations == 10);
    REQUIRE(edge.exit_to == END);
    REQUIRE_FALSE(edge.reenter.has_value());
}

TEST_CASE("Routes collect a single default", "[parser]") {
    auto spec = WorkflowParser::parse_from_string(with("{from: echo, to: END}",
        "{from: echo, routes: [{condition: \"topic == 'x'\", to: END}, {condition: default, to: echo}]}"));
    const auto& edge = std::get<ConditionalEdge>(spec.edges[1]);
    REQUIRE(edge.routes.size() == 1);
    REQUIRE(edge.routes[0].predicate == "topic == 'x'");
    REQUIRE(edge.default_target == std::optional<NodeId>("echo"));

    auto location = parse_error_location(with("{from: echo, to: END}",
        "{from: echo, routes: [{condition: default, to: END}, {condition: default, to: echo}]}"));
    REQUIRE(location == "edges[1].routes[1]");
}

TEST_CASE("Parse errors carry the offending location", "[parser]") {
    REQUIRE(parse_error_location(with("flow: {name: minimal}", "flow: {}")) == "flow.name");
    REQUIRE(parse_error_location("schema_version: \"2.0\"\n" + std::string(kMinimal)) == "schema_version");
    REQUIRE(parse_error_location(with("    outputs: topic\n", "")) == "nodes[0].outputs");
    REQUIRE(parse_error_location(with("{from: echo, to: END}", "{from: echo}")) == "edges[1]");
    REQUIRE(parse_error_location(with("{from: echo, to: END}", "{from: echo, to: END, routes: []}")) == "edges[1]");
    REQUIRE(parse_error_location(with("{from: echo, to: END}", "{from: echo, loop: {max_iterations: 3}}")) ==
            "edges[1].loop");
    REQUIRE(parse_error_location(with("{from: echo, to: END}", "{from: echo, loop: {until: x, max_iterations: many}}")) ==
            "edges[1].loop.max_iterations");
    REQUIRE(parse_error_location(with("    outputs: topic\n",
        "    outputs: topic\n    code: \"x\"\n    sandbox: {preset: extreme}\n")) == "nodes[0].sandbox.preset");
    REQUIRE(parse_error_location(with("    outputs: topic\n",
        "    outputs: topic\n    code: \"x\"\n    sandbox: {timeout: 7200}\n")) == "nodes[0].sandbox.timeout");
    REQUIRE(parse_error_location(kMinimal + std::string("config:\n  execution: {timeout: 0}\n")) ==
            "config.execution.timeout");
    REQUIRE(parse_error_location("nodes: [unclosed") == "<document>");
    REQUIRE(parse_error_location("- just\n- a list\n") == "<document>");
}

TEST_CASE("Missing files are reported", "[parser]") {
    REQUIRE_THROWS_AS(WorkflowParser::parse_from_file(kDataDir + "/does_not_exist.yaml"), SpecParseError);
}
