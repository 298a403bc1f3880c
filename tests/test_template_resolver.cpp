// tests/test_template_resolver.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/resolver/template_resolver.h"
#include "core/types/errors.h"

using namespace agentgraph;

namespace {

TypedState make_state() {
    StateFieldDeclaration topic{"topic", "str", true, std::nullopt, "", {}};
    StateFieldDeclaration count{"count", "int", false, Value(3), "", {}};
    StateFieldDeclaration tags{"tags", "list[str]", false, Value::array({"ml", "ai"}), "", {}};
    StateFieldDeclaration author{"author", "str", false, Value("ann"), "", {}};
    StateFieldDeclaration meta{"meta", "object", false, std::nullopt, "", {author}};
    auto schema = StateSchema::build({topic, count, tags, meta});
    return schema->instantiate({{"topic", "AI safety"}, {"meta", Value::object()}});
}

} // namespace

TEST_CASE("Placeholders resolve against state", "[resolver]") {
    auto state = make_state();
    auto inputs = Value::object();

    REQUIRE(TemplateResolver::resolve("Write about {topic}", inputs, state) == "Write about AI safety");
    REQUIRE(TemplateResolver::resolve("{state.topic} x{count}", inputs, state) == "AI safety x3");
    REQUIRE(TemplateResolver::resolve("by {meta.author}", inputs, state) == "by ann");
    REQUIRE(TemplateResolver::resolve("tags: {tags}", inputs, state) == R"(tags: ["ml","ai"])");
    REQUIRE(TemplateResolver::resolve("no placeholders", inputs, state) == "no placeholders");
}

TEST_CASE("Node inputs take precedence over state", "[resolver]") {
    auto state = make_state();
    Value inputs = {{"topic", "local topic"}, {"notes", "n1"}};

    REQUIRE(TemplateResolver::resolve("{topic} / {notes}", inputs, state) == "local topic / n1");
    // state. 前缀只是语法糖，不会绕过局部输入
    REQUIRE(TemplateResolver::resolve("{state.topic}", inputs, state) == "local topic");
}

TEST_CASE("Unknown placeholder raises with suggestion", "[resolver]") {
    auto state = make_state();
    try {
        TemplateResolver::resolve("Write about {topc}", Value::object(), state);
        FAIL("expected TemplateResolutionError");
    } catch (const TemplateResolutionError& e) {
        REQUIRE(e.path() == "topc");
        REQUIRE(e.suggestion().has_value());
        REQUIRE(*e.suggestion() == "topic");
        std::string msg = e.what();
        REQUIRE(msg.find("Did you mean 'topic'?") != std::string::npos);
    }

    try {
        TemplateResolver::resolve("{completely_unrelated}", Value::object(), state);
        FAIL("expected TemplateResolutionError");
    } catch (const TemplateResolutionError& e) {
        REQUIRE_FALSE(e.suggestion().has_value());
        REQUIRE_FALSE(e.valid_paths().empty());
    }
}

TEST_CASE("Input mappings bind typed values for single placeholders", "[resolver]") {
    auto state = make_state();
    std::map<std::string, std::string> mapping = {
        {"n", "{count}"},
        {"labels", "{state.tags}"},
        {"line", "Topic: {topic} ({count})"},
    };
    auto inputs = TemplateResolver::resolve_inputs(mapping, state);
    REQUIRE(inputs["n"] == 3);
    REQUIRE(inputs["labels"].is_array());
    REQUIRE(inputs["line"] == "Topic: AI safety (3)");
}

TEST_CASE("Variables are extracted without the state prefix", "[resolver]") {
    auto vars = TemplateResolver::extract_variables("{state.topic} and {notes} and {meta.author}");
    REQUIRE(vars == std::vector<std::string>{"topic", "notes", "meta.author"});
}
