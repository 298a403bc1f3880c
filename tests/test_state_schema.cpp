// tests/test_state_schema.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/schema/state_schema.h"
#include "core/types/errors.h"
#include <algorithm>

using namespace agentgraph;

namespace {

StateFieldDeclaration field(std::string name, std::string type, bool required = false,
                            std::optional<Value> def = std::nullopt) {
    StateFieldDeclaration d;
    d.name = std::move(name);
    d.type = std::move(type);
    d.required = required;
    d.default_value = std::move(def);
    return d;
}

std::shared_ptr<const StateSchema> article_schema() {
    auto meta = field("metadata", "object");
    meta.schema = {field("author", "str", false, Value("anon")), field("flags", "dict[str,bool]")};
    return StateSchema::build({
        field("topic", "str", true),
        field("tags", "list[str]", false, Value::array()),
        field("score", "float", false, Value(0.0)),
        field("count", "int", false, Value(0)),
        meta,
    });
}

} // namespace

TEST_CASE("StateSchema instantiates with inputs and defaults", "[schema]") {
    auto schema = article_schema();
    auto state = schema->instantiate({{"topic", "AI"}, {"score", 3}});

    REQUIRE(state.values()["topic"] == "AI");
    REQUIRE(state.values()["tags"] == Value::array());
    REQUIRE(state.values()["score"].is_number_float());
    REQUIRE(state.values()["score"].get<double>() == 3.0);
    REQUIRE(state.values()["count"] == 0);
    REQUIRE(state.values()["metadata"].is_null());
}

TEST_CASE("StateSchema rejects missing required field", "[schema]") {
    auto schema = article_schema();
    try {
        schema->instantiate(Value::object());
        FAIL("expected SchemaBuildError");
    } catch (const SchemaBuildError& e) {
        REQUIRE(e.field() == "topic");
    }
}

TEST_CASE("StateSchema rejects wrong input type and undeclared keys", "[schema]") {
    auto schema = article_schema();
    REQUIRE_THROWS_AS(schema->instantiate({{"topic", "AI"}, {"count", "three"}}), SchemaBuildError);
    REQUIRE_THROWS_AS(schema->instantiate({{"topic", "AI"}, {"tags", {1, 2}}}), SchemaBuildError);

    try {
        schema->instantiate({{"topic", "AI"}, {"scroe", 1.0}});
        FAIL("expected SchemaBuildError");
    } catch (const SchemaBuildError& e) {
        std::string msg = e.what();
        REQUIRE(msg.find("did you mean 'score'") != std::string::npos);
    }
}

TEST_CASE("Nested object fields are validated and defaulted", "[schema]") {
    auto schema = article_schema();
    auto state = schema->instantiate({{"topic", "AI"}, {"metadata", {{"flags", {{"draft", true}}}}}});
    REQUIRE(state.values()["metadata"]["author"] == "anon");
    REQUIRE(state.values()["metadata"]["flags"]["draft"] == true);

    REQUIRE_THROWS_AS(schema->instantiate({{"topic", "AI"}, {"metadata", {{"flags", {{"draft", "yes"}}}}}}),
                      SchemaBuildError);
    REQUIRE_THROWS_AS(schema->instantiate({{"topic", "AI"}, {"metadata", {{"editor", "bob"}}}}),
                      SchemaBuildError);
}

TEST_CASE("StateSchema::build rejects invalid declarations", "[schema]") {
    REQUIRE_THROWS_AS(StateSchema::build({}), SchemaBuildError);
    REQUIRE_THROWS_AS(StateSchema::build({field("a", "str"), field("a", "int")}), SchemaBuildError);
    REQUIRE_THROWS_AS(StateSchema::build({field("1bad", "str")}), SchemaBuildError);
    REQUIRE_THROWS_AS(StateSchema::build({field("a", "tuple[int]")}), SchemaBuildError);
    REQUIRE_THROWS_AS(StateSchema::build({field("a", "list[object]")}), SchemaBuildError);
    REQUIRE_THROWS_AS(StateSchema::build({field("a", "object")}), SchemaBuildError);
    REQUIRE_THROWS_AS(StateSchema::build({field("a", "str", true, Value("x"))}), SchemaBuildError);
    REQUIRE_THROWS_AS(StateSchema::build({field("a", "int", false, Value("x"))}), SchemaBuildError);
}

TEST_CASE("Type strings parse into descriptors", "[schema]") {
    REQUIRE(TypeDescriptor::parse("list[dict[str, int]]").to_string() == "list[dict[str,int]]");
    REQUIRE(TypeDescriptor::parse(" float ").kind() == TypeKind::Float);
    REQUIRE_THROWS_AS(TypeDescriptor::parse("dict[list[int],str]"), std::invalid_argument);
    REQUIRE_THROWS_AS(TypeDescriptor::parse("list[int,str]"), std::invalid_argument);
}

TEST_CASE("TypedState updates are copy-on-write", "[schema]") {
    auto schema = article_schema();
    auto state = schema->instantiate({{"topic", "AI"}});
    auto next = state.with_updates({{"count", 2}, {"tags", Value::array({"x"})}});

    REQUIRE(state.values()["count"] == 0);
    REQUIRE(next.values()["count"] == 2);
    REQUIRE(next.values()["tags"][0] == "x");
    REQUIRE_FALSE(state == next);

    REQUIRE_THROWS_AS(state.with_updates({{"unknown", 1}}), StateUpdateError);
    REQUIRE_THROWS_AS(state.with_updates({{"count", "many"}}), StateUpdateError);
    REQUIRE_THROWS_AS(state.with_updates({{"topic", nullptr}}), StateUpdateError);
}

TEST_CASE("TypedState path lookup and schema paths", "[schema]") {
    auto schema = article_schema();
    auto state = schema->instantiate({{"topic", "AI"}, {"tags", {"a", "b"}},
                                      {"metadata", {{"flags", {{"x", true}}}}}});
    REQUIRE(*state.find("metadata.author") == "anon");
    REQUIRE(*state.find("tags.1") == "b");
    REQUIRE(state.find("metadata.missing") == nullptr);

    REQUIRE(schema->has_path("metadata.flags.anything"));
    REQUIRE(schema->has_path("metadata.author"));
    REQUIRE_FALSE(schema->has_path("metadata.editor"));
    REQUIRE_FALSE(schema->has_path("topic.length"));

    auto paths = schema->field_paths();
    REQUIRE(std::find(paths.begin(), paths.end(), "metadata.author") != paths.end());
}

TEST_CASE("Serialized state instantiates back to an equal state", "[schema]") {
    auto schema = article_schema();
    auto full = schema->instantiate({{"topic", "AI"}, {"score", 0.1}, {"tags", {"a", "b"}},
                                     {"metadata", {{"author", "ada"}, {"flags", {{"draft", false}}}}}});
    auto sparse = schema->instantiate({{"topic", "AI"}, {"score", 2}});

    for (const auto& state : {full, sparse}) {
        auto restored = schema->instantiate(Value::parse(state.dump()));
        REQUIRE(restored == state);
        REQUIRE(restored.values()["score"].is_number_float());
    }
    REQUIRE(schema->instantiate(Value::parse(sparse.dump())).values()["metadata"].is_null());
    REQUIRE(schema->instantiate(Value::parse(full.dump())).values()["score"].get<double>() == 0.1);
}

TEST_CASE("Collection defaults are copied per instance", "[schema]") {
    auto schema = StateSchema::build({
        field("queue", "list[str]", false, Value::array({"seed"})),
        field("weights", "dict[str,int]", false, Value{{"base", 1}}),
    });
    auto first = schema->instantiate(Value::object());
    auto changed = first.with_updates({{"queue", {"seed", "next"}}, {"weights", {{"base", 9}}}});
    auto second = schema->instantiate(Value::object());

    REQUIRE(changed.values()["queue"].size() == 2);
    REQUIRE(first.values()["queue"] == Value::array({"seed"}));
    REQUIRE(second.values()["queue"] == Value::array({"seed"}));
    REQUIRE(second.values()["weights"]["base"] == 1);
    REQUIRE(*schema->field("queue")->default_value == Value::array({"seed"}));
}

TEST_CASE("State inputs are not coerced to strings", "[schema]") {
    auto schema = article_schema();
    REQUIRE_THROWS_AS(schema->instantiate({{"topic", 5}}), SchemaBuildError);
    REQUIRE_THROWS_AS(schema->instantiate({{"topic", true}}), SchemaBuildError);
    auto state = schema->instantiate({{"topic", "AI"}});
    REQUIRE_THROWS_AS(state.with_updates({{"topic", 7}}), StateUpdateError);
}
