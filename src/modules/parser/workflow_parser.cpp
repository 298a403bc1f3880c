// modules/parser/workflow_parser.cpp
#include "modules/parser/workflow_parser.h"
#include "common/utils/yaml_json.h"
#include "core/types/errors.h"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace agentgraph {

namespace {

std::string join(const std::string& path, const std::string& key) {
    return path.empty() ? key : path + "." + key;
}

std::string indexed(const std::string& path, size_t i) {
    return path + "[" + std::to_string(i) + "]";
}

void expect_map(const YAML::Node& node, const std::string& path) {
    if (!node.IsMap()) {
        throw SpecParseError(path, "expected a mapping");
    }
}

std::string scalar(const YAML::Node& node, const std::string& path) {
    if (!node.IsScalar()) {
        throw SpecParseError(path, "expected a scalar value");
    }
    return node.Scalar();
}

std::string required_scalar(const YAML::Node& map, const char* key, const std::string& path) {
    if (!map[key]) {
        throw SpecParseError(join(path, key), "missing required key");
    }
    return scalar(map[key], join(path, key));
}

std::string optional_scalar(const YAML::Node& map, const char* key, const std::string& path, std::string fallback = "") {
    if (!map[key] || map[key].IsNull()) return fallback;
    return scalar(map[key], join(path, key));
}

int integer(const YAML::Node& node, const std::string& path) {
    try {
        return node.as<int>();
    } catch (const YAML::BadConversion&) {
        throw SpecParseError(path, "expected an integer, got '" + (node.IsScalar() ? node.Scalar() : std::string("<collection>")) + "'");
    }
}

bool boolean(const YAML::Node& node, const std::string& path) {
    Value v = yaml_to_json(node);
    if (!v.is_boolean()) {
        throw SpecParseError(path, "expected true or false");
    }
    return v.get<bool>();
}

std::vector<std::string> string_list(const YAML::Node& node, const std::string& path) {
    std::vector<std::string> out;
    if (node.IsScalar()) {
        out.push_back(node.Scalar());
        return out;
    }
    if (!node.IsSequence()) {
        throw SpecParseError(path, "expected a list of strings");
    }
    for (size_t i = 0; i < node.size(); ++i) {
        out.push_back(scalar(node[i], indexed(path, i)));
    }
    return out;
}

// 谓词可以写成字符串，也可以写成 {logic: "..."}
std::string condition_text(const YAML::Node& node, const std::string& path) {
    if (node.IsMap()) {
        return required_scalar(node, "logic", path);
    }
    return scalar(node, path);
}

} // namespace

WorkflowSpec WorkflowParser::parse_from_string(const std::string& content) {
    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::ParserException& e) {
        throw SpecParseError("<document>", "YAML parse error at line " + std::to_string(e.mark.line + 1) + ": " + e.msg);
    }
    try {
        return parse_document(root);
    } catch (const YAML::Exception& e) {
        throw SpecParseError("<document>", e.what());
    }
}

WorkflowSpec WorkflowParser::parse_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw SpecParseError(file_path, "cannot open file");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    auto spec = parse_from_string(buffer.str());
    spdlog::info("Loaded workflow '{}' from {} ({} nodes, {} edges)",
                 spec.flow.name, file_path, spec.nodes.size(), spec.edges.size());
    return spec;
}

WorkflowSpec WorkflowParser::parse_document(const YAML::Node& root) {
    expect_map(root, "<document>");

    WorkflowSpec spec;
    spec.schema_version = optional_scalar(root, "schema_version", "", kSchemaVersion);
    if (spec.schema_version != kSchemaVersion) {
        throw SpecParseError("schema_version", "unsupported version '" + spec.schema_version +
                             "', expected '" + kSchemaVersion + "'");
    }

    if (!root["flow"]) throw SpecParseError("flow", "missing required section");
    spec.flow = parse_flow(root["flow"], "flow");

    if (!root["state"]) throw SpecParseError("state", "missing required section");
    const YAML::Node state = root["state"];
    expect_map(state, "state");
    // 允许 state: {fields: {...}} 与直接 state: {...}
    if (state["fields"] && state["fields"].IsMap()) {
        spec.state = parse_fields(state["fields"], "state.fields");
    } else {
        spec.state = parse_fields(state, "state");
    }

    const YAML::Node nodes = root["nodes"];
    if (!nodes || !nodes.IsSequence()) {
        throw SpecParseError("nodes", "expected a list of nodes");
    }
    for (size_t i = 0; i < nodes.size(); ++i) {
        spec.nodes.push_back(parse_node(nodes[i], indexed("nodes", i)));
    }

    const YAML::Node edges = root["edges"];
    if (!edges || !edges.IsSequence()) {
        throw SpecParseError("edges", "expected a list of edges");
    }
    for (size_t i = 0; i < edges.size(); ++i) {
        spec.edges.push_back(parse_edge(edges[i], indexed("edges", i)));
    }

    if (root["config"] && !root["config"].IsNull()) {
        parse_config(root["config"], "config", spec);
    }
    return spec;
}

FlowMetadata WorkflowParser::parse_flow(const YAML::Node& node, const std::string& path) {
    expect_map(node, path);
    FlowMetadata flow;
    flow.name = required_scalar(node, "name", path);
    flow.description = optional_scalar(node, "description", path);
    flow.version = optional_scalar(node, "version", path);
    return flow;
}

std::vector<StateFieldDeclaration> WorkflowParser::parse_fields(const YAML::Node& node, const std::string& path) {
    expect_map(node, path);
    std::vector<StateFieldDeclaration> fields;
    // 迭代 YAML map 以保留文档顺序
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string name = scalar(it->first, path);
        fields.push_back(parse_field(name, it->second, join(path, name)));
    }
    return fields;
}

StateFieldDeclaration WorkflowParser::parse_field(const std::string& name, const YAML::Node& node, const std::string& path) {
    StateFieldDeclaration field;
    field.name = name;
    // 简写：topic: str
    if (node.IsScalar()) {
        field.type = node.Scalar();
        return field;
    }
    expect_map(node, path);
    field.type = required_scalar(node, "type", path);
    if (node["required"]) {
        field.required = boolean(node["required"], join(path, "required"));
    }
    if (node["default"]) {
        field.default_value = yaml_to_json(node["default"]);
    }
    field.description = optional_scalar(node, "description", path);
    if (node["schema"] && !node["schema"].IsNull()) {
        const YAML::Node schema = node["schema"];
        std::string schema_path = join(path, "schema");
        if (schema.IsMap() && schema["fields"] && schema["fields"].IsMap()) {
            field.schema = parse_fields(schema["fields"], join(schema_path, "fields"));
        } else {
            field.schema = parse_fields(schema, schema_path);
        }
    }
    return field;
}

NodeDeclaration WorkflowParser::parse_node(const YAML::Node& node, const std::string& path) {
    expect_map(node, path);
    NodeDeclaration decl;
    decl.id = required_scalar(node, "id", path);
    decl.description = optional_scalar(node, "description", path);
    decl.prompt = optional_scalar(node, "prompt", path);

    if (node["inputs"] && !node["inputs"].IsNull()) {
        const YAML::Node inputs = node["inputs"];
        expect_map(inputs, join(path, "inputs"));
        for (auto it = inputs.begin(); it != inputs.end(); ++it) {
            std::string local = scalar(it->first, join(path, "inputs"));
            decl.inputs[local] = scalar(it->second, join(join(path, "inputs"), local));
        }
    }

    if (node["output_schema"]) {
        decl.output_schema = parse_output_schema(node["output_schema"], join(path, "output_schema"));
    }

    if (!node["outputs"]) {
        throw SpecParseError(join(path, "outputs"), "missing required key");
    }
    decl.outputs = string_list(node["outputs"], join(path, "outputs"));
    if (decl.outputs.empty()) {
        throw SpecParseError(join(path, "outputs"), "node must write at least one state field");
    }

    if (node["tools"] && !node["tools"].IsNull()) {
        const YAML::Node tools = node["tools"];
        std::string tools_path = join(path, "tools");
        if (!tools.IsSequence()) throw SpecParseError(tools_path, "expected a list");
        for (size_t i = 0; i < tools.size(); ++i) {
            // 工具可以是名字，也可以是 {name: ...}
            if (tools[i].IsMap()) {
                decl.tools.push_back(required_scalar(tools[i], "name", indexed(tools_path, i)));
            } else {
                decl.tools.push_back(scalar(tools[i], indexed(tools_path, i)));
            }
        }
    }

    if (node["llm"] && !node["llm"].IsNull()) {
        Value llm = yaml_to_json(node["llm"]);
        if (!llm.is_object()) throw SpecParseError(join(path, "llm"), "expected a mapping");
        decl.llm = std::move(llm);
    }

    if (node["code"] && !node["code"].IsNull()) {
        CodeBlock code;
        code.code = scalar(node["code"], join(path, "code"));
        if (node["sandbox"] && !node["sandbox"].IsNull()) {
            code.limits = parse_sandbox(node["sandbox"], join(path, "sandbox"));
        }
        decl.code = std::move(code);
    } else if (node["sandbox"]) {
        spdlog::warn("'{}' ignored: node '{}' has no code block", join(path, "sandbox"), decl.id);
    }
    return decl;
}

OutputShape WorkflowParser::parse_output_schema(const YAML::Node& node, const std::string& path) {
    OutputShape shape;
    if (node.IsScalar()) {
        shape.type = node.Scalar();
        return shape;
    }
    expect_map(node, path);
    shape.type = required_scalar(node, "type", path);
    shape.description = optional_scalar(node, "description", path);
    if (node["fields"] && !node["fields"].IsNull()) {
        const YAML::Node fields = node["fields"];
        std::string fields_path = join(path, "fields");
        if (!fields.IsSequence()) throw SpecParseError(fields_path, "expected a list of fields");
        for (size_t i = 0; i < fields.size(); ++i) {
            std::string field_path = indexed(fields_path, i);
            expect_map(fields[i], field_path);
            OutputFieldDeclaration f;
            f.name = required_scalar(fields[i], "name", field_path);
            f.type = required_scalar(fields[i], "type", field_path);
            f.description = optional_scalar(fields[i], "description", field_path);
            shape.fields.push_back(std::move(f));
        }
    }
    return shape;
}

SandboxLimits WorkflowParser::parse_sandbox(const YAML::Node& node, const std::string& path) {
    expect_map(node, path);
    SandboxLimits limits;
    limits.preset = optional_scalar(node, "preset", path, limits.preset);
    if (limits.preset != "low" && limits.preset != "medium" && limits.preset != "high" && limits.preset != "max") {
        throw SpecParseError(join(path, "preset"), "must be one of low, medium, high, max");
    }
    if (node["network"]) {
        limits.network = boolean(node["network"], join(path, "network"));
    }
    if (node["timeout"]) {
        limits.timeout_sec = integer(node["timeout"], join(path, "timeout"));
        if (limits.timeout_sec < 1 || limits.timeout_sec > 3600) {
            throw SpecParseError(join(path, "timeout"), "must be between 1 and 3600 seconds");
        }
    }
    if (node["resources"] && node["resources"].IsMap()) {
        const YAML::Node res = node["resources"];
        std::string res_path = join(path, "resources");
        if (res["memory"]) limits.memory = scalar(res["memory"], join(res_path, "memory"));
        if (res["cpu"]) {
            Value cpu = yaml_to_json(res["cpu"]);
            if (!cpu.is_number()) throw SpecParseError(join(res_path, "cpu"), "expected a number");
            limits.cpu = cpu.get<double>();
        }
        if (res["timeout"]) limits.timeout_sec = integer(res["timeout"], join(res_path, "timeout"));
    }
    return limits;
}

EdgeDeclaration WorkflowParser::parse_edge(const YAML::Node& node, const std::string& path) {
    expect_map(node, path);
    NodeId from = required_scalar(node, "from", path);

    int kinds = (node["to"] ? 1 : 0) + (node["routes"] ? 1 : 0) + (node["loop"] ? 1 : 0) + (node["parallel"] ? 1 : 0);
    if (kinds != 1) {
        throw SpecParseError(path, "edge must have exactly one of 'to', 'routes', 'loop' or 'parallel'");
    }

    if (node["to"]) {
        return LinearEdge{from, scalar(node["to"], join(path, "to"))};
    }
    if (node["routes"]) {
        return parse_routes(from, node["routes"], join(path, "routes"));
    }
    if (node["loop"]) {
        return parse_loop(from, node["loop"], join(path, "loop"));
    }
    return parse_parallel(from, node["parallel"], join(path, "parallel"));
}

ConditionalEdge WorkflowParser::parse_routes(NodeId from, const YAML::Node& node, const std::string& path) {
    if (!node.IsSequence() || node.size() == 0) {
        throw SpecParseError(path, "expected a non-empty list of routes");
    }
    ConditionalEdge edge;
    edge.from = std::move(from);
    for (size_t i = 0; i < node.size(); ++i) {
        std::string route_path = indexed(path, i);
        const YAML::Node route = node[i];
        expect_map(route, route_path);
        NodeId target = required_scalar(route, "to", route_path);
        if (!route["condition"]) {
            throw SpecParseError(join(route_path, "condition"), "missing required key");
        }
        std::string condition = condition_text(route["condition"], join(route_path, "condition"));
        if (condition == "default") {
            if (edge.default_target) {
                throw SpecParseError(route_path, "duplicate default route");
            }
            edge.default_target = target;
        } else {
            edge.routes.push_back(Route{condition, target});
        }
    }
    return edge;
}

LoopEdge WorkflowParser::parse_loop(NodeId from, const YAML::Node& node, const std::string& path) {
    expect_map(node, path);
    LoopEdge edge;
    edge.node = std::move(from);
    if (node["until"] && node["condition_field"]) {
        throw SpecParseError(path, "use either 'until' or 'condition_field', not both");
    }
    if (node["until"]) {
        edge.until = condition_text(node["until"], join(path, "until"));
    } else if (node["condition_field"]) {
        // condition_field 简写：布尔状态字段为真时退出
        edge.until = "state." + scalar(node["condition_field"], join(path, "condition_field"));
    } else {
        throw SpecParseError(path, "loop needs 'until' or 'condition_field'");
    }
    if (node["max_iterations"]) {
        edge.max_iterations = integer(node["max_iterations"], join(path, "max_iterations"));
    }
    if (node["reenter"]) {
        edge.reenter = scalar(node["reenter"], join(path, "reenter"));
    }
    edge.exit_to = optional_scalar(node, "exit_to", path, END);
    return edge;
}

ParallelEdge WorkflowParser::parse_parallel(NodeId from, const YAML::Node& node, const std::string& path) {
    expect_map(node, path);
    ParallelEdge edge;
    edge.from = std::move(from);
    if (!node["targets"]) throw SpecParseError(join(path, "targets"), "missing required key");
    edge.targets = string_list(node["targets"], join(path, "targets"));
    edge.join = required_scalar(node, "join", path);
    return edge;
}

void WorkflowParser::parse_config(const YAML::Node& node, const std::string& path, WorkflowSpec& spec) {
    expect_map(node, path);
    if (node["llm"] && !node["llm"].IsNull()) {
        spec.llm = yaml_to_json(node["llm"]);
        if (!spec.llm.is_object()) throw SpecParseError(join(path, "llm"), "expected a mapping");
    }
    if (node["execution"] && !node["execution"].IsNull()) {
        const YAML::Node exec = node["execution"];
        std::string exec_path = join(path, "execution");
        expect_map(exec, exec_path);
        if (exec["timeout"]) {
            int timeout = integer(exec["timeout"], join(exec_path, "timeout"));
            if (timeout <= 0) throw SpecParseError(join(exec_path, "timeout"), "must be positive");
            spec.execution.timeout_sec = timeout;
        }
        if (exec["max_retries"]) {
            int retries = integer(exec["max_retries"], join(exec_path, "max_retries"));
            if (retries < 0) throw SpecParseError(join(exec_path, "max_retries"), "must not be negative");
            spec.execution.max_retries = retries;
        }
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = scalar(it->first, path);
        if (key != "llm" && key != "execution") {
            SPDLOG_DEBUG("Ignoring unsupported config section '{}'", join(path, key));
        }
    }
}

} // namespace agentgraph
