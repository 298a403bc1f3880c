// core/types/workflow.h
#ifndef AGENTGRAPH_TYPES_WORKFLOW_H
#define AGENTGRAPH_TYPES_WORKFLOW_H

#include "value.h" // 引入 Value
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <variant>

namespace agentgraph {

using NodeId = std::string;

// 状态字段声明；type 为 "object" 时 schema 给出嵌套字段
struct StateFieldDeclaration {
    std::string name;
    std::string type;
    bool required = false;
    std::optional<Value> default_value;
    std::string description;
    std::vector<StateFieldDeclaration> schema;
};

struct OutputFieldDeclaration {
    std::string name;
    std::string type;
    std::string description;
};

// 节点输出形状：标量（包装为 "result"）或带字段的 object
struct OutputShape {
    std::string type = "str";
    std::string description;
    std::vector<OutputFieldDeclaration> fields;
};

struct SandboxLimits {
    int timeout_sec = 30;
    std::string preset = "medium"; // low | medium | high | max
    bool network = false;
    std::optional<std::string> memory;
    std::optional<double> cpu;
};

struct CodeBlock {
    std::string code;
    SandboxLimits limits;
};

struct NodeDeclaration {
    NodeId id;
    std::string description;
    std::map<std::string, std::string> inputs; // local name -> template
    std::string prompt;
    OutputShape output_schema;
    std::vector<std::string> outputs; // state fields written by this node
    std::vector<std::string> tools;
    std::optional<Value> llm; // node-level capability override
    std::optional<CodeBlock> code;
};

// --- 边（tagged variant）---

struct LinearEdge {
    NodeId from;
    NodeId to;
};

struct Route {
    std::string predicate;
    NodeId target;
};

struct ConditionalEdge {
    NodeId from;
    std::vector<Route> routes;
    std::optional<NodeId> default_target;
};

struct LoopEdge {
    NodeId node;                  // loop tail, evaluated after it runs
    std::optional<NodeId> reenter; // loop head, defaults to node
    int max_iterations = 10;
    std::string until;
    NodeId exit_to = END;
};

struct ParallelEdge {
    NodeId from;
    std::vector<NodeId> targets;
    NodeId join;
};

using EdgeDeclaration = std::variant<LinearEdge, ConditionalEdge, LoopEdge, ParallelEdge>;

// 返回边的源节点
const NodeId& edge_source(const EdgeDeclaration& edge);

struct FlowMetadata {
    std::string name;
    std::string description;
    std::string version;
};

struct ExecutionDefaults {
    std::optional<int> timeout_sec;
    std::optional<int> max_retries;
};

struct WorkflowSpec {
    std::string schema_version = "1.0";
    FlowMetadata flow;
    std::vector<StateFieldDeclaration> state;
    std::vector<NodeDeclaration> nodes;
    std::vector<EdgeDeclaration> edges;
    Value llm = Value::object(); // workflow-level capability config
    ExecutionDefaults execution;
};

} // namespace agentgraph

#endif // AGENTGRAPH_TYPES_WORKFLOW_H
