// modules/parser/workflow_parser.h
#ifndef AGENTGRAPH_MODULES_PARSER_WORKFLOW_PARSER_H
#define AGENTGRAPH_MODULES_PARSER_WORKFLOW_PARSER_H

#include "core/types/workflow.h" // 引入 WorkflowSpec
#include <string>
#include <yaml-cpp/yaml.h>

namespace agentgraph {

// 把 YAML（或 JSON）工作流文档解析为 WorkflowSpec。
// 只做形状检查；结构校验交给 GraphCompiler。错误抛出 SpecParseError，location 为点路径
class WorkflowParser {
public:
    static constexpr const char* kSchemaVersion = "1.0";

    static WorkflowSpec parse_from_string(const std::string& content);
    static WorkflowSpec parse_from_file(const std::string& file_path);

private:
    static WorkflowSpec parse_document(const YAML::Node& root);

    static FlowMetadata parse_flow(const YAML::Node& node, const std::string& path);
    static std::vector<StateFieldDeclaration> parse_fields(const YAML::Node& node, const std::string& path);
    static StateFieldDeclaration parse_field(const std::string& name, const YAML::Node& node, const std::string& path);
    static NodeDeclaration parse_node(const YAML::Node& node, const std::string& path);
    static OutputShape parse_output_schema(const YAML::Node& node, const std::string& path);
    static SandboxLimits parse_sandbox(const YAML::Node& node, const std::string& path);
    static EdgeDeclaration parse_edge(const YAML::Node& node, const std::string& path);
    static ConditionalEdge parse_routes(NodeId from, const YAML::Node& node, const std::string& path);
    static LoopEdge parse_loop(NodeId from, const YAML::Node& node, const std::string& path);
    static ParallelEdge parse_parallel(NodeId from, const YAML::Node& node, const std::string& path);
    static void parse_config(const YAML::Node& node, const std::string& path, WorkflowSpec& spec);
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_PARSER_WORKFLOW_PARSER_H
