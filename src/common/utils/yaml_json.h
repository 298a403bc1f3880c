#ifndef AGENTGRAPH_COMMON_UTILS_YAML_JSON_H
#define AGENTGRAPH_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace agentgraph {

// 将 YAML::Node 转换为 nlohmann::json；带引号的标量保持为字符串
nlohmann::json yaml_to_json(const YAML::Node& node);

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_UTILS_YAML_JSON_H
