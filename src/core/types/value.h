// core/types/value.h
#ifndef AGENTGRAPH_TYPES_VALUE_H
#define AGENTGRAPH_TYPES_VALUE_H

#include <nlohmann/json.hpp>
#include <string>

namespace agentgraph {

// 使用 nlohmann::json 作为统一的数据类型
using Value = nlohmann::json;

// 伪节点
inline const std::string START = "START";
inline const std::string END = "END";

} // namespace agentgraph

#endif // AGENTGRAPH_TYPES_VALUE_H
