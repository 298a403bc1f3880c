// common/utils/logging.h
#ifndef AGENTGRAPH_COMMON_UTILS_LOGGING_H
#define AGENTGRAPH_COMMON_UTILS_LOGGING_H

#include <string>

namespace agentgraph {

// 设置 spdlog 默认 logger 的级别：debug | info | warning | error | critical | off
// 未知级别回退到 info 并给出警告
void configure_logging(const std::string& level);

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_UTILS_LOGGING_H
