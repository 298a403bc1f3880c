// common/utils/logging.cpp
#include "common/utils/logging.h"
#include <spdlog/spdlog.h>

namespace agentgraph {

void configure_logging(const std::string& level) {
    std::string name = level == "warning" ? "warn" : level;
    auto parsed = spdlog::level::from_str(name);
    // from_str 对未知名称返回 off
    if (parsed == spdlog::level::off && name != "off") {
        spdlog::set_level(spdlog::level::info);
        spdlog::warn("Unknown log level '{}', using info", level);
        return;
    }
    spdlog::set_level(parsed);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

} // namespace agentgraph
