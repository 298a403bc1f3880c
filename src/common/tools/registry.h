// common/tools/registry.h
#ifndef AGENTGRAPH_COMMON_TOOLS_REGISTRY_H
#define AGENTGRAPH_COMMON_TOOLS_REGISTRY_H

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace agentgraph {

using ToolArgs = std::unordered_map<std::string, std::string>;
using ToolFunction = std::function<nlohmann::json(const ToolArgs&)>;

struct Tool {
    std::string name;
    std::string description;
    ToolFunction function;

    nlohmann::json operator()(const ToolArgs& args) const { return function(args); }
};

class ToolRegistry {
public:
    ToolRegistry() = default;

    template<typename Func>
    void register_tool(std::string name, Func&& func, std::string description = "") {
        std::lock_guard<std::mutex> lock(mutex_);
        Tool tool{name, std::move(description), ToolFunction(std::forward<Func>(func))};
        tools_[std::move(name)] = std::move(tool);
    }

    // 找不到时抛出 ToolNotFoundError
    const Tool& get(const std::string& name) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Tool> tools_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_TOOLS_REGISTRY_H
