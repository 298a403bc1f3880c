// common/tools/registry.cpp
#include "common/tools/registry.h"
#include "core/types/errors.h"

namespace agentgraph {

const Tool& ToolRegistry::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        throw ToolNotFoundError(name);
    }
    // unordered_map 节点地址在插入后保持稳定
    return it->second;
}

} // namespace agentgraph
