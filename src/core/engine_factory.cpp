// src/core/engine_factory.cpp
#include "core/engine.h"
#include "common/llm/llama_adapter.h"
#include "common/utils/logging.h"
#include "modules/cost/pricing_table.h"

namespace agentgraph {

std::unique_ptr<WorkflowEngine> WorkflowEngine::from_config(const std::string& config_path) {
    auto config = EngineConfig::load(config_path);
    configure_logging(config.log_level);

    Capabilities caps;
    caps.llm = std::make_shared<LlamaAdapter>(LlamaAdapter::Config::from_json(config.llama));
    caps.pricing = std::make_shared<StaticPricingTable>();
    caps.tools = std::make_shared<ToolRegistry>();
    return std::make_unique<WorkflowEngine>(std::move(caps), std::move(config));
}

} // namespace agentgraph
