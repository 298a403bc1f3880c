// examples/run_workflow/main.cpp
#include <iostream>
#include <cctype>
#include <fstream>
#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "core/engine.h"
#include "core/types/errors.h"

namespace {

// key=value，原样保存，编译后再按状态字段类型转换
bool parse_input(const std::string& arg, std::map<std::string, std::string>& raw_inputs) {
    auto eq = arg.find('=');
    if (eq == std::string::npos || eq == 0) {
        return false;
    }
    raw_inputs[arg.substr(0, eq)] = arg.substr(eq + 1);
    return true;
}

// str 字段保留原文；其余字段能按 JSON 解析则保留类型
nlohmann::json typed_inputs(const agentgraph::StateSchema& schema,
                            const std::map<std::string, std::string>& raw_inputs) {
    nlohmann::json inputs = nlohmann::json::object();
    for (const auto& [key, raw] : raw_inputs) {
        const auto* field = schema.field(key);
        if (field && field->type.kind() == agentgraph::TypeKind::Str) {
            inputs[key] = raw;
            continue;
        }
        nlohmann::json value = nlohmann::json::parse(raw, nullptr, false);
        inputs[key] = value.is_discarded() ? nlohmann::json(raw) : value;
    }
    return inputs;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <workflow.yaml> [--config agentgraph.json] [key=value ...]\n";
        return 1;
    }

    std::string workflow_path = argv[1];
    std::string config_path = "agentgraph.json";
    std::map<std::string, std::string> raw_inputs;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (!parse_input(arg, raw_inputs)) {
            std::cerr << "Ignoring malformed input '" << arg << "' (expected key=value)\n";
        }
    }

    try {
        // 1. 创建引擎（llama.cpp + 内置价格表）
        auto engine = agentgraph::WorkflowEngine::from_config(config_path);

        // 2. 注册工具
        engine->register_tool("word_count", [](const agentgraph::ToolArgs& args) {
            const std::string& text = args.count("text") ? args.at("text") : std::string();
            size_t words = 0;
            bool in_word = false;
            for (char c : text) {
                bool space = std::isspace(static_cast<unsigned char>(c));
                if (!space && !in_word) ++words;
                in_word = !space;
            }
            return nlohmann::json{{"words", words}};
        }, "Count the words in 'text'");

        // 3. 编译并同步执行
        auto graph = engine->compile_file(workflow_path);
        auto inputs = typed_inputs(*graph->state_schema(), raw_inputs);
        auto result = engine->execute(graph, inputs, agentgraph::ExecutionMode::Sync);

        if (result.timed_out) {
            std::cout << "[TIMEOUT] run " << result.run_id << " continues in background, waiting...\n";
            result.final_state = result.handle->final_state();
        }

        // 4. 输出结果
        if (result.final_state) {
            std::cout << "[SUCCESS] " << result.run_id << "\n";
            std::cout << "Final state:\n" << result.final_state->dump(2) << "\n\n";
        } else {
            std::cout << "[" << agentgraph::to_string(result.status) << "] " << result.run_id << "\n";
        }

        nlohmann::json bottlenecks = engine->bottlenecks(result.run_id);
        nlohmann::json costs = engine->costs(result.run_id);
        std::cout << "Bottlenecks:\n" << bottlenecks.dump(2) << "\n";
        std::cout << "Costs:\n" << costs.dump(2) << "\n";

        // 5. 导出 Trace 到文件
        auto records = engine->trace(result.run_id);
        nlohmann::json trace_json = records;
        std::ofstream trace_file("execution_trace.json");
        trace_file << trace_json.dump(2) << std::endl;
        std::cout << "Trace exported to execution_trace.json (" << records.size() << " records)\n";

    } catch (const agentgraph::NodeExecutionError& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
