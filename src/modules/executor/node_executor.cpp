// modules/executor/node_executor.cpp
#include "modules/executor/node_executor.h"
#include "modules/resolver/template_resolver.h" // 引入 TemplateResolver
#include "common/utils/template_renderer.h"     // 引入 InjaTemplateRenderer (澄清提示)
#include "core/types/errors.h"
#include <spdlog/spdlog.h>
#include <exception>
#include <utility>

namespace agentgraph {

namespace {

std::string config_string(const Value& config, const char* key) {
    auto it = config.find(key);
    if (it == config.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

// 纯代码节点记在本地沙箱名下
constexpr const char* kSandboxProvider = "local";
constexpr const char* kSandboxModel = "sandbox";

} // namespace

NodeExecutor::NodeExecutor(Capabilities capabilities, ExecutorOptions options)
    : caps_(std::move(capabilities)), options_(options) {
    if (!caps_.tools) {
        caps_.tools = std::make_shared<ToolRegistry>();
    }
}

Value NodeExecutor::merge_config(const Value& base, const Value& overlay) {
    if (!base.is_object() || !overlay.is_object()) {
        return overlay.is_null() ? base : overlay;
    }
    Value merged = base;
    for (const auto& [key, value] : overlay.items()) {
        if (merged.contains(key) && merged[key].is_object() && value.is_object()) {
            merged[key] = merge_config(merged[key], value);
        } else {
            merged[key] = value;
        }
    }
    return merged;
}

TypedState NodeExecutor::execute(const CompiledGraph& graph,
                                  const CompiledNode& node,
                                  const TypedState& state,
                                  ExecutionSession& session,
                                  std::optional<int> iteration) {
    const NodeId& id = node.decl->id;
    Value config = merge_config(graph.workflow_llm(), node.decl->llm.value_or(Value::object()));

    ExecutionRecord record;
    record.node_id = id;
    record.provider = config_string(config, "provider");
    record.model = config_string(config, "model");
    record.iteration = iteration;
    record.start_time = std::chrono::system_clock::now();
    auto started = std::chrono::steady_clock::now();

    if (iteration) {
        spdlog::info("[{}] node '{}' started (iteration {})", session.run_id(), id, *iteration);
    } else {
        spdlog::info("[{}] node '{}' started", session.run_id(), id);
    }

    Phase phase = Phase::Resolve;
    try {
        TypedState next = run_node(graph, node, state, session, config, record, phase);
        commit(session, node, record, started);
        spdlog::info("[{}] node '{}' finished in {:.1f} ms ({} attempt(s))",
                     session.run_id(), id, record.duration_ms, record.attempts);
        return next;
    } catch (const RunCancelledError&) {
        // 取消：不提交记录
        throw;
    } catch (const std::exception& e) {
        record.error = std::string(to_string(phase)) + ": " + e.what();
        commit(session, node, record, started);
        spdlog::error("[{}] node '{}' failed during {}: {}", session.run_id(), id, to_string(phase), e.what());
        std::throw_with_nested(NodeExecutionError(id, phase, e.what()));
    }
}

TypedState NodeExecutor::run_node(const CompiledGraph& graph,
                                  const CompiledNode& node,
                                  const TypedState& state,
                                  ExecutionSession& session,
                                  const Value& config,
                                  ExecutionRecord& record,
                                  Phase& phase) {
    const NodeDeclaration& decl = *node.decl;

    phase = Phase::Resolve;
    Value locals = TemplateResolver::resolve_inputs(decl.inputs, state);

    Value validated;
    if (decl.code) {
        phase = Phase::Invoke;
        if (decl.prompt.empty()) ++record.attempts;
        Value result = run_code_block(*decl.code, locals, state);
        session.throw_if_cancelled();

        if (decl.prompt.empty()) {
            // 纯代码节点：沙箱结果即为输出
            phase = Phase::Validate;
            validated = node.validator.validate(result);
        } else {
            locals["code_result"] = std::move(result);
        }
    }

    if (!decl.prompt.empty()) {
        phase = Phase::Resolve;
        LlmRequest request;
        request.node_id = decl.id;
        request.prompt = TemplateResolver::resolve(decl.prompt, locals, state);
        request.output_schema = node.validator.json_schema();
        for (const auto& name : decl.tools) {
            request.tools.push_back(&caps_.tools->get(name));
        }
        request.config = config;
        request.cancel_token = &session.cancel_token();

        validated = invoke_with_retries(graph, node, std::move(request), session, record, phase);
    }

    phase = Phase::Validate;
    return state.with_updates(to_updates(node, validated));
}

Value NodeExecutor::run_code_block(const CodeBlock& code, const Value& locals, const TypedState& state) {
    if (!caps_.sandbox) {
        throw PermanentCapabilityError("no sandbox capability configured for code block");
    }
    // 绑定：完整状态，局部输入覆盖同名字段
    Value bindings = state.to_json();
    for (const auto& [key, value] : locals.items()) {
        bindings[key] = value;
    }
    return caps_.sandbox->run(code.code, bindings, code.limits);
}

Value NodeExecutor::invoke_with_retries(const CompiledGraph& graph,
                                        const CompiledNode& node,
                                        LlmRequest request,
                                        ExecutionSession& session,
                                        ExecutionRecord& record,
                                        Phase& phase) {
    if (!caps_.llm) {
        phase = Phase::Invoke;
        throw PermanentCapabilityError("no LLM capability configured");
    }

    const int max_validation_retries = graph.execution().max_retries.value_or(options_.max_validation_retries);
    const std::string original_prompt = request.prompt;
    int validation_retries = 0;
    int transient_retries = 0;

    while (true) {
        session.throw_if_cancelled();
        phase = Phase::Invoke;
        ++record.attempts;

        LlmResponse response;
        try {
            response = caps_.llm->invoke(request);
        } catch (const TransientCapabilityError& e) {
            if (transient_retries >= options_.max_transient_retries) {
                throw;
            }
            auto delay = options_.backoff.delay(transient_retries++);
            spdlog::warn("[{}] node '{}' transient failure ({}), retry {}/{} in {} ms",
                         session.run_id(), request.node_id, e.what(),
                         transient_retries, options_.max_transient_retries, delay.count());
            if (session.cancel_token().wait_for(delay)) {
                throw RunCancelledError(session.run_id());
            }
            continue;
        }

        record.usage += response.usage;
        if (!response.provider.empty()) record.provider = response.provider;
        if (!response.model.empty()) record.model = response.model;
        session.throw_if_cancelled();

        phase = Phase::Validate;
        try {
            return node.validator.validate(response.payload);
        } catch (const OutputValidationError& e) {
            if (validation_retries >= max_validation_retries) {
                throw;
            }
            ++validation_retries;
            spdlog::warn("[{}] node '{}' output rejected ({}), clarification {}/{}",
                         session.run_id(), request.node_id, e.what(),
                         validation_retries, max_validation_retries);
            request.prompt = InjaTemplateRenderer::render_clarification(
                original_prompt, request.output_schema, e.what(), validation_retries);
        }
    }
}

Value NodeExecutor::to_updates(const CompiledNode& node, const Value& validated) {
    Value updates = Value::object();
    const auto& outputs = node.decl->outputs;
    if (node.validator.is_wrapped()) {
        if (!outputs.empty()) {
            updates[outputs.front()] = validated.at(OutputValidator::kWrappedField);
        }
        return updates;
    }
    for (const auto& name : outputs) {
        updates[name] = validated.at(name);
    }
    return updates;
}

void NodeExecutor::commit(ExecutionSession& session, const CompiledNode& node, ExecutionRecord& record,
                          std::chrono::steady_clock::time_point started) {
    record.end_time = std::chrono::system_clock::now();
    record.duration_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();

    // 每条记录对应一条成本条目；取消后丢弃的记录其成本仍计入汇总
    // 纯代码节点与 LLM 调用前失败的节点记零成本，不询问定价能力
    if (node.decl->prompt.empty()) {
        record.provider = session.costs().record_unpriced(kSandboxProvider, kSandboxModel);
        record.model = kSandboxModel;
    } else if (record.attempts > 0) {
        std::string provider;
        record.cost = session.costs().record(record.provider, record.model, record.usage, &provider);
        record.provider = provider;
    } else {
        record.provider = session.costs().record_unpriced(record.provider, record.model);
    }
    session.commit_record(record);
}

} // namespace agentgraph
