#include "llama_adapter.h"
#include "core/types/errors.h"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <thread>
#include <vector>

namespace agentgraph {

LlamaAdapter::Config LlamaAdapter::Config::from_json(const Value& j) {
    namespace fs = std::filesystem;

    Config config;
    config.n_threads = static_cast<int>(std::thread::hardware_concurrency());
    if (!j.is_object()) return config;

    if (j.contains("model_path") && j["model_path"].is_string()) {
        std::string model_rel = j["model_path"].get<std::string>();
        fs::path config_dir = j.value("config_dir", std::string());
        if (config_dir.empty()) config_dir = ".";
        config.model_path = fs::absolute(config_dir / model_rel).string();
    }
    if (j.contains("n_ctx") && j["n_ctx"].is_number_integer()) {
        config.n_ctx = j["n_ctx"].get<int>();
    }
    if (j.contains("n_threads") && j["n_threads"].is_number_integer()) {
        int threads = j["n_threads"].get<int>();
        config.n_threads = (threads > 0) ? threads : static_cast<int>(std::thread::hardware_concurrency());
    }
    if (j.contains("temperature") && j["temperature"].is_number()) {
        config.temperature = static_cast<float>(j["temperature"].get<double>());
    }
    if (j.contains("min_p") && j["min_p"].is_number()) {
        config.min_p = static_cast<float>(j["min_p"].get<double>());
    }
    if (j.contains("n_predict") && j["n_predict"].is_number_integer()) {
        config.n_predict = j["n_predict"].get<int>();
    }
    return config;
}

LlamaAdapter::LlamaAdapter(const Config& config)
    : config_(config),
      model_(nullptr, llama_model_free),
      ctx_(nullptr, llama_free),
      sampler_(nullptr, llama_sampler_free) {

    llama_model_params model_params = llama_model_default_params();
    model_params.n_gpu_layers = 99;

    llama_model* raw_model = llama_model_load_from_file(config_.model_path.c_str(), model_params);
    if (!raw_model) {
        throw PermanentCapabilityError("failed to load model: " + config_.model_path);
    }
    model_.reset(raw_model);

    llama_context_params ctx_params = llama_context_default_params();
    ctx_params.n_ctx = config_.n_ctx;
    ctx_params.n_threads = config_.n_threads;
    ctx_params.n_threads_batch = config_.n_threads;

    llama_context* raw_ctx = llama_init_from_model(model_.get(), ctx_params);
    if (!raw_ctx) {
        throw PermanentCapabilityError("failed to create llama context");
    }
    ctx_.reset(raw_ctx);

    auto smpl_params = llama_sampler_chain_default_params();
    llama_sampler* raw_sampler = llama_sampler_chain_init(smpl_params);
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_min_p(config_.min_p, 1));
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_temp(config_.temperature));
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_dist(LLAMA_DEFAULT_SEED));
    sampler_.reset(raw_sampler);

    spdlog::info("Loaded llama.cpp model '{}' (n_ctx={}, threads={})", model_name(), config_.n_ctx, config_.n_threads);
}

LlamaAdapter::~LlamaAdapter() = default;

std::string LlamaAdapter::model_name() const {
    return std::filesystem::path(config_.model_path).filename().string();
}

bool LlamaAdapter::is_loaded() const {
    return model_ != nullptr && ctx_ != nullptr && sampler_ != nullptr;
}

std::vector<llama_token> LlamaAdapter::tokenize(const std::string& text, bool add_bos) {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    // 缓冲区为空时返回所需 token 数的相反数
    int32_t n_tokens = -llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                                       nullptr, 0, add_bos, true);
    if (n_tokens <= 0) return {};

    std::vector<llama_token> tokens(n_tokens);
    if (llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                       tokens.data(), n_tokens, add_bos, true) < 0) {
        return {};
    }
    return tokens;
}

std::string LlamaAdapter::detokenize(llama_token token) {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    char buf[256] = {0};
    int n = llama_token_to_piece(vocab, token, buf, sizeof(buf) - 1, 0, true);
    if (n < 0) return "";
    return std::string(buf, n);
}

std::string LlamaAdapter::generate(const std::string& prompt, const CancellationToken* cancel_token, TokenUsage& usage) {
    std::lock_guard<std::mutex> lock(generate_mutex_);
    if (!is_loaded()) {
        throw PermanentCapabilityError("model not loaded");
    }

    // 每次调用相互独立：清空 KV cache
    llama_memory_clear(llama_get_memory(ctx_.get()), true);

    auto tokens = tokenize(prompt, true);
    if (tokens.empty()) {
        throw PermanentCapabilityError("tokenization failed");
    }
    if (static_cast<int>(tokens.size()) >= config_.n_ctx) {
        throw PermanentCapabilityError("prompt of " + std::to_string(tokens.size()) +
                                       " tokens exceeds context size " + std::to_string(config_.n_ctx));
    }
    usage.input_tokens += static_cast<int64_t>(tokens.size());

    llama_batch batch = llama_batch_get_one(tokens.data(), static_cast<int32_t>(tokens.size()));
    if (llama_decode(ctx_.get(), batch)) {
        throw TransientCapabilityError("prompt evaluation failed");
    }

    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    std::string response;
    for (int i = 0; i < config_.n_predict; ++i) {
        if (cancel_token && cancel_token->is_cancelled()) {
            break;
        }
        llama_token new_token = llama_sampler_sample(sampler_.get(), ctx_.get(), -1);
        if (llama_vocab_is_eog(vocab, new_token)) {
            break;
        }
        response += detokenize(new_token);
        usage.output_tokens += 1;

        batch = llama_batch_get_one(&new_token, 1);
        if (llama_decode(ctx_.get(), batch)) {
            spdlog::warn("llama_decode failed after {} tokens, returning partial output", i + 1);
            break;
        }
    }

    llama_sampler_reset(sampler_.get());
    return response;
}

LlmResponse LlamaAdapter::invoke(const LlmRequest& request) {
    std::string prompt = request.prompt;
    if (!request.output_schema.is_null()) {
        prompt += "\n\nRespond with a single JSON value matching this JSON schema:\n";
        prompt += request.output_schema.dump(2);
        prompt += "\n";
    }
    if (!request.tools.empty()) {
        prompt += "\nAvailable tools:\n";
        for (const Tool* tool : request.tools) {
            prompt += "- " + tool->name + ": " + tool->description + "\n";
        }
    }

    LlmResponse response;
    response.provider = kProvider;
    response.model = model_name();
    std::string text = generate(prompt, request.cancel_token, response.usage);
    SPDLOG_DEBUG("[{}] llama.cpp generated {} tokens", request.node_id, response.usage.output_tokens);
    response.payload = parse_generated_payload(text);
    return response;
}

Value parse_generated_payload(const std::string& text) {
    auto first = text.find('{');
    auto last = text.rfind('}');
    if (first != std::string::npos && last != std::string::npos && last > first) {
        Value parsed = Value::parse(text.substr(first, last - first + 1), nullptr, false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }
    // 标量输出：由 OutputValidator 包装并校验
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return Value("");
    auto end = text.find_last_not_of(" \t\r\n");
    return Value(text.substr(begin, end - begin + 1));
}

} // namespace agentgraph
