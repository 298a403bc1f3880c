#ifndef AGENTGRAPH_COMMON_LLM_LLAMA_ADAPTER_H
#define AGENTGRAPH_COMMON_LLM_LLAMA_ADAPTER_H

#include "common/capabilities.h" // 引入 LlmCapability
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <llama.h>

namespace agentgraph {

// 本地 llama.cpp 模型作为 LLM capability；provider 固定为 "llama.cpp"，不计费
class LlamaAdapter : public LlmCapability {
public:
    static constexpr const char* kProvider = "llama.cpp";

    struct Config {
        std::string model_path = "models/qwen-0.6b.gguf";
        int n_ctx = 2048;
        int n_threads = 4;
        float temperature = 0.7f;
        float min_p = 0.05f;
        int n_predict = 512;

        // 读取 EngineConfig 的 "llama" 块；model_path 相对于 config_dir 解析
        static Config from_json(const Value& j);
    };

    explicit LlamaAdapter(const Config& config);
    ~LlamaAdapter() override;

    LlmResponse invoke(const LlmRequest& request) override;

    std::string model_name() const;
    bool is_loaded() const;

private:
    Config config_;
    std::unique_ptr<llama_model, decltype(&llama_model_free)> model_;
    std::unique_ptr<llama_context, decltype(&llama_free)> ctx_;
    std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)> sampler_;
    std::mutex generate_mutex_; // 单个上下文，串行生成

    std::vector<llama_token> tokenize(const std::string& text, bool add_bos);
    std::string detokenize(llama_token token);
    std::string generate(const std::string& prompt, const CancellationToken* cancel_token, TokenUsage& usage);
};

// 从生成文本中提取 JSON：取第一个 '{' 到最后一个 '}'，解析失败则返回原始文本
Value parse_generated_payload(const std::string& text);

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_LLM_LLAMA_ADAPTER_H
