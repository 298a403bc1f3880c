#ifndef AGENTGRAPH_COMMON_UTILS_TEMPLATE_RENDERER_H
#define AGENTGRAPH_COMMON_UTILS_TEMPLATE_RENDERER_H

#include "core/types/value.h" // 引入 Value (nlohmann::json)
#include <inja/inja.hpp>
#include <string>
#include <string_view>

namespace agentgraph {

// inja 仅用于引擎自己的提示模板（如重试澄清提示）；
// 用户提示中的 {path} 占位符由 TemplateResolver 处理
class InjaTemplateRenderer {
public:
    InjaTemplateRenderer();

    // 使用默认环境渲染模板
    static std::string render(std::string_view template_str, const Value& data);

    // 输出校验失败后重新提问：重述期望的 schema 与上次的错误
    static std::string render_clarification(const std::string& original_prompt,
                                            const Value& output_schema,
                                            const std::string& validation_error,
                                            int attempt);

private:
    inja::Environment env_;
    void configure_security(); // 禁用 include
};

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_UTILS_TEMPLATE_RENDERER_H
