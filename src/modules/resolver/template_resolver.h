// modules/resolver/template_resolver.h
#ifndef AGENTGRAPH_MODULES_RESOLVER_TEMPLATE_RESOLVER_H
#define AGENTGRAPH_MODULES_RESOLVER_TEMPLATE_RESOLVER_H

#include "core/types/value.h"
#include "modules/schema/state_schema.h"
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace agentgraph {

// 解析提示模板中的 {path} 占位符。
// 优先级：节点局部输入映射 > 状态点路径；可选前缀 "state." 会被去掉
class TemplateResolver {
public:
    // 渲染模板；未解析的路径抛出 TemplateResolutionError
    static std::string resolve(const std::string& template_str, const Value& inputs, const TypedState& state);

    // 按输入映射优先查找一个路径；找不到抛出 TemplateResolutionError
    static const Value& lookup(std::string_view path, const Value& inputs, const TypedState& state);

    // 仅针对状态解析节点的输入映射。
    // 单个占位符的模板绑定原始值，其余绑定替换后的字符串
    static Value resolve_inputs(const std::map<std::string, std::string>& mapping, const TypedState& state);

    // 模板中出现的所有变量（已去掉 "state." 前缀）
    static std::vector<std::string> extract_variables(const std::string& template_str);

    static std::string stringify(const Value& value);

    static std::string strip_state_prefix(std::string_view path);
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_RESOLVER_TEMPLATE_RESOLVER_H
