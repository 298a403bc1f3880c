// modules/resolver/predicate.h
#ifndef AGENTGRAPH_MODULES_RESOLVER_PREDICATE_H
#define AGENTGRAPH_MODULES_RESOLVER_PREDICATE_H

#include "core/types/value.h"
#include "modules/schema/state_schema.h"
#include <memory>
#include <string>
#include <vector>

namespace agentgraph {

// 受限语法的布尔表达式，用于条件路由与循环终止：
//   or/and/not (|| && !)、比较 == != < <= > >=、算术 + - * / %、
//   括号、字面量（数字、字符串、true/false/null）与路径（可带 "state." 前缀）
// 不支持函数调用、属性赋值或任何动态求值
class Predicate {
public:
    struct Node;

    // 语法错误抛出 PredicateError
    static Predicate parse(const std::string& source);

    // 未知路径抛出 TemplateResolutionError，类型错误抛出 PredicateError
    bool evaluate(const TypedState& state, const Value& locals = Value::object()) const;

    // 表达式的值（不做真值转换）
    Value evaluate_value(const TypedState& state, const Value& locals = Value::object()) const;

    const std::string& source() const { return source_; }
    const std::vector<std::string>& referenced_paths() const { return paths_; }

private:
    Predicate() = default;

    std::string source_;
    std::shared_ptr<const Node> root_; // 不可变 AST，可共享
    std::vector<std::string> paths_;
};

// Python 风格的真值：null、false、0、空字符串/列表/对象为假
bool truthy(const Value& value);

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_RESOLVER_PREDICATE_H
