// modules/schema/type_descriptor.h
#ifndef AGENTGRAPH_MODULES_SCHEMA_TYPE_DESCRIPTOR_H
#define AGENTGRAPH_MODULES_SCHEMA_TYPE_DESCRIPTOR_H

#include "core/types/value.h"
#include <memory>
#include <string>
#include <string_view>

namespace agentgraph {

class StateSchema;

enum class TypeKind { Str, Int, Float, Bool, List, Dict, Object };

// 由类型字符串解析出的类型描述符：
//   str | int | float | bool | list | dict | list[T] | dict[K,V] | object
// list/dict 的元素类型可省略；object 的嵌套结构由 StateSchema 提供
class TypeDescriptor {
public:
    // 解析失败抛出 std::invalid_argument
    static TypeDescriptor parse(std::string_view type_string);

    static TypeDescriptor object(std::shared_ptr<const StateSchema> nested);

    TypeKind kind() const { return kind_; }
    bool is_scalar() const;
    const TypeDescriptor* element() const { return element_.get(); }
    const TypeDescriptor* key() const { return key_.get(); }
    const std::shared_ptr<const StateSchema>& nested() const { return nested_; }

    // 规范化的类型字符串，例如 "list[dict[str,int]]"
    std::string to_string() const;

    // 类型对齐检查（忽略 object 的嵌套结构）
    bool same_shape(const TypeDescriptor& other) const;

    // 校验并规范化一个值；int 可拓宽为 float。
    // coerce_to_str 只用于 LLM 输出校验：数字/布尔规范化为 str。不匹配时抛出 TypeMismatchError
    Value conform(const Value& value, const std::string& path, bool coerce_to_str = false) const;

    // 对应的 JSON schema 片段（提供给 LLM capability）
    Value json_schema() const;

private:
    TypeKind kind_ = TypeKind::Str;
    std::shared_ptr<const TypeDescriptor> element_;
    std::shared_ptr<const TypeDescriptor> key_;
    std::shared_ptr<const StateSchema> nested_;
};

struct TypeMismatch {
    std::string path;
    std::string expected;
    std::string actual;
};

// conform() 抛出的异常
class TypeMismatchError : public std::exception {
public:
    explicit TypeMismatchError(TypeMismatch mismatch);
    const char* what() const noexcept override { return message_.c_str(); }
    const TypeMismatch& mismatch() const { return mismatch_; }

private:
    TypeMismatch mismatch_;
    std::string message_;
};

// 值的 JSON 类型名，用于错误信息
std::string describe_value_type(const Value& value);

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_SCHEMA_TYPE_DESCRIPTOR_H
