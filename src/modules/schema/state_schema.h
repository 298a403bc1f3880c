// modules/schema/state_schema.h
#ifndef AGENTGRAPH_MODULES_SCHEMA_STATE_SCHEMA_H
#define AGENTGRAPH_MODULES_SCHEMA_STATE_SCHEMA_H

#include "core/types/value.h"
#include "core/types/workflow.h"
#include "modules/schema/type_descriptor.h"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentgraph {

class TypedState;

struct StateField {
    std::string name;
    TypeDescriptor type;
    bool required = false;
    std::optional<Value> default_value;
    std::string description;
};

// 由字段声明构建的状态 schema；构建一次，之后不可变
class StateSchema : public std::enable_shared_from_this<StateSchema> {
public:
    // 声明不合法时抛出 SchemaBuildError
    static std::shared_ptr<const StateSchema> build(const std::vector<StateFieldDeclaration>& declarations);

    // 由调用方输入 + 默认值构造状态；缺失必填字段、类型不符或未声明键抛出 SchemaBuildError
    TypedState instantiate(const Value& inputs) const;

    // 校验一个嵌套 object 值并补全默认值，用于 TypeDescriptor::conform
    Value conform_object(const Value& value, const std::string& path, bool coerce_to_str = false) const;

    const std::vector<StateField>& fields() const { return fields_; }
    const StateField* field(std::string_view name) const;

    // 路径是否可能存在：object 逐级检查，dict/list 之下视为动态
    bool has_path(std::string_view dot_path) const;

    // 所有点路径（含嵌套字段），按声明顺序
    std::vector<std::string> field_paths() const;

    Value json_schema() const;

private:
    StateSchema() = default;
    static std::shared_ptr<StateSchema> build_level(const std::vector<StateFieldDeclaration>& declarations,
                                                    const std::string& prefix);

    std::vector<StateField> fields_;
};

// 类型化的状态容器：不可变值，每次转换产生新实例
class TypedState {
public:
    TypedState(std::shared_ptr<const StateSchema> schema, Value values);

    const Value& values() const { return *data_; }
    const StateSchema& schema() const { return *schema_; }
    const std::shared_ptr<const StateSchema>& schema_ptr() const { return schema_; }

    // 点路径查找，找不到返回 nullptr
    const Value* find(std::string_view dot_path) const;

    // 写时复制：返回应用 updates 后的新状态；未声明字段或类型不符抛出 StateUpdateError
    TypedState with_updates(const Value& updates) const;

    // 独立的深拷贝（并行分支使用）
    TypedState clone() const;

    Value to_json() const { return *data_; }
    std::string dump(int indent = -1) const { return data_->dump(indent); }

    bool operator==(const TypedState& other) const { return *data_ == *other.data_; }

private:
    std::shared_ptr<const StateSchema> schema_;
    std::shared_ptr<const Value> data_;
};

// 按点路径在 JSON 中查找
const Value* find_path(const Value& root, std::string_view dot_path);

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_SCHEMA_STATE_SCHEMA_H
