// modules/schema/output_schema.h
#ifndef AGENTGRAPH_MODULES_SCHEMA_OUTPUT_SCHEMA_H
#define AGENTGRAPH_MODULES_SCHEMA_OUTPUT_SCHEMA_H

#include "core/types/value.h"
#include "core/types/workflow.h"
#include "modules/schema/type_descriptor.h"
#include <string>
#include <vector>

namespace agentgraph {

struct OutputField {
    std::string name;
    TypeDescriptor type;
    std::string description;
};

// 节点输出校验器。标量输出包装为单字段记录 {"result": ...}
class OutputValidator {
public:
    static constexpr const char* kWrappedField = "result";

    // 形状不合法时抛出 SchemaBuildError
    static OutputValidator build(const OutputShape& shape, const std::string& node_id);

    // 返回规范化后的记录；不匹配抛出 OutputValidationError
    Value validate(const Value& payload) const;

    const std::vector<OutputField>& fields() const { return fields_; }
    bool is_wrapped() const { return wrapped_; }
    const std::string& node_id() const { return node_id_; }

    Value json_schema() const;

private:
    std::string node_id_;
    std::string description_;
    bool wrapped_ = false;
    std::vector<OutputField> fields_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_SCHEMA_OUTPUT_SCHEMA_H
