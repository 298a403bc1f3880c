// modules/schema/output_schema.cpp
#include "modules/schema/output_schema.h"
#include "core/types/errors.h"
#include "common/utils/string_utils.h"
#include <unordered_set>

namespace agentgraph {

OutputValidator OutputValidator::build(const OutputShape& shape, const std::string& node_id) {
    OutputValidator validator;
    validator.node_id_ = node_id;
    validator.description_ = shape.description;
    const std::string where = node_id + ".output_schema";

    TypeDescriptor top;
    try {
        top = TypeDescriptor::parse(shape.type);
    } catch (const std::invalid_argument& e) {
        throw SchemaBuildError(where, e.what());
    }

    if (top.kind() != TypeKind::Object) {
        if (!shape.fields.empty()) {
            throw SchemaBuildError(where, "fields are only valid for 'object' output type");
        }
        validator.wrapped_ = true;
        validator.fields_.push_back({kWrappedField, std::move(top), shape.description});
        return validator;
    }

    if (shape.fields.empty()) {
        throw SchemaBuildError(where, "'object' output type requires at least one field");
    }

    std::unordered_set<std::string> seen;
    for (const auto& decl : shape.fields) {
        const std::string full = where + "." + decl.name;
        if (!is_identifier(decl.name)) {
            throw SchemaBuildError(full, "field name must be a valid identifier");
        }
        if (!seen.insert(decl.name).second) {
            throw SchemaBuildError(full, "duplicate output field");
        }
        TypeDescriptor type;
        try {
            type = TypeDescriptor::parse(decl.type);
        } catch (const std::invalid_argument& e) {
            throw SchemaBuildError(full, e.what());
        }
        if (type.kind() == TypeKind::Object) {
            throw SchemaBuildError(full, "nested object output fields are not supported");
        }
        validator.fields_.push_back({decl.name, std::move(type), decl.description});
    }
    return validator;
}

Value OutputValidator::validate(const Value& payload) const {
    Value record = payload;
    if (wrapped_ && !(payload.is_object() && payload.size() == 1 && payload.contains(kWrappedField))) {
        record = Value{{kWrappedField, payload}};
    }

    if (!record.is_object()) {
        throw OutputValidationError(node_id_, "<payload>", "object", describe_value_type(record));
    }

    for (const auto& [key, value] : record.items()) {
        bool declared = false;
        for (const auto& f : fields_) {
            if (f.name == key) { declared = true; break; }
        }
        if (!declared) {
            throw OutputValidationError(node_id_, key, "<absent>", describe_value_type(value));
        }
    }

    Value normalized = Value::object();
    for (const auto& f : fields_) {
        auto it = record.find(f.name);
        if (it == record.end() || it->is_null()) {
            throw OutputValidationError(node_id_, f.name, f.type.to_string(), it == record.end() ? "missing" : "null");
        }
        try {
            normalized[f.name] = f.type.conform(*it, f.name, /*coerce_to_str=*/true);
        } catch (const TypeMismatchError& e) {
            throw OutputValidationError(node_id_, e.mismatch().path, e.mismatch().expected, e.mismatch().actual);
        }
    }
    return normalized;
}

Value OutputValidator::json_schema() const {
    Value properties = Value::object();
    Value required = Value::array();
    for (const auto& f : fields_) {
        Value prop = f.type.json_schema();
        if (!f.description.empty()) prop["description"] = f.description;
        properties[f.name] = std::move(prop);
        required.push_back(f.name);
    }
    Value schema = {{"type", "object"}, {"properties", properties}, {"required", required},
                    {"additionalProperties", false}};
    if (!description_.empty()) schema["description"] = description_;
    return schema;
}

} // namespace agentgraph
