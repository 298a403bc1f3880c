// modules/schema/state_schema.cpp
#include "modules/schema/state_schema.h"
#include "core/types/errors.h"
#include "common/utils/string_utils.h"
#include <unordered_set>

namespace agentgraph {

namespace {

std::string join_path(const std::string& prefix, const std::string& name) {
    return prefix.empty() ? name : prefix + "." + name;
}

std::vector<std::string> field_names(const std::vector<StateField>& fields) {
    std::vector<std::string> names;
    names.reserve(fields.size());
    for (const auto& f : fields) names.push_back(f.name);
    return names;
}

} // namespace

const Value* find_path(const Value& root, std::string_view dot_path) {
    const Value* current = &root;
    for (const auto& segment : split(dot_path, '.')) {
        if (segment.empty()) return nullptr;
        if (current->is_object()) {
            auto it = current->find(segment);
            if (it == current->end()) return nullptr;
            current = &*it;
        } else if (current->is_array()) {
            size_t consumed = 0;
            size_t index = 0;
            try {
                index = std::stoul(segment, &consumed);
            } catch (const std::logic_error&) {
                return nullptr;
            }
            if (consumed != segment.size() || index >= current->size()) return nullptr;
            current = &(*current)[index];
        } else {
            return nullptr;
        }
    }
    return current;
}

// --- StateSchema ---

std::shared_ptr<const StateSchema> StateSchema::build(const std::vector<StateFieldDeclaration>& declarations) {
    if (declarations.empty()) {
        throw SchemaBuildError("<state>", "state must declare at least one field");
    }
    return build_level(declarations, "");
}

std::shared_ptr<StateSchema> StateSchema::build_level(const std::vector<StateFieldDeclaration>& declarations,
                                                      const std::string& prefix) {
    std::shared_ptr<StateSchema> schema(new StateSchema());
    std::unordered_set<std::string> seen;

    for (const auto& decl : declarations) {
        const std::string full = join_path(prefix, decl.name);
        if (!is_identifier(decl.name)) {
            throw SchemaBuildError(full, "field name must be a valid identifier");
        }
        if (!seen.insert(decl.name).second) {
            throw SchemaBuildError(full, "duplicate field");
        }
        if (decl.required && decl.default_value.has_value()) {
            throw SchemaBuildError(full, "required fields cannot have a default");
        }

        StateField field;
        field.name = decl.name;
        field.required = decl.required;
        field.description = decl.description;

        TypeDescriptor parsed;
        try {
            parsed = TypeDescriptor::parse(decl.type);
        } catch (const std::invalid_argument& e) {
            throw SchemaBuildError(full, e.what());
        }

        if (parsed.kind() == TypeKind::Object) {
            if (decl.schema.empty()) {
                throw SchemaBuildError(full, "object type requires a non-empty nested schema");
            }
            field.type = TypeDescriptor::object(build_level(decl.schema, full));
        } else {
            if (!decl.schema.empty()) {
                throw SchemaBuildError(full, "nested schema is only valid for 'object' fields");
            }
            field.type = std::move(parsed);
        }

        if (decl.default_value.has_value() && !decl.default_value->is_null()) {
            try {
                field.default_value = field.type.conform(*decl.default_value, full);
            } catch (const TypeMismatchError& e) {
                throw SchemaBuildError(full, std::string("invalid default: ") + e.what());
            }
        } else if (decl.default_value.has_value()) {
            field.default_value = Value(nullptr);
        }

        schema->fields_.push_back(std::move(field));
    }
    return schema;
}

const StateField* StateSchema::field(std::string_view name) const {
    for (const auto& f : fields_) {
        if (f.name == name) return &f;
    }
    return nullptr;
}

bool StateSchema::has_path(std::string_view dot_path) const {
    auto segments = split(dot_path, '.');
    const StateSchema* level = this;
    for (size_t i = 0; i < segments.size(); ++i) {
        const StateField* f = level->field(segments[i]);
        if (!f) return false;
        const TypeDescriptor& type = f->type;
        if (type.kind() == TypeKind::Dict || type.kind() == TypeKind::List) {
            return true;
        }
        if (type.kind() != TypeKind::Object || !type.nested()) {
            return i + 1 == segments.size();
        }
        level = type.nested().get();
    }
    return true;
}

std::vector<std::string> StateSchema::field_paths() const {
    std::vector<std::string> paths;
    for (const auto& f : fields_) {
        paths.push_back(f.name);
        if (f.type.nested()) {
            for (const auto& sub : f.type.nested()->field_paths()) {
                paths.push_back(f.name + "." + sub);
            }
        }
    }
    return paths;
}

Value StateSchema::json_schema() const {
    Value properties = Value::object();
    Value required = Value::array();
    for (const auto& f : fields_) {
        Value prop = f.type.json_schema();
        if (!f.description.empty()) prop["description"] = f.description;
        properties[f.name] = std::move(prop);
        if (f.required) required.push_back(f.name);
    }
    return {{"type", "object"}, {"properties", properties}, {"required", required}};
}

Value StateSchema::conform_object(const Value& value, const std::string& path, bool coerce_to_str) const {
    Value out = Value::object();
    for (const auto& [key, _] : value.items()) {
        if (!field(key)) {
            std::string actual = "undeclared key";
            if (auto hint = closest_match(key, field_names(fields_))) {
                actual += " (did you mean '" + *hint + "'?)";
            }
            throw TypeMismatchError({join_path(path, key), "a declared field", actual});
        }
    }

    for (const auto& f : fields_) {
        const std::string full = join_path(path, f.name);
        auto it = value.find(f.name);
        if (it != value.end() && !it->is_null()) {
            out[f.name] = f.type.conform(*it, full, coerce_to_str);
        } else if (it != value.end()) {
            if (f.required) {
                throw TypeMismatchError({full, f.type.to_string(), "null"});
            }
            out[f.name] = nullptr;
        } else if (f.default_value.has_value()) {
            out[f.name] = *f.default_value; // 深拷贝
        } else if (f.required) {
            throw TypeMismatchError({full, f.type.to_string(), "missing required field"});
        } else {
            out[f.name] = nullptr;
        }
    }
    return out;
}

TypedState StateSchema::instantiate(const Value& inputs) const {
    if (!inputs.is_null() && !inputs.is_object()) {
        throw SchemaBuildError("<inputs>", "initial state inputs must be a mapping, got " + describe_value_type(inputs));
    }
    try {
        Value values = conform_object(inputs.is_null() ? Value::object() : inputs, "");
        return TypedState(shared_from_this(), std::move(values));
    } catch (const TypeMismatchError& e) {
        throw SchemaBuildError(e.mismatch().path, "expected " + e.mismatch().expected + ", got " + e.mismatch().actual);
    }
}

// --- TypedState ---

TypedState::TypedState(std::shared_ptr<const StateSchema> schema, Value values)
    : schema_(std::move(schema)), data_(std::make_shared<const Value>(std::move(values))) {}

const Value* TypedState::find(std::string_view dot_path) const {
    return find_path(*data_, dot_path);
}

TypedState TypedState::with_updates(const Value& updates) const {
    if (!updates.is_object()) {
        throw StateUpdateError("<updates>", "updates must be a mapping");
    }
    Value next = *data_;
    for (const auto& [key, value] : updates.items()) {
        const StateField* f = schema_->field(key);
        if (!f) {
            throw StateUpdateError(key, "not a declared state field");
        }
        if (value.is_null()) {
            if (f->required) {
                throw StateUpdateError(key, "required field cannot be null");
            }
            next[key] = nullptr;
            continue;
        }
        try {
            next[key] = f->type.conform(value, key);
        } catch (const TypeMismatchError& e) {
            throw StateUpdateError(key, e.what());
        }
    }
    return TypedState(schema_, std::move(next));
}

TypedState TypedState::clone() const {
    return TypedState(schema_, Value(*data_));
}

} // namespace agentgraph
