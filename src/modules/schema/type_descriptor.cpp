// modules/schema/type_descriptor.cpp
#include "modules/schema/type_descriptor.h"
#include "modules/schema/state_schema.h"
#include "common/utils/string_utils.h"
#include <stdexcept>

namespace agentgraph {

namespace {

// 在顶层（不在括号内）的第一个逗号处拆分
size_t find_top_level_comma(std::string_view s) {
    int depth = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '[') ++depth;
        else if (s[i] == ']') --depth;
        else if (s[i] == ',' && depth == 0) return i;
    }
    return std::string_view::npos;
}

const char* kind_name(TypeKind kind) {
    switch (kind) {
        case TypeKind::Str: return "str";
        case TypeKind::Int: return "int";
        case TypeKind::Float: return "float";
        case TypeKind::Bool: return "bool";
        case TypeKind::List: return "list";
        case TypeKind::Dict: return "dict";
        case TypeKind::Object: return "object";
    }
    return "unknown";
}

} // namespace

TypeMismatchError::TypeMismatchError(TypeMismatch mismatch)
    : mismatch_(std::move(mismatch)) {
    message_ = "field '" + mismatch_.path + "': expected " + mismatch_.expected + ", got " + mismatch_.actual;
}

std::string describe_value_type(const Value& value) {
    switch (value.type()) {
        case Value::value_t::null: return "null";
        case Value::value_t::boolean: return "bool";
        case Value::value_t::string: return "str";
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned: return "int";
        case Value::value_t::number_float: return "float";
        case Value::value_t::array: return "list";
        case Value::value_t::object: return "dict";
        default: return value.type_name();
    }
}

TypeDescriptor TypeDescriptor::parse(std::string_view type_string) {
    std::string s = trim(type_string);
    if (s.empty()) {
        throw std::invalid_argument("empty type string");
    }

    TypeDescriptor td;
    if (s == "str") { td.kind_ = TypeKind::Str; return td; }
    if (s == "int") { td.kind_ = TypeKind::Int; return td; }
    if (s == "float") { td.kind_ = TypeKind::Float; return td; }
    if (s == "bool") { td.kind_ = TypeKind::Bool; return td; }
    if (s == "list") { td.kind_ = TypeKind::List; return td; }
    if (s == "dict") { td.kind_ = TypeKind::Dict; return td; }
    if (s == "object") { td.kind_ = TypeKind::Object; return td; }

    auto open = s.find('[');
    if (open == std::string::npos || s.back() != ']') {
        throw std::invalid_argument("unsupported type '" + s + "'");
    }
    std::string base = trim(std::string_view(s).substr(0, open));
    std::string_view inner = std::string_view(s).substr(open + 1, s.size() - open - 2);
    if (trim(inner).empty()) {
        throw std::invalid_argument("empty type parameters in '" + s + "'");
    }

    if (base == "list") {
        if (find_top_level_comma(inner) != std::string_view::npos) {
            throw std::invalid_argument("list takes exactly one type parameter: '" + s + "'");
        }
        auto elem = parse(inner);
        if (elem.kind_ == TypeKind::Object) {
            throw std::invalid_argument("object is not allowed as a collection element: '" + s + "'");
        }
        td.kind_ = TypeKind::List;
        td.element_ = std::make_shared<const TypeDescriptor>(std::move(elem));
        return td;
    }
    if (base == "dict") {
        auto comma = find_top_level_comma(inner);
        if (comma == std::string_view::npos) {
            throw std::invalid_argument("dict requires key and value types: '" + s + "'");
        }
        auto key = parse(inner.substr(0, comma));
        auto value = parse(inner.substr(comma + 1));
        if (!key.is_scalar()) {
            throw std::invalid_argument("dict key type must be scalar: '" + s + "'");
        }
        if (value.kind_ == TypeKind::Object) {
            throw std::invalid_argument("object is not allowed as a collection element: '" + s + "'");
        }
        td.kind_ = TypeKind::Dict;
        td.key_ = std::make_shared<const TypeDescriptor>(std::move(key));
        td.element_ = std::make_shared<const TypeDescriptor>(std::move(value));
        return td;
    }
    throw std::invalid_argument("unsupported type '" + s + "'");
}

TypeDescriptor TypeDescriptor::object(std::shared_ptr<const StateSchema> nested) {
    TypeDescriptor td;
    td.kind_ = TypeKind::Object;
    td.nested_ = std::move(nested);
    return td;
}

bool TypeDescriptor::is_scalar() const {
    return kind_ == TypeKind::Str || kind_ == TypeKind::Int ||
           kind_ == TypeKind::Float || kind_ == TypeKind::Bool;
}

std::string TypeDescriptor::to_string() const {
    std::string out = kind_name(kind_);
    if (kind_ == TypeKind::List && element_) {
        out += "[" + element_->to_string() + "]";
    } else if (kind_ == TypeKind::Dict && key_ && element_) {
        out += "[" + key_->to_string() + "," + element_->to_string() + "]";
    }
    return out;
}

bool TypeDescriptor::same_shape(const TypeDescriptor& other) const {
    if (kind_ != other.kind_) return false;
    if (static_cast<bool>(element_) != static_cast<bool>(other.element_)) return false;
    if (static_cast<bool>(key_) != static_cast<bool>(other.key_)) return false;
    if (element_ && !element_->same_shape(*other.element_)) return false;
    if (key_ && !key_->same_shape(*other.key_)) return false;
    return true;
}

Value TypeDescriptor::conform(const Value& value, const std::string& path, bool coerce_to_str) const {
    auto mismatch = [&]() {
        return TypeMismatchError({path, to_string(), describe_value_type(value)});
    };

    switch (kind_) {
        case TypeKind::Str:
            if (value.is_string()) return value;
            if (coerce_to_str && (value.is_number() || value.is_boolean())) return value.dump();
            throw mismatch();
        case TypeKind::Int:
            if (value.is_number_integer()) return value;
            throw mismatch();
        case TypeKind::Float:
            if (value.is_number()) return value.get<double>();
            throw mismatch();
        case TypeKind::Bool:
            if (value.is_boolean()) return value;
            throw mismatch();
        case TypeKind::List: {
            if (!value.is_array()) throw mismatch();
            if (!element_) return value;
            Value out = Value::array();
            for (size_t i = 0; i < value.size(); ++i) {
                out.push_back(element_->conform(value[i], path + "[" + std::to_string(i) + "]", coerce_to_str));
            }
            return out;
        }
        case TypeKind::Dict: {
            if (!value.is_object()) throw mismatch();
            if (!element_) return value;
            Value out = Value::object();
            for (const auto& [k, v] : value.items()) {
                if (key_ && key_->kind_ == TypeKind::Int) {
                    try {
                        size_t consumed = 0;
                        (void)std::stoll(k, &consumed);
                        if (consumed != k.size()) throw std::invalid_argument(k);
                    } catch (const std::logic_error&) {
                        throw TypeMismatchError({path + "." + k, "int key", "str key"});
                    }
                }
                out[k] = element_->conform(v, path + "." + k, coerce_to_str);
            }
            return out;
        }
        case TypeKind::Object:
            if (!value.is_object()) throw mismatch();
            if (!nested_) return value;
            return nested_->conform_object(value, path, coerce_to_str);
    }
    throw mismatch();
}

Value TypeDescriptor::json_schema() const {
    switch (kind_) {
        case TypeKind::Str: return {{"type", "string"}};
        case TypeKind::Int: return {{"type", "integer"}};
        case TypeKind::Float: return {{"type", "number"}};
        case TypeKind::Bool: return {{"type", "boolean"}};
        case TypeKind::List: {
            Value schema = {{"type", "array"}};
            if (element_) schema["items"] = element_->json_schema();
            return schema;
        }
        case TypeKind::Dict: {
            Value schema = {{"type", "object"}};
            if (element_) schema["additionalProperties"] = element_->json_schema();
            return schema;
        }
        case TypeKind::Object:
            return nested_ ? nested_->json_schema() : Value{{"type", "object"}};
    }
    return Value::object();
}

} // namespace agentgraph
