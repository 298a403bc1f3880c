// modules/resolver/template_resolver.cpp
#include "modules/resolver/template_resolver.h"
#include "core/types/errors.h"
#include "common/utils/string_utils.h"
#include <regex>

namespace agentgraph {

namespace {

const std::regex& placeholder_pattern() {
    static const std::regex pattern(R"(\{([a-zA-Z_][a-zA-Z0-9_\.]*)\})");
    return pattern;
}

std::vector<std::string> known_paths(const Value& inputs, const TypedState& state) {
    std::vector<std::string> paths;
    if (inputs.is_object()) {
        for (const auto& [key, _] : inputs.items()) paths.push_back(key);
    }
    for (const auto& p : state.schema().field_paths()) paths.push_back(p);
    return paths;
}

} // namespace

std::string TemplateResolver::strip_state_prefix(std::string_view path) {
    constexpr std::string_view prefix = "state.";
    if (path.substr(0, prefix.size()) == prefix) {
        return std::string(path.substr(prefix.size()));
    }
    return std::string(path);
}

std::string TemplateResolver::stringify(const Value& value) {
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

const Value& TemplateResolver::lookup(std::string_view raw_path, const Value& inputs, const TypedState& state) {
    std::string path = strip_state_prefix(raw_path);

    // 输入映射优先（包括 {local.sub} 形式）
    if (inputs.is_object()) {
        if (const Value* v = find_path(inputs, path)) return *v;
    }
    if (const Value* v = state.find(path)) return *v;

    auto candidates = known_paths(inputs, state);
    auto suggestion = closest_match(path, candidates);
    throw TemplateResolutionError(path, suggestion, candidates);
}

std::string TemplateResolver::resolve(const std::string& template_str, const Value& inputs, const TypedState& state) {
    std::string out;
    out.reserve(template_str.size());

    auto begin = std::sregex_iterator(template_str.begin(), template_str.end(), placeholder_pattern());
    auto end = std::sregex_iterator();
    size_t last = 0;
    for (auto it = begin; it != end; ++it) {
        const auto& match = *it;
        out.append(template_str, last, static_cast<size_t>(match.position()) - last);
        out += stringify(lookup(match[1].str(), inputs, state));
        last = static_cast<size_t>(match.position() + match.length());
    }
    out.append(template_str, last, std::string::npos);
    return out;
}

Value TemplateResolver::resolve_inputs(const std::map<std::string, std::string>& mapping, const TypedState& state) {
    Value resolved = Value::object();
    const Value no_inputs = Value::object();
    std::smatch match;
    for (const auto& [local, tmpl] : mapping) {
        std::string trimmed = trim(tmpl);
        if (std::regex_match(trimmed, match, placeholder_pattern())) {
            resolved[local] = lookup(match[1].str(), no_inputs, state);
        } else {
            resolved[local] = resolve(tmpl, no_inputs, state);
        }
    }
    return resolved;
}

std::vector<std::string> TemplateResolver::extract_variables(const std::string& template_str) {
    std::vector<std::string> vars;
    auto begin = std::sregex_iterator(template_str.begin(), template_str.end(), placeholder_pattern());
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        vars.push_back(strip_state_prefix((*it)[1].str()));
    }
    return vars;
}

} // namespace agentgraph
