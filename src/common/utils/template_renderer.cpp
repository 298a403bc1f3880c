// common/utils/template_renderer.cpp
#include "common/utils/template_renderer.h"
#include <filesystem>
#include <stdexcept>

namespace agentgraph {

namespace {

const char* kClarificationTemplate =
    "{{ original_prompt }}\n\n"
    "Your previous answer (attempt {{ attempt }}) was rejected: {{ error }}\n"
    "Respond ONLY with a JSON object that matches this schema exactly:\n"
    "{{ schema }}\n"
    "## for field in fields\n"
    "- \"{{ field.name }}\": {{ field.type }}\n"
    "## endfor\n";

} // namespace

InjaTemplateRenderer::InjaTemplateRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_line_statement("##");
    env_.set_trim_blocks(true);

    configure_security();
}

void InjaTemplateRenderer::configure_security() {
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled for security.", inja::SourceLocation{});
    });
}

std::string InjaTemplateRenderer::render(std::string_view template_str, const Value& data) {
    static InjaTemplateRenderer renderer;
    try {
        return renderer.env_.render(template_str, data);
    } catch (const inja::InjaError& e) {
        throw std::runtime_error("Template render error: " + std::string(e.message));
    }
}

std::string InjaTemplateRenderer::render_clarification(const std::string& original_prompt,
                                                       const Value& output_schema,
                                                       const std::string& validation_error,
                                                       int attempt) {
    Value fields = Value::array();
    if (output_schema.contains("properties")) {
        for (const auto& [name, prop] : output_schema["properties"].items()) {
            fields.push_back({{"name", name}, {"type", prop.value("type", "any")}});
        }
    }

    Value data;
    data["original_prompt"] = original_prompt;
    data["attempt"] = attempt;
    data["error"] = validation_error;
    data["schema"] = output_schema.dump();
    data["fields"] = fields;
    return render(kClarificationTemplate, data);
}

} // namespace agentgraph
