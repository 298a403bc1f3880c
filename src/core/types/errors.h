// core/types/errors.h
#ifndef AGENTGRAPH_TYPES_ERRORS_H
#define AGENTGRAPH_TYPES_ERRORS_H

#include <stdexcept>
#include <string>
#include <vector>
#include <optional>

namespace agentgraph {

// 所有 agentgraph 异常的基类
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// --- 编译期错误：致命，不重试 ---

class SchemaBuildError : public Error {
public:
    SchemaBuildError(std::string field, const std::string& message)
        : Error("Schema error in field '" + field + "': " + message), field_(std::move(field)) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

class GraphStructureError : public Error {
public:
    explicit GraphStructureError(const std::string& message, std::string node_id = "")
        : Error(node_id.empty() ? "Graph error: " + message
                                : "Graph error at node '" + node_id + "': " + message),
          node_id_(std::move(node_id)) {}

    const std::string& node_id() const { return node_id_; }

private:
    std::string node_id_;
};

class SpecParseError : public Error {
public:
    SpecParseError(std::string location, const std::string& message)
        : Error("Workflow parse error at '" + location + "': " + message), location_(std::move(location)) {}

    const std::string& location() const { return location_; }

private:
    std::string location_;
};

// --- 运行期、节点范围的错误 ---

class TemplateResolutionError : public Error {
public:
    TemplateResolutionError(std::string path, std::optional<std::string> suggestion, std::vector<std::string> valid_paths);

    const std::string& path() const { return path_; }
    const std::optional<std::string>& suggestion() const { return suggestion_; }
    const std::vector<std::string>& valid_paths() const { return valid_paths_; }

private:
    std::string path_;
    std::optional<std::string> suggestion_;
    std::vector<std::string> valid_paths_;
};

class PredicateError : public Error {
public:
    PredicateError(std::string expression, const std::string& message)
        : Error("Predicate '" + expression + "': " + message), expression_(std::move(expression)) {}

    const std::string& expression() const { return expression_; }

private:
    std::string expression_;
};

class OutputValidationError : public Error {
public:
    OutputValidationError(std::string node_id, std::string field, std::string expected, std::string actual)
        : Error("Output of node '" + node_id + "' failed validation on field '" + field +
                "': expected " + expected + ", got " + actual),
          node_id_(std::move(node_id)), field_(std::move(field)),
          expected_(std::move(expected)), actual_(std::move(actual)) {}

    const std::string& node_id() const { return node_id_; }
    const std::string& field() const { return field_; }
    const std::string& expected() const { return expected_; }
    const std::string& actual() const { return actual_; }

private:
    std::string node_id_;
    std::string field_;
    std::string expected_;
    std::string actual_;
};

class StateUpdateError : public Error {
public:
    StateUpdateError(std::string field, const std::string& message)
        : Error("State update rejected for field '" + field + "': " + message), field_(std::move(field)) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

class SafetyError : public Error {
public:
    SafetyError(const std::string& message, std::string code_snippet = "")
        : Error("Sandbox safety violation: " + message), code_snippet_(std::move(code_snippet)) {}

    const std::string& code_snippet() const { return code_snippet_; }

private:
    std::string code_snippet_;
};

class ToolNotFoundError : public Error {
public:
    explicit ToolNotFoundError(std::string name)
        : Error("Tool '" + name + "' not registered"), name_(std::move(name)) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

// 能力调用失败：transient 可退避重试，permanent 立即失败
class TransientCapabilityError : public Error {
public:
    explicit TransientCapabilityError(const std::string& reason) : Error("Transient capability failure: " + reason) {}
};

class PermanentCapabilityError : public Error {
public:
    explicit PermanentCapabilityError(const std::string& reason) : Error("Capability failure: " + reason) {}
};

class UnknownPricingError : public Error {
public:
    UnknownPricingError(const std::string& provider, const std::string& model)
        : Error("No pricing for provider '" + provider + "' model '" + model + "'") {}
};

enum class Phase { Resolve, Invoke, Validate };

const char* to_string(Phase phase);

// 重试耗尽或不可恢复的能力失败
class NodeExecutionError : public Error {
public:
    NodeExecutionError(std::string node_id, Phase phase, const std::string& cause)
        : Error("Node '" + node_id + "' failed during " + to_string(phase) + ": " + cause),
          node_id_(std::move(node_id)), phase_(phase), cause_(cause) {}

    const std::string& node_id() const { return node_id_; }
    Phase phase() const { return phase_; }
    const std::string& cause() const { return cause_; }

private:
    std::string node_id_;
    Phase phase_;
    std::string cause_;
};

class RunCancelledError : public Error {
public:
    explicit RunCancelledError(const std::string& run_id) : Error("Run '" + run_id + "' was cancelled") {}
};

class RunNotFoundError : public Error {
public:
    explicit RunNotFoundError(const std::string& run_id) : Error("Unknown run id '" + run_id + "'") {}
};

} // namespace agentgraph

#endif // AGENTGRAPH_TYPES_ERRORS_H
