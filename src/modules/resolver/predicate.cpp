// modules/resolver/predicate.cpp
#include "modules/resolver/predicate.h"
#include "modules/resolver/template_resolver.h"
#include "core/types/errors.h"
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>

namespace agentgraph {

struct Predicate::Node {
    enum class Kind { Literal, Path, Negate, Not, And, Or, Binary };

    Kind kind = Kind::Literal;
    Value literal;
    std::string text; // path 或运算符
    std::shared_ptr<const Node> lhs;
    std::shared_ptr<const Node> rhs;
};

namespace {

using NodePtr = std::shared_ptr<const Predicate::Node>;
using Kind = Predicate::Node::Kind;

enum class TokenType { Literal, String, Identifier, Operator, LParen, RParen, End };

struct Token {
    TokenType type;
    std::string text;
    Value value;
    size_t offset;
};

bool is_comparison(const std::string& op) {
    return op == "==" || op == "!=" || op == "<" || op == "<=" || op == ">" || op == ">=";
}

// --- 词法分析 ---

std::vector<Token> tokenize(const std::string& src) {
    std::vector<Token> tokens;
    size_t i = 0;
    while (i < src.size()) {
        char c = src[i];
        if (std::isspace(static_cast<unsigned char>(c))) { ++i; continue; }

        size_t start = i;
        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && i + 1 < src.size() && std::isdigit(static_cast<unsigned char>(src[i + 1])))) {
            bool is_float = false;
            while (i < src.size() && (std::isdigit(static_cast<unsigned char>(src[i])) || src[i] == '.')) {
                if (src[i] == '.') is_float = true;
                ++i;
            }
            if (i < src.size() && (src[i] == 'e' || src[i] == 'E')) {
                is_float = true;
                ++i;
                if (i < src.size() && (src[i] == '+' || src[i] == '-')) ++i;
                while (i < src.size() && std::isdigit(static_cast<unsigned char>(src[i]))) ++i;
            }
            std::string text = src.substr(start, i - start);
            Value v;
            try {
                v = is_float ? Value(std::stod(text)) : Value(std::stoll(text));
            } catch (const std::logic_error&) {
                throw PredicateError(src, "invalid number '" + text + "' at offset " + std::to_string(start));
            }
            tokens.push_back({TokenType::Literal, text, v, start});
            continue;
        }

        if (c == '"' || c == '\'') {
            char quote = c;
            std::string text;
            ++i;
            bool closed = false;
            while (i < src.size()) {
                if (src[i] == '\\' && i + 1 < src.size()) {
                    text += src[i + 1];
                    i += 2;
                    continue;
                }
                if (src[i] == quote) { closed = true; ++i; break; }
                text += src[i++];
            }
            if (!closed) {
                throw PredicateError(src, "unterminated string literal at offset " + std::to_string(start));
            }
            tokens.push_back({TokenType::String, text, Value(text), start});
            continue;
        }

        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            while (i < src.size() && (std::isalnum(static_cast<unsigned char>(src[i])) || src[i] == '_' || src[i] == '.')) {
                ++i;
            }
            std::string text = src.substr(start, i - start);
            if (text.back() == '.') {
                throw PredicateError(src, "path '" + text + "' ends with '.'");
            }
            if (text == "and" || text == "or" || text == "not") {
                tokens.push_back({TokenType::Operator, text, nullptr, start});
            } else if (text == "true" || text == "True") {
                tokens.push_back({TokenType::Literal, text, true, start});
            } else if (text == "false" || text == "False") {
                tokens.push_back({TokenType::Literal, text, false, start});
            } else if (text == "null" || text == "None") {
                tokens.push_back({TokenType::Literal, text, nullptr, start});
            } else {
                tokens.push_back({TokenType::Identifier, text, nullptr, start});
            }
            continue;
        }

        if (c == '(') { tokens.push_back({TokenType::LParen, "(", nullptr, start}); ++i; continue; }
        if (c == ')') { tokens.push_back({TokenType::RParen, ")", nullptr, start}); ++i; continue; }

        std::string two = src.substr(i, 2);
        if (two == "==" || two == "!=" || two == "<=" || two == ">=" || two == "&&" || two == "||") {
            std::string op = two == "&&" ? "and" : two == "||" ? "or" : two;
            tokens.push_back({TokenType::Operator, op, nullptr, start});
            i += 2;
            continue;
        }
        if (c == '<' || c == '>' || c == '+' || c == '-' || c == '*' || c == '/' || c == '%') {
            tokens.push_back({TokenType::Operator, std::string(1, c), nullptr, start});
            ++i;
            continue;
        }
        if (c == '!') {
            tokens.push_back({TokenType::Operator, "not", nullptr, start});
            ++i;
            continue;
        }
        throw PredicateError(src, std::string("unexpected character '") + c + "' at offset " + std::to_string(start));
    }
    tokens.push_back({TokenType::End, "", nullptr, src.size()});
    return tokens;
}

// --- 语法分析（递归下降）---

class Parser {
public:
    Parser(const std::string& source, std::vector<std::string>& paths)
        : source_(source), tokens_(tokenize(source)), paths_(paths) {}

    NodePtr parse() {
        auto node = parse_or();
        if (peek().type != TokenType::End) {
            fail("unexpected token '" + peek().text + "'");
        }
        return node;
    }

private:
    const std::string& source_;
    std::vector<Token> tokens_;
    size_t pos_ = 0;
    std::vector<std::string>& paths_;

    const Token& peek() const { return tokens_[pos_]; }
    const Token& advance() { return tokens_[pos_++]; }

    bool accept_operator(const std::string& op) {
        if (peek().type == TokenType::Operator && peek().text == op) {
            ++pos_;
            return true;
        }
        return false;
    }

    [[noreturn]] void fail(const std::string& message) const {
        throw PredicateError(source_, message + " at offset " + std::to_string(peek().offset));
    }

    static NodePtr make(Kind kind, std::string text, NodePtr lhs, NodePtr rhs = nullptr) {
        auto node = std::make_shared<Predicate::Node>();
        node->kind = kind;
        node->text = std::move(text);
        node->lhs = std::move(lhs);
        node->rhs = std::move(rhs);
        return node;
    }

    NodePtr parse_or() {
        auto lhs = parse_and();
        while (accept_operator("or")) {
            lhs = make(Kind::Or, "or", lhs, parse_and());
        }
        return lhs;
    }

    NodePtr parse_and() {
        auto lhs = parse_not();
        while (accept_operator("and")) {
            lhs = make(Kind::And, "and", lhs, parse_not());
        }
        return lhs;
    }

    NodePtr parse_not() {
        if (accept_operator("not")) {
            return make(Kind::Not, "not", parse_not());
        }
        return parse_comparison();
    }

    NodePtr parse_comparison() {
        auto lhs = parse_additive();
        if (peek().type == TokenType::Operator && is_comparison(peek().text)) {
            std::string op = advance().text;
            auto rhs = parse_additive();
            if (peek().type == TokenType::Operator && is_comparison(peek().text)) {
                fail("chained comparisons are not supported");
            }
            return make(Kind::Binary, op, lhs, rhs);
        }
        return lhs;
    }

    NodePtr parse_additive() {
        auto lhs = parse_multiplicative();
        while (peek().type == TokenType::Operator && (peek().text == "+" || peek().text == "-")) {
            std::string op = advance().text;
            lhs = make(Kind::Binary, op, lhs, parse_multiplicative());
        }
        return lhs;
    }

    NodePtr parse_multiplicative() {
        auto lhs = parse_unary();
        while (peek().type == TokenType::Operator &&
               (peek().text == "*" || peek().text == "/" || peek().text == "%")) {
            std::string op = advance().text;
            lhs = make(Kind::Binary, op, lhs, parse_unary());
        }
        return lhs;
    }

    NodePtr parse_unary() {
        if (accept_operator("-")) {
            return make(Kind::Negate, "-", parse_unary());
        }
        return parse_primary();
    }

    NodePtr parse_primary() {
        const Token& tok = peek();
        switch (tok.type) {
            case TokenType::Literal:
            case TokenType::String: {
                auto node = std::make_shared<Predicate::Node>();
                node->kind = Kind::Literal;
                node->literal = tok.value;
                ++pos_;
                return node;
            }
            case TokenType::Identifier: {
                auto node = std::make_shared<Predicate::Node>();
                node->kind = Kind::Path;
                node->text = TemplateResolver::strip_state_prefix(tok.text);
                paths_.push_back(node->text);
                ++pos_;
                if (peek().type == TokenType::LParen) {
                    fail("function calls are not allowed");
                }
                return node;
            }
            case TokenType::LParen: {
                ++pos_;
                auto inner = parse_or();
                if (peek().type != TokenType::RParen) {
                    fail("expected ')'");
                }
                ++pos_;
                return inner;
            }
            case TokenType::End:
                fail("unexpected end of expression");
            default:
                fail("unexpected token '" + tok.text + "'");
        }
    }
};

// --- 求值 ---

// 超出 int64 的无符号整数按浮点处理
bool fits_int64(const Value& v) {
    if (v.is_number_unsigned()) {
        return v.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    }
    return v.is_number_integer();
}

Value arithmetic(const std::string& source, const std::string& op, const Value& a, const Value& b) {
    if (op == "+" && a.is_string() && b.is_string()) {
        return a.get<std::string>() + b.get<std::string>();
    }
    if (!a.is_number() || !b.is_number()) {
        throw PredicateError(source, "operator '" + op + "' needs numbers, got " +
                             describe_value_type(a) + " and " + describe_value_type(b));
    }
    bool both_int = fits_int64(a) && fits_int64(b);
    if (op == "/") {
        if (b.get<double>() == 0.0) throw PredicateError(source, "division by zero");
        return a.get<double>() / b.get<double>();
    }
    if (op == "%") {
        if (b.get<double>() == 0.0) throw PredicateError(source, "modulo by zero");
        if (both_int) {
            int64_t y = b.get<int64_t>();
            if (y == -1) return int64_t{0}; // INT64_MIN % -1 会触发 SIGFPE
            return a.get<int64_t>() % y;
        }
        return std::fmod(a.get<double>(), b.get<double>());
    }
    if (both_int) {
        int64_t x = a.get<int64_t>();
        int64_t y = b.get<int64_t>();
        int64_t out = 0;
        bool overflow;
        if (op == "+") {
            overflow = __builtin_add_overflow(x, y, &out);
        } else if (op == "-") {
            overflow = __builtin_sub_overflow(x, y, &out);
        } else {
            overflow = __builtin_mul_overflow(x, y, &out);
        }
        if (overflow) throw PredicateError(source, "integer overflow in '" + op + "'");
        return out;
    }
    double x = a.get<double>();
    double y = b.get<double>();
    if (op == "+") return x + y;
    if (op == "-") return x - y;
    return x * y;
}

bool compare(const std::string& source, const std::string& op, const Value& a, const Value& b) {
    if (op == "==" || op == "!=") {
        bool equal = (a.is_number() && b.is_number()) ? a.get<double>() == b.get<double>() : a == b;
        return op == "==" ? equal : !equal;
    }
    // 与 null 的大小比较恒为假（可选字段尚未赋值）
    if (a.is_null() || b.is_null()) {
        return false;
    }
    int ordering = 0;
    if (a.is_number() && b.is_number()) {
        double x = a.get<double>();
        double y = b.get<double>();
        ordering = x < y ? -1 : (x > y ? 1 : 0);
    } else if (a.is_string() && b.is_string()) {
        ordering = a.get<std::string>().compare(b.get<std::string>());
    } else {
        throw PredicateError(source, "cannot order " + describe_value_type(a) + " and " + describe_value_type(b));
    }
    if (op == "<") return ordering < 0;
    if (op == "<=") return ordering <= 0;
    if (op == ">") return ordering > 0;
    return ordering >= 0;
}

Value eval(const std::string& source, const Predicate::Node& node, const TypedState& state, const Value& locals) {
    switch (node.kind) {
        case Kind::Literal:
            return node.literal;
        case Kind::Path:
            return TemplateResolver::lookup(node.text, locals, state);
        case Kind::Not:
            return !truthy(eval(source, *node.lhs, state, locals));
        case Kind::And:
            return truthy(eval(source, *node.lhs, state, locals)) && truthy(eval(source, *node.rhs, state, locals));
        case Kind::Or:
            return truthy(eval(source, *node.lhs, state, locals)) || truthy(eval(source, *node.rhs, state, locals));
        case Kind::Negate: {
            Value v = eval(source, *node.lhs, state, locals);
            if (fits_int64(v)) {
                int64_t x = v.get<int64_t>();
                if (x == std::numeric_limits<int64_t>::min()) {
                    throw PredicateError(source, "integer overflow in unary '-'");
                }
                return -x;
            }
            if (v.is_number()) return -v.get<double>();
            throw PredicateError(source, "unary '-' needs a number, got " + describe_value_type(v));
        }
        case Kind::Binary: {
            Value a = eval(source, *node.lhs, state, locals);
            Value b = eval(source, *node.rhs, state, locals);
            if (is_comparison(node.text)) return compare(source, node.text, a, b);
            return arithmetic(source, node.text, a, b);
        }
    }
    throw PredicateError(source, "malformed expression");
}

} // namespace

bool truthy(const Value& value) {
    switch (value.type()) {
        case Value::value_t::null: return false;
        case Value::value_t::boolean: return value.get<bool>();
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
        case Value::value_t::number_float: return value.get<double>() != 0.0;
        case Value::value_t::string: return !value.get<std::string>().empty();
        case Value::value_t::array:
        case Value::value_t::object: return !value.empty();
        default: return true;
    }
}

Predicate Predicate::parse(const std::string& source) {
    Predicate predicate;
    predicate.source_ = source;
    Parser parser(source, predicate.paths_);
    predicate.root_ = parser.parse();
    return predicate;
}

Value Predicate::evaluate_value(const TypedState& state, const Value& locals) const {
    return eval(source_, *root_, state, locals);
}

bool Predicate::evaluate(const TypedState& state, const Value& locals) const {
    return truthy(evaluate_value(state, locals));
}

} // namespace agentgraph
