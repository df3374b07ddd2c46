#include <ccmatch/expression.hpp>
#include <ccmatch/errors.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace ccmatch {
namespace expr {

const char* op_symbol(OpCode op) {
    switch (op) {
        case OpCode::Add: return "+";
        case OpCode::Subtract: return "-";
        case OpCode::Multiply: return "*";
        case OpCode::Divide: return "/";
        case OpCode::Equal: return "==";
        case OpCode::NotEqual: return "!=";
        case OpCode::Less: return "<";
        case OpCode::LessEqual: return "<=";
        case OpCode::Greater: return ">";
        case OpCode::GreaterEqual: return ">=";
        case OpCode::And: return "&";
        case OpCode::Or: return "|";
        case OpCode::Not: return "!";
        case OpCode::Negate: return "-";
    }
    return "?";
}

namespace {

Value truth(bool b) {
    return Value(b ? 1 : 0);
}

// NA stays NA; everything else is read as a truth value
std::optional<bool> as_truth(const Value& v) {
    switch (v.type()) {
        case Value::Type::Null:
            return std::nullopt;
        case Value::Type::Integer:
            return v.as_integer() != 0;
        case Value::Type::Real:
            if (std::isnan(v.as_real())) return std::nullopt;
            return v.as_real() != 0.0;
        case Value::Type::String:
            return !v.as_string().empty();
        case Value::Type::Date:
            return true;
    }
    return std::nullopt;
}

[[noreturn]] void type_error(OpCode op, const Value& a, const Value& b) {
    throw std::runtime_error(std::string("extra_conditions: cannot apply '") + op_symbol(op) +
                             "' to " + type_name(a.type()) + " and " + type_name(b.type()));
}

// Date moved by a whole number of days; NA when the result leaves the Date range
Value shift_date(const Date& date, double days) {
    constexpr double limit = std::numeric_limits<std::int32_t>::max();
    if (!std::isfinite(days) || std::fabs(days) > 2 * limit) return Value::na();

    std::int64_t shifted = static_cast<std::int64_t>(date.days) + std::llround(days);
    if (shifted < std::numeric_limits<std::int32_t>::min() ||
        shifted > std::numeric_limits<std::int32_t>::max()) {
        return Value::na();
    }
    return Value(Date(static_cast<std::int32_t>(shifted)));
}

Value arithmetic(OpCode op, const Value& a, const Value& b) {
    if (a.is_na() || b.is_na()) return Value::na();

    if (a.is_numeric() && b.is_numeric()) {
        if (a.is_integer() && b.is_integer() && op != OpCode::Divide) {
            std::int64_t x = a.as_integer(), y = b.as_integer();
            std::int64_t r = 0;
            bool overflow = false;
            switch (op) {
                case OpCode::Add: overflow = __builtin_add_overflow(x, y, &r); break;
                case OpCode::Subtract: overflow = __builtin_sub_overflow(x, y, &r); break;
                case OpCode::Multiply: overflow = __builtin_mul_overflow(x, y, &r); break;
                default: break;
            }
            // Integer overflow is NA, as in R
            return overflow ? Value::na() : Value(r);
        }
        double x = a.as_real(), y = b.as_real();
        switch (op) {
            case OpCode::Add: return Value(x + y);
            case OpCode::Subtract: return Value(x - y);
            case OpCode::Multiply: return Value(x * y);
            case OpCode::Divide:
                if (y == 0.0) return Value::na();
                return Value(x / y);
            default: break;
        }
    }

    // Date arithmetic: date +/- days, date - date
    if (a.is_date() || b.is_date()) {
        if (a.is_date() && b.is_numeric() && (op == OpCode::Add || op == OpCode::Subtract)) {
            return shift_date(a.as_date(), op == OpCode::Add ? b.as_real() : -b.as_real());
        }
        if (a.is_numeric() && b.is_date() && op == OpCode::Add) {
            return shift_date(b.as_date(), a.as_real());
        }
        if (op == OpCode::Subtract) {
            auto x = a.to_date();
            auto y = b.to_date();
            if (x && y && (a.is_date() || a.is_string()) && (b.is_date() || b.is_string())) {
                return Value(static_cast<std::int64_t>(x->days) - y->days);
            }
        }
    }

    type_error(op, a, b);
}

Value comparison(OpCode op, const Value& a, const Value& b) {
    if (a.is_na() || b.is_na()) return Value::na();

    if (op == OpCode::Equal || op == OpCode::NotEqual) {
        bool equal;
        if ((a.is_date() && b.is_string()) || (a.is_string() && b.is_date())) {
            auto order = a.compare(b);
            if (!order) return Value::na();
            equal = *order == 0;
        } else {
            equal = a.equals(b);
        }
        return truth(op == OpCode::Equal ? equal : !equal);
    }

    auto order = a.compare(b);
    if (!order) return Value::na();

    switch (op) {
        case OpCode::Less: return truth(*order < 0);
        case OpCode::LessEqual: return truth(*order <= 0);
        case OpCode::Greater: return truth(*order > 0);
        case OpCode::GreaterEqual: return truth(*order >= 0);
        default: break;
    }
    return Value::na();
}

class LiteralNode : public Node {
private:
    Value value_;

public:
    explicit LiteralNode(Value value) : value_(std::move(value)) {}

    Value evaluate(const Row&, const Row&) const override { return value_; }
    void bind(const Table&, const Table&) override {}
    void collect_fields(std::vector<FieldRef>&) const override {}

    std::string to_string() const override {
        if (value_.is_string()) return "'" + value_.as_string() + "'";
        return value_.to_string();
    }

    const Value& value() const { return value_; }
};

class FieldNode : public Node {
private:
    FieldRef field_;
    std::size_t column_ = 0;

public:
    explicit FieldNode(FieldRef field) : field_(std::move(field)) {}

    Value evaluate(const Row& case_row, const Row& control_row) const override {
        return field_.scope == FieldScope::Case ? case_row[column_] : control_row[column_];
    }

    void bind(const Table& cases, const Table& controls) override {
        const Table& table = field_.scope == FieldScope::Case ? cases : controls;
        auto index = table.find_column(field_.name);
        if (!index) {
            throw ConfigurationError::missing_column(
                "extra_conditions", field_.name,
                field_.scope == FieldScope::Case ? "cases" : "control pool");
        }
        column_ = *index;
    }

    void collect_fields(std::vector<FieldRef>& out) const override {
        if (std::find(out.begin(), out.end(), field_) == out.end()) {
            out.push_back(field_);
        }
    }

    std::string to_string() const override {
        return (field_.scope == FieldScope::Case ? "case." : "control.") + field_.name;
    }
};

class UnaryNode : public Node {
private:
    OpCode op_;
    NodePtr operand_;

public:
    UnaryNode(OpCode op, NodePtr operand) : op_(op), operand_(std::move(operand)) {}

    Value evaluate(const Row& case_row, const Row& control_row) const override {
        Value v = operand_->evaluate(case_row, control_row);
        if (op_ == OpCode::Not) {
            auto t = as_truth(v);
            return t ? truth(!*t) : Value::na();
        }
        if (v.is_na()) return v;
        if (v.is_integer()) {
            if (v.as_integer() == std::numeric_limits<std::int64_t>::min()) return Value::na();
            return Value(-v.as_integer());
        }
        if (v.is_real()) return Value(-v.as_real());
        throw std::runtime_error(std::string("extra_conditions: cannot negate ") + type_name(v.type()));
    }

    void bind(const Table& cases, const Table& controls) override {
        operand_->bind(cases, controls);
    }

    void collect_fields(std::vector<FieldRef>& out) const override {
        operand_->collect_fields(out);
    }

    std::string to_string() const override {
        return std::string("(") + op_symbol(op_) + operand_->to_string() + ")";
    }
};

class BinaryNode : public Node {
private:
    OpCode op_;
    NodePtr lhs_;
    NodePtr rhs_;

public:
    BinaryNode(OpCode op, NodePtr lhs, NodePtr rhs)
        : op_(op), lhs_(std::move(lhs)), rhs_(std::move(rhs)) {}

    Value evaluate(const Row& case_row, const Row& control_row) const override {
        if (op_ == OpCode::And || op_ == OpCode::Or) {
            auto a = as_truth(lhs_->evaluate(case_row, control_row));
            // Short circuit on a decisive left operand
            if (op_ == OpCode::And && a && !*a) return truth(false);
            if (op_ == OpCode::Or && a && *a) return truth(true);

            auto b = as_truth(rhs_->evaluate(case_row, control_row));
            if (op_ == OpCode::And) {
                if (b && !*b) return truth(false);
                if (a && b) return truth(true);
            } else {
                if (b && *b) return truth(true);
                if (a && b) return truth(false);
            }
            return Value::na();
        }

        Value a = lhs_->evaluate(case_row, control_row);
        Value b = rhs_->evaluate(case_row, control_row);

        switch (op_) {
            case OpCode::Add:
            case OpCode::Subtract:
            case OpCode::Multiply:
            case OpCode::Divide:
                return arithmetic(op_, a, b);
            default:
                return comparison(op_, a, b);
        }
    }

    void bind(const Table& cases, const Table& controls) override {
        lhs_->bind(cases, controls);
        rhs_->bind(cases, controls);
    }

    void collect_fields(std::vector<FieldRef>& out) const override {
        lhs_->collect_fields(out);
        rhs_->collect_fields(out);
    }

    std::string to_string() const override {
        return "(" + lhs_->to_string() + " " + op_symbol(op_) + " " + rhs_->to_string() + ")";
    }
};

class InNode : public Node {
private:
    NodePtr operand_;
    std::vector<Value> choices_;

public:
    InNode(NodePtr operand, std::vector<Value> choices)
        : operand_(std::move(operand)), choices_(std::move(choices)) {}

    Value evaluate(const Row& case_row, const Row& control_row) const override {
        Value v = operand_->evaluate(case_row, control_row);
        if (v.is_na()) return truth(false);
        for (const auto& choice : choices_) {
            if (v.equals(choice)) return truth(true);
            if (v.is_date() && choice.is_string()) {
                auto order = v.compare(choice);
                if (order && *order == 0) return truth(true);
            }
        }
        return truth(false);
    }

    void bind(const Table& cases, const Table& controls) override {
        operand_->bind(cases, controls);
    }

    void collect_fields(std::vector<FieldRef>& out) const override {
        operand_->collect_fields(out);
    }

    std::string to_string() const override {
        std::string text = "(" + operand_->to_string() + " in (";
        for (std::size_t i = 0; i < choices_.size(); ++i) {
            if (i) text += ", ";
            text += choices_[i].is_string() ? "'" + choices_[i].as_string() + "'" : choices_[i].to_string();
        }
        return text + "))";
    }
};

class IsNaNode : public Node {
private:
    NodePtr operand_;

public:
    explicit IsNaNode(NodePtr operand) : operand_(std::move(operand)) {}

    Value evaluate(const Row& case_row, const Row& control_row) const override {
        return truth(operand_->evaluate(case_row, control_row).is_na());
    }

    void bind(const Table& cases, const Table& controls) override {
        operand_->bind(cases, controls);
    }

    void collect_fields(std::vector<FieldRef>& out) const override {
        operand_->collect_fields(out);
    }

    std::string to_string() const override {
        return "is_na(" + operand_->to_string() + ")";
    }
};

// === TOKENIZER ===

enum class TokenKind { Number, String, Identifier, Symbol, End };

struct Token {
    TokenKind kind;
    std::string text;
    std::size_t position;
};

std::vector<Token> tokenize(const std::string& source) {
    std::vector<Token> tokens;
    std::size_t i = 0;

    auto is_ident_start = [](char c) {
        return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '.';
    };
    auto is_ident_char = [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
    };

    while (i < source.size()) {
        char c = source[i];

        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }

        std::size_t start = i;

        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && i + 1 < source.size() && std::isdigit(static_cast<unsigned char>(source[i + 1])))) {
            while (i < source.size() && (std::isdigit(static_cast<unsigned char>(source[i])) || source[i] == '.')) {
                ++i;
            }
            if (i < source.size() && (source[i] == 'e' || source[i] == 'E')) {
                std::size_t exp = i + 1;
                if (exp < source.size() && (source[exp] == '+' || source[exp] == '-')) ++exp;
                if (exp < source.size() && std::isdigit(static_cast<unsigned char>(source[exp]))) {
                    i = exp;
                    while (i < source.size() && std::isdigit(static_cast<unsigned char>(source[i]))) ++i;
                }
            }
            // R-style integer suffix
            std::string text = source.substr(start, i - start);
            if (i < source.size() && source[i] == 'L') ++i;
            tokens.push_back({TokenKind::Number, text, start});
            continue;
        }

        if (is_ident_start(c)) {
            while (i < source.size() && is_ident_char(source[i])) ++i;
            tokens.push_back({TokenKind::Identifier, source.substr(start, i - start), start});
            continue;
        }

        if (c == '\'' || c == '"') {
            std::string text;
            ++i;
            bool closed = false;
            while (i < source.size()) {
                char d = source[i++];
                if (d == '\\' && i < source.size()) {
                    text += source[i++];
                } else if (d == c) {
                    closed = true;
                    break;
                } else {
                    text += d;
                }
            }
            if (!closed) throw ExpressionError("unterminated string literal", start);
            tokens.push_back({TokenKind::String, text, start});
            continue;
        }

        if (c == '%') {
            std::size_t close = source.find('%', i + 1);
            if (close == std::string::npos || source.substr(i, close - i + 1) != "%in%") {
                throw ExpressionError("unknown operator", start);
            }
            i = close + 1;
            tokens.push_back({TokenKind::Identifier, "in", start});
            continue;
        }

        static const char* two_char[] = {"==", "!=", "<=", ">=", "&&", "||"};
        bool matched = false;
        for (const char* op : two_char) {
            if (source.compare(i, 2, op) == 0) {
                tokens.push_back({TokenKind::Symbol, op, start});
                i += 2;
                matched = true;
                break;
            }
        }
        if (matched) continue;

        if (std::string("<>=!&|+-*/(),").find(c) != std::string::npos) {
            tokens.push_back({TokenKind::Symbol, std::string(1, c), start});
            ++i;
            continue;
        }

        throw ExpressionError(std::string("unexpected character '") + c + "'", start);
    }

    tokens.push_back({TokenKind::End, std::string(), source.size()});
    return tokens;
}

// === PARSER ===

class Parser {
private:
    std::vector<Token> tokens_;
    std::size_t pos_ = 0;

    const Token& peek() const { return tokens_[pos_]; }
    const Token& advance() { return tokens_[pos_++]; }

    bool at_symbol(const char* symbol) const {
        return peek().kind == TokenKind::Symbol && peek().text == symbol;
    }

    bool at_keyword(const char* keyword) const {
        return peek().kind == TokenKind::Identifier && peek().text == keyword;
    }

    bool accept_symbol(const char* symbol) {
        if (!at_symbol(symbol)) return false;
        ++pos_;
        return true;
    }

    void expect_symbol(const char* symbol) {
        if (!accept_symbol(symbol)) {
            throw ExpressionError(std::string("expected '") + symbol + "'", peek().position);
        }
    }

    NodePtr parse_or() {
        NodePtr lhs = parse_and();
        while (at_symbol("||") || at_symbol("|") || at_keyword("or")) {
            advance();
            lhs = std::make_unique<BinaryNode>(OpCode::Or, std::move(lhs), parse_and());
        }
        return lhs;
    }

    NodePtr parse_and() {
        NodePtr lhs = parse_not();
        while (at_symbol("&&") || at_symbol("&") || at_keyword("and")) {
            advance();
            lhs = std::make_unique<BinaryNode>(OpCode::And, std::move(lhs), parse_not());
        }
        return lhs;
    }

    NodePtr parse_not() {
        if (at_symbol("!") || at_keyword("not")) {
            advance();
            return std::make_unique<UnaryNode>(OpCode::Not, parse_not());
        }
        return parse_compare();
    }

    NodePtr parse_compare() {
        NodePtr lhs = parse_sum();

        if (at_keyword("in")) {
            advance();
            return std::make_unique<InNode>(std::move(lhs), parse_list());
        }

        static const std::pair<const char*, OpCode> ops[] = {
            {"==", OpCode::Equal}, {"=", OpCode::Equal}, {"!=", OpCode::NotEqual},
            {"<=", OpCode::LessEqual}, {">=", OpCode::GreaterEqual},
            {"<", OpCode::Less}, {">", OpCode::Greater}
        };
        for (const auto& [symbol, op] : ops) {
            if (accept_symbol(symbol)) {
                NodePtr rhs = parse_sum();
                if (at_symbol("==") || at_symbol("=") || at_symbol("!=") || at_symbol("<") ||
                    at_symbol("<=") || at_symbol(">") || at_symbol(">=")) {
                    throw ExpressionError("comparisons cannot be chained", peek().position);
                }
                return std::make_unique<BinaryNode>(op, std::move(lhs), std::move(rhs));
            }
        }
        return lhs;
    }

    NodePtr parse_sum() {
        NodePtr lhs = parse_product();
        while (at_symbol("+") || at_symbol("-")) {
            OpCode op = advance().text == "+" ? OpCode::Add : OpCode::Subtract;
            lhs = std::make_unique<BinaryNode>(op, std::move(lhs), parse_product());
        }
        return lhs;
    }

    NodePtr parse_product() {
        NodePtr lhs = parse_unary();
        while (at_symbol("*") || at_symbol("/")) {
            OpCode op = advance().text == "*" ? OpCode::Multiply : OpCode::Divide;
            lhs = std::make_unique<BinaryNode>(op, std::move(lhs), parse_unary());
        }
        return lhs;
    }

    NodePtr parse_unary() {
        if (accept_symbol("-")) {
            return std::make_unique<UnaryNode>(OpCode::Negate, parse_unary());
        }
        return parse_primary();
    }

    std::optional<Value> parse_literal_token(const Token& token) {
        switch (token.kind) {
            case TokenKind::Number: {
                bool real = token.text.find_first_of(".eE") != std::string::npos;
                try {
                    if (real) return Value(std::stod(token.text));
                    return Value(static_cast<std::int64_t>(std::stoll(token.text)));
                } catch (const std::exception&) {
                    throw ExpressionError("malformed number '" + token.text + "'", token.position);
                }
            }
            case TokenKind::String:
                return Value(token.text);
            case TokenKind::Identifier:
                if (token.text == "TRUE" || token.text == "true") return Value(1);
                if (token.text == "FALSE" || token.text == "false") return Value(0);
                if (token.text == "NA" || token.text == "null") return Value::na();
                return std::nullopt;
            default:
                return std::nullopt;
        }
    }

    std::vector<Value> parse_list() {
        if (at_keyword("c")) advance();
        expect_symbol("(");

        std::vector<Value> values;
        do {
            bool negative = accept_symbol("-");
            const Token& token = advance();
            auto literal = parse_literal_token(token);
            if (!literal || (token.kind == TokenKind::Identifier && negative)) {
                throw ExpressionError("expected a literal in list", token.position);
            }
            if (negative) {
                if (literal->is_integer()) literal = Value(-literal->as_integer());
                else if (literal->is_real()) literal = Value(-literal->as_real());
                else throw ExpressionError("cannot negate a string literal", token.position);
            }
            values.push_back(std::move(*literal));
        } while (accept_symbol(","));

        expect_symbol(")");
        return values;
    }

    NodePtr parse_primary() {
        const Token& token = peek();

        if (token.kind == TokenKind::End) {
            throw ExpressionError("unexpected end of expression", token.position);
        }

        if (accept_symbol("(")) {
            NodePtr inner = parse_or();
            expect_symbol(")");
            return inner;
        }

        if (token.kind == TokenKind::Symbol) {
            throw ExpressionError("unexpected '" + token.text + "'", token.position);
        }

        if (auto literal = parse_literal_token(token)) {
            advance();
            return std::make_unique<LiteralNode>(std::move(*literal));
        }

        // Identifier: function call or field reference
        std::string name = advance().text;

        if (at_symbol("(")) {
            if (name != "is_na" && name != "is.na") {
                throw ExpressionError("unknown function '" + name + "'", token.position);
            }
            advance();
            NodePtr operand = parse_or();
            expect_symbol(")");
            return std::make_unique<IsNaNode>(std::move(operand));
        }

        if (name == "and" || name == "or" || name == "not" || name == "in") {
            throw ExpressionError("unexpected keyword '" + name + "'", token.position);
        }

        FieldRef field{FieldScope::Control, name};
        if (name.rfind("case.", 0) == 0) {
            field = {FieldScope::Case, name.substr(5)};
        } else if (name.rfind("control.", 0) == 0) {
            field = {FieldScope::Control, name.substr(8)};
        }
        if (field.name.empty()) {
            throw ExpressionError("missing field name after '" + name + "'", token.position);
        }
        return std::make_unique<FieldNode>(std::move(field));
    }

public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    NodePtr parse() {
        NodePtr root = parse_or();
        if (peek().kind != TokenKind::End) {
            throw ExpressionError("unexpected '" + peek().text + "'", peek().position);
        }
        return root;
    }
};

} // namespace
} // namespace expr

Expression::Expression(std::string source, expr::NodePtr root)
    : source_(std::move(source)), root_(std::move(root)) {
    root_->collect_fields(fields_);
}

Expression Expression::parse(const std::string& source) {
    expr::Parser parser(expr::tokenize(source));
    return Expression(source, parser.parse());
}

void Expression::bind(const Table& cases, const Table& controls) {
    root_->bind(cases, controls);
    bound_ = true;
}

Value Expression::evaluate(const Row& case_row, const Row& control_row) const {
    if (!bound_) {
        throw std::logic_error("extra_conditions evaluated before binding to tables");
    }
    return root_->evaluate(case_row, control_row);
}

bool Expression::test(const Row& case_row, const Row& control_row) const {
    auto t = expr::as_truth(evaluate(case_row, control_row));
    return t && *t;
}

std::string Expression::to_string() const {
    return root_->to_string();
}

} // namespace ccmatch
