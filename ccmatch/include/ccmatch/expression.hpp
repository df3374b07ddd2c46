#ifndef CCMATCH_EXPRESSION_HPP
#define CCMATCH_EXPRESSION_HPP

#include <ccmatch/table.hpp>
#include <ccmatch/value.hpp>
#include <memory>
#include <string>
#include <vector>

namespace ccmatch {

/**
 * Which row a field reference reads from.
 * `case.x` reads the case row; `control.x` and a bare `x` read the candidate.
 */
enum class FieldScope { Case, Control };

struct FieldRef {
    FieldScope scope;
    std::string name;

    bool operator==(const FieldRef& other) const {
        return scope == other.scope && name == other.name;
    }
};

namespace expr {

enum class OpCode {
    Add, Subtract, Multiply, Divide,
    Equal, NotEqual, Less, LessEqual, Greater, GreaterEqual,
    And, Or,
    Not, Negate
};

const char* op_symbol(OpCode op);

/**
 * AST node. Nodes are immutable once bound, so one tree is shared by all
 * worker threads.
 */
class Node {
public:
    virtual ~Node() = default;

    virtual Value evaluate(const Row& case_row, const Row& control_row) const = 0;

    // Resolve column indices; throws ConfigurationError for unknown columns
    virtual void bind(const Table& cases, const Table& controls) = 0;

    virtual void collect_fields(std::vector<FieldRef>& out) const = 0;

    virtual std::string to_string() const = 0;
};

using NodePtr = std::unique_ptr<Node>;

} // namespace expr

/**
 * Parsed extra_conditions expression.
 *
 * Grammar (lowest to highest precedence):
 *   or      := and (("||" | "|" | "or") and)*
 *   and     := not (("&&" | "&" | "and") not)*
 *   not     := ("!" | "not") not | compare
 *   compare := sum (("==" | "=" | "!=" | "<" | "<=" | ">" | ">=") sum)?
 *            | sum ("in" | "%in%") list
 *   sum     := product (("+" | "-") product)*
 *   product := unary (("*" | "/") unary)*
 *   unary   := "-" unary | primary
 *   primary := number | string | TRUE | FALSE | NA | field
 *            | "(" or ")" | is_na "(" or ")"
 *   list    := ["c"] "(" literal ("," literal)* ")"
 *
 * Truth values are integers 0/1. Comparisons against NA give NA, `&` and `|`
 * follow three-valued logic, and a condition that ends up NA is not met.
 */
class Expression {
private:
    std::string source_;
    expr::NodePtr root_;
    std::vector<FieldRef> fields_;
    bool bound_ = false;

    Expression(std::string source, expr::NodePtr root);

public:
    Expression(Expression&&) noexcept = default;
    Expression& operator=(Expression&&) noexcept = default;

    // Throws ExpressionError on a syntax error
    static Expression parse(const std::string& source);

    /**
     * Resolve every field against the case and control tables.
     * Must be called once before evaluate() or test().
     */
    void bind(const Table& cases, const Table& controls);

    bool is_bound() const { return bound_; }

    Value evaluate(const Row& case_row, const Row& control_row) const;

    // True only when the expression evaluates to a non-NA, non-zero value
    bool test(const Row& case_row, const Row& control_row) const;

    // Distinct field references in order of first appearance
    const std::vector<FieldRef>& referenced_fields() const { return fields_; }

    const std::string& source() const { return source_; }

    // Fully parenthesised form of the parsed tree
    std::string to_string() const;
};

} // namespace ccmatch

#endif // CCMATCH_EXPRESSION_HPP
