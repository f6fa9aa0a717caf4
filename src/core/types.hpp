/**
 * xsys Core Types
 *
 * Data model shared by the parser, the evaluator and the output writers.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <variant>
#include <unordered_map>

namespace xsys {

// -----------------------------------------------------------------------------
// Declarations
// -----------------------------------------------------------------------------

/**
 * A named declaration from the stmt or results section.
 * For statements `value` is the question text, for results the outcome text.
 */
struct Variable {
    std::string name;
    std::string value;

    bool operator==(const Variable&) const = default;
};

// -----------------------------------------------------------------------------
// Expressions
// -----------------------------------------------------------------------------

/**
 * Reference to a statement, optionally negated.
 */
struct Condition {
    std::string variable;
    bool negated = false;

    bool operator==(const Condition&) const = default;
};

enum class LogicalOperator : uint8_t {
    AND = 0,
    OR = 1,
};

inline const char* to_string(LogicalOperator op) {
    return op == LogicalOperator::AND ? "AND" : "OR";
}

struct Expression;
using ExpressionPtr = std::unique_ptr<Expression>;

/**
 * Binary AND/OR node. Both children are always present and owned
 * exclusively by this node.
 */
struct Logical {
    LogicalOperator op;
    ExpressionPtr left;
    ExpressionPtr right;
};

/**
 * Boolean expression tree: either a Condition leaf or a Logical node.
 */
struct Expression {
    std::variant<Condition, Logical> node;

    bool is_condition() const { return std::holds_alternative<Condition>(node); }
    bool is_logical() const { return std::holds_alternative<Logical>(node); }

    const Condition& condition() const { return std::get<Condition>(node); }
    const Logical& logical() const { return std::get<Logical>(node); }

    static ExpressionPtr make_condition(std::string variable, bool negated = false) {
        auto expr = std::make_unique<Expression>();
        expr->node = Condition{std::move(variable), negated};
        return expr;
    }

    static ExpressionPtr make_logical(LogicalOperator op, ExpressionPtr left, ExpressionPtr right) {
        auto expr = std::make_unique<Expression>();
        expr->node = Logical{op, std::move(left), std::move(right)};
        return expr;
    }
};

/**
 * Structural equality: same shape, operators, variables and negation flags.
 */
inline bool operator==(const Expression& a, const Expression& b) {
    if (a.is_condition() != b.is_condition()) return false;
    if (a.is_condition()) return a.condition() == b.condition();

    const Logical& la = a.logical();
    const Logical& lb = b.logical();
    return la.op == lb.op && *la.left == *lb.left && *la.right == *lb.right;
}

// -----------------------------------------------------------------------------
// Rules and programs
// -----------------------------------------------------------------------------

/**
 * IF <expression> THEN <result>.
 * `result` names an entry of ParsedProgram::results.
 */
struct Rule {
    ExpressionPtr expression;
    std::string result;
};

inline bool operator==(const Rule& a, const Rule& b) {
    return a.result == b.result && *a.expression == *b.expression;
}

/**
 * Output of one parse pass. Built once and never mutated afterwards, so a
 * single instance can be evaluated concurrently against many answer sets.
 * Rule order is significant (last matching rule wins).
 */
struct ParsedProgram {
    std::vector<Variable> statements;
    std::vector<Variable> results;
    std::vector<Rule> rules;
};

inline bool operator==(const ParsedProgram& a, const ParsedProgram& b) {
    return a.statements == b.statements && a.results == b.results && a.rules == b.rules;
}

// -----------------------------------------------------------------------------
// Answers
// -----------------------------------------------------------------------------

constexpr const char* ANSWER_YES = "yes";
constexpr const char* ANSWER_NO = "no";

/**
 * Statement name -> answer. Only the exact strings "yes" and "no" carry
 * meaning; anything else (or a missing key) counts as unanswered.
 */
using Answers = std::unordered_map<std::string, std::string>;

}  // namespace xsys
