/**
 * Expression Parser Implementation
 *
 * Recursive substring splitting. Every recursive call works on a strictly
 * shorter substring, so the resulting tree is finite and acyclic.
 */

#include "expression_parser.hpp"
#include "parse_error.hpp"
#include "text_util.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace xsys {

namespace {

constexpr std::string_view KW_AND = "AND";
constexpr std::string_view KW_OR = "OR";
constexpr std::string_view KW_NOT = "NOT";

// Parenthesis nesting accepted in one condition
constexpr int MAX_NESTING_DEPTH = 64;

ParseError invalid_condition(std::string_view text) {
    return ParseError(ParseErrorKind::INVALID_CONDITION,
                      "Invalid condition: \"" + std::string(text) +
                      "\". Expected format: \"NOT <variable>\" or \"<variable>\"");
}

ParseError invalid_logical(std::string_view text) {
    return ParseError(ParseErrorKind::INVALID_LOGICAL_EXPRESSION,
                      "Invalid logical expression: \"" + std::string(text) +
                      "\". Expected format: \"<expression> AND <expression>\" or "
                      "\"<expression> OR <expression>\"");
}

// True when the first '(' is closed by the last character
bool wrapped_in_parens(std::string_view s) {
    if (s.size() < 2 || s.front() != '(' || s.back() != ')') return false;

    int depth = 0;
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == '(') depth++;
        else if (s[i] == ')') depth--;
        if (depth == 0) return i == s.size() - 1;
    }
    return false;
}

int nesting_depth(std::string_view s) {
    int depth = 0;
    int max_depth = 0;
    for (char c : s) {
        if (c == '(') max_depth = std::max(max_depth, ++depth);
        else if (c == ')') depth--;
    }
    return max_depth;
}

bool contains_operator(std::string_view s) {
    for (size_t i = 0; i < s.size(); i++) {
        if (text::word_at(s, i, KW_AND) || text::word_at(s, i, KW_OR)) return true;
    }
    return false;
}

void append(std::string& out, const Expression& expr) {
    if (expr.is_condition()) {
        const Condition& cond = expr.condition();
        if (cond.negated) out += "NOT ";
        out += cond.variable;
        return;
    }

    const Logical& node = expr.logical();
    out += '(';
    append(out, *node.left);
    out += ' ';
    out += to_string(node.op);
    out += ' ';
    append(out, *node.right);
    out += ')';
}

ExpressionPtr parse_node(std::string_view text);

}  // namespace

Condition parse_condition(std::string_view text) {
    std::string_view s = text::trim(text);

    Condition cond;
    std::string rest(s);
    size_t not_pos = text::find_word_icase(rest, KW_NOT);
    if (not_pos != std::string::npos) {
        cond.negated = true;
        rest.erase(not_pos, KW_NOT.size());
    }

    std::string_view name = text::trim(rest);
    while (wrapped_in_parens(name)) {
        name = text::trim(name.substr(1, name.size() - 2));
    }

    // "NOT (a OR b)" would otherwise become a variable called "a OR b"
    if (name.empty() || name.find_first_of("()") != std::string_view::npos ||
        contains_operator(name)) {
        throw invalid_condition(text::trim(text));
    }

    cond.variable = std::string(name);
    return cond;
}

namespace {

ExpressionPtr parse_node(std::string_view text) {
    std::string_view s = text::trim(text);

    if (wrapped_in_parens(s)) {
        return parse_node(s.substr(1, s.size() - 2));
    }

    int depth = 0;
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (c == '(') depth++;
        if (c == ')') depth--;
        if (depth < 0) throw invalid_logical(s);
        if (depth != 0) continue;

        std::string_view keyword;
        LogicalOperator op = LogicalOperator::AND;
        if (text::word_at(s, i, KW_AND)) {
            keyword = KW_AND;
            op = LogicalOperator::AND;
        } else if (text::word_at(s, i, KW_OR)) {
            keyword = KW_OR;
            op = LogicalOperator::OR;
        } else {
            continue;
        }

        std::string_view left = text::trim(s.substr(0, i));
        std::string_view right = text::trim(s.substr(i + keyword.size()));
        if (left.empty() || right.empty()) {
            throw invalid_logical(s);
        }

        return Expression::make_logical(op, parse_node(left), parse_node(right));
    }

    if (depth != 0) throw invalid_logical(s);

    Condition leaf = parse_condition(s);
    return Expression::make_condition(std::move(leaf.variable), leaf.negated);
}

}  // namespace

ExpressionPtr parse_expression(std::string_view text) {
    std::string_view s = text::trim(text);
    if (nesting_depth(s) > MAX_NESTING_DEPTH) {
        throw invalid_logical(s);
    }
    return parse_node(s);
}

std::string to_string(const Expression& expr) {
    std::string out;
    append(out, expr);
    return out;
}

}  // namespace xsys
