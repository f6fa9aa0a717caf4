/**
 * Expression Parser
 *
 * Builds an expression tree from the condition text of a rule.
 *
 * Grouping is decided by the FIRST top-level AND/OR encountered scanning left
 * to right, not by operator precedence:
 *
 *   A AND B OR C   ->  AND(A, OR(B, C))
 *   A OR B AND C   ->  OR(A, AND(B, C))
 *
 * Use parentheses to force a different grouping. AND/OR are case-sensitive
 * whole words; NOT is a case-insensitive whole word that may appear anywhere
 * in a leaf condition.
 */

#pragma once

#include "types.hpp"
#include <string>
#include <string_view>

namespace xsys {

/**
 * Parse a leaf condition: `[NOT] <variable>`.
 *
 * @throws ParseError (INVALID_CONDITION) if no variable name remains after
 *         stripping NOT, or if the remainder is not a single operand
 */
Condition parse_condition(std::string_view text);

/**
 * Parse a condition expression recursively.
 *
 * @throws ParseError (INVALID_CONDITION) for an empty or malformed leaf
 * @throws ParseError (INVALID_LOGICAL_EXPRESSION) when an operator has an
 *         empty side, parentheses are unbalanced or nested more than 64 deep
 */
ExpressionPtr parse_expression(std::string_view text);

/**
 * Fully parenthesised rendering, e.g. "(a AND (NOT b OR c))".
 */
std::string to_string(const Expression& expr);

}  // namespace xsys
