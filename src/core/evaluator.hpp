/**
 * Evaluator
 *
 * Pure evaluation of an expression tree against a set of answers.
 * Total over any tree and any answer map; never throws.
 */

#pragma once

#include "types.hpp"
#include <string_view>

namespace xsys {

/**
 * A condition holds when its statement was answered "yes", or "no" when
 * negated. An unanswered statement is false under both polarities, so
 * NOT x is not the same as !x.
 */
bool evaluate(const Condition& cond, const Answers& answers);

/**
 * Evaluate both children of every logical node and combine with AND/OR.
 */
bool evaluate(const Expression& expr, const Answers& answers);

/**
 * Parse an answer list such as "fan_noise=yes, no_boot=no".
 *
 * @throws std::invalid_argument on a missing '=', an empty name, or a value
 *         other than yes/no (case-insensitive, stored lowercase)
 */
Answers parse_answers(std::string_view list);

}  // namespace xsys
