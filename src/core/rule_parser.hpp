/**
 * Rule Parser
 *
 * Parses lines of the rules section:
 *
 *   IF <condition> THEN <result>
 *
 * The condition text goes to the expression parser; <result> is a single
 * word naming a declared result. Anything after that word is ignored.
 */

#pragma once

#include "types.hpp"
#include <string_view>
#include <vector>

namespace xsys {

/**
 * Parse one rule line.
 *
 * @param line Raw line (untrimmed)
 * @param line_number 1-based index of the line among non-blank rule lines
 * @throws ParseError (MALFORMED_RULE) if the line does not match the pattern;
 *         expression errors are rethrown with the line number and raw line
 *         prepended, keeping their kind
 */
Rule parse_rule(std::string_view line, size_t line_number);

/**
 * Parse every non-blank line of the rules section, in declaration order.
 */
std::vector<Rule> parse_rules(std::string_view block);

}  // namespace xsys
