/**
 * Declaration Parser
 *
 * Turns the body of a stmt or results section into Variables.
 * Each non-blank line must have the form `<name> = <value>`.
 */

#pragma once

#include "types.hpp"
#include <string_view>
#include <vector>

namespace xsys {

/**
 * Parse one declaration line.
 *
 * @param line Raw line (untrimmed)
 * @param section Section name used in error messages
 * @param line_number 1-based index of the line among non-blank lines
 * @throws ParseError (MALFORMED_DECLARATION) unless the line splits into
 *         exactly two parts around '='
 */
Variable parse_declaration(std::string_view line, std::string_view section, size_t line_number);

/**
 * Parse all declarations in a section body, preserving line order.
 */
std::vector<Variable> parse_declarations(std::string_view block, std::string_view section);

}  // namespace xsys
