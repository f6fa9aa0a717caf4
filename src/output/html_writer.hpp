/**
 * HTML Writer
 *
 * Renders a ParsedProgram as a standalone questionnaire page. Statements
 * become Yes/No radio groups; rules, statements and results are embedded as
 * JSON and evaluated in the browser with the same semantics as RuleEngine.
 */

#pragma once

#include "../core/types.hpp"
#include <string>
#include <string_view>

namespace xsys {
namespace output {

constexpr const char* DEFAULT_TITLE = "Expert System";
constexpr const char* NO_RESULT_MESSAGE =
    "No specific issue identified. Your system may be functioning normally.";

/**
 * Escape &, <, >, " and ' for HTML text and attribute values.
 */
std::string html_escape(std::string_view str);

/**
 * JSON made safe for an inline <script> block ("</" becomes "<\/").
 */
std::string script_safe_json(std::string_view json);

std::string to_html(const ParsedProgram& program, std::string_view title = DEFAULT_TITLE);

}  // namespace output
}  // namespace xsys
