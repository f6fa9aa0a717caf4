/**
 * JSON Writer
 *
 * Structured-data form of a ParsedProgram:
 *
 *   {
 *     "statements": [ { "name": ..., "value": ... }, ... ],
 *     "results":    [ { "name": ..., "value": ... }, ... ],
 *     "rules":      [ { "expression": <expr>, "result": ... }, ... ]
 *   }
 *
 *   <expr> := { "type": "condition", "condition": { "variable": ..., "negated": bool } }
 *           | { "type": "logical", "operator": "AND"|"OR", "left": <expr>, "right": <expr> }
 */

#pragma once

#include "../core/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace xsys {
namespace output {

/**
 * Escape quotes, backslashes and control characters for a JSON string body.
 */
std::string json_escape(std::string_view str);

/**
 * Serialize one expression tree.
 *
 * @param indent Spaces per nesting level; 0 produces compact output
 */
std::string expression_to_json(const Expression& expr, int indent = 2);

/**
 * `[ { "name": ..., "value": ... }, ... ]`
 */
std::string variables_to_json(const std::vector<Variable>& vars, int indent = 2);

/**
 * `[ { "expression": <expr>, "result": ... }, ... ]`
 */
std::string rules_to_json(const std::vector<Rule>& rules, int indent = 2);

/**
 * Serialize a whole program. indent = 2 matches a conventional
 * pretty-printer; indent = 0 produces compact output.
 */
std::string to_json(const ParsedProgram& program, int indent = 2);

}  // namespace output
}  // namespace xsys
