/**
 * Reference Validator
 *
 * Optional strict checks run after a successful parse. By default the
 * language is permissive: an unknown statement in a condition evaluates as
 * unanswered and a rule naming an unknown result never selects anything.
 * Strict mode turns those cases into errors instead.
 */

#pragma once

#include "types.hpp"

namespace xsys {

/**
 * Check that
 *  - statement names are unique, and result names are unique,
 *  - every condition names a declared statement,
 *  - every rule names a declared result.
 *
 * @throws ParseError (DUPLICATE_DECLARATION or DANGLING_REFERENCE) on the
 *         first violation, with the 1-based rule line where applicable
 */
void validate_references(const ParsedProgram& program);

}  // namespace xsys
