/**
 * Program Parser
 *
 * Entry point of the compiler core: raw rule-file text in, ParsedProgram out.
 * No I/O happens here; callers read the file themselves.
 */

#pragma once

#include "types.hpp"
#include <string_view>

namespace xsys {

struct ParseOptions {
    bool strict = false;  // Reject dangling references and duplicate names
};

/**
 * Parse a complete rule file.
 *
 * Any failure aborts the whole parse. Every error is rethrown with a
 * "Failed to parse input: " prefix, keeping its kind.
 *
 * @throws ParseError
 */
ParsedProgram parse_program(std::string_view source, const ParseOptions& options = {});

}  // namespace xsys
