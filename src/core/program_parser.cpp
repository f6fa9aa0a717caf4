/**
 * Program Parser Implementation
 */

#include "program_parser.hpp"
#include "block_extractor.hpp"
#include "declaration_parser.hpp"
#include "rule_parser.hpp"
#include "reference_validator.hpp"
#include "parse_error.hpp"
#include "logger.hpp"

#include <sstream>

namespace xsys {

ParsedProgram parse_program(std::string_view source, const ParseOptions& options) {
    ParsedProgram program;
    try {
        SourceBlocks blocks = extract_blocks(source);

        program.statements = parse_declarations(blocks.statements, SECTION_STATEMENTS);
        program.results = parse_declarations(blocks.results, SECTION_RESULTS);
        program.rules = parse_rules(blocks.rules);

        if (options.strict) {
            validate_references(program);
        }
    } catch (const ParseError& e) {
        throw e.wrap("Failed to parse input: ");
    }

    std::stringstream ss;
    ss << "PARSE: Statements=" << program.statements.size()
       << ", Results=" << program.results.size()
       << ", Rules=" << program.rules.size()
       << (options.strict ? ", Strict" : "");
    XSYS_LOG_DEBUG(ss.str());

    return program;
}

}  // namespace xsys
