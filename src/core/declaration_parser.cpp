/**
 * Declaration Parser Implementation
 */

#include "declaration_parser.hpp"
#include "parse_error.hpp"
#include "text_util.hpp"

#include <string>

namespace xsys {

Variable parse_declaration(std::string_view line, std::string_view section, size_t line_number) {
    size_t eq = line.find('=');

    // A second '=' would produce a third part
    if (eq == std::string_view::npos || line.find('=', eq + 1) != std::string_view::npos) {
        throw ParseError(ParseErrorKind::MALFORMED_DECLARATION,
                         "Invalid variable declaration in " + std::string(section) +
                         " block at line " + std::to_string(line_number) + ": \"" +
                         std::string(line) + "\". Expected format: <name> = <value>",
                         line_number);
    }

    Variable var;
    var.name = std::string(text::trim(line.substr(0, eq)));
    var.value = std::string(text::trim(line.substr(eq + 1)));
    return var;
}

std::vector<Variable> parse_declarations(std::string_view block, std::string_view section) {
    std::vector<Variable> vars;
    auto lines = text::non_blank_lines(block);
    vars.reserve(lines.size());

    for (size_t i = 0; i < lines.size(); i++) {
        vars.push_back(parse_declaration(lines[i], section, i + 1));
    }
    return vars;
}

}  // namespace xsys
