/**
 * Reference Validator Implementation
 */

#include "reference_validator.hpp"
#include "parse_error.hpp"

#include <string>
#include <unordered_set>

namespace xsys {

namespace {

std::unordered_set<std::string> collect_names(const std::vector<Variable>& vars, const char* section) {
    std::unordered_set<std::string> names;
    for (size_t i = 0; i < vars.size(); i++) {
        if (!names.insert(vars[i].name).second) {
            throw ParseError(ParseErrorKind::DUPLICATE_DECLARATION,
                             "Duplicate declaration \"" + vars[i].name + "\" in " + section +
                             " block at line " + std::to_string(i + 1) + ".",
                             i + 1);
        }
    }
    return names;
}

void check_conditions(const Expression& expr,
                      const std::unordered_set<std::string>& statements,
                      size_t line_number) {
    if (expr.is_logical()) {
        check_conditions(*expr.logical().left, statements, line_number);
        check_conditions(*expr.logical().right, statements, line_number);
        return;
    }

    const std::string& name = expr.condition().variable;
    if (!statements.count(name)) {
        throw ParseError(ParseErrorKind::DANGLING_REFERENCE,
                         "Unknown statement \"" + name + "\" referenced by rule at line " +
                         std::to_string(line_number) + ".",
                         line_number);
    }
}

}  // namespace

void validate_references(const ParsedProgram& program) {
    auto statements = collect_names(program.statements, "stmt");
    auto results = collect_names(program.results, "results");

    for (size_t i = 0; i < program.rules.size(); i++) {
        const Rule& rule = program.rules[i];
        check_conditions(*rule.expression, statements, i + 1);

        if (!results.count(rule.result)) {
            throw ParseError(ParseErrorKind::DANGLING_REFERENCE,
                             "Unknown result \"" + rule.result + "\" referenced by rule at line " +
                             std::to_string(i + 1) + ".",
                             i + 1);
        }
    }
}

}  // namespace xsys
