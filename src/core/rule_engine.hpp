/**
 * xsys Rule Engine
 *
 * Selects the outcome of a parsed program for one answer set.
 *
 * Rules are considered in declaration order. Each rule that evaluates true
 * and names a known result replaces the current selection, so the LAST
 * matching rule wins. A matching rule whose result is not declared is
 * skipped silently.
 */

#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>
#include <unordered_map>

namespace xsys {

/**
 * Fold over `rules`: text of the result named by the last matching rule
 * that resolves, or nullopt when none does.
 */
std::optional<std::string> select_result(const std::vector<Rule>& rules,
                                         const Answers& answers,
                                         const std::vector<Variable>& results);

/**
 * Outcome of one evaluation pass with a trace of the rules that fired.
 */
struct Verdict {
    std::optional<std::string> result_name;
    std::optional<std::string> result_text;
    std::vector<size_t> fired;       // 0-based indices of rules that evaluated true
    std::vector<size_t> unresolved;  // fired, but named an undeclared result

    bool has_result() const { return result_text.has_value(); }
};

/**
 * Evaluates a ParsedProgram repeatedly.
 *
 * Holds a reference to the program, which must outlive the engine. All
 * evaluation methods are const and touch no shared mutable state, so one
 * engine can serve many threads at once.
 */
class RuleEngine {
public:
    explicit RuleEngine(const ParsedProgram& program);

    /**
     * Selected result text for `answers`, or nullopt.
     */
    std::optional<std::string> select(const Answers& answers) const;

    /**
     * Same selection as select(), plus which rules fired.
     */
    Verdict evaluate(const Answers& answers) const;

    /**
     * Result declaration by name (first declaration wins), or nullptr.
     */
    const Variable* find_result(const std::string& name) const;

    const ParsedProgram& program() const { return program_; }

private:
    const ParsedProgram& program_;
    std::unordered_map<std::string, const Variable*> results_by_name_;
};

}  // namespace xsys
