/**
 * Rule Engine Implementation
 */

#include "rule_engine.hpp"
#include "evaluator.hpp"

#include <algorithm>
#include <numeric>

namespace xsys {

std::optional<std::string> select_result(const std::vector<Rule>& rules,
                                         const Answers& answers,
                                         const std::vector<Variable>& results) {
    return std::accumulate(rules.begin(), rules.end(), std::optional<std::string>{},
        [&](std::optional<std::string> selected, const Rule& rule) {
            if (!evaluate(*rule.expression, answers)) return selected;

            auto it = std::find_if(results.begin(), results.end(),
                                   [&](const Variable& v) { return v.name == rule.result; });
            if (it == results.end()) return selected;

            return std::optional<std::string>(it->value);
        });
}

RuleEngine::RuleEngine(const ParsedProgram& program)
    : program_(program) {
    results_by_name_.reserve(program.results.size());
    for (const Variable& var : program.results) {
        results_by_name_.emplace(var.name, &var);  // keeps the first declaration
    }
}

std::optional<std::string> RuleEngine::select(const Answers& answers) const {
    return evaluate(answers).result_text;
}

Verdict RuleEngine::evaluate(const Answers& answers) const {
    Verdict verdict;

    for (size_t i = 0; i < program_.rules.size(); i++) {
        const Rule& rule = program_.rules[i];
        if (!xsys::evaluate(*rule.expression, answers)) continue;

        verdict.fired.push_back(i);

        const Variable* result = find_result(rule.result);
        if (result == nullptr) {
            verdict.unresolved.push_back(i);
            continue;
        }

        verdict.result_name = result->name;
        verdict.result_text = result->value;
    }

    return verdict;
}

const Variable* RuleEngine::find_result(const std::string& name) const {
    auto it = results_by_name_.find(name);
    return it != results_by_name_.end() ? it->second : nullptr;
}

}  // namespace xsys
