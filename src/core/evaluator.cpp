/**
 * Evaluator Implementation
 */

#include "evaluator.hpp"
#include "text_util.hpp"

#include <stdexcept>
#include <string>

namespace xsys {

bool evaluate(const Condition& cond, const Answers& answers) {
    auto it = answers.find(cond.variable);
    if (it == answers.end()) return false;

    return it->second == (cond.negated ? ANSWER_NO : ANSWER_YES);
}

bool evaluate(const Expression& expr, const Answers& answers) {
    if (expr.is_condition()) {
        return evaluate(expr.condition(), answers);
    }

    const Logical& node = expr.logical();
    bool left = evaluate(*node.left, answers);
    bool right = evaluate(*node.right, answers);
    return node.op == LogicalOperator::AND ? (left && right) : (left || right);
}

Answers parse_answers(std::string_view list) {
    Answers answers;

    size_t pos = 0;
    while (pos <= list.size()) {
        size_t comma = list.find(',', pos);
        if (comma == std::string_view::npos) comma = list.size();

        std::string_view item = text::trim(list.substr(pos, comma - pos));
        pos = comma + 1;
        if (item.empty()) continue;

        size_t eq = item.find('=');
        if (eq == std::string_view::npos) {
            throw std::invalid_argument("Invalid answer \"" + std::string(item) +
                                        "\". Expected format: <statement>=yes|no");
        }

        std::string name(text::trim(item.substr(0, eq)));
        std::string_view value = text::trim(item.substr(eq + 1));
        if (name.empty()) {
            throw std::invalid_argument("Invalid answer \"" + std::string(item) + "\": missing statement name");
        }

        if (text::iequals(value, ANSWER_YES)) {
            answers[name] = ANSWER_YES;
        } else if (text::iequals(value, ANSWER_NO)) {
            answers[name] = ANSWER_NO;
        } else {
            throw std::invalid_argument("Invalid answer for \"" + name + "\": \"" +
                                        std::string(value) + "\" (expected yes or no)");
        }
    }
    return answers;
}

}  // namespace xsys
