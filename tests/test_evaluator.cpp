/**
 * Evaluator Tests
 */

#include "../src/core/evaluator.hpp"
#include "../src/core/expression_parser.hpp"
#include <iostream>
#include <cassert>
#include <stdexcept>
#include <vector>

using namespace xsys;

void test_condition_polarity() {
    Condition plain{"v", false};
    Condition negated{"v", true};

    assert(evaluate(plain, {{"v", "yes"}}));
    assert(!evaluate(plain, {{"v", "no"}}));
    assert(evaluate(negated, {{"v", "no"}}));
    assert(!evaluate(negated, {{"v", "yes"}}));

    std::cout << "[PASS] Condition polarity\n";
}

void test_unanswered_is_false_both_ways() {
    Condition plain{"v", false};
    Condition negated{"v", true};

    assert(!evaluate(plain, {}));
    assert(!evaluate(negated, {}));

    // Only the exact strings count
    assert(!evaluate(plain, {{"v", "YES"}}));
    assert(!evaluate(negated, {{"v", "No"}}));
    assert(!evaluate(plain, {{"v", "maybe"}}));
    assert(!evaluate(negated, {{"v", ""}}));

    std::cout << "[PASS] Unanswered is false both ways\n";
}

void test_logical_combination() {
    auto expr_and = parse_expression("a AND NOT b");
    auto expr_or = parse_expression("a OR NOT b");
    auto left = parse_expression("a");
    auto right = parse_expression("NOT b");

    const std::vector<const char*> values = {"yes", "no", nullptr};
    for (const char* va : values) {
        for (const char* vb : values) {
            Answers answers;
            if (va) answers["a"] = va;
            if (vb) answers["b"] = vb;

            bool l = evaluate(*left, answers);
            bool r = evaluate(*right, answers);
            assert(evaluate(*expr_and, answers) == (l && r));
            assert(evaluate(*expr_or, answers) == (l || r));
        }
    }

    std::cout << "[PASS] Logical combination\n";
}

void test_nested_expression() {
    auto expr = parse_expression("graphics_issues AND (fan_noise OR no_boot)");

    assert(evaluate(*expr, {{"graphics_issues", "yes"}, {"no_boot", "yes"}}));
    assert(evaluate(*expr, {{"graphics_issues", "yes"}, {"fan_noise", "yes"}, {"no_boot", "no"}}));
    assert(!evaluate(*expr, {{"graphics_issues", "yes"}}));
    assert(!evaluate(*expr, {{"graphics_issues", "no"}, {"fan_noise", "yes"}}));
    assert(!evaluate(*expr, {}));

    std::cout << "[PASS] Nested expression\n";
}

void test_unknown_variable() {
    auto expr = parse_expression("ghost OR NOT ghost");

    assert(!evaluate(*expr, {}));
    assert(!evaluate(*expr, {{"other", "yes"}}));

    std::cout << "[PASS] Unknown variable\n";
}

void test_parse_answers() {
    Answers answers = parse_answers(" fan_noise=yes, no_boot = NO ,,");

    assert(answers.size() == 2);
    assert(answers.at("fan_noise") == "yes");
    assert(answers.at("no_boot") == "no");

    assert(parse_answers("").empty());

    for (const char* bad : {"a", "a=maybe", "=yes", "a=yes,b"}) {
        bool threw = false;
        try {
            parse_answers(bad);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[PASS] Parse answers\n";
}

int main() {
    std::cout << "=== Evaluator Tests ===\n\n";

    test_condition_polarity();
    test_unanswered_is_false_both_ways();
    test_logical_combination();
    test_nested_expression();
    test_unknown_variable();
    test_parse_answers();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
