/**
 * Rule Engine Tests
 *
 * Selection semantics: declaration order, last match wins, unresolved
 * result names are skipped.
 */

#include "../src/core/rule_engine.hpp"
#include "../src/core/program_parser.hpp"
#include <iostream>
#include <cassert>
#include <atomic>
#include <thread>
#include <vector>

using namespace xsys;

static const char* DIAGNOSIS =
    "stmt\n"
    "    a = Q1\n"
    "    b = Q2\n"
    "endstmt\n"
    "results\n"
    "    r1 = Outcome1\n"
    "    r2 = Outcome2\n"
    "endresults\n"
    "rules\n"
    "    IF a AND b THEN r1\n"
    "    IF a THEN r2\n"
    "endrules\n";

void test_last_match_wins() {
    ParsedProgram program = parse_program(DIAGNOSIS);
    RuleEngine engine(program);

    // Both rules match; the later one wins
    auto both = engine.select({{"a", "yes"}, {"b", "yes"}});
    assert(both.has_value());
    assert(*both == "Outcome2");

    auto second_only = engine.select({{"a", "yes"}, {"b", "no"}});
    assert(second_only.has_value());
    assert(*second_only == "Outcome2");

    assert(!engine.select({{"a", "no"}, {"b", "no"}}).has_value());
    assert(!engine.select({}).has_value());

    std::cout << "[PASS] Last match wins\n";
}

void test_verdict_trace() {
    ParsedProgram program = parse_program(DIAGNOSIS);
    RuleEngine engine(program);

    Verdict verdict = engine.evaluate({{"a", "yes"}, {"b", "yes"}});
    assert(verdict.has_result());
    assert(verdict.result_name == "r2");
    assert(verdict.result_text == "Outcome2");
    assert((verdict.fired == std::vector<size_t>{0, 1}));
    assert(verdict.unresolved.empty());

    Verdict none = engine.evaluate({{"a", "no"}});
    assert(!none.has_result());
    assert(none.fired.empty());

    std::cout << "[PASS] Verdict trace\n";
}

void test_unresolved_result_is_skipped() {
    ParsedProgram program = parse_program(
        "stmt\n a = Q\nendstmt\n"
        "results\n r1 = Known\nendresults\n"
        "rules\n IF a THEN r1\n IF a THEN missing\nendrules\n");
    RuleEngine engine(program);

    Verdict verdict = engine.evaluate({{"a", "yes"}});
    assert(verdict.result_text == "Known");
    assert((verdict.fired == std::vector<size_t>{0, 1}));
    assert((verdict.unresolved == std::vector<size_t>{1}));

    // Only an unresolved rule matches: nothing selected
    ParsedProgram dangling = parse_program(
        "stmt\n a = Q\nendstmt\nresults\n r1 = Known\nendresults\n"
        "rules\n IF a THEN missing\nendrules\n");
    assert(!RuleEngine(dangling).select({{"a", "yes"}}).has_value());

    std::cout << "[PASS] Unresolved result is skipped\n";
}

void test_duplicate_result_uses_first_declaration() {
    ParsedProgram program = parse_program(
        "stmt\n a = Q\nendstmt\n"
        "results\n r = First\n r = Second\nendresults\n"
        "rules\n IF a THEN r\nendrules\n");
    RuleEngine engine(program);

    assert(engine.find_result("r")->value == "First");
    assert(engine.select({{"a", "yes"}}) == "First");
    assert(select_result(program.rules, {{"a", "yes"}}, program.results) == "First");
    assert(engine.find_result("nope") == nullptr);

    std::cout << "[PASS] Duplicate result uses first declaration\n";
}

void test_fold_matches_engine() {
    ParsedProgram program = parse_program(DIAGNOSIS);
    RuleEngine engine(program);

    const char* values[] = {"yes", "no", nullptr};
    for (const char* va : values) {
        for (const char* vb : values) {
            Answers answers;
            if (va) answers["a"] = va;
            if (vb) answers["b"] = vb;
            assert(select_result(program.rules, answers, program.results) == engine.select(answers));
        }
    }

    std::cout << "[PASS] Fold matches engine\n";
}

void test_empty_program() {
    ParsedProgram program = parse_program("stmt\nendstmt\nresults\nendresults\nrules\nendrules\n");
    RuleEngine engine(program);

    assert(!engine.select({{"a", "yes"}}).has_value());

    std::cout << "[PASS] Empty program\n";
}

void test_concurrent_evaluation() {
    ParsedProgram program = parse_program(DIAGNOSIS);
    const RuleEngine engine(program);

    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&engine, &mismatches, t] {
            Answers answers = (t % 2 == 0)
                ? Answers{{"a", "yes"}, {"b", "yes"}}
                : Answers{{"a", "no"}};
            for (int i = 0; i < 1000; i++) {
                auto result = engine.select(answers);
                bool ok = (t % 2 == 0) ? (result == "Outcome2") : !result.has_value();
                if (!ok) mismatches++;
            }
        });
    }
    for (auto& thread : threads) thread.join();

    assert(mismatches == 0);

    std::cout << "[PASS] Concurrent evaluation\n";
}

int main() {
    std::cout << "=== Rule Engine Tests ===\n\n";

    test_last_match_wins();
    test_verdict_trace();
    test_unresolved_result_is_skipped();
    test_duplicate_result_uses_first_declaration();
    test_fold_matches_engine();
    test_empty_program();
    test_concurrent_evaluation();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
