/**
 * HTML Writer Tests
 */

#include "../src/output/html_writer.hpp"
#include "../src/output/json_writer.hpp"
#include "../src/core/program_parser.hpp"
#include "test_helpers.hpp"
#include <iostream>
#include <cassert>
#include <string>

using namespace xsys;
using namespace xsys::output;
using xsys::test::contains;

static size_t count(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        n++;
    }
    return n;
}

static const char* DIAGNOSIS =
    "stmt\n"
    "    fan_noise = Is the fan <very> loud?\n"
    "    no_boot = Does it fail to boot?\n"
    "endstmt\n"
    "results\n"
    "    psu = Replace the \"power\" supply </script>\n"
    "endresults\n"
    "rules\n"
    "    IF no_boot AND NOT fan_noise THEN psu\n"
    "endrules\n";

void test_html_escape() {
    assert(html_escape("a & b") == "a &amp; b");
    assert(html_escape("<tag attr=\"x\">'") == "&lt;tag attr=&quot;x&quot;&gt;&#39;");
    assert(html_escape("plain") == "plain");

    std::cout << "[PASS] HTML escape\n";
}

void test_script_safe_json() {
    assert(script_safe_json("\"</script>\"") == "\"<\\/script>\"");
    assert(script_safe_json("a < b") == "a < b");

    std::cout << "[PASS] Script-safe JSON\n";
}

void test_page_structure() {
    ParsedProgram program = parse_program(DIAGNOSIS);
    std::string html = to_html(program, "PC <Doctor>");

    assert(xsys::test::starts_with(html, "<!DOCTYPE html>"));
    assert(contains(html, "<title>PC &lt;Doctor&gt;</title>"));
    assert(contains(html, "<h1>PC &lt;Doctor&gt;</h1>"));

    // One radio pair per statement
    assert(contains(html, "<label>Is the fan &lt;very&gt; loud?</label>"));
    assert(contains(html, "name=\"fan_noise\" value=\"yes\""));
    assert(contains(html, "name=\"fan_noise\" value=\"no\""));
    assert(contains(html, "name=\"no_boot\" value=\"yes\""));
    assert(count(html, "type=\"radio\"") == 4);

    assert(contains(html, "Diagnose"));
    assert(contains(html, NO_RESULT_MESSAGE));

    std::cout << "[PASS] Page structure\n";
}

void test_embedded_data() {
    ParsedProgram program = parse_program(DIAGNOSIS);
    std::string html = to_html(program);

    assert(contains(html, "<title>Expert System</title>"));
    assert(contains(html, "const rules = ["));
    assert(contains(html, "\"result\":\"psu\""));
    assert(contains(html, "{\"type\":\"logical\",\"operator\":\"AND\""));
    assert(contains(html, "{\"variable\":\"fan_noise\",\"negated\":true}"));
    assert(contains(html, "{\"name\":\"psu\",\"value\":\"Replace the \\\"power\\\" supply <\\/script>\"}"));

    // Only the page's own script block is closed
    assert(count(html, "</script>") == 1);

    std::cout << "[PASS] Embedded data\n";
}

void test_embedded_data_matches_json_writer() {
    ParsedProgram program = parse_program(DIAGNOSIS);
    std::string html = to_html(program);

    assert(contains(html, "const rules = " + script_safe_json(rules_to_json(program.rules, 0)) + ";"));
    assert(contains(html, "const allStatements = " +
                          script_safe_json(variables_to_json(program.statements, 0)) + ";"));
    assert(contains(html, "const allResults = " +
                          script_safe_json(variables_to_json(program.results, 0)) + ";"));

    std::cout << "[PASS] Embedded data matches JSON writer\n";
}

void test_client_semantics_present() {
    ParsedProgram program = parse_program(DIAGNOSIS);
    std::string html = to_html(program);

    assert(contains(html, "answer === 'no'"));
    assert(contains(html, "answer === 'yes'"));
    assert(contains(html, "if (resultVar) selected = resultVar.value;"));

    std::cout << "[PASS] Client semantics present\n";
}

void test_empty_program() {
    ParsedProgram program;
    std::string html = to_html(program);

    assert(contains(html, "const rules = [];"));
    assert(contains(html, "const allStatements = [];"));
    assert(count(html, "type=\"radio\"") == 0);

    std::cout << "[PASS] Empty program\n";
}

int main() {
    std::cout << "=== HTML Writer Tests ===\n\n";

    test_html_escape();
    test_script_safe_json();
    test_page_structure();
    test_embedded_data();
    test_embedded_data_matches_json_writer();
    test_client_semantics_present();
    test_empty_program();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
