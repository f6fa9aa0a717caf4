/**
 * JSON Writer / Reader Tests
 */

#include "../src/output/json_writer.hpp"
#include "../src/output/json_reader.hpp"
#include "../src/core/program_parser.hpp"
#include "../src/core/expression_parser.hpp"
#include "../src/core/fingerprint.hpp"
#include "test_helpers.hpp"
#include <iostream>
#include <cassert>
#include <string>

using namespace xsys;
using namespace xsys::output;
using xsys::test::contains;

static const char* SMALL =
    "stmt\n a = Q1\nendstmt\n"
    "results\n r = R\nendresults\n"
    "rules\n IF NOT a THEN r\nendrules\n";

void test_escape() {
    assert(json_escape("plain") == "plain");
    assert(json_escape("a\"b\\c") == "a\\\"b\\\\c");
    assert(json_escape("line\nbreak\ttab\r") == "line\\nbreak\\ttab\\r");
    assert(json_escape(std::string("\x01", 1)) == "\\u0001");
    assert(json_escape("caf\xc3\xa9") == "caf\xc3\xa9");

    std::cout << "[PASS] Escape\n";
}

void test_pretty_layout() {
    ParsedProgram program = parse_program(SMALL);

    const std::string expected =
        "{\n"
        "  \"statements\": [\n"
        "    {\n"
        "      \"name\": \"a\",\n"
        "      \"value\": \"Q1\"\n"
        "    }\n"
        "  ],\n"
        "  \"results\": [\n"
        "    {\n"
        "      \"name\": \"r\",\n"
        "      \"value\": \"R\"\n"
        "    }\n"
        "  ],\n"
        "  \"rules\": [\n"
        "    {\n"
        "      \"expression\": {\n"
        "        \"type\": \"condition\",\n"
        "        \"condition\": {\n"
        "          \"variable\": \"a\",\n"
        "          \"negated\": true\n"
        "        }\n"
        "      },\n"
        "      \"result\": \"r\"\n"
        "    }\n"
        "  ]\n"
        "}";

    assert(to_json(program) == expected);

    std::cout << "[PASS] Pretty layout\n";
}

void test_compact_layout() {
    ParsedProgram program = parse_program(SMALL);

    assert(to_json(program, 0) ==
           "{\"statements\":[{\"name\":\"a\",\"value\":\"Q1\"}],"
           "\"results\":[{\"name\":\"r\",\"value\":\"R\"}],"
           "\"rules\":[{\"expression\":{\"type\":\"condition\","
           "\"condition\":{\"variable\":\"a\",\"negated\":true}},\"result\":\"r\"}]}");

    auto expr = parse_expression("x OR y");
    assert(expression_to_json(*expr, 0) ==
           "{\"type\":\"logical\",\"operator\":\"OR\","
           "\"left\":{\"type\":\"condition\",\"condition\":{\"variable\":\"x\",\"negated\":false}},"
           "\"right\":{\"type\":\"condition\",\"condition\":{\"variable\":\"y\",\"negated\":false}}}");

    std::cout << "[PASS] Compact layout\n";
}

void test_empty_program() {
    ParsedProgram program;
    assert(to_json(program) == "{\n  \"statements\": [],\n  \"results\": [],\n  \"rules\": []\n}");
    assert(program_from_json(to_json(program)) == program);

    std::cout << "[PASS] Empty program\n";
}

void test_round_trip() {
    ParsedProgram program = parse_program(
        "stmt\n"
        "    graphics_issues = Do you see \"artifacts\" on C:\\screen?\n"
        "    fan_noise = Is the fan loud?\ttab\n"
        "    no_boot = Caf\xc3\xa9 won't boot\n"
        "endstmt\n"
        "results\n"
        "    gpu = GPU </script> failing\n"
        "    psu = PSU failing\n"
        "endresults\n"
        "rules\n"
        "    IF graphics_issues AND (fan_noise OR no_boot) THEN gpu\n"
        "    IF NOT graphics_issues AND no_boot OR fan_noise THEN psu\n"
        "    IF (a OR b) AND (c OR NOT d) THEN gpu\n"
        "endrules\n");

    for (int indent : {0, 2, 4}) {
        ParsedProgram back = program_from_json(to_json(program, indent));
        assert(back == program);
        assert(fingerprint(back) == fingerprint(program));
    }

    std::cout << "[PASS] Round trip\n";
}

void test_parse_json_values() {
    JsonValue v = parse_json(R"( {"n": -12.5e1, "t": true, "f": false, "z": null, "a": [1, "two"]} )");

    assert(v.type == JsonValue::Type::OBJECT);
    assert(v.find("n")->number == -125.0);
    assert(v.find("t")->boolean);
    assert(v.find("f")->type == JsonValue::Type::BOOLEAN && !v.find("f")->boolean);
    assert(v.find("z")->type == JsonValue::Type::NUL);
    assert(v.find("a")->array.size() == 2);
    assert(v.find("a")->array[1].string == "two");
    assert(v.find("missing") == nullptr);

    assert(parse_json(R"("\u00e9")").string == "\xc3\xa9");
    assert(parse_json(R"("\ud83d\ude00")").string == "\xf0\x9f\x98\x80");
    assert(parse_json(R"("a\/b")").string == "a/b");

    std::cout << "[PASS] Parse JSON values\n";
}

static bool rejects(const std::string& text) {
    try {
        program_from_json(text);
    } catch (const JsonError&) {
        return true;
    }
    return false;
}

void test_reader_errors() {
    assert(rejects(""));
    assert(rejects("{"));
    assert(rejects("[]"));
    assert(rejects("{\"statements\": [], \"results\": []}"));
    assert(rejects("{\"statements\": [], \"results\": [], \"rules\": []} extra"));
    assert(rejects("{\"statements\": [{\"name\": \"a\"}], \"results\": [], \"rules\": []}"));
    assert(rejects("{\"statements\": [], \"results\": [], \"rules\": "
                   "[{\"expression\": {\"type\": \"logical\", \"operator\": \"XOR\"}, \"result\": \"r\"}]}"));
    assert(rejects("{\"statements\": [], \"results\": [], \"rules\": "
                   "[{\"expression\": {\"type\": \"condition\", \"condition\": "
                   "{\"variable\": \"\", \"negated\": false}}, \"result\": \"r\"}]}"));
    assert(rejects("{\"statements\": \"oops\", \"results\": [], \"rules\": []}"));

    try {
        parse_json("[1, 2");
        assert(false);
    } catch (const JsonError& e) {
        assert(e.offset() == 5);
        assert(contains(e.what(), "offset 5"));
    }

    std::cout << "[PASS] Reader errors\n";
}

int main() {
    std::cout << "=== JSON Tests ===\n\n";

    test_escape();
    test_pretty_layout();
    test_compact_layout();
    test_empty_program();
    test_round_trip();
    test_parse_json_values();
    test_reader_errors();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
