/**
 * Rule Parser Implementation
 *
 * Single left-to-right scan, linear in the line length. The first "IF"
 * followed by whitespace opens the condition; the last "THEN" with
 * whitespace on both sides and a word after it closes it. Text after the
 * result word is ignored.
 */

#include "rule_parser.hpp"
#include "expression_parser.hpp"
#include "parse_error.hpp"
#include "text_util.hpp"

#include <cctype>
#include <string>

namespace xsys {

namespace {

constexpr std::string_view KW_IF = "IF";
constexpr std::string_view KW_THEN = "THEN";

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

struct RuleParts {
    std::string_view condition;
    std::string_view result;
};

// Length of the result word after "THEN<ws>", 0 if there is none
size_t result_word_length(std::string_view s, size_t after_then) {
    size_t i = after_then;
    while (i < s.size() && text::is_space(s[i])) i++;
    if (i == after_then) return 0;

    size_t start = i;
    while (i < s.size() && is_word_char(s[i])) i++;
    return i - start;
}

bool split_rule(std::string_view s, RuleParts& parts) {
    // Last usable THEN, scanning backwards
    size_t then_pos = std::string_view::npos;
    for (size_t t = s.size() >= KW_THEN.size() ? s.size() - KW_THEN.size() + 1 : 0; t-- > 1;) {
        if (s.compare(t, KW_THEN.size(), KW_THEN) != 0) continue;
        if (!text::is_space(s[t - 1])) continue;
        if (result_word_length(s, t + KW_THEN.size()) == 0) continue;
        then_pos = t;
        break;
    }
    if (then_pos == std::string_view::npos) return false;

    // Leftmost IF<ws> that still leaves whitespace before THEN
    for (size_t p = 0; p + KW_IF.size() < s.size(); p++) {
        if (s.compare(p, KW_IF.size(), KW_IF) != 0) continue;
        size_t body = p + KW_IF.size();
        if (!text::is_space(s[body])) continue;
        if (then_pos < body + 2) break;

        size_t word = then_pos + KW_THEN.size();
        while (text::is_space(s[word])) word++;

        parts.condition = s.substr(body, then_pos - body);
        parts.result = s.substr(word, result_word_length(s, then_pos + KW_THEN.size()));
        return true;
    }
    return false;
}

std::string rule_context(const std::string& line, size_t line_number) {
    return "rule at line " + std::to_string(line_number) + ": \"" + line + "\".";
}

}  // namespace

Rule parse_rule(std::string_view line, size_t line_number) {
    std::string raw(line);
    RuleParts parts;
    if (!split_rule(raw, parts)) {
        throw ParseError(ParseErrorKind::MALFORMED_RULE,
                         "Invalid " + rule_context(raw, line_number) +
                         " Expected format: \"IF <condition> THEN <result>\"",
                         line_number);
    }

    Rule rule;
    rule.result = std::string(parts.result);
    try {
        rule.expression = parse_expression(parts.condition);
    } catch (const ParseError& e) {
        throw e.wrap("Error in " + rule_context(raw, line_number) + " Details: ", line_number);
    }
    return rule;
}

std::vector<Rule> parse_rules(std::string_view block) {
    std::vector<Rule> rules;
    auto lines = text::non_blank_lines(block);
    rules.reserve(lines.size());

    for (size_t i = 0; i < lines.size(); i++) {
        rules.push_back(parse_rule(lines[i], i + 1));
    }
    return rules;
}

}  // namespace xsys
