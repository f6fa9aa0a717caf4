/**
 * Small string helpers used by the parsers.
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cctype>

namespace xsys {
namespace text {

inline bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline std::string_view trim(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && is_space(s[start])) start++;
    size_t end = s.size();
    while (end > start && is_space(s[end - 1])) end--;
    return s.substr(start, end - start);
}

inline bool is_blank(std::string_view s) {
    return trim(s).empty();
}

/**
 * Split on '\n' and drop lines that are empty after trimming.
 * Lines are returned untrimmed (a trailing '\r' is removed).
 */
inline std::vector<std::string_view> non_blank_lines(std::string_view block) {
    std::vector<std::string_view> lines;
    size_t pos = 0;
    while (pos <= block.size()) {
        size_t eol = block.find('\n', pos);
        if (eol == std::string_view::npos) eol = block.size();

        std::string_view line = block.substr(pos, eol - pos);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (!is_blank(line)) lines.push_back(line);

        pos = eol + 1;
    }
    return lines;
}

/**
 * A keyword is a whole word when it is bounded by the ends of the text,
 * whitespace or a parenthesis.
 */
inline bool is_word_boundary(std::string_view s, size_t pos) {
    if (pos >= s.size()) return true;
    char c = s[pos];
    return is_space(c) || c == '(' || c == ')';
}

inline bool word_at(std::string_view s, size_t pos, std::string_view word) {
    if (s.substr(pos, word.size()) != word) return false;
    bool left_ok = pos == 0 || is_word_boundary(s, pos - 1);
    return left_ok && is_word_boundary(s, pos + word.size());
}

inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (std::toupper(static_cast<unsigned char>(a[i])) !=
            std::toupper(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

/**
 * Position of the first whole-word, case-insensitive occurrence of `word`,
 * or npos.
 */
inline size_t find_word_icase(std::string_view s, std::string_view word) {
    if (word.empty() || s.size() < word.size()) return std::string_view::npos;
    for (size_t i = 0; i + word.size() <= s.size(); i++) {
        if (!iequals(s.substr(i, word.size()), word)) continue;
        bool left_ok = i == 0 || is_word_boundary(s, i - 1);
        if (left_ok && is_word_boundary(s, i + word.size())) return i;
    }
    return std::string_view::npos;
}

}  // namespace text
}  // namespace xsys
