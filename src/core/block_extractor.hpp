/**
 * Block Extractor
 *
 * Locates the stmt / results / rules sections of a rule file:
 *
 *   stmt ... endstmt
 *   results ... endresults
 *   rules ... endrules
 *
 * Delimiters are literal and case-sensitive. The first occurrence of each
 * start keyword wins; section order is not checked.
 */

#pragma once

#include <string_view>

namespace xsys {

constexpr std::string_view SECTION_STATEMENTS = "stmt";
constexpr std::string_view SECTION_RESULTS = "results";
constexpr std::string_view SECTION_RULES = "rules";

/**
 * Inner text of each section, trimmed at the outer edges only.
 * Views point into the source passed to extract_blocks().
 */
struct SourceBlocks {
    std::string_view statements;
    std::string_view results;
    std::string_view rules;
};

/**
 * Inner text of section `name`, delimited by `name` and `end<name>`.
 *
 * @throws ParseError (MISSING_SECTION) if the section is absent
 */
std::string_view extract_block(std::string_view source, std::string_view name);

/**
 * Extract all three sections, checked in the order stmt, results, rules.
 *
 * @throws ParseError (MISSING_SECTION) naming the first missing section
 */
SourceBlocks extract_blocks(std::string_view source);

}  // namespace xsys
