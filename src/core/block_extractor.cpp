/**
 * Block Extractor Implementation
 */

#include "block_extractor.hpp"
#include "parse_error.hpp"
#include "text_util.hpp"

#include <string>

namespace xsys {

std::string_view extract_block(std::string_view source, std::string_view name) {
    const std::string end_keyword = "end" + std::string(name);

    size_t start = source.find(name);
    if (start != std::string_view::npos) {
        size_t body = start + name.size();
        size_t end = source.find(end_keyword, body);
        if (end != std::string_view::npos) {
            return text::trim(source.substr(body, end - body));
        }
    }

    throw ParseError(ParseErrorKind::MISSING_SECTION,
                     "Missing \"" + std::string(name) + "\" block. Ensure the input contains a \"" +
                     std::string(name) + "\" section.");
}

SourceBlocks extract_blocks(std::string_view source) {
    SourceBlocks blocks;
    blocks.statements = extract_block(source, SECTION_STATEMENTS);
    blocks.results = extract_block(source, SECTION_RESULTS);
    blocks.rules = extract_block(source, SECTION_RULES);
    return blocks;
}

}  // namespace xsys
