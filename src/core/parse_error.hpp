/**
 * xsys Parse Errors
 *
 * Every failure while compiling a rule file is reported as a ParseError.
 * Errors are fatal to the whole parse; no partial program is ever returned.
 */

#pragma once

#include <cstdint>
#include <string>
#include <stdexcept>

namespace xsys {

enum class ParseErrorKind : uint8_t {
    MISSING_SECTION,
    MALFORMED_DECLARATION,
    MALFORMED_RULE,
    INVALID_CONDITION,
    INVALID_LOGICAL_EXPRESSION,
    DANGLING_REFERENCE,      // strict mode only
    DUPLICATE_DECLARATION,   // strict mode only
};

inline const char* to_string(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::MISSING_SECTION:            return "MissingSection";
        case ParseErrorKind::MALFORMED_DECLARATION:      return "MalformedDeclaration";
        case ParseErrorKind::MALFORMED_RULE:             return "MalformedRule";
        case ParseErrorKind::INVALID_CONDITION:          return "InvalidCondition";
        case ParseErrorKind::INVALID_LOGICAL_EXPRESSION: return "InvalidLogicalExpression";
        case ParseErrorKind::DANGLING_REFERENCE:         return "DanglingReference";
        case ParseErrorKind::DUPLICATE_DECLARATION:      return "DuplicateDeclaration";
        default: return "Unknown";
    }
}

class ParseError : public std::runtime_error {
public:
    ParseError(ParseErrorKind kind, const std::string& message, size_t line = 0)
        : std::runtime_error(message)
        , kind_(kind)
        , line_(line) {}

    ParseErrorKind kind() const { return kind_; }

    /// 1-based line within the section, 0 when not tied to a line.
    size_t line() const { return line_; }

    /**
     * Re-throwable copy with `prefix` prepended to the message.
     * Kind is kept; `line` replaces the stored line when non-zero.
     */
    ParseError wrap(const std::string& prefix, size_t line = 0) const {
        return ParseError(kind_, prefix + what(), line != 0 ? line : line_);
    }

private:
    ParseErrorKind kind_;
    size_t line_;
};

}  // namespace xsys
