/**
 * JSON Reader
 *
 * Reads the structured-data form written by to_json() back into a
 * ParsedProgram. Also usable as a minimal general JSON parser.
 */

#pragma once

#include "../core/types.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace xsys {
namespace output {

class JsonError : public std::runtime_error {
public:
    JsonError(const std::string& message, size_t offset)
        : std::runtime_error(message + " (at offset " + std::to_string(offset) + ")")
        , offset_(offset) {}

    size_t offset() const { return offset_; }

private:
    size_t offset_;
};

struct JsonValue {
    enum class Type : uint8_t { NUL, BOOLEAN, NUMBER, STRING, ARRAY, OBJECT };

    Type type = Type::NUL;
    bool boolean = false;
    double number = 0.0;
    std::string string;
    std::vector<JsonValue> array;
    std::vector<std::pair<std::string, JsonValue>> object;  // insertion order

    /// Member lookup on an object; nullptr if absent or not an object.
    const JsonValue* find(std::string_view key) const;

    /// Byte offset of the value in the source text (for error messages).
    size_t offset = 0;
};

/**
 * Parse one JSON document. Trailing non-whitespace is an error.
 *
 * @throws JsonError
 */
JsonValue parse_json(std::string_view text);

/**
 * Rebuild a program from to_json() output.
 *
 * @throws JsonError on malformed JSON or a document that does not match the
 *         program schema
 */
ParsedProgram program_from_json(std::string_view text);

}  // namespace output
}  // namespace xsys
