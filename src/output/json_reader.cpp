/**
 * JSON Reader Implementation
 *
 * Recursive descent over the raw text. Nesting is limited so that hostile
 * input cannot exhaust the stack.
 */

#include "json_reader.hpp"

#include <cctype>
#include <cstdlib>
#include <cstring>

namespace xsys {
namespace output {

const JsonValue* JsonValue::find(std::string_view key) const {
    if (type != Type::OBJECT) return nullptr;
    for (const auto& [name, value] : object) {
        if (name == key) return &value;
    }
    return nullptr;
}

namespace {

constexpr int MAX_DEPTH = 512;

class JsonParser {
public:
    explicit JsonParser(std::string_view text) : text_(text) {}

    JsonValue parse_document() {
        JsonValue value = parse_value(0);
        skip_whitespace();
        if (pos_ != text_.size()) fail("Unexpected trailing characters");
        return value;
    }

private:
    [[noreturn]] void fail(const std::string& message) const {
        throw JsonError(message, pos_);
    }

    void skip_whitespace() {
        while (pos_ < text_.size() &&
               (text_[pos_] == ' ' || text_[pos_] == '\t' || text_[pos_] == '\n' || text_[pos_] == '\r')) {
            pos_++;
        }
    }

    char peek() const { return pos_ < text_.size() ? text_[pos_] : '\0'; }

    void expect(char c) {
        if (peek() != c) fail(std::string("Expected '") + c + "'");
        pos_++;
    }

    bool consume_literal(std::string_view word) {
        if (text_.substr(pos_, word.size()) != word) return false;
        pos_ += word.size();
        return true;
    }

    JsonValue parse_value(int depth) {
        if (depth > MAX_DEPTH) fail("Nesting too deep");
        skip_whitespace();

        JsonValue value;
        value.offset = pos_;

        char c = peek();
        if (c == '{') {
            value.type = JsonValue::Type::OBJECT;
            parse_object(value, depth);
        } else if (c == '[') {
            value.type = JsonValue::Type::ARRAY;
            parse_array(value, depth);
        } else if (c == '"') {
            value.type = JsonValue::Type::STRING;
            value.string = parse_string();
        } else if (consume_literal("true")) {
            value.type = JsonValue::Type::BOOLEAN;
            value.boolean = true;
        } else if (consume_literal("false")) {
            value.type = JsonValue::Type::BOOLEAN;
        } else if (consume_literal("null")) {
            value.type = JsonValue::Type::NUL;
        } else if (c == '-' || (c >= '0' && c <= '9')) {
            value.type = JsonValue::Type::NUMBER;
            value.number = parse_number();
        } else if (c == '\0') {
            fail("Unexpected end of input");
        } else {
            fail(std::string("Unexpected character '") + c + "'");
        }
        return value;
    }

    void parse_object(JsonValue& value, int depth) {
        expect('{');
        skip_whitespace();
        if (peek() == '}') {
            pos_++;
            return;
        }
        while (true) {
            skip_whitespace();
            if (peek() != '"') fail("Expected object key");
            std::string key = parse_string();
            skip_whitespace();
            expect(':');
            value.object.emplace_back(std::move(key), parse_value(depth + 1));
            skip_whitespace();
            if (peek() == ',') {
                pos_++;
                continue;
            }
            expect('}');
            return;
        }
    }

    void parse_array(JsonValue& value, int depth) {
        expect('[');
        skip_whitespace();
        if (peek() == ']') {
            pos_++;
            return;
        }
        while (true) {
            value.array.push_back(parse_value(depth + 1));
            skip_whitespace();
            if (peek() == ',') {
                pos_++;
                continue;
            }
            expect(']');
            return;
        }
    }

    double parse_number() {
        size_t start = pos_;
        if (peek() == '-') pos_++;
        while (pos_ < text_.size() &&
               (std::isdigit(static_cast<unsigned char>(text_[pos_])) ||
                (text_[pos_] != '\0' && std::strchr(".eE+-", text_[pos_]) != nullptr))) {
            pos_++;
        }
        std::string literal(text_.substr(start, pos_ - start));
        char* end = nullptr;
        double number = std::strtod(literal.c_str(), &end);
        if (end == literal.c_str() || *end != '\0') {
            pos_ = start;
            fail("Invalid number '" + literal + "'");
        }
        return number;
    }

    uint32_t parse_hex4() {
        if (pos_ + 4 > text_.size()) fail("Truncated \\u escape");
        uint32_t code = 0;
        for (int i = 0; i < 4; i++) {
            char h = text_[pos_++];
            code <<= 4;
            if (h >= '0' && h <= '9') code |= h - '0';
            else if (h >= 'a' && h <= 'f') code |= h - 'a' + 10;
            else if (h >= 'A' && h <= 'F') code |= h - 'A' + 10;
            else fail("Invalid \\u escape");
        }
        return code;
    }

    static void append_utf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    std::string parse_string() {
        expect('"');
        std::string out;
        while (true) {
            if (pos_ >= text_.size()) fail("Unterminated string");
            char c = text_[pos_++];
            if (c == '"') return out;
            if (static_cast<unsigned char>(c) < 0x20) fail("Control character in string");
            if (c != '\\') {
                out += c;
                continue;
            }

            if (pos_ >= text_.size()) fail("Unterminated escape");
            char e = text_[pos_++];
            switch (e) {
                case '"':  out += '"'; break;
                case '\\': out += '\\'; break;
                case '/':  out += '/'; break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u': {
                    uint32_t cp = parse_hex4();
                    // Surrogate pair
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        if (!consume_literal("\\u")) fail("Unpaired surrogate");
                        uint32_t low = parse_hex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("Invalid low surrogate");
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    fail(std::string("Invalid escape '\\") + e + "'");
            }
        }
    }

    std::string_view text_;
    size_t pos_ = 0;
};

// -----------------------------------------------------------------------------
// Schema mapping
// -----------------------------------------------------------------------------

const JsonValue& member(const JsonValue& obj, std::string_view key, JsonValue::Type type) {
    if (obj.type != JsonValue::Type::OBJECT) {
        throw JsonError("Expected an object", obj.offset);
    }
    const JsonValue* value = obj.find(key);
    if (value == nullptr) {
        throw JsonError("Missing member \"" + std::string(key) + "\"", obj.offset);
    }
    if (value->type != type) {
        throw JsonError("Member \"" + std::string(key) + "\" has the wrong type", value->offset);
    }
    return *value;
}

const std::string& string_member(const JsonValue& obj, std::string_view key) {
    return member(obj, key, JsonValue::Type::STRING).string;
}

std::vector<Variable> read_variables(const JsonValue& array) {
    std::vector<Variable> vars;
    vars.reserve(array.array.size());
    for (const auto& item : array.array) {
        vars.push_back(Variable{string_member(item, "name"), string_member(item, "value")});
    }
    return vars;
}

ExpressionPtr read_expression(const JsonValue& obj) {
    const std::string& type = string_member(obj, "type");

    if (type == "condition") {
        const JsonValue& cond = member(obj, "condition", JsonValue::Type::OBJECT);
        const std::string& variable = string_member(cond, "variable");
        if (variable.empty()) {
            throw JsonError("Condition with empty variable", cond.offset);
        }
        bool negated = member(cond, "negated", JsonValue::Type::BOOLEAN).boolean;
        return Expression::make_condition(variable, negated);
    }

    if (type == "logical") {
        const std::string& op = string_member(obj, "operator");
        LogicalOperator logical_op;
        if (op == "AND") logical_op = LogicalOperator::AND;
        else if (op == "OR") logical_op = LogicalOperator::OR;
        else throw JsonError("Unknown operator \"" + op + "\"", obj.offset);

        return Expression::make_logical(logical_op,
                                        read_expression(member(obj, "left", JsonValue::Type::OBJECT)),
                                        read_expression(member(obj, "right", JsonValue::Type::OBJECT)));
    }

    throw JsonError("Unknown expression type \"" + type + "\"", obj.offset);
}

}  // namespace

JsonValue parse_json(std::string_view text) {
    JsonParser parser(text);
    return parser.parse_document();
}

ParsedProgram program_from_json(std::string_view text) {
    JsonValue root = parse_json(text);

    ParsedProgram program;
    program.statements = read_variables(member(root, "statements", JsonValue::Type::ARRAY));
    program.results = read_variables(member(root, "results", JsonValue::Type::ARRAY));

    const JsonValue& rules = member(root, "rules", JsonValue::Type::ARRAY);
    program.rules.reserve(rules.array.size());
    for (const auto& item : rules.array) {
        Rule rule;
        rule.expression = read_expression(member(item, "expression", JsonValue::Type::OBJECT));
        rule.result = string_member(item, "result");
        program.rules.push_back(std::move(rule));
    }
    return program;
}

}  // namespace output
}  // namespace xsys
