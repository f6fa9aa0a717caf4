/**
 * JSON Writer Implementation
 */

#include "json_writer.hpp"

#include <cstdio>
#include <sstream>
#include <vector>

namespace xsys {
namespace output {

std::string json_escape(std::string_view str) {
    std::string result;
    result.reserve(str.size() + str.size() / 8);
    for (char c : str) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    // Escape control characters as \u00XX
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

namespace {

/**
 * Emits objects and arrays with JSON.stringify-style layout.
 */
class JsonEmitter {
public:
    explicit JsonEmitter(int indent) : indent_(indent) {}

    void begin_object() { open('{'); }
    void end_object() { close('}'); }
    void begin_array() { open('['); }
    void end_array() { close(']'); }

    void key(std::string_view name) {
        separate();
        out_ << '"' << json_escape(name) << "\":";
        if (indent_ > 0) out_ << ' ';
        pending_value_ = true;
    }

    void value(std::string_view s) {
        separate();
        out_ << '"' << json_escape(s) << '"';
    }

    void value(const char* s) { value(std::string_view(s)); }

    void value(bool b) {
        separate();
        out_ << (b ? "true" : "false");
    }

    std::string str() const { return out_.str(); }

private:
    struct Frame {
        char closer;
        size_t count;
    };

    void open(char c) {
        separate();
        out_ << c;
        frames_.push_back({c == '{' ? '}' : ']', 0});
    }

    void close(char c) {
        size_t count = frames_.back().count;
        frames_.pop_back();
        if (count > 0) newline();
        out_ << c;
    }

    // Comma and line break before an element; nothing after "key":
    void separate() {
        if (pending_value_) {
            pending_value_ = false;
            return;
        }
        if (frames_.empty()) return;
        if (frames_.back().count++ > 0) out_ << ',';
        newline();
    }

    void newline() {
        if (indent_ <= 0) return;
        out_ << '\n' << std::string(frames_.size() * static_cast<size_t>(indent_), ' ');
    }

    int indent_;
    bool pending_value_ = false;
    std::vector<Frame> frames_;
    std::ostringstream out_;
};

void emit_expression(JsonEmitter& json, const Expression& expr) {
    json.begin_object();
    if (expr.is_condition()) {
        const Condition& cond = expr.condition();
        json.key("type");
        json.value("condition");
        json.key("condition");
        json.begin_object();
        json.key("variable");
        json.value(cond.variable);
        json.key("negated");
        json.value(cond.negated);
        json.end_object();
    } else {
        const Logical& node = expr.logical();
        json.key("type");
        json.value("logical");
        json.key("operator");
        json.value(to_string(node.op));
        json.key("left");
        emit_expression(json, *node.left);
        json.key("right");
        emit_expression(json, *node.right);
    }
    json.end_object();
}

void emit_variables(JsonEmitter& json, const std::vector<Variable>& vars) {
    json.begin_array();
    for (const auto& var : vars) {
        json.begin_object();
        json.key("name");
        json.value(var.name);
        json.key("value");
        json.value(var.value);
        json.end_object();
    }
    json.end_array();
}

void emit_rules(JsonEmitter& json, const std::vector<Rule>& rules) {
    json.begin_array();
    for (const auto& rule : rules) {
        json.begin_object();
        json.key("expression");
        emit_expression(json, *rule.expression);
        json.key("result");
        json.value(rule.result);
        json.end_object();
    }
    json.end_array();
}

}  // namespace

std::string expression_to_json(const Expression& expr, int indent) {
    JsonEmitter json(indent);
    emit_expression(json, expr);
    return json.str();
}

std::string variables_to_json(const std::vector<Variable>& vars, int indent) {
    JsonEmitter json(indent);
    emit_variables(json, vars);
    return json.str();
}

std::string rules_to_json(const std::vector<Rule>& rules, int indent) {
    JsonEmitter json(indent);
    emit_rules(json, rules);
    return json.str();
}

std::string to_json(const ParsedProgram& program, int indent) {
    JsonEmitter json(indent);
    json.begin_object();

    json.key("statements");
    emit_variables(json, program.statements);
    json.key("results");
    emit_variables(json, program.results);

    json.key("rules");
    emit_rules(json, program.rules);

    json.end_object();
    return json.str();
}

}  // namespace output
}  // namespace xsys
