/**
 * Program Fingerprint
 *
 * 64-bit XXH3 digest of a ParsedProgram's content. Equal programs always
 * hash equally, so the fingerprint identifies a compiled rule set across
 * runs and across JSON round-trips.
 */

#pragma once

#include "types.hpp"

#include <cstdint>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

// XXH3 header-only (already a project dependency)
#define XXH_INLINE_ALL
#include "xxhash.h"

namespace xsys {

namespace detail {

struct XXH3StateDeleter {
    void operator()(XXH3_state_t* state) const { XXH3_freeState(state); }
};

using XXH3StatePtr = std::unique_ptr<XXH3_state_t, XXH3StateDeleter>;

/**
 * Feeds a length-prefixed encoding into an XXH3 stream so that field
 * boundaries cannot collide ("ab"+"c" vs "a"+"bc").
 */
class FingerprintBuilder {
public:
    FingerprintBuilder() : state_(XXH3_createState()) {
        if (!state_ || XXH3_64bits_reset(state_.get()) == XXH_ERROR) {
            throw std::runtime_error("XXH3 state allocation failed");
        }
    }

    void add_tag(uint8_t tag) {
        XXH3_64bits_update(state_.get(), &tag, sizeof(tag));
    }

    void add_string(std::string_view s) {
        uint64_t len = s.size();
        XXH3_64bits_update(state_.get(), &len, sizeof(len));
        XXH3_64bits_update(state_.get(), s.data(), s.size());
    }

    void add_expression(const Expression& expr) {
        if (expr.is_condition()) {
            const Condition& cond = expr.condition();
            add_tag(cond.negated ? 'N' : 'C');
            add_string(cond.variable);
            return;
        }
        const Logical& node = expr.logical();
        add_tag(node.op == LogicalOperator::AND ? '&' : '|');
        add_expression(*node.left);
        add_expression(*node.right);
    }

    void add_variables(uint8_t section, const std::vector<Variable>& vars) {
        add_tag(section);
        add_string(std::to_string(vars.size()));
        for (const auto& var : vars) {
            add_string(var.name);
            add_string(var.value);
        }
    }

    uint64_t digest() const { return XXH3_64bits_digest(state_.get()); }

private:
    XXH3StatePtr state_;
};

}  // namespace detail

inline uint64_t fingerprint(const ParsedProgram& program) {
    detail::FingerprintBuilder builder;
    builder.add_variables('S', program.statements);
    builder.add_variables('R', program.results);

    builder.add_tag('X');
    builder.add_string(std::to_string(program.rules.size()));
    for (const auto& rule : program.rules) {
        builder.add_expression(*rule.expression);
        builder.add_string(rule.result);
    }
    return builder.digest();
}

/**
 * 16 lowercase hex digits.
 */
inline std::string format_fingerprint(uint64_t fp) {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(fp));
    return buf;
}

}  // namespace xsys
