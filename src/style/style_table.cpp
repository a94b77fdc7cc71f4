#include "style/style_table.hpp"
#include "core/error.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace geobim::style {

bool rule_matches(const StyleRule& rule, const AttributeList& attributes) {
    for (const auto& condition : rule.conditions) {
        const Attribute* attribute = find_attribute(attributes, condition.field);
        if (!attribute || !values_equal(attribute->value, condition.expected)) {
            return false;
        }
    }
    return true;
}

StyleTable::StyleTable(std::vector<StyleRule> rules, DefaultStyle default_style)
    : m_rules(std::move(rules)), m_default(std::move(default_style)) {
    if (!is_valid_color(m_default.color)) {
        throw InvalidStyleRule("Default style has a color component outside [0, 1]");
    }
    if (m_default.category.empty()) {
        throw InvalidStyleRule("Default style has an empty category");
    }

    std::unordered_set<std::string> seen_ids;
    for (size_t i = 0; i < m_rules.size(); ++i) {
        StyleRule& rule = m_rules[i];
        if (rule.id.empty()) {
            rule.id = "rule-" + std::to_string(i);
        }

        const std::string where = "Style rule '" + rule.id + "' (#" + std::to_string(i) + ")";

        if (rule.id == DEFAULT_RULE_ID) {
            throw InvalidStyleRule(where + ": id '" + DEFAULT_RULE_ID + "' is reserved");
        }
        if (!seen_ids.insert(rule.id).second) {
            throw InvalidStyleRule(where + ": duplicate rule id");
        }
        if (!is_valid_color(rule.color)) {
            throw InvalidStyleRule(where + ": color component outside [0, 1]");
        }
        if (rule.category.empty()) {
            throw InvalidStyleRule(where + ": empty category");
        }
        for (const auto& condition : rule.conditions) {
            if (condition.field.empty()) {
                throw InvalidStyleRule(where + ": condition with empty field name");
            }
            if (const auto* number = std::get_if<double>(&condition.expected)) {
                if (!std::isfinite(*number)) {
                    throw InvalidStyleRule(where + ": condition on '" + condition.field +
                                           "' expects a non-finite number");
                }
            }
        }
    }

    // Equal priorities keep declaration order
    std::stable_sort(m_rules.begin(), m_rules.end(),
                     [](const StyleRule& a, const StyleRule& b) { return a.priority < b.priority; });

    spdlog::debug("StyleTable: {} rules, default category '{}'", m_rules.size(), m_default.category);
}

ResolvedStyle StyleTable::resolve(const AttributeList& attributes) const {
    for (const auto& rule : m_rules) {
        if (rule_matches(rule, attributes)) {
            return ResolvedStyle{rule.color, rule.category, rule.id};
        }
    }
    return ResolvedStyle{m_default.color, m_default.category, DEFAULT_RULE_ID};
}

} // namespace geobim::style
