/**
 * @file style_table.hpp
 * @brief Attribute-driven style rules and their resolution
 * @author GeoBIM Team
 * @version 0.1.0
 * @date 2026
 *
 * A StyleTable is an ordered list of conjunctive rules. Resolution scans the
 * rules by ascending priority and returns the first match; rules of equal
 * priority keep their declaration order. Resolution is total: when nothing
 * matches the table's default style is returned.
 */

#pragma once

#include "core/types.hpp"
#include "style/color.hpp"
#include <string>
#include <vector>

namespace geobim::style {

/// Rule id reported when no rule matched
inline constexpr const char* DEFAULT_RULE_ID = "default";

/**
 * @brief One (field, expected value) condition of a rule
 */
struct MatchCondition {
    std::string field;          ///< Attribute name (source spelling)
    AttributeValue expected;    ///< Value compared with values_equal()
};

/**
 * @brief One row of the style table
 */
struct StyleRule {
    std::string id;                         ///< Unique rule id ("rule-<n>" if left empty)
    std::vector<MatchCondition> conditions; ///< All must match; empty matches everything
    Color color = DEFAULT_COLOR;            ///< Output color
    std::string category;                   ///< Output category label
    int priority = 0;                       ///< Lower is checked first
};

/**
 * @brief Style used when no rule matches
 */
struct DefaultStyle {
    Color color = DEFAULT_COLOR;
    std::string category = "Unclassified";
};

/**
 * @brief Result of style resolution
 */
struct ResolvedStyle {
    Color color = DEFAULT_COLOR;
    std::string category;
    std::string matched_rule_id = DEFAULT_RULE_ID;

    [[nodiscard]] bool is_default() const { return matched_rule_id == DEFAULT_RULE_ID; }

    bool operator==(const ResolvedStyle& other) const {
        return color == other.color &&
               category == other.category &&
               matched_rule_id == other.matched_rule_id;
    }
    bool operator!=(const ResolvedStyle& other) const { return !(*this == other); }
};

/**
 * @brief Check whether every condition of a rule holds for the attributes
 */
[[nodiscard]] bool rule_matches(const StyleRule& rule, const AttributeList& attributes);

/**
 * @brief Validated, priority-ordered rule table
 *
 * Immutable once constructed; safe to share between threads.
 */
class StyleTable {
public:
    /**
     * @brief Empty table: every record resolves to the default style
     */
    StyleTable() = default;

    /**
     * @brief Validate and order rules
     * @param rules Rules in declaration order
     * @param default_style Style returned when nothing matches
     * @throws InvalidStyleRule on a malformed rule or default style
     */
    explicit StyleTable(std::vector<StyleRule> rules, DefaultStyle default_style = {});

    /**
     * @brief Resolve the style for a record's attributes
     *
     * Never fails; deterministic for a given table and attribute list.
     */
    [[nodiscard]] ResolvedStyle resolve(const AttributeList& attributes) const;

    /**
     * @brief Rules in evaluation order (ascending priority, stable)
     */
    [[nodiscard]] const std::vector<StyleRule>& rules() const { return m_rules; }

    [[nodiscard]] const DefaultStyle& default_style() const { return m_default; }

    [[nodiscard]] size_t size() const { return m_rules.size(); }
    [[nodiscard]] bool empty() const { return m_rules.empty(); }

private:
    std::vector<StyleRule> m_rules;
    DefaultStyle m_default;
};

/**
 * @brief Free-function form of StyleTable::resolve
 */
[[nodiscard]] inline ResolvedStyle resolve(const AttributeList& attributes, const StyleTable& table) {
    return table.resolve(attributes);
}

} // namespace geobim::style
