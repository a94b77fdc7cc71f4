#include "core/error.hpp"
#include "style/color.hpp"
#include "style/style_loader.hpp"
#include "style/style_table.hpp"
#include <gtest/gtest.h>
#include <limits>

using namespace geobim;
using namespace geobim::style;

namespace {

StyleRule make_rule(const std::string& id, std::vector<MatchCondition> conditions,
                    const std::string& category, int priority = 0,
                    Color color = Color(0.5f, 0.5f, 0.5f, 1.0f)) {
    StyleRule rule;
    rule.id = id;
    rule.conditions = std::move(conditions);
    rule.category = category;
    rule.priority = priority;
    rule.color = color;
    return rule;
}

AttributeList dwelling_attributes() {
    return {
        {"objtype", std::string("Bygning")},
        {"bygningstype", 111.0},
        {"fredet", false},
    };
}

} // namespace

// ============================================================================
// Colors
// ============================================================================

TEST(ColorTest, ParsesHexForms) {
    auto full = parse_color("#CC9966");
    ASSERT_TRUE(full.has_value());
    EXPECT_FLOAT_EQ(full->r, 204.0f / 255.0f);
    EXPECT_FLOAT_EQ(full->g, 153.0f / 255.0f);
    EXPECT_FLOAT_EQ(full->b, 102.0f / 255.0f);
    EXPECT_FLOAT_EQ(full->a, 1.0f);

    auto short_form = parse_color("f00");
    ASSERT_TRUE(short_form.has_value());
    EXPECT_FLOAT_EQ(short_form->r, 1.0f);
    EXPECT_FLOAT_EQ(short_form->g, 0.0f);

    auto with_alpha = parse_color("#00000080");
    ASSERT_TRUE(with_alpha.has_value());
    EXPECT_FLOAT_EQ(with_alpha->a, 128.0f / 255.0f);
}

TEST(ColorTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(parse_color("Terracotta"), parse_color("terracotta"));
    EXPECT_TRUE(parse_color("GREY").has_value());
}

TEST(ColorTest, RejectsGarbage) {
    EXPECT_FALSE(parse_color("").has_value());
    EXPECT_FALSE(parse_color("#12345").has_value());
    EXPECT_FALSE(parse_color("#GGHHII").has_value());
    EXPECT_FALSE(parse_color("not-a-color").has_value());
}

TEST(ColorTest, Validity) {
    EXPECT_TRUE(is_valid_color(Color(0.0f, 0.5f, 1.0f, 1.0f)));
    EXPECT_FALSE(is_valid_color(Color(1.2f, 0.5f, 0.5f, 1.0f)));
    EXPECT_FALSE(is_valid_color(Color(-0.1f, 0.5f, 0.5f, 1.0f)));
}

TEST(ColorTest, HexFormatting) {
    EXPECT_EQ(color_to_hex(Color(1.0f, 0.0f, 0.0f, 1.0f)), "#FF0000");
    EXPECT_EQ(color_to_hex(Color(0.0f, 0.0f, 1.0f, 0.5f)), "#0000FF80");
}

// ============================================================================
// StyleTable
// ============================================================================

TEST(StyleTableTest, EmptyTableResolvesToDefault) {
    StyleTable table;
    ResolvedStyle style = table.resolve(dwelling_attributes());

    EXPECT_TRUE(style.is_default());
    EXPECT_EQ(style.matched_rule_id, DEFAULT_RULE_ID);
    EXPECT_EQ(style.category, "Unclassified");
    EXPECT_EQ(style.color, DEFAULT_COLOR);
}

TEST(StyleTableTest, NoMatchFallsBackToConfiguredDefault) {
    DefaultStyle fallback;
    fallback.category = "Other";
    fallback.color = Color(0.1f, 0.2f, 0.3f, 1.0f);

    StyleTable table({make_rule("road", {{"objtype", std::string("Vej")}}, "Road")}, fallback);
    ResolvedStyle style = table.resolve(dwelling_attributes());

    EXPECT_TRUE(style.is_default());
    EXPECT_EQ(style.category, "Other");
    EXPECT_EQ(style.color, fallback.color);
}

TEST(StyleTableTest, ConjunctiveMatch) {
    StyleTable table({
        make_rule("dwelling", {{"objtype", std::string("Bygning")}, {"bygningstype", 111.0}}, "Bolig"),
    });

    EXPECT_EQ(table.resolve(dwelling_attributes()).matched_rule_id, "dwelling");

    AttributeList other_type = {{"objtype", std::string("Bygning")}, {"bygningstype", 120.0}};
    EXPECT_TRUE(table.resolve(other_type).is_default());

    AttributeList missing_field = {{"objtype", std::string("Bygning")}};
    EXPECT_TRUE(table.resolve(missing_field).is_default());
}

TEST(StyleTableTest, EmptyConditionsMatchEverything) {
    StyleTable table({make_rule("catch-all", {}, "Everything")});

    EXPECT_EQ(table.resolve({}).matched_rule_id, "catch-all");
    EXPECT_EQ(table.resolve(dwelling_attributes()).category, "Everything");
}

TEST(StyleTableTest, LowerPriorityWins) {
    StyleTable table({
        make_rule("generic", {{"objtype", std::string("Bygning")}}, "Building", 20),
        make_rule("specific", {{"bygningstype", 111.0}}, "Bolig", 10),
    });

    EXPECT_EQ(table.resolve(dwelling_attributes()).matched_rule_id, "specific");
    EXPECT_EQ(table.rules().front().id, "specific");
}

TEST(StyleTableTest, EqualPriorityKeepsDeclarationOrder) {
    StyleTable table({
        make_rule("first", {{"objtype", std::string("Bygning")}}, "A", 5),
        make_rule("second", {{"bygningstype", 111.0}}, "B", 5),
        make_rule("third", {}, "C", 5),
    });

    EXPECT_EQ(table.resolve(dwelling_attributes()).matched_rule_id, "first");
    ASSERT_EQ(table.size(), 3u);
    EXPECT_EQ(table.rules()[0].id, "first");
    EXPECT_EQ(table.rules()[1].id, "second");
    EXPECT_EQ(table.rules()[2].id, "third");
}

TEST(StyleTableTest, ResolutionIsDeterministic) {
    StyleTable table({
        make_rule("a", {{"fredet", false}}, "Unprotected", 3),
        make_rule("b", {{"objtype", std::string("Bygning")}}, "Building", 3),
    });

    ResolvedStyle first = table.resolve(dwelling_attributes());
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(table.resolve(dwelling_attributes()), first);
    }
    EXPECT_EQ(resolve(dwelling_attributes(), table), first);
}

TEST(StyleTableTest, ValueKindsNeverCrossMatch) {
    StyleTable table({
        make_rule("text", {{"bygningstype", std::string("111")}}, "Text"),
        make_rule("flag", {{"fredet", 0.0}}, "Number"),
    });

    EXPECT_TRUE(table.resolve(dwelling_attributes()).is_default());
}

TEST(StyleTableTest, StringMatchIsCaseSensitive) {
    StyleTable table({make_rule("lower", {{"objtype", std::string("bygning")}}, "Lower")});
    EXPECT_TRUE(table.resolve(dwelling_attributes()).is_default());
}

TEST(StyleTableTest, AssignsIdsToAnonymousRules) {
    StyleTable table({make_rule("", {}, "A"), make_rule("", {}, "B")});
    EXPECT_EQ(table.rules()[0].id, "rule-0");
    EXPECT_EQ(table.rules()[1].id, "rule-1");
}

TEST(StyleTableTest, RejectsMalformedRules) {
    EXPECT_THROW(StyleTable({make_rule("x", {}, "")}), InvalidStyleRule);
    EXPECT_THROW(StyleTable({make_rule("x", {}, "A"), make_rule("x", {}, "B")}), InvalidStyleRule);
    EXPECT_THROW(StyleTable({make_rule("default", {}, "A")}), InvalidStyleRule);
    EXPECT_THROW(StyleTable({make_rule("x", {{"", 1.0}}, "A")}), InvalidStyleRule);
    EXPECT_THROW(StyleTable({make_rule("x", {}, "A", 0, Color(2.0f, 0.0f, 0.0f, 1.0f))}),
                 InvalidStyleRule);

    DefaultStyle bad_default;
    bad_default.category = "";
    EXPECT_THROW(StyleTable({}, bad_default), InvalidStyleRule);
}

// ============================================================================
// StyleLoader
// ============================================================================

TEST(StyleLoaderTest, LoadsRulesAndDefault) {
    const std::string text = R"({
        "default": { "color": "#FFFFFF", "category": "Other" },
        "rules": [
            { "id": "dwelling",
              "conditions": { "objtype": "Bygning", "bygningstype": 111 },
              "color": "#CC9966", "category": "Bolig", "priority": 10 },
            { "id": "protected",
              "conditions": [["fredet", true]],
              "color": [255, 0, 0], "category": "Fredet", "priority": 1 }
        ]
    })";

    StyleTable table = StyleLoader::load_string(text);

    ASSERT_EQ(table.size(), 2u);
    EXPECT_EQ(table.rules()[0].id, "protected");
    EXPECT_EQ(table.rules()[1].id, "dwelling");
    EXPECT_EQ(table.default_style().category, "Other");
    EXPECT_FLOAT_EQ(table.rules()[0].color.r, 1.0f);
    EXPECT_FLOAT_EQ(table.rules()[0].color.g, 0.0f);

    ResolvedStyle style = table.resolve(dwelling_attributes());
    EXPECT_EQ(style.matched_rule_id, "dwelling");
    EXPECT_EQ(style.category, "Bolig");

    AttributeList protected_building = dwelling_attributes();
    protected_building.push_back({"fredet", true});
    // First "fredet" attribute (false) is the one looked up
    EXPECT_EQ(table.resolve(protected_building).matched_rule_id, "dwelling");
}

TEST(StyleLoaderTest, FractionalColorsAndOpacity) {
    StyleTable table = StyleLoader::load_string(R"({
        "rules": [ { "color": [0.2, 0.4, 0.6], "opacity": 0.5, "category": "Water" } ]
    })");

    ASSERT_EQ(table.size(), 1u);
    const StyleRule& rule = table.rules().front();
    EXPECT_EQ(rule.id, "rule-0");
    EXPECT_FLOAT_EQ(rule.color.r, 0.2f);
    EXPECT_FLOAT_EQ(rule.color.b, 0.6f);
    EXPECT_FLOAT_EQ(rule.color.a, 0.5f);
    EXPECT_EQ(table.default_style().category, "Unclassified");
}

TEST(StyleLoaderTest, EmptyDocumentIsEmptyTable) {
    StyleTable table = StyleLoader::load_string("{}");
    EXPECT_TRUE(table.empty());
    EXPECT_TRUE(table.resolve(dwelling_attributes()).is_default());
}

TEST(StyleLoaderTest, RejectsMalformedDocuments) {
    EXPECT_THROW(StyleLoader::load_string("{ not json"), InvalidStyleRule);
    EXPECT_THROW(StyleLoader::load_string("[]"), InvalidStyleRule);
    EXPECT_THROW(StyleLoader::load_string(R"({"rules": {}})"), InvalidStyleRule);
    EXPECT_THROW(StyleLoader::load_string(R"({"rules": [ { "category": "A" } ]})"), InvalidStyleRule);
    EXPECT_THROW(StyleLoader::load_string(R"({"rules": [ { "color": "red" } ]})"), InvalidStyleRule);
    EXPECT_THROW(StyleLoader::load_string(R"({"rules": [ { "color": "chartreuse-ish", "category": "A" } ]})"),
                 InvalidStyleRule);
    EXPECT_THROW(StyleLoader::load_string(R"({"rules": [ { "color": [0.5, 0.5], "category": "A" } ]})"),
                 InvalidStyleRule);
    EXPECT_THROW(StyleLoader::load_string(R"({"rules": [ { "color": [300, 0, 0], "category": "A" } ]})"),
                 InvalidStyleRule);
    EXPECT_THROW(StyleLoader::load_string(R"({"rules": [ { "color": [128, 0.5, 0], "category": "A" } ]})"),
                 InvalidStyleRule);
    EXPECT_THROW(StyleLoader::load_string(
                     R"({"rules": [ { "color": "red", "category": "A", "priority": 1.5 } ]})"),
                 InvalidStyleRule);
    EXPECT_THROW(StyleLoader::load_string(
                     R"({"rules": [ { "color": "red", "category": "A", "conditions": { "x": [1, 2] } } ]})"),
                 InvalidStyleRule);
    EXPECT_THROW(StyleLoader::load_string(
                     R"({"rules": [ { "color": "red", "category": "A", "conditions": [["x"]] } ]})"),
                 InvalidStyleRule);
    EXPECT_THROW(StyleLoader::load_string(
                     R"({"rules": [ { "id": "a", "color": "red", "category": "A" },
                                    { "id": "a", "color": "blue", "category": "B" } ]})"),
                 InvalidStyleRule);
}

TEST(StyleLoaderTest, PriorityMustFitAnInt) {
    StyleTable table = StyleLoader::load_string(R"({
        "rules": [ { "id": "low", "color": "red", "category": "A", "priority": -2147483648 },
                   { "id": "high", "color": "blue", "category": "B", "priority": 2147483647 } ]
    })");
    ASSERT_EQ(table.size(), 2u);
    EXPECT_EQ(table.rules()[0].priority, std::numeric_limits<int>::min());
    EXPECT_EQ(table.rules()[1].priority, std::numeric_limits<int>::max());

    EXPECT_THROW(StyleLoader::load_string(
                     R"({"rules": [ { "color": "red", "category": "A", "priority": 2147483648 } ]})"),
                 InvalidStyleRule);
    EXPECT_THROW(StyleLoader::load_string(
                     R"({"rules": [ { "color": "red", "category": "A", "priority": -2147483649 } ]})"),
                 InvalidStyleRule);
    EXPECT_THROW(StyleLoader::load_string(
                     R"({"rules": [ { "color": "red", "category": "A", "priority": 18446744073709551615 } ]})"),
                 InvalidStyleRule);
}

TEST(StyleLoaderTest, MissingFileIsInvalidStyleRule) {
    EXPECT_THROW(StyleLoader::load_file("/nonexistent/geobim/styles.json"), InvalidStyleRule);
}
