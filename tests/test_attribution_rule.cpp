#include <gtest/gtest.h>
#include <memory>

#include "config.hpp"
#include "errors.hpp"
#include "rules/attributionrule.h"
#include "test_support.hpp"

using namespace attribution;
using attribution::test::makeLine;
using attribution::test::makePoint;

class AttributionRuleTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg_ = loadConfig(ATTRIBUTION_DEFAULT_CONFIG);
        registry_.load(cfg_.categories);
        rules_ = std::make_unique<AttributionRule>(cfg_.rules, registry_, cfg_.codes, cfg_.defaultStrategy);
    }

    RuleMatch classify(const Asset& a) const { return rules_->classify(a); }

    AttributorConfig                 cfg_;
    CategoryRegistry                 registry_;
    std::unique_ptr<AttributionRule> rules_;
};

TEST_F(AttributionRuleTest, AsBuiltCityPointsUseZoneSequence)
{
    const RuleMatch m = classify(makePoint(1, "Manhole", 0, 0, 1, "SS", 0));
    EXPECT_EQ(m.strategy, Strategy::ZoneSequence);
    EXPECT_EQ(m.rule, "city_points_sequence");
    EXPECT_EQ(classify(makePoint(2, "Cleanout", 0, 0, 1, "CB", 0)).strategy, Strategy::ZoneSequence);
}

TEST_F(AttributionRuleTest, PrivatePointsUseFingerprint)
{
    const RuleMatch m = classify(makePoint(1, "Manhole", 0, 0, -2, "SS", 0));
    EXPECT_EQ(m.strategy, Strategy::FingerprintOnly);
    EXPECT_EQ(m.rule, "points_fingerprint");
}

TEST_F(AttributionRuleTest, StormStructuresInManholeLayerUseFingerprint)
{
    EXPECT_EQ(classify(makePoint(1, "Manhole", 0, 0, 1, "SW", 0)).strategy, Strategy::FingerprintOnly);
}

TEST_F(AttributionRuleTest, ProposedCityPointsAreDeferred)
{
    const RuleMatch m = classify(makePoint(1, "Manhole", 0, 0, 1, "SS", 1));
    EXPECT_EQ(m.strategy, Strategy::Deferred);
    EXPECT_EQ(m.rule, "city_points_proposed");
}

TEST_F(AttributionRuleTest, OtherPointCategoriesUseFingerprint)
{
    EXPECT_EQ(classify(makePoint(1, "Inlet", 0, 0)).strategy, Strategy::FingerprintOnly);
    EXPECT_EQ(classify(makePoint(1, "Fitting", 0, 0)).strategy, Strategy::FingerprintOnly);
    Asset basin = makePoint(1, "DetentionBasin", 0, 0, -2, "SW", 0);
    EXPECT_EQ(classify(basin).strategy, Strategy::FingerprintOnly);
}

TEST_F(AttributionRuleTest, SanitaryCityMainsUseEndpoints)
{
    const RuleMatch m = classify(makeLine(1, "GravityMain", {0, 0}, {1, 1}, 1, "SS", 0));
    EXPECT_EQ(m.strategy, Strategy::EndpointPair);
    EXPECT_EQ(m.rule, "sanitary_mains_endpoints");
    EXPECT_EQ(classify(makeLine(2, "GravityMain", {0, 0}, {1, 1}, 1, "CB", 0)).strategy,
              Strategy::EndpointPair);
}

TEST_F(AttributionRuleTest, StormAndForeignLinesUseFingerprint)
{
    EXPECT_EQ(classify(makeLine(1, "GravityMain", {0, 0}, {1, 1}, 1, "SW", 0)).strategy,
              Strategy::FingerprintOnly);
    EXPECT_EQ(classify(makeLine(1, "GravityMain", {0, 0}, {1, 1}, -2, "SS", 0)).strategy,
              Strategy::FingerprintOnly);
    const RuleMatch culvert = classify(makeLine(1, "Culvert", {0, 0}, {1, 1}, 1, "SS", 0));
    EXPECT_EQ(culvert.strategy, Strategy::FingerprintOnly);
    EXPECT_EQ(culvert.rule, "lines_fingerprint");
}

TEST_F(AttributionRuleTest, ProposedSanitaryMainsAreDeferred)
{
    EXPECT_EQ(classify(makeLine(1, "GravityMain", {0, 0}, {1, 1}, 1, "SS", 1)).strategy,
              Strategy::Deferred);
}

TEST_F(AttributionRuleTest, UnknownCategoryThrows)
{
    EXPECT_THROW(classify(makePoint(1, "Hydrant", 0, 0)), AttributionError);
}

/* ---------- custom tables ------------------------------------------------- */
class CustomRuleTableTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_.load(YAML::Load(R"(
Manhole:     { id: 1, kind: point }
GravityMain: { id: 2, kind: line }
)"));
    }

    std::unique_ptr<AttributionRule> build(const std::string& rules_yaml,
                                           const std::string& fallback = "FingerprintOnly") {
        return std::make_unique<AttributionRule>(YAML::Load(rules_yaml), registry_, codes_, fallback);
    }

    CategoryRegistry registry_;
    CodeConfig       codes_;
};

TEST_F(CustomRuleTableTest, HigherPriorityWinsRegardlessOfFileOrder)
{
    auto rules = build(R"(
- { name: low,  priority: 1,  expr: "point", strategy: FingerprintOnly }
- { name: high, priority: 10, expr: "point", strategy: ZoneSequence }
)");
    EXPECT_EQ(rules->classify(makePoint(1, "Manhole", 0, 0)).rule, "high");
}

TEST_F(CustomRuleTableTest, FileOrderBreaksTies)
{
    auto rules = build(R"(
- { name: first,  priority: 5, expr: "1", strategy: Deferred }
- { name: second, priority: 5, expr: "1", strategy: ZoneSequence }
)");
    EXPECT_EQ(rules->classify(makePoint(1, "Manhole", 0, 0)).rule, "first");
}

TEST_F(CustomRuleTableTest, CategoryScopeAndFallback)
{
    auto rules = build(R"(
- { name: mains, categories: [GravityMain], strategy: EndpointPair }
)", "Deferred");
    EXPECT_EQ(rules->classify(makeLine(1, "GravityMain", {0, 0}, {1, 1})).strategy, Strategy::EndpointPair);
    const RuleMatch m = rules->classify(makePoint(2, "Manhole", 0, 0));
    EXPECT_EQ(m.strategy, Strategy::Deferred);
    EXPECT_EQ(m.rule, "default");
}

TEST_F(CustomRuleTableTest, WaterTypeConstants)
{
    auto rules = build(R"(
- { name: storm, expr: "water == SW", strategy: Deferred }
)");
    EXPECT_EQ(rules->classify(makePoint(1, "Manhole", 0, 0, 1, "SW")).strategy, Strategy::Deferred);
    EXPECT_EQ(rules->classify(makePoint(1, "Manhole", 0, 0, 1, "SS")).strategy, Strategy::FingerprintOnly);
    EXPECT_EQ(rules->classify(makePoint(1, "Manhole", 0, 0, 1, "")).strategy, Strategy::FingerprintOnly);
}

TEST_F(CustomRuleTableTest, InvalidTablesRejected)
{
    EXPECT_THROW(build("- { name: bad, expr: 'unknown_variable > 1', strategy: Deferred }"), ConfigError);
    EXPECT_THROW(build("- { name: bad, expr: '1', strategy: Magic }"), ConfigError);
    EXPECT_THROW(build("- { name: bad, categories: [Hydrant], strategy: Deferred }"), ConfigError);
    EXPECT_THROW(build("- { expr: '1', strategy: Deferred }"), ConfigError);
    EXPECT_THROW(build("name: not-a-list"), ConfigError);
    EXPECT_THROW(build("[]", "Sometimes"), ConfigError);
}

TEST(StrategyNamesTest, ParseAndPrint)
{
    for (Strategy s : {Strategy::FingerprintOnly, Strategy::ZoneSequence,
                       Strategy::EndpointPair, Strategy::Deferred})
        EXPECT_EQ(parseStrategy(toString(s)), s);
    EXPECT_THROW(parseStrategy("fingerprint"), ConfigError);
}
