#include <gtest/gtest.h>
#include "analysis/indicator_rules.h"

namespace {

// Features that trip no rule at the default thresholds
UrlFeatures quietFeatures() {
    UrlFeatures f;
    f.length = 20;
    f.dotCount = 1;
    f.usesHttps = true;
    f.entropy = 3.5;
    return f;
}

} // namespace

TEST(IndicatorRulesTest, PlaceholderWhenNothingTriggers) {
    auto out = indicatorsFor(quietFeatures());

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], kNoIndicatorsText);
    EXPECT_EQ(triggeredCount(out), 0);
}

TEST(IndicatorRulesTest, KeywordIndicatorPrecedesEntropyIndicator) {
    UrlFeatures f = quietFeatures();
    f.suspiciousKeywordCount = 2;
    f.entropy = 4.5;

    auto out = indicatorsFor(f);

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], "Suspicious keywords detected (2 found)");
    EXPECT_EQ(out[1], "High URL entropy (obfuscation indicator)");
    EXPECT_EQ(triggeredCount(out), 2);
}

TEST(IndicatorRulesTest, AllRulesInFixedOrder) {
    UrlFeatures f;
    f.length = 120;
    f.dotCount = 7;
    f.hasIpHost = true;
    f.suspiciousKeywordCount = 3;
    f.tldRiskScore = 1.0;
    f.usesHttps = false;
    f.subdomainCount = 4;
    f.entropy = 5.1;

    auto out = indicatorsFor(f);

    std::vector<std::string> expected = {
        "Unusually long URL (120 characters)",
        "Excessive dots in URL (7 found)",
        "IP address detected instead of domain",
        "Suspicious keywords detected (3 found)",
        "High-risk TLD detected",
        "No HTTPS encryption",
        "Excessive subdomain depth (4 levels)",
        "High URL entropy (obfuscation indicator)"
    };
    EXPECT_EQ(out, expected);
    EXPECT_EQ(triggeredCount(out), kIndicatorRuleCount);
}

TEST(IndicatorRulesTest, ThresholdsAreStrict) {
    UrlFeatures atLimit = quietFeatures();
    atLimit.length = 75;
    atLimit.dotCount = 3;
    atLimit.subdomainCount = 2;
    atLimit.entropy = 4.0;
    EXPECT_EQ(triggeredCount(indicatorsFor(atLimit)), 0);

    UrlFeatures over = atLimit;
    over.length = 76;
    over.dotCount = 4;
    over.subdomainCount = 3;
    over.entropy = 4.01;
    EXPECT_EQ(triggeredCount(indicatorsFor(over)), 4);
}

TEST(IndicatorRulesTest, CustomThresholds) {
    UrlFeatures f = quietFeatures();
    f.length = 21;

    IndicatorThresholds t;
    t.maxLength = 20;

    auto out = indicatorsFor(f, t);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], "Unusually long URL (21 characters)");
}

TEST(IndicatorRulesTest, MissingHttpsAlone) {
    UrlFeatures f = quietFeatures();
    f.usesHttps = false;

    auto out = indicatorsFor(f);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], "No HTTPS encryption");
}
