#include <gtest/gtest.h>
#include "analysis/feature_extractor.h"

#include <algorithm>
#include <string>
#include <vector>

TEST(FeatureExtractorTest, PlainHttpsDomain) {
    UrlFeatures f = FeatureExtractor::extract("https://google.com");

    EXPECT_EQ(f.length, 18);
    EXPECT_EQ(f.dotCount, 1);
    EXPECT_FALSE(f.hasIpHost);
    EXPECT_TRUE(f.usesHttps);
    EXPECT_EQ(f.suspiciousKeywordCount, 0);
    EXPECT_DOUBLE_EQ(f.tldRiskScore, 0.0);
    EXPECT_EQ(f.subdomainCount, 0);
    EXPECT_LT(f.entropy, 4.0);
    ASSERT_TRUE(f.domainAgeDays.has_value());
    EXPECT_GE(*f.domainAgeDays, 0);
    EXPECT_LT(*f.domainAgeDays, 3650);
}

TEST(FeatureExtractorTest, IpLiteralHost) {
    UrlFeatures f = FeatureExtractor::extract("http://192.168.1.1/pay");

    EXPECT_TRUE(f.hasIpHost);
    EXPECT_FALSE(f.usesHttps);
    EXPECT_EQ(f.dotCount, 3);
    EXPECT_FALSE(f.domainAgeDays.has_value());
    EXPECT_DOUBLE_EQ(f.tldRiskScore, 0.0);
}

TEST(FeatureExtractorTest, KeywordsAndRiskyTld) {
    UrlFeatures f = FeatureExtractor::extract("https://update.microsoft.xyz/verify");

    EXPECT_EQ(f.suspiciousKeywordCount, 2);
    EXPECT_DOUBLE_EQ(f.tldRiskScore, 1.0);
    EXPECT_EQ(f.subdomainCount, 1);
    EXPECT_GT(f.entropy, 4.0);
}

TEST(FeatureExtractorTest, MatchingIsCaseInsensitive) {
    UrlFeatures f = FeatureExtractor::extract("HTTPS://EXAMPLE.TK/LOGIN");

    EXPECT_TRUE(f.usesHttps);
    EXPECT_EQ(f.suspiciousKeywordCount, 1);
    EXPECT_DOUBLE_EQ(f.tldRiskScore, 1.0);
}

TEST(FeatureExtractorTest, EachKeywordCountsOnce) {
    EXPECT_EQ(FeatureExtractor::countSuspiciousKeywords("login-login-login"), 1);
    EXPECT_EQ(FeatureExtractor::countSuspiciousKeywords("secure-account-login"), 3);
    EXPECT_EQ(FeatureExtractor::countSuspiciousKeywords("https://example.org/"), 0);
}

TEST(FeatureExtractorTest, UnreadableHostCountsAsIpHost) {
    EXPECT_TRUE(FeatureExtractor::extract("http://exa mple.com/").hasIpHost);
    EXPECT_TRUE(FeatureExtractor::extract("").hasIpHost);
    EXPECT_TRUE(FeatureExtractor::extract("http://[::1]/").hasIpHost);
}

TEST(FeatureExtractorTest, ShannonEntropy) {
    EXPECT_DOUBLE_EQ(FeatureExtractor::shannonEntropy(""), 0.0);
    EXPECT_DOUBLE_EQ(FeatureExtractor::shannonEntropy("aaaa"), 0.0);
    EXPECT_DOUBLE_EQ(FeatureExtractor::shannonEntropy("ab"), 1.0);
    EXPECT_DOUBLE_EQ(FeatureExtractor::shannonEntropy("abcd"), 2.0);
}

TEST(FeatureExtractorTest, TldRiskTable) {
    EXPECT_DOUBLE_EQ(FeatureExtractor::tldRisk("xyz"), 1.0);
    EXPECT_DOUBLE_EQ(FeatureExtractor::tldRisk("RU"), 1.0);
    EXPECT_DOUBLE_EQ(FeatureExtractor::tldRisk("com"), 0.0);
    EXPECT_DOUBLE_EQ(FeatureExtractor::tldRisk(""), 0.0);
}

TEST(FeatureExtractorTest, SimulatedDomainAgeIsStable) {
    int a = FeatureExtractor::simulatedDomainAge("example.com");
    EXPECT_EQ(a, FeatureExtractor::simulatedDomainAge("example.com"));
    EXPECT_GE(a, 0);
    EXPECT_LT(a, 3650);

    // Same registrable domain, same simulated age
    EXPECT_EQ(FeatureExtractor::extract("https://a.example.com/x").domainAgeDays,
              FeatureExtractor::extract("http://example.com").domainAgeDays);
}

TEST(FeatureExtractorTest, TotalOverArbitraryInput) {
    std::vector<std::string> inputs = {
        "",
        "://",
        "http://",
        "[",
        "http://[::1",
        "\xff\xfe\x00\x01",
        "javascript:alert(1)",
        "http://user@@host@/",
        "....",
        std::string(10000, 'a') + ".....",
        "http://" + std::string(300, '.') + "/"
    };

    for (const auto& s : inputs) {
        UrlFeatures f = FeatureExtractor::extract(s);
        EXPECT_EQ(f.length, static_cast<int>(s.size()));
        EXPECT_EQ(f.dotCount, static_cast<int>(std::count(s.begin(), s.end(), '.')));
        EXPECT_GE(f.suspiciousKeywordCount, 0);
        EXPECT_GE(f.subdomainCount, 0);
        EXPECT_GE(f.entropy, 0.0);
        EXPECT_GE(f.tldRiskScore, 0.0);
        EXPECT_LE(f.tldRiskScore, 1.0);
        if (f.domainAgeDays) {
            EXPECT_GE(*f.domainAgeDays, 0);
        }
    }
}

TEST(FeatureExtractorTest, ExtractionIsDeterministic) {
    const std::string url = "http://secure-login.paypa1.accounts.example.top/verify?id=9";
    EXPECT_EQ(FeatureExtractor::extract(url), FeatureExtractor::extract(url));
}

TEST(FeatureExtractorTest, ModelVectorFollowsSchemaOrder) {
    UrlFeatures f = FeatureExtractor::extract("http://192.168.1.1/pay");
    std::vector<double> x = toModelVector(f);

    ASSERT_EQ(x.size(), featureSchemaNames().size());
    EXPECT_EQ(featureSchemaNames()[0], "url_length");
    EXPECT_DOUBLE_EQ(x[0], 22.0);
    EXPECT_DOUBLE_EQ(x[1], 3.0);
    EXPECT_DOUBLE_EQ(x[2], 1.0);    // has_ip
    EXPECT_DOUBLE_EQ(x[3], 0.0);    // has_https
    EXPECT_DOUBLE_EQ(x[7], f.entropy);
}
