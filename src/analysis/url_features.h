#pragma once
#include <optional>
#include <string>
#include <vector>

struct UrlFeatures {
    int length = 0;
    int dotCount = 0;
    bool hasIpHost = false;
    int suspiciousKeywordCount = 0;
    // Simulated from a hash of the registrable domain, NOT a WHOIS lookup.
    // Stable per domain, carries no freshness information.
    std::optional<int> domainAgeDays;
    double tldRiskScore = 0.0;
    bool usesHttps = false;
    int subdomainCount = 0;
    double entropy = 0.0;

    bool operator==(const UrlFeatures& o) const {
        return length == o.length &&
               dotCount == o.dotCount &&
               hasIpHost == o.hasIpHost &&
               suspiciousKeywordCount == o.suspiciousKeywordCount &&
               domainAgeDays == o.domainAgeDays &&
               tldRiskScore == o.tldRiskScore &&
               usesHttps == o.usesHttps &&
               subdomainCount == o.subdomainCount &&
               entropy == o.entropy;
    }
    bool operator!=(const UrlFeatures& o) const { return !(*this == o); }
};

// Model input schema. Order is fixed per version and must match the order the
// forest was trained with.
constexpr int kFeatureSchemaVersion = 1;

const std::vector<std::string>& featureSchemaNames();
std::vector<double> toModelVector(const UrlFeatures& f);
