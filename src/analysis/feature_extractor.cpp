#include "analysis/feature_extractor.h"
#include "analysis/url_parser.h"

#include <openssl/sha.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <unordered_set>

namespace {

constexpr int kSimulatedAgeRangeDays = 3650;

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

/* ---------- MODEL SCHEMA ---------- */

const std::vector<std::string>& featureSchemaNames() {
    static const std::vector<std::string> names = {
        "url_length",
        "dot_count",
        "has_ip",
        "has_https",
        "suspicious_keywords",
        "tld_risk_score",
        "subdomain_count",
        "entropy"
    };
    return names;
}

std::vector<double> toModelVector(const UrlFeatures& f) {
    return {
        static_cast<double>(f.length),
        static_cast<double>(f.dotCount),
        f.hasIpHost ? 1.0 : 0.0,
        f.usesHttps ? 1.0 : 0.0,
        static_cast<double>(f.suspiciousKeywordCount),
        f.tldRiskScore,
        static_cast<double>(f.subdomainCount),
        f.entropy
    };
}

/* ---------- VOCABULARIES ---------- */

const std::vector<std::string>& FeatureExtractor::suspiciousKeywords() {
    static const std::vector<std::string> keywords = {
        "verify", "update", "secure", "account", "login", "banking",
        "free", "gift", "urgent", "suspend", "encrypt", "decrypt",
        "download", "wallet", "crypto", "bitcoin", "password",
        "invoice", "payment", "support", "confirm", "unlock"
    };
    return keywords;
}

double FeatureExtractor::tldRisk(const std::string& tld) {
    static const std::unordered_set<std::string> highRisk = {
        "xyz", "top", "click", "site", "work", "loan", "ru", "cn", "tk",
        "pw", "cc", "ws", "info", "link", "date", "racing", "gq", "ml",
        "ga", "cf"
    };
    return highRisk.count(toLower(tld)) ? 1.0 : 0.0;
}

/* ---------- FEATURE PRIMITIVES ---------- */

double FeatureExtractor::shannonEntropy(const std::string& s) {
    if (s.empty())
        return 0.0;

    std::array<size_t, 256> counts{};
    for (unsigned char c : s)
        ++counts[c];

    const double total = static_cast<double>(s.size());
    double h = 0.0;
    for (size_t n : counts) {
        if (n == 0) continue;
        double p = static_cast<double>(n) / total;
        h -= p * std::log2(p);
    }
    return h;
}

int FeatureExtractor::countSuspiciousKeywords(const std::string& url) {
    const std::string lower = toLower(url);
    int count = 0;
    for (const auto& kw : suspiciousKeywords()) {
        if (lower.find(kw) != std::string::npos)
            ++count;
    }
    return count;
}

int FeatureExtractor::simulatedDomainAge(const std::string& registrableDomain) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(
        reinterpret_cast<const unsigned char*>(registrableDomain.data()),
        registrableDomain.size(),
        hash
    );

    uint32_t v = (static_cast<uint32_t>(hash[0]) << 24) |
                 (static_cast<uint32_t>(hash[1]) << 16) |
                 (static_cast<uint32_t>(hash[2]) << 8) |
                  static_cast<uint32_t>(hash[3]);
    return static_cast<int>(v % kSimulatedAgeRangeDays);
}

/* ---------- EXTRACTION ---------- */

UrlFeatures FeatureExtractor::extract(const std::string& url) {
    UrlFeatures f;
    f.length = static_cast<int>(url.size());
    f.dotCount = static_cast<int>(std::count(url.begin(), url.end(), '.'));
    f.suspiciousKeywordCount = countSuspiciousKeywords(url);
    f.entropy = shannonEntropy(url);

    ParsedUrl parsed = parseUrl(url);
    f.usesHttps = (parsed.scheme == "https");

    switch (parsed.hostKind) {
    case HostKind::Name:
        f.hasIpHost = false;
        f.tldRiskScore = tldRisk(parsed.tld);
        f.subdomainCount = parsed.subdomainLabels;
        if (!parsed.registrableDomain.empty())
            f.domainAgeDays = simulatedDomainAge(parsed.registrableDomain);
        break;
    case HostKind::Ipv4:
    case HostKind::Ipv6:
    case HostKind::Invalid:
        // An unreadable host hides the destination just like a raw address
        f.hasIpHost = true;
        break;
    }

    return f;
}
