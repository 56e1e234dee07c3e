#include "analysis/indicator_rules.h"

const char* const kNoIndicatorsText = "No specific threat indicators detected.";

static void add(std::vector<std::string>& out, const std::string& text) {
    out.push_back(text);
}

/* ---------- STRUCTURE ---------- */

static void applyStructureRules(std::vector<std::string>& out,
                                const UrlFeatures& f,
                                const IndicatorThresholds& t) {
    if (f.length > t.maxLength)
        add(out, "Unusually long URL (" + std::to_string(f.length) + " characters)");

    if (f.dotCount > t.maxDots)
        add(out, "Excessive dots in URL (" + std::to_string(f.dotCount) + " found)");

    if (f.hasIpHost)
        add(out, "IP address detected instead of domain");
}

/* ---------- CONTENT / REPUTATION ---------- */

static void applyContentRules(std::vector<std::string>& out,
                              const UrlFeatures& f) {
    if (f.suspiciousKeywordCount > 0)
        add(out, "Suspicious keywords detected (" +
                 std::to_string(f.suspiciousKeywordCount) + " found)");

    if (f.tldRiskScore > 0.0)
        add(out, "High-risk TLD detected");

    if (!f.usesHttps)
        add(out, "No HTTPS encryption");
}

/* ---------- OBFUSCATION ---------- */

static void applyObfuscationRules(std::vector<std::string>& out,
                                  const UrlFeatures& f,
                                  const IndicatorThresholds& t) {
    if (f.subdomainCount > t.maxSubdomains)
        add(out, "Excessive subdomain depth (" +
                 std::to_string(f.subdomainCount) + " levels)");

    if (f.entropy > t.maxEntropy)
        add(out, "High URL entropy (obfuscation indicator)");
}

std::vector<std::string> indicatorsFor(const UrlFeatures& f,
                                       const IndicatorThresholds& t) {
    std::vector<std::string> out;

    applyStructureRules(out, f, t);
    applyContentRules(out, f);
    applyObfuscationRules(out, f, t);

    if (out.empty())
        out.push_back(kNoIndicatorsText);
    return out;
}

int triggeredCount(const std::vector<std::string>& indicators) {
    if (indicators.size() == 1 && indicators.front() == kNoIndicatorsText)
        return 0;
    return static_cast<int>(indicators.size());
}
