#include "engine/verdict_json.h"

using json = nlohmann::json;

std::string dumpJson(const json& j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

static json flagToJson(const std::optional<bool>& flag) {
    return flag ? json(*flag) : json(nullptr);
}

void to_json(json& j, const UrlFeatures& f) {
    j = json{
        {"url_length", f.length},
        {"dot_count", f.dotCount},
        {"has_ip", f.hasIpHost},
        {"has_https", f.usesHttps},
        {"suspicious_keywords", f.suspiciousKeywordCount},
        {"tld_risk_score", f.tldRiskScore},
        {"subdomain_count", f.subdomainCount},
        {"entropy", f.entropy}
    };
    j["domain_age_days_simulated"] = f.domainAgeDays ? json(*f.domainAgeDays) : json(nullptr);
}

void to_json(json& j, const ThreatIntelSignal& s) {
    j = json{
        {"googleSafeBrowsing", flagToJson(s.flaggedBySafeBrowsing)},
        {"virusTotal", flagToJson(s.flaggedByVirusTotal)},
        {"vendorHitCount", s.vendorHitCount}
    };
}

void to_json(json& j, const ThreatVerdict& v) {
    j = json{
        {"url", v.url},
        {"threatScore", roundScore(v.threatScore)},
        {"threatLevel", threatLevelToString(v.threatLevel)},
        {"confidence", confidenceToString(v.confidence)},
        {"indicators", v.indicators},
        {"recommendation", v.recommendation},
        {"actionRequired", v.actionRequired},
        {"safeToVisit", v.safeToVisit},
        {"features", v.features},
        {"threatIntel", v.intel}
    };
}
