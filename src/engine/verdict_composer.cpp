#include "engine/verdict_composer.h"
#include "analysis/indicator_rules.h"

std::string recommendationFor(ThreatLevel level) {
    switch (level) {
    case ThreatLevel::Safe:
        return "This URL appears to be safe. Exercise normal caution.";
    case ThreatLevel::Suspicious:
        return "This URL shows some suspicious characteristics. Proceed with caution "
               "and do not enter credentials or download files from it.";
    case ThreatLevel::HighRisk:
        return "This URL shows multiple high-risk indicators. Do not visit this URL "
               "and report it to your security team.";
    }
    return {};
}

static std::vector<std::string> intelIndicators(const ThreatIntelSignal& intel) {
    std::vector<std::string> out;
    if (intel.flaggedBySafeBrowsing.value_or(false))
        out.push_back("Flagged by Google Safe Browsing");
    if (intel.flaggedByVirusTotal.value_or(false))
        out.push_back("Flagged by VirusTotal (" +
                      std::to_string(intel.vendorHitCount) + " vendors)");
    return out;
}

ThreatVerdict compose(const std::string& url,
                      const UrlFeatures& features,
                      const std::vector<std::string>& indicators,
                      const FusionResult& fusion,
                      const ThreatIntelSignal& intel) {
    ThreatVerdict v;
    v.url = url;
    v.threatScore = fusion.threatScore;
    v.threatLevel = fusion.threatLevel;
    v.confidence = fusion.confidence;
    v.features = features;
    v.intel = intel;

    if (triggeredCount(indicators) > 0)
        v.indicators = indicators;
    for (auto& extra : intelIndicators(intel))
        v.indicators.push_back(std::move(extra));
    if (v.indicators.empty())
        v.indicators.push_back(kNoIndicatorsText);

    v.recommendation = recommendationFor(fusion.threatLevel);
    v.safeToVisit = (fusion.threatLevel == ThreatLevel::Safe);
    v.actionRequired = !v.safeToVisit;
    return v;
}
