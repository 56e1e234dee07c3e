#pragma once
#include <string>
#include <vector>
#include "analysis/url_features.h"
#include "intel/intel_signal.h"

enum class ThreatLevel {
    Safe,
    Suspicious,
    HighRisk
};

enum class Confidence {
    Low,
    Medium,
    High
};

inline std::string threatLevelToString(ThreatLevel l) {
    switch (l) {
    case ThreatLevel::Safe: return "Safe";
    case ThreatLevel::Suspicious: return "Suspicious";
    case ThreatLevel::HighRisk: return "High Risk";
    }
    return "Unknown";
}

inline std::string confidenceToString(Confidence c) {
    switch (c) {
    case Confidence::Low: return "Low";
    case Confidence::Medium: return "Medium";
    case Confidence::High: return "High";
    }
    return "Unknown";
}

struct ThreatVerdict {
    std::string url;
    double threatScore = 0.0;
    ThreatLevel threatLevel = ThreatLevel::Safe;
    Confidence confidence = Confidence::Low;
    std::vector<std::string> indicators;
    std::string recommendation;
    bool actionRequired = false;
    bool safeToVisit = true;
    UrlFeatures features;
    ThreatIntelSignal intel;

    bool operator==(const ThreatVerdict& o) const {
        return url == o.url &&
               threatScore == o.threatScore &&
               threatLevel == o.threatLevel &&
               confidence == o.confidence &&
               indicators == o.indicators &&
               recommendation == o.recommendation &&
               actionRequired == o.actionRequired &&
               safeToVisit == o.safeToVisit &&
               features == o.features &&
               intel == o.intel;
    }
    bool operator!=(const ThreatVerdict& o) const { return !(*this == o); }
};
