#include "engine/score_fusion.h"
#include "analysis/indicator_rules.h"

#include <algorithm>
#include <cmath>

double roundScore(double score) {
    return std::round(score * 100.0) / 100.0;
}

ThreatLevel levelForScore(double score, const ScoringPolicy& policy) {
    if (score >= policy.highRiskThreshold)
        return ThreatLevel::HighRisk;
    if (score >= policy.suspiciousThreshold)
        return ThreatLevel::Suspicious;
    return ThreatLevel::Safe;
}

static Confidence confidenceFor(const ModelEstimate& estimate,
                                int triggered,
                                bool intelHit,
                                const ScoringPolicy& policy) {
    if (intelHit)
        return Confidence::High;

    if (!estimate.fromModel)
        return triggered <= 1 ? Confidence::Low : Confidence::Medium;

    bool modelSaysRisky = estimate.probability >= policy.suspiciousThreshold;
    bool rulesSayRisky = triggered >= policy.heuristicRiskCount;
    return modelSaysRisky == rulesSayRisky ? Confidence::High : Confidence::Medium;
}

FusionResult classify(const ModelEstimate& estimate,
                      const std::vector<std::string>& indicators,
                      const ThreatIntelSignal& intel,
                      const ScoringPolicy& policy) {
    const int triggered = std::min(triggeredCount(indicators), kIndicatorRuleCount);
    const double density = static_cast<double>(triggered) / kIndicatorRuleCount;

    double p = estimate.probability;
    if (!std::isfinite(p))
        p = 0.0;
    p = std::clamp(p, 0.0, 1.0);

    double weightSum = policy.modelWeight + policy.indicatorWeight;
    double score = weightSum > 0.0
        ? (policy.modelWeight * p + policy.indicatorWeight * density) / weightSum
        : p;

    const bool intelHit = intel.positive();
    if (intelHit)
        score = std::max(score, policy.intelOverrideFloor);

    FusionResult r;
    r.threatScore = roundScore(std::clamp(score, 0.0, 1.0));
    r.threatLevel = levelForScore(r.threatScore, policy);
    r.confidence = confidenceFor(estimate, triggered, intelHit, policy);
    return r;
}
