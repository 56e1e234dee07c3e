#pragma once
#include <string>
#include <vector>
#include "engine/threat_types.h"
#include "model/threat_classifier.h"

// Fusion weights and tier boundaries. Policy, not derived values: they can be
// recalibrated from the "scoring" config section.
struct ScoringPolicy {
    double modelWeight = 0.7;
    double indicatorWeight = 0.3;
    double suspiciousThreshold = 0.4;
    double highRiskThreshold = 0.7;
    double intelOverrideFloor = 0.85;
    int heuristicRiskCount = 2;     // triggered rules that count as "risky"
};

struct FusionResult {
    double threatScore = 0.0;
    ThreatLevel threatLevel = ThreatLevel::Safe;
    Confidence confidence = Confidence::Low;
};

// Two decimals. Fused scores are rounded before tiering so the published
// score and its tier always agree.
double roundScore(double score);

// Lower bound of each tier is inclusive.
ThreatLevel levelForScore(double score, const ScoringPolicy& policy = {});

FusionResult classify(const ModelEstimate& estimate,
                      const std::vector<std::string>& indicators,
                      const ThreatIntelSignal& intel,
                      const ScoringPolicy& policy = {});
