#pragma once
#include <memory>
#include <string>
#include "analysis/indicator_rules.h"
#include "engine/score_fusion.h"
#include "engine/threat_types.h"
#include "intel/intel_source.h"
#include "model/threat_classifier.h"

class ThreatEngine {
public:
    ThreatEngine(std::shared_ptr<const ThreatClassifier> classifier,
                 std::shared_ptr<ThreatIntelSource> intel,
                 ScoringPolicy policy = {},
                 IndicatorThresholds thresholds = {});

    // Pure apart from the optional reputation lookups; never throws.
    ThreatVerdict analyze(const std::string& url) const;

    const ThreatClassifier& classifier() const { return *classifier_; }
    const ThreatIntelSource& intel() const { return *intel_; }
    const ScoringPolicy& policy() const { return policy_; }

private:
    ThreatIntelSignal lookupIntel(const std::string& url) const;

    std::shared_ptr<const ThreatClassifier> classifier_;
    std::shared_ptr<ThreatIntelSource> intel_;
    ScoringPolicy policy_;
    IndicatorThresholds thresholds_;
};
