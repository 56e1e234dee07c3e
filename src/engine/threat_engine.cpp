#include "engine/threat_engine.h"
#include "analysis/feature_extractor.h"
#include "core/logger.h"
#include "engine/verdict_composer.h"

#include <future>
#include <system_error>

ThreatEngine::ThreatEngine(std::shared_ptr<const ThreatClassifier> classifier,
                           std::shared_ptr<ThreatIntelSource> intel,
                           ScoringPolicy policy,
                           IndicatorThresholds thresholds)
    : classifier_(classifier ? std::move(classifier) : ThreatClassifier::heuristicOnly())
    , intel_(intel ? std::move(intel) : std::make_shared<DisabledIntelSource>())
    , policy_(policy)
    , thresholds_(thresholds) {}

ThreatIntelSignal ThreatEngine::lookupIntel(const std::string& url) const {
    try {
        return intel_->lookup(url);
    } catch (const std::exception& e) {
        Logger::instance().log(LogLevel::Warn,
            "ThreatEngine: intel lookup failed: " + std::string(e.what()));
    }
    return {};
}

ThreatVerdict ThreatEngine::analyze(const std::string& url) const {
    // Reputation lookups are the only slow stage; overlap them with the rest
    std::future<ThreatIntelSignal> intelFuture;
    if (intel_->enabled()) {
        try {
            intelFuture = std::async(std::launch::async,
                [this, url]() { return lookupIntel(url); });
        } catch (const std::system_error& e) {
            Logger::instance().log(LogLevel::Warn,
                "ThreatEngine: cannot start intel lookup: " + std::string(e.what()));
        }
    }

    UrlFeatures features = FeatureExtractor::extract(url);
    std::vector<std::string> indicators = indicatorsFor(features, thresholds_);
    ModelEstimate estimate = classifier_->predict(features, thresholds_);

    ThreatIntelSignal intel;
    if (intelFuture.valid())
        intel = intelFuture.get();

    FusionResult fusion = classify(estimate, indicators, intel, policy_);

    Logger::instance().log(LogLevel::Debug,
        "ThreatEngine: " + url + " -> " + threatLevelToString(fusion.threatLevel) +
        " score=" + std::to_string(fusion.threatScore) +
        (estimate.fromModel ? " (model)" : " (fallback)"));

    return compose(url, features, indicators, fusion, intel);
}
