#pragma once
#include <memory>
#include <optional>
#include <string>
#include "analysis/indicator_rules.h"
#include "analysis/url_features.h"
#include "model/forest_model.h"

struct ModelEstimate {
    double probability = 0.0;   // [0, 1]
    bool fromModel = false;     // false: heuristic fallback produced it
};

// Loaded once at startup and shared read-only between requests.
class ThreatClassifier {
public:
    // Never fails: a missing or rejected artifact yields the fallback.
    static std::shared_ptr<const ThreatClassifier> load(const std::string& modelPath);
    static std::shared_ptr<const ThreatClassifier> heuristicOnly();
    static std::shared_ptr<const ThreatClassifier> fromModel(ForestModel model,
                                                             std::string source);

    // Thresholds feed the fallback estimator only; the forest ignores them.
    ModelEstimate predict(const UrlFeatures& f,
                          const IndicatorThresholds& t = {}) const;

    bool modelLoaded() const { return model_.has_value(); }
    const std::string& modelSource() const { return source_; }

    static double heuristicProbability(const UrlFeatures& f,
                                       const IndicatorThresholds& t = {});

private:
    ThreatClassifier(std::optional<ForestModel> model, std::string source);

    std::optional<ForestModel> model_;
    std::string source_;
};
