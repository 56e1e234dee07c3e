#include "model/threat_classifier.h"
#include "analysis/indicator_rules.h"
#include "core/logger.h"

#include <algorithm>
#include <filesystem>

namespace {

const char* kFallbackSource = "heuristic-fallback";

// Additive weights of the fallback estimator. Thresholds are shared with the
// indicator rules so both stages read the same feature the same way.
struct FallbackWeights {
    double longUrl = 0.10;
    double manyDots = 0.10;
    double ipHost = 0.40;
    double perKeyword = 0.15;
    double keywordCap = 0.45;
    double riskyTld = 0.30;
    double noHttps = 0.15;
    double deepSubdomains = 0.10;
    double highEntropy = 0.10;
    double youngDomain = 0.05;
    int youngDomainDays = 90;
};

} // namespace

ThreatClassifier::ThreatClassifier(std::optional<ForestModel> model, std::string source)
    : model_(std::move(model)), source_(std::move(source)) {}

std::shared_ptr<const ThreatClassifier> ThreatClassifier::load(const std::string& modelPath) {
    if (modelPath.empty()) {
        Logger::instance().log(LogLevel::Warn,
            "Classifier: no model path configured, using heuristic fallback");
        return heuristicOnly();
    }

    std::error_code ec;
    if (!std::filesystem::exists(modelPath, ec)) {
        Logger::instance().log(LogLevel::Warn,
            "Classifier: model " + modelPath + " not found, using heuristic fallback");
        return heuristicOnly();
    }

    ForestModel model;
    std::string error;
    if (!model.load(modelPath, error)) {
        Logger::instance().log(LogLevel::Error,
            "Classifier: rejected model " + modelPath + ": " + error +
            "; using heuristic fallback");
        return heuristicOnly();
    }

    Logger::instance().log(LogLevel::Info,
        "Classifier: loaded " + std::to_string(model.treeCount()) +
        "-tree forest from " + modelPath);
    return fromModel(std::move(model), modelPath);
}

std::shared_ptr<const ThreatClassifier> ThreatClassifier::heuristicOnly() {
    return std::shared_ptr<const ThreatClassifier>(
        new ThreatClassifier(std::nullopt, kFallbackSource));
}

std::shared_ptr<const ThreatClassifier> ThreatClassifier::fromModel(ForestModel model,
                                                                    std::string source) {
    return std::shared_ptr<const ThreatClassifier>(
        new ThreatClassifier(std::move(model), std::move(source)));
}

ModelEstimate ThreatClassifier::predict(const UrlFeatures& f,
                                        const IndicatorThresholds& t) const {
    ModelEstimate e;
    if (model_) {
        e.probability = std::clamp(model_->maliciousProbability(toModelVector(f)), 0.0, 1.0);
        e.fromModel = true;
    } else {
        e.probability = heuristicProbability(f, t);
        e.fromModel = false;
    }
    return e;
}

double ThreatClassifier::heuristicProbability(const UrlFeatures& f,
                                              const IndicatorThresholds& t) {
    static const FallbackWeights w;

    double p = 0.0;
    if (f.length > t.maxLength)          p += w.longUrl;
    if (f.dotCount > t.maxDots)          p += w.manyDots;
    if (f.hasIpHost)                     p += w.ipHost;
    p += std::min(w.keywordCap, f.suspiciousKeywordCount * w.perKeyword);
    if (f.tldRiskScore > 0.0)            p += w.riskyTld;
    if (!f.usesHttps)                    p += w.noHttps;
    if (f.subdomainCount > t.maxSubdomains) p += w.deepSubdomains;
    if (f.entropy > t.maxEntropy)        p += w.highEntropy;
    if (f.domainAgeDays && *f.domainAgeDays < w.youngDomainDays)
        p += w.youngDomain;

    return std::clamp(p, 0.0, 1.0);
}
