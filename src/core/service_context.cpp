#include "core/service_context.h"
#include "core/logger.h"
#include "intel/safe_browsing_source.h"
#include "intel/virustotal_source.h"

std::shared_ptr<IntelAggregator> ServiceContext::buildIntel(const ServiceConfig& cfg,
                                                            std::shared_ptr<HttpClient> http) {
    auto intel = std::make_shared<IntelAggregator>(
        std::chrono::milliseconds(cfg.intelTimeoutMs));

    const bool anyKey = (cfg.safeBrowsingEnabled && !cfg.safeBrowsingApiKey.empty()) ||
                        (cfg.virusTotalEnabled && !cfg.virusTotalApiKey.empty());
    if (anyKey && !http)
        http = std::make_shared<CurlHttpClient>();

    // Per-request transport timeout equals the aggregate budget, so an
    // abandoned lookup still ends shortly after the deadline.
    const long timeoutMs = cfg.intelTimeoutMs;

    intel->addSource(std::make_shared<SafeBrowsingSource>(
        cfg.safeBrowsingEnabled ? cfg.safeBrowsingApiKey : std::string(),
        http, timeoutMs));
    intel->addSource(std::make_shared<VirusTotalSource>(
        cfg.virusTotalEnabled ? cfg.virusTotalApiKey : std::string(),
        http, timeoutMs, cfg.virusTotalMinDetections));

    return intel;
}

ServiceContext::ServiceContext(const ServiceConfig& cfg,
                               std::shared_ptr<HttpClient> http)
    : config(cfg)
    , classifier(ThreatClassifier::load(cfg.modelPath))
    , intel(buildIntel(cfg, std::move(http)))
    , engine(classifier, intel, cfg.scoring, cfg.thresholds)
    , scanStore(cfg.historyFile, static_cast<size_t>(cfg.maxRecords))
{
    Logger::instance().log(LogLevel::Info,
        std::string("Threat engine ready: classifier=") + classifier->modelSource() +
        ", intel=" + (intel->enabled() ? "enabled" : "disabled"));
}
