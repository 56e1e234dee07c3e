#pragma once

#include <memory>
#include "core/config_loader.h"
#include "engine/threat_engine.h"
#include "intel/http_client.h"
#include "intel/intel_aggregator.h"
#include "model/threat_classifier.h"
#include "storage/scan_store.h"

// Everything a running service shares between requests. The classifier is
// the only engine-level resource and is read-only after construction.
struct ServiceContext {
    ServiceConfig config;
    std::shared_ptr<const ThreatClassifier> classifier;
    std::shared_ptr<IntelAggregator> intel;
    ThreatEngine engine;
    ScanStore scanStore;

    // http defaults to libcurl; tests pass a fake transport.
    explicit ServiceContext(const ServiceConfig& cfg,
                            std::shared_ptr<HttpClient> http = nullptr);

    static std::shared_ptr<IntelAggregator> buildIntel(const ServiceConfig& cfg,
                                                       std::shared_ptr<HttpClient> http);
};
