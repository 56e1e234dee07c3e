#pragma once
#include <string>
#include <vector>
#include "intel/intel_aggregator.h"

class ThreatEngine;

struct HealthStatus {
    bool ok = false;                // false: running on the heuristic fallback
    std::string message;            // READY or DEGRADED: <reason>
    bool classifierLoaded = false;
    std::string modelSource;
    std::vector<IntelSourceStatus> intelSources;
};

class Health {
public:
    // Informational only: a degraded service still answers analyze requests.
    static HealthStatus check(const ThreatEngine& engine,
                              const IntelAggregator* intel);
};
