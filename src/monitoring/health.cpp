#include "monitoring/health.h"
#include "core/logger.h"
#include "engine/threat_engine.h"

HealthStatus Health::check(const ThreatEngine& engine,
                           const IntelAggregator* intel) {
    HealthStatus s;

    const ThreatClassifier& classifier = engine.classifier();
    s.classifierLoaded = classifier.modelLoaded();
    s.modelSource = classifier.modelSource();
    if (intel)
        s.intelSources = intel->status();

    if (s.classifierLoaded) {
        s.ok = true;
        s.message = "READY";
    } else {
        s.ok = false;
        s.message = "DEGRADED: classifier artifact not loaded, heuristic fallback active";
    }

    Logger::instance().log(LogLevel::Debug, "Health check: " + s.message);
    return s;
}
