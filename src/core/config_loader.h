#pragma once

#include <string>
#include "analysis/indicator_rules.h"
#include "engine/score_fusion.h"

struct ServiceConfig {
    std::string host = "0.0.0.0";
    int port = 8000;

    std::string logFile;                 // empty: log to stderr
    std::string logLevel = "info";

    std::string modelPath = "models/url_threat_model.json";

    // Threat intelligence. An empty key disables that source.
    int intelTimeoutMs = 5000;
    bool safeBrowsingEnabled = true;
    std::string safeBrowsingApiKey;
    bool virusTotalEnabled = true;
    std::string virusTotalApiKey;
    int virusTotalMinDetections = 1;

    ScoringPolicy scoring;
    IndicatorThresholds thresholds;

    std::string historyFile = "data/url_scans.json";
    int historyLimit = 50;
    int historyMaxLimit = 500;
    int maxRecords = 10000;     // retention cap, oldest dropped first
};

class ConfigLoader {
public:
    static ServiceConfig loadFromFile(const std::string& path);

    // Environment overrides: API keys and model path.
    static void applyEnvironment(ServiceConfig& cfg);

    static void validateConfig(const ServiceConfig& cfg);
};
