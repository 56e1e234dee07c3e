#include "core/config_loader.h"
#include "core/logger.h"

#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <vector>

ServiceConfig ConfigLoader::loadFromFile(const std::string& path) {
    ServiceConfig cfg;

    try {
        YAML::Node root = YAML::LoadFile(path);

        if (root["server"]) {
            auto s = root["server"];
            if (s["host"]) cfg.host = s["host"].as<std::string>();
            if (s["port"]) cfg.port = s["port"].as<int>();
        }

        if (root["logging"]) {
            auto l = root["logging"];
            if (l["file"])  cfg.logFile  = l["file"].as<std::string>();
            if (l["level"]) cfg.logLevel = l["level"].as<std::string>();
        }

        if (root["model"]) {
            auto m = root["model"];
            if (m["path"]) cfg.modelPath = m["path"].as<std::string>();
        }

        if (root["intel"]) {
            auto i = root["intel"];
            if (i["timeout_ms"]) cfg.intelTimeoutMs = i["timeout_ms"].as<int>();

            if (i["safe_browsing"]) {
                auto sb = i["safe_browsing"];
                if (sb["enabled"]) cfg.safeBrowsingEnabled = sb["enabled"].as<bool>();
                if (sb["api_key"]) cfg.safeBrowsingApiKey = sb["api_key"].as<std::string>();
            }
            if (i["virustotal"]) {
                auto vt = i["virustotal"];
                if (vt["enabled"]) cfg.virusTotalEnabled = vt["enabled"].as<bool>();
                if (vt["api_key"]) cfg.virusTotalApiKey = vt["api_key"].as<std::string>();
                if (vt["min_detections"]) cfg.virusTotalMinDetections = vt["min_detections"].as<int>();
            }
        }

        if (root["scoring"]) {
            auto s = root["scoring"];
            auto& p = cfg.scoring;
            if (s["model_weight"])          p.modelWeight = s["model_weight"].as<double>();
            if (s["indicator_weight"])      p.indicatorWeight = s["indicator_weight"].as<double>();
            if (s["suspicious_threshold"])  p.suspiciousThreshold = s["suspicious_threshold"].as<double>();
            if (s["high_risk_threshold"])   p.highRiskThreshold = s["high_risk_threshold"].as<double>();
            if (s["intel_override_floor"])  p.intelOverrideFloor = s["intel_override_floor"].as<double>();
            if (s["heuristic_risk_count"])  p.heuristicRiskCount = s["heuristic_risk_count"].as<int>();
        }

        if (root["indicators"]) {
            auto n = root["indicators"];
            auto& t = cfg.thresholds;
            if (n["max_length"])     t.maxLength = n["max_length"].as<int>();
            if (n["max_dots"])       t.maxDots = n["max_dots"].as<int>();
            if (n["max_subdomains"]) t.maxSubdomains = n["max_subdomains"].as<int>();
            if (n["max_entropy"])    t.maxEntropy = n["max_entropy"].as<double>();
        }

        if (root["storage"]) {
            auto s = root["storage"];
            if (s["history_file"])      cfg.historyFile = s["history_file"].as<std::string>();
            if (s["history_limit"])     cfg.historyLimit = s["history_limit"].as<int>();
            if (s["history_max_limit"]) cfg.historyMaxLimit = s["history_max_limit"].as<int>();
            if (s["max_records"])       cfg.maxRecords = s["max_records"].as<int>();
        }
    } catch (const std::exception& ex) {
        Logger::instance().log(
            LogLevel::Error,
            std::string("Failed to load config: ") + ex.what());
        throw;
    }

    validateConfig(cfg);

    return cfg;
}

void ConfigLoader::applyEnvironment(ServiceConfig& cfg) {
    if (const char* v = std::getenv("GOOGLE_SAFE_BROWSING_API_KEY"))
        cfg.safeBrowsingApiKey = v;
    if (const char* v = std::getenv("VIRUSTOTAL_API_KEY"))
        cfg.virusTotalApiKey = v;
    if (const char* v = std::getenv("URLSENTRY_MODEL_PATH"))
        cfg.modelPath = v;
}

void ConfigLoader::validateConfig(const ServiceConfig& cfg) {
    std::vector<std::string> errors;

    if (cfg.port <= 0 || cfg.port > 65535) {
        errors.push_back("server.port must be between 1-65535");
    }

    std::vector<std::string> validLevels = {"debug", "info", "warn", "warning", "error"};
    if (std::find(validLevels.begin(), validLevels.end(), cfg.logLevel) == validLevels.end()) {
        errors.push_back("logging.level must be one of: debug, info, warn, error");
    }

    if (cfg.intelTimeoutMs < 100 || cfg.intelTimeoutMs > 60000) {
        errors.push_back("intel.timeout_ms must be between 100 and 60000");
    }
    if (cfg.virusTotalMinDetections < 1) {
        errors.push_back("intel.virustotal.min_detections must be at least 1");
    }

    const auto& p = cfg.scoring;
    if (p.modelWeight < 0.0 || p.indicatorWeight < 0.0 ||
        p.modelWeight + p.indicatorWeight <= 0.0) {
        errors.push_back("scoring weights must be non-negative and not both zero");
    }
    if (!(p.suspiciousThreshold > 0.0 && p.suspiciousThreshold < p.highRiskThreshold &&
          p.highRiskThreshold <= 1.0)) {
        errors.push_back("scoring thresholds must satisfy 0 < suspicious < high_risk <= 1");
    }
    // A confirmed vendor hit must never come out as Safe or Suspicious
    if (p.intelOverrideFloor < p.highRiskThreshold || p.intelOverrideFloor > 1.0) {
        errors.push_back("scoring.intel_override_floor must be in [high_risk_threshold, 1]");
    }
    if (p.heuristicRiskCount < 1 || p.heuristicRiskCount > kIndicatorRuleCount) {
        errors.push_back("scoring.heuristic_risk_count must be between 1 and " +
                         std::to_string(kIndicatorRuleCount));
    }

    const auto& t = cfg.thresholds;
    if (t.maxLength < 0 || t.maxDots < 0 || t.maxSubdomains < 0 || t.maxEntropy < 0.0) {
        errors.push_back("indicator thresholds must be non-negative");
    }

    if (cfg.historyFile.empty()) {
        errors.push_back("storage.history_file is required");
    }
    if (cfg.historyLimit < 1 || cfg.historyLimit > cfg.historyMaxLimit) {
        errors.push_back("storage.history_limit must be between 1 and history_max_limit");
    }
    if (cfg.maxRecords < 1) {
        errors.push_back("storage.max_records must be at least 1");
    }

    if (!errors.empty()) {
        std::string errorMsg = "Configuration validation failed:\n";
        for (const auto& error : errors) {
            errorMsg += "  - " + error + "\n";
        }
        Logger::instance().log(LogLevel::Error, errorMsg);
        throw std::runtime_error("Invalid configuration: " + errorMsg);
    }

    Logger::instance().log(LogLevel::Debug, "Configuration validation passed");
}
