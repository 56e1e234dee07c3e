#include "api/api_server.h"
#include "core/config_loader.h"
#include "core/logger.h"
#include "core/service_context.h"
#include "engine/threat_engine.h"
#include "engine/verdict_json.h"
#include "model/threat_classifier.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <getopt.h>
#include <iostream>
#include <string>
#include <thread>

namespace {

// Global flag for graceful shutdown
std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

void printUsage(const char* app) {
    std::cerr << "Usage: " << app << " [-c config] <command>\n"
              << "  analyze URL...   Print one verdict JSON per URL\n"
              << "  serve            Run the HTTP API until SIGINT/SIGTERM\n"
              << "Options:\n"
              << "  -c <path>   YAML config (default: config/urlsentry.yml or CONFIG_PATH)\n"
              << "  -h          Show this help message\n";
}

ServiceConfig loadConfig(const std::string& path, bool explicitPath) {
    ServiceConfig cfg;
    if (explicitPath || std::filesystem::exists(path)) {
        cfg = ConfigLoader::loadFromFile(path);
    } else {
        Logger::instance().log(LogLevel::Info,
            "No config at " + path + ", using built-in defaults");
    }
    ConfigLoader::applyEnvironment(cfg);
    ConfigLoader::validateConfig(cfg);
    return cfg;
}

int runAnalyze(const ServiceConfig& cfg, int argc, char** argv, int first) {
    if (first >= argc) {
        std::cerr << "analyze: at least one URL is required\n";
        return 1;
    }

    ThreatEngine engine(ThreatClassifier::load(cfg.modelPath),
                        ServiceContext::buildIntel(cfg, nullptr),
                        cfg.scoring, cfg.thresholds);

    for (int i = first; i < argc; ++i) {
        nlohmann::json out = engine.analyze(argv[i]);
        std::cout << dumpJson(out) << std::endl;
    }
    return 0;
}

int runServe(const ServiceConfig& cfg) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);

    ServiceContext ctx(cfg);

    ApiServer api(ctx);
    api.start(cfg.host, cfg.port);

    Logger::instance().log(LogLevel::Info, "urlsentry running. Waiting for shutdown signal...");

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    Logger::instance().log(LogLevel::Info, "Shutting down API server...");
    api.stop();
    Logger::instance().log(LogLevel::Info, "Shutdown complete");
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::string configPath = "config/urlsentry.yml";
    bool explicitConfig = false;
    if (const char* envConfig = std::getenv("CONFIG_PATH")) {
        configPath = envConfig;
        explicitConfig = true;
    }

    int opt = 0;
    while ((opt = ::getopt(argc, argv, "+hc:")) != -1) {
        switch (opt) {
            case 'c':
                configPath = optarg;
                explicitConfig = true;
                break;
            case 'h':
            default:
                printUsage(argv[0]);
                return (opt == 'h') ? 0 : 1;
        }
    }

    if (optind >= argc) {
        printUsage(argv[0]);
        return 1;
    }
    const std::string command = argv[optind];

    try {
        ServiceConfig cfg = loadConfig(configPath, explicitConfig);

        Logger::instance().setFile(cfg.logFile);
        Logger::instance().setLevel(logLevelFromString(cfg.logLevel));

        if (command == "analyze")
            return runAnalyze(cfg, argc, argv, optind + 1);
        if (command == "serve")
            return runServe(cfg);

        std::cerr << "Unknown command: " << command << "\n";
        printUsage(argv[0]);
        return 1;
    }
    catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        Logger::instance().log(LogLevel::Error, "Fatal error: " + std::string(ex.what()));
        return 1;
    }
}
