// Batch URL scanner
// Analyzes every URL in a text file (one per line, '#' comments allowed) and
// writes one verdict JSON object per line.
// Usage: urlsentry_batch urls.txt verdicts.jsonl

#include "../src/core/config_loader.h"
#include "../src/core/logger.h"
#include "../src/core/service_context.h"
#include "../src/engine/threat_engine.h"
#include "../src/engine/verdict_json.h"
#include "../src/model/threat_classifier.h"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <urls.txt> <out.jsonl>" << std::endl;
        return 1;
    }

    std::string inputFile = argv[1];
    std::string outputFile = argv[2];

    try {
        std::string configPath = "config/urlsentry.yml";
        if (const char* env = std::getenv("CONFIG_PATH"))
            configPath = env;

        ServiceConfig cfg;
        if (std::filesystem::exists(configPath))
            cfg = ConfigLoader::loadFromFile(configPath);
        ConfigLoader::applyEnvironment(cfg);
        ConfigLoader::validateConfig(cfg);
        Logger::instance().setLevel(logLevelFromString(cfg.logLevel));

        std::ifstream in(inputFile);
        if (!in) {
            std::cerr << "Error: cannot read " << inputFile << std::endl;
            return 1;
        }
        std::ofstream out(outputFile, std::ios::trunc);
        if (!out) {
            std::cerr << "Error: cannot write " << outputFile << std::endl;
            return 1;
        }

        ThreatEngine engine(ThreatClassifier::load(cfg.modelPath),
                            ServiceContext::buildIntel(cfg, nullptr),
                            cfg.scoring, cfg.thresholds);

        int scanned = 0;
        int safe = 0;
        int suspicious = 0;
        int highRisk = 0;

        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.empty() || line[0] == '#')
                continue;

            ThreatVerdict v = engine.analyze(line);
            out << dumpJson(v) << "\n";
            scanned++;

            switch (v.threatLevel) {
            case ThreatLevel::Safe: safe++; break;
            case ThreatLevel::Suspicious: suspicious++; break;
            case ThreatLevel::HighRisk: highRisk++; break;
            }
        }
        out.close();
        if (!out) {
            std::cerr << "Error: write failed for " << outputFile << std::endl;
            return 1;
        }

        std::cout << "Scan complete:" << std::endl;
        std::cout << "  Scanned: " << scanned << " URLs" << std::endl;
        std::cout << "  Safe: " << safe << std::endl;
        std::cout << "  Suspicious: " << suspicious << std::endl;
        std::cout << "  High Risk: " << highRisk << std::endl;
        std::cout << "\nOutput written to: " << outputFile << std::endl;

        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
