#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/threat_types.h"

struct ScanRecord {
    std::string id;
    std::optional<std::string> userId;
    std::string createdAt;      // ISO-8601 UTC, e.g. 2026-10-19T07:42:00Z

    std::string url;
    double threatScore = 0.0;
    std::string threatLevel;
    std::string confidence;
    std::vector<std::string> indicators;
    std::string recommendation;
    bool safeToVisit = true;
};

void to_json(nlohmann::json& j, const ScanRecord& r);
void from_json(const nlohmann::json& j, ScanRecord& r);

struct LevelCounts {
    int total = 0;
    int safe = 0;
    int suspicious = 0;
    int highRisk = 0;
};

// Scan history persisted as one JSON array. Every mutation rewrites the file
// through a temp file + rename, so at most maxRecords are kept (oldest
// dropped first). The engine never touches this store; the service layer
// does.
class ScanStore {
public:
    explicit ScanStore(std::string path, size_t maxRecords = 10000);

    // Throws std::runtime_error when the file cannot be written; the record
    // stays in memory either way.
    ScanRecord save(const ThreatVerdict& verdict,
                    const std::optional<std::string>& userId = std::nullopt);

    std::vector<ScanRecord> recent(size_t limit) const;
    std::optional<ScanRecord> find(const std::string& id) const;
    bool remove(const std::string& id);

    LevelCounts countsByLevel() const;

    // Keyed by UTC date (YYYY-MM-DD), oldest first
    std::map<std::string, LevelCounts> countsByDay() const;

    size_t size() const;

    static std::string newScanId();
    static std::string utcTimestamp();

private:
    void load();
    void saveUnlocked() const;
    void trimUnlocked();

    std::string path_;
    size_t maxRecords_;
    mutable std::mutex mutex_;
    std::vector<ScanRecord> records_;   // insertion order, oldest first
};
