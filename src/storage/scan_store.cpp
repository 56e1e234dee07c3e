#include "storage/scan_store.h"
#include "core/logger.h"
#include "engine/verdict_json.h"

#include <nlohmann/json.hpp>
#include <openssl/rand.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

static void addToCounts(LevelCounts& c, const std::string& level) {
    ++c.total;
    if (level == threatLevelToString(ThreatLevel::Safe)) ++c.safe;
    else if (level == threatLevelToString(ThreatLevel::Suspicious)) ++c.suspicious;
    else if (level == threatLevelToString(ThreatLevel::HighRisk)) ++c.highRisk;
}

void to_json(json& j, const ScanRecord& r) {
    j = json{
        {"scanId", r.id},
        {"createdAt", r.createdAt},
        {"url", r.url},
        {"threatScore", r.threatScore},
        {"threatLevel", r.threatLevel},
        {"confidence", r.confidence},
        {"indicators", r.indicators},
        {"recommendation", r.recommendation},
        {"safeToVisit", r.safeToVisit}
    };
    j["userId"] = r.userId ? json(*r.userId) : json(nullptr);
}

void from_json(const json& j, ScanRecord& r) {
    r.id = j.at("scanId").get<std::string>();
    r.createdAt = j.at("createdAt").get<std::string>();
    r.url = j.at("url").get<std::string>();
    r.threatScore = j.value("threatScore", 0.0);
    r.threatLevel = j.value("threatLevel", std::string());
    r.confidence = j.value("confidence", std::string());
    r.indicators = j.value("indicators", std::vector<std::string>{});
    r.recommendation = j.value("recommendation", std::string());
    r.safeToVisit = j.value("safeToVisit", false);
    if (j.contains("userId") && j["userId"].is_string())
        r.userId = j["userId"].get<std::string>();
    else
        r.userId.reset();
}

ScanStore::ScanStore(std::string path, size_t maxRecords)
    : path_(std::move(path)), maxRecords_(std::max<size_t>(maxRecords, 1)) {
    std::error_code ec;
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty())
        std::filesystem::create_directories(parent, ec);
    load();
}

void ScanStore::load() {
    std::lock_guard lock(mutex_);
    if (!std::filesystem::exists(path_)) return;

    try {
        std::ifstream in(path_);
        json j;
        in >> j;
        records_ = j.get<std::vector<ScanRecord>>();
        trimUnlocked();
        Logger::instance().log(LogLevel::Info,
            "ScanStore: Loaded " + std::to_string(records_.size()) + " scan records");
    } catch (const std::exception& e) {
        Logger::instance().log(LogLevel::Error,
            "ScanStore: Load failed: " + std::string(e.what()));
        records_.clear();
    }
}

void ScanStore::saveUnlocked() const {
    json j = records_;

    std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out)
            throw std::runtime_error("ScanStore: cannot open " + tmp);
        out << dumpJson(j, 2);
        if (!out)
            throw std::runtime_error("ScanStore: write failed for " + tmp);
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path_, ec);
    if (ec)
        throw std::runtime_error("ScanStore: rename failed: " + ec.message());
}

void ScanStore::trimUnlocked() {
    if (records_.size() <= maxRecords_)
        return;
    size_t excess = records_.size() - maxRecords_;
    records_.erase(records_.begin(), records_.begin() + static_cast<std::ptrdiff_t>(excess));
    Logger::instance().log(LogLevel::Debug,
        "ScanStore: Dropped " + std::to_string(excess) + " oldest scan records");
}

ScanRecord ScanStore::save(const ThreatVerdict& verdict,
                           const std::optional<std::string>& userId) {
    ScanRecord r;
    r.id = newScanId();
    r.userId = userId;
    r.createdAt = utcTimestamp();
    r.url = verdict.url;
    r.threatScore = verdict.threatScore;
    r.threatLevel = threatLevelToString(verdict.threatLevel);
    r.confidence = confidenceToString(verdict.confidence);
    r.indicators = verdict.indicators;
    r.recommendation = verdict.recommendation;
    r.safeToVisit = verdict.safeToVisit;

    std::lock_guard lock(mutex_);
    records_.push_back(r);
    trimUnlocked();
    saveUnlocked();
    Logger::instance().log(LogLevel::Debug, "ScanStore: Saved scan " + r.id);
    return r;
}

std::vector<ScanRecord> ScanStore::recent(size_t limit) const {
    std::lock_guard lock(mutex_);
    std::vector<ScanRecord> out;
    for (auto it = records_.rbegin(); it != records_.rend() && out.size() < limit; ++it)
        out.push_back(*it);
    return out;
}

std::optional<ScanRecord> ScanStore::find(const std::string& id) const {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(records_.begin(), records_.end(),
        [&](const ScanRecord& r) { return r.id == id; });
    if (it == records_.end())
        return std::nullopt;
    return *it;
}

bool ScanStore::remove(const std::string& id) {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(records_.begin(), records_.end(),
        [&](const ScanRecord& r) { return r.id == id; });
    if (it == records_.end())
        return false;
    records_.erase(it);
    saveUnlocked();
    return true;
}

LevelCounts ScanStore::countsByLevel() const {
    std::lock_guard lock(mutex_);
    LevelCounts c;
    for (const auto& r : records_)
        addToCounts(c, r.threatLevel);
    return c;
}

std::map<std::string, LevelCounts> ScanStore::countsByDay() const {
    std::lock_guard lock(mutex_);
    std::map<std::string, LevelCounts> out;
    for (const auto& r : records_) {
        if (r.createdAt.size() < 10)
            continue;
        addToCounts(out[r.createdAt.substr(0, 10)], r.threatLevel);
    }
    return out;
}

size_t ScanStore::size() const {
    std::lock_guard lock(mutex_);
    return records_.size();
}

std::string ScanStore::newScanId() {
    unsigned char b[16];
    if (RAND_bytes(b, sizeof(b)) != 1)
        throw std::runtime_error("ScanStore: RAND_bytes failed");

    // RFC 4122 version 4, variant 1
    b[6] = static_cast<unsigned char>((b[6] & 0x0F) | 0x40);
    b[8] = static_cast<unsigned char>((b[8] & 0x3F) | 0x80);

    std::ostringstream oss;
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) oss << '-';
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b[i]);
    }
    return oss.str();
}

std::string ScanStore::utcTimestamp() {
    std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}
