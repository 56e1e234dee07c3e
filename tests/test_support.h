#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>

#include "intel/http_client.h"
#include "intel/intel_source.h"
#include "storage/scan_store.h"

// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        path_ = std::filesystem::temp_directory_path() /
                ("urlsentry_test_" + ScanStore::newScanId());
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::string file(const std::string& name) const {
        return (path_ / name).string();
    }

    std::string write(const std::string& name, const std::string& content) const {
        std::string p = file(name);
        std::ofstream out(p, std::ios::trunc);
        out << content;
        return p;
    }

private:
    std::filesystem::path path_;
};

// Canned transport: returns one response or throws one HttpError, and keeps
// the last request for inspection.
class FakeHttpClient : public HttpClient {
public:
    HttpResponse response{200, "{}"};
    bool fail = false;
    bool failWithTimeout = false;

    std::string lastMethod;
    std::string lastUrl;
    std::string lastBody;
    HttpHeaders lastHeaders;
    long lastTimeoutMs = 0;
    int calls = 0;

    HttpResponse get(const std::string& url,
                     const HttpHeaders& headers,
                     long timeoutMs) override {
        record("GET", url, "", headers, timeoutMs);
        return answer();
    }

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const HttpHeaders& headers,
                      long timeoutMs) override {
        record("POST", url, body, headers, timeoutMs);
        return answer();
    }

private:
    void record(const std::string& method, const std::string& url,
                const std::string& body, const HttpHeaders& headers,
                long timeoutMs) {
        std::lock_guard lock(mutex_);
        lastMethod = method;
        lastUrl = url;
        lastBody = body;
        lastHeaders = headers;
        lastTimeoutMs = timeoutMs;
        ++calls;
    }

    HttpResponse answer() const {
        if (fail)
            throw HttpError(failWithTimeout ? "operation timed out" : "connection refused",
                            failWithTimeout);
        return response;
    }

    std::mutex mutex_;
};

// Scripted reputation source.
class FakeIntelSource : public ThreatIntelSource {
public:
    FakeIntelSource(std::string name, ThreatIntelSignal signal,
                    std::chrono::milliseconds delay = std::chrono::milliseconds(0),
                    bool isEnabled = true)
        : name_(std::move(name)), signal_(signal), delay_(delay), enabled_(isEnabled) {}

    ThreatIntelSignal lookup(const std::string&) override {
        ++calls;
        if (delay_.count() > 0)
            std::this_thread::sleep_for(delay_);
        ++completed;
        if (throws)
            throw std::runtime_error("scripted failure");
        return signal_;
    }

    std::string name() const override { return name_; }
    bool enabled() const override { return enabled_; }

    std::atomic<int> calls{0};
    std::atomic<int> completed{0};
    bool throws = false;

private:
    std::string name_;
    ThreatIntelSignal signal_;
    std::chrono::milliseconds delay_;
    bool enabled_;
};

inline ThreatIntelSignal safeBrowsingHit() {
    ThreatIntelSignal s;
    s.flaggedBySafeBrowsing = true;
    return s;
}

inline ThreatIntelSignal virusTotalResult(bool flagged, int hits) {
    ThreatIntelSignal s;
    s.flaggedByVirusTotal = flagged;
    s.vendorHitCount = hits;
    return s;
}
