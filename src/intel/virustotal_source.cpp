#include "intel/virustotal_source.h"
#include "core/base64.h"
#include "core/logger.h"
#include "monitoring/metrics.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

VirusTotalSource::VirusTotalSource(std::string apiKey,
                                   std::shared_ptr<HttpClient> http,
                                   long timeoutMs,
                                   int minDetections)
    : apiKey_(std::move(apiKey))
    , http_(std::move(http))
    , timeoutMs_(timeoutMs)
    , minDetections_(minDetections < 1 ? 1 : minDetections) {}

std::string VirusTotalSource::urlIdentifier(const std::string& url) {
    return base64UrlEncode(url);
}

ThreatIntelSignal VirusTotalSource::lookup(const std::string& url) {
    ThreatIntelSignal signal;
    if (!enabled() || !http_)
        return signal;

    try {
        HttpResponse resp = http_->get(
            "https://www.virustotal.com/api/v3/urls/" + urlIdentifier(url),
            {{"x-apikey", apiKey_}, {"Accept", "application/json"}},
            timeoutMs_);

        if (resp.status == 404) {
            Logger::instance().log(LogLevel::Debug,
                "VirusTotal: no report for " + url);
            return signal;
        }
        if (resp.status != 200) {
            Logger::instance().log(LogLevel::Warn,
                "VirusTotal: HTTP " + std::to_string(resp.status) + " for lookup");
            Metrics::instance().inc("intel_lookup_failures_total");
            return signal;
        }

        json j = json::parse(resp.body);
        const json& stats = j.at("data").at("attributes").at("last_analysis_stats");
        int malicious = stats.value("malicious", 0);
        if (malicious < 0) malicious = 0;

        signal.vendorHitCount = malicious;
        signal.flaggedByVirusTotal = malicious >= minDetections_;

        Logger::instance().log(LogLevel::Debug,
            "VirusTotal: " + std::to_string(malicious) + " engines flag " + url);
    } catch (const HttpError& e) {
        Logger::instance().log(LogLevel::Warn,
            std::string("VirusTotal: transport error: ") + e.what());
        Metrics::instance().inc(e.timedOut() ? "intel_lookup_timeouts_total"
                                             : "intel_lookup_failures_total");
    } catch (const std::exception& e) {
        Logger::instance().log(LogLevel::Warn,
            std::string("VirusTotal: bad response: ") + e.what());
        Metrics::instance().inc("intel_lookup_failures_total");
    }

    return signal;
}
