#include "intel/safe_browsing_source.h"
#include "core/logger.h"
#include "monitoring/metrics.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static const char* kEndpoint =
    "https://safebrowsing.googleapis.com/v4/threatMatches:find?key=";

SafeBrowsingSource::SafeBrowsingSource(std::string apiKey,
                                       std::shared_ptr<HttpClient> http,
                                       long timeoutMs)
    : apiKey_(std::move(apiKey)), http_(std::move(http)), timeoutMs_(timeoutMs) {}

std::string SafeBrowsingSource::buildRequestBody(const std::string& url) const {
    json entry = json::object();
    entry["url"] = url;

    json payload = {
        {"client", {
            {"clientId", "urlsentry"},
            {"clientVersion", "1.0.0"}
        }},
        {"threatInfo", {
            {"threatTypes", json::array({"MALWARE", "SOCIAL_ENGINEERING",
                             "UNWANTED_SOFTWARE", "POTENTIALLY_HARMFUL_APPLICATION"})},
            {"platformTypes", json::array({"ANY_PLATFORM"})},
            {"threatEntryTypes", json::array({"URL"})},
            {"threatEntries", json::array({entry})}
        }}
    };
    return payload.dump();
}

ThreatIntelSignal SafeBrowsingSource::lookup(const std::string& url) {
    ThreatIntelSignal signal;
    if (!enabled() || !http_)
        return signal;

    try {
        HttpResponse resp = http_->post(
            kEndpoint + apiKey_,
            buildRequestBody(url),
            {{"Content-Type", "application/json"}},
            timeoutMs_);

        if (resp.status != 200) {
            Logger::instance().log(LogLevel::Warn,
                "SafeBrowsing: HTTP " + std::to_string(resp.status) + " for lookup");
            Metrics::instance().inc("intel_lookup_failures_total");
            return signal;
        }

        // An empty object is the documented "no match" answer
        json j = resp.body.empty() ? json::object() : json::parse(resp.body);
        bool matched = j.contains("matches") &&
                       j["matches"].is_array() &&
                       !j["matches"].empty();
        signal.flaggedBySafeBrowsing = matched;

        if (matched) {
            Logger::instance().log(LogLevel::Info,
                "SafeBrowsing: match for " + url);
        }
    } catch (const HttpError& e) {
        Logger::instance().log(LogLevel::Warn,
            std::string("SafeBrowsing: transport error: ") + e.what());
        Metrics::instance().inc(e.timedOut() ? "intel_lookup_timeouts_total"
                                             : "intel_lookup_failures_total");
    } catch (const std::exception& e) {
        Logger::instance().log(LogLevel::Warn,
            std::string("SafeBrowsing: bad response: ") + e.what());
        Metrics::instance().inc("intel_lookup_failures_total");
    }

    return signal;
}
