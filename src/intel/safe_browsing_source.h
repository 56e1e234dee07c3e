#pragma once
#include <memory>
#include "intel/intel_source.h"
#include "intel/http_client.h"

// Google Safe Browsing v4 threatMatches:find
class SafeBrowsingSource : public ThreatIntelSource {
public:
    SafeBrowsingSource(std::string apiKey,
                       std::shared_ptr<HttpClient> http,
                       long timeoutMs);

    ThreatIntelSignal lookup(const std::string& url) override;

    std::string name() const override {
        return "GoogleSafeBrowsing";
    }

    bool enabled() const override { return !apiKey_.empty(); }

    std::string buildRequestBody(const std::string& url) const;

private:
    std::string apiKey_;
    std::shared_ptr<HttpClient> http_;
    long timeoutMs_;
};
