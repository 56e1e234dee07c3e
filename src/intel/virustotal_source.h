#pragma once
#include <memory>
#include "intel/intel_source.h"
#include "intel/http_client.h"

// VirusTotal v3 URL report lookup. Never submits the URL for a new scan.
class VirusTotalSource : public ThreatIntelSource {
public:
    VirusTotalSource(std::string apiKey,
                     std::shared_ptr<HttpClient> http,
                     long timeoutMs,
                     int minDetections = 1);

    ThreatIntelSignal lookup(const std::string& url) override;

    std::string name() const override {
        return "VirusTotal";
    }

    bool enabled() const override { return !apiKey_.empty(); }

    static std::string urlIdentifier(const std::string& url);

private:
    std::string apiKey_;
    std::shared_ptr<HttpClient> http_;
    long timeoutMs_;
    int minDetections_;
};
