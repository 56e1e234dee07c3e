#pragma once
#include <string>
#include "intel/intel_signal.h"

class ThreatIntelSource {
public:
    virtual ~ThreatIntelSource() = default;

    // Must not throw. Failures come back as an unknown signal.
    virtual ThreatIntelSignal lookup(const std::string& url) = 0;

    virtual std::string name() const = 0;

    virtual bool enabled() const { return true; }
};

class DisabledIntelSource : public ThreatIntelSource {
public:
    ThreatIntelSignal lookup(const std::string&) override {
        return {};
    }

    std::string name() const override {
        return "disabled";
    }

    bool enabled() const override { return false; }
};
