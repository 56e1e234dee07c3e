#pragma once
#include <optional>

// Reputation verdicts for one URL. An absent flag means the vendor was not
// asked, did not answer in time, or failed.
struct ThreatIntelSignal {
    std::optional<bool> flaggedBySafeBrowsing;
    std::optional<bool> flaggedByVirusTotal;
    int vendorHitCount = 0;

    bool known() const {
        return flaggedBySafeBrowsing.has_value() || flaggedByVirusTotal.has_value();
    }

    bool positive() const {
        return flaggedBySafeBrowsing.value_or(false) ||
               flaggedByVirusTotal.value_or(false);
    }

    bool operator==(const ThreatIntelSignal& o) const {
        return flaggedBySafeBrowsing == o.flaggedBySafeBrowsing &&
               flaggedByVirusTotal == o.flaggedByVirusTotal &&
               vendorHitCount == o.vendorHitCount;
    }
    bool operator!=(const ThreatIntelSignal& o) const { return !(*this == o); }
};

inline std::optional<bool> mergeFlag(const std::optional<bool>& a,
                                     const std::optional<bool>& b) {
    if (!a) return b;
    if (!b) return a;
    return *a || *b;
}

inline ThreatIntelSignal mergeSignals(const ThreatIntelSignal& a,
                                      const ThreatIntelSignal& b) {
    ThreatIntelSignal r;
    r.flaggedBySafeBrowsing = mergeFlag(a.flaggedBySafeBrowsing, b.flaggedBySafeBrowsing);
    r.flaggedByVirusTotal = mergeFlag(a.flaggedByVirusTotal, b.flaggedByVirusTotal);
    r.vendorHitCount = a.vendorHitCount + b.vendorHitCount;
    return r;
}
