#pragma once
#include <string>
#include <vector>
#include "analysis/url_features.h"

extern const char* const kNoIndicatorsText;

// Number of heuristic rules; denominator of the indicator density.
constexpr int kIndicatorRuleCount = 8;

struct IndicatorThresholds {
    int maxLength = 75;
    int maxDots = 3;
    int maxSubdomains = 2;
    double maxEntropy = 4.0;
};

// Rules are evaluated in a fixed order (length, dots, IP, keywords, TLD,
// HTTPS, subdomains, entropy) so the output order is stable.
std::vector<std::string> indicatorsFor(const UrlFeatures& f,
                                       const IndicatorThresholds& t = {});

// Number of rules behind an indicator list; 0 for the placeholder list.
int triggeredCount(const std::vector<std::string>& indicators);
