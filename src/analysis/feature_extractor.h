#pragma once
#include <string>
#include <vector>
#include "analysis/url_features.h"

class FeatureExtractor {
public:
    // Total: every input, including garbage, yields a feature record.
    static UrlFeatures extract(const std::string& url);

    static double shannonEntropy(const std::string& s);
    static int countSuspiciousKeywords(const std::string& url);
    static double tldRisk(const std::string& tld);
    static int simulatedDomainAge(const std::string& registrableDomain);

    static const std::vector<std::string>& suspiciousKeywords();
};
