#pragma once
#include <string>
#include <vector>
#include "engine/score_fusion.h"
#include "engine/threat_types.h"

std::string recommendationFor(ThreatLevel level);

ThreatVerdict compose(const std::string& url,
                      const UrlFeatures& features,
                      const std::vector<std::string>& indicators,
                      const FusionResult& fusion,
                      const ThreatIntelSignal& intel);
