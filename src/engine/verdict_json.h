#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "engine/score_fusion.h"
#include "engine/threat_types.h"

void to_json(nlohmann::json& j, const UrlFeatures& f);
void to_json(nlohmann::json& j, const ThreatIntelSignal& s);
void to_json(nlohmann::json& j, const ThreatVerdict& v);

// Replaces invalid UTF-8 (raw-byte URLs) instead of throwing
std::string dumpJson(const nlohmann::json& j, int indent = -1);
