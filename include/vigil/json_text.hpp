#pragma once

#include <map>
#include <string>
#include <vector>

#include "vigil/detection_types.hpp"
#include "vigil/scenario_store.hpp"

namespace vigil {

// Small helpers for the hand-written JSON emitted by the publisher and the HTTP API.
std::string json_escape(const std::string& s);
std::string json_string(const std::string& s);
std::string json_number(double v, int precision = 4);
std::string json_scores(const std::map<std::string, double>& scores);
std::string json_string_list(const std::vector<std::string>& items);

std::string to_json(const ScenarioDefinition& def);
std::string to_json(const ScenarioStatistics& st);
std::string to_json(const DetectorInfo& info);
std::string to_json(const ReloadReport& report);
std::string to_json(const DetectionResult& result);

// Wall-clock helpers.
std::string now_iso_utc();
std::string now_compact_local();   // YYYYmmdd_HHMMSS

}  // namespace vigil
