#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>

#include "vigil/scenario.hpp"

namespace vigil {

// Outcome of one detect() call. Plain value, owns all of its data.
struct DetectionResult {
    bool detected{false};
    std::string scenario_id;
    std::string scenario_name;
    double confidence{0.0};
    AlertLevel alert_level{AlertLevel::LOW};
    std::map<std::string, double> all_scores;   // every scenario evaluated this frame
    double timestamp_sec{0.0};
    std::optional<std::string> error;           // scoring failed for this frame

    bool ok() const { return !error.has_value(); }
};

struct ScenarioStatistics {
    std::string scenario_id;
    std::string scenario_name;
    bool enabled{false};
    double threshold{0.0};
    AlertLevel alert_level{AlertLevel::LOW};
    std::size_t history_size{0};
    double mean_confidence{0.0};
    double min_confidence{0.0};
    double max_confidence{0.0};
    double std_confidence{0.0};     // population standard deviation
    int consecutive_count{0};
    double last_trigger_time{0.0};
    bool in_cooldown{false};
};

struct DetectorInfo {
    bool enabled{true};
    float temperature{1.0f};
    std::size_t total_scenarios{0};
    std::size_t enabled_scenarios{0};
    std::size_t history_capacity{0};
    std::map<std::string, std::string> model;   // provider description
};

}  // namespace vigil
