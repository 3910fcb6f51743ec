#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "vigil/scenario.hpp"

namespace vigil {

// Parsed contents of a scenario definition file.
struct ScenarioFile {
    std::vector<ScenarioDefinition> scenarios;     // document order
    std::optional<float> temperature;
    std::optional<std::size_t> history_size;
};

// All of these throw ConfigError; nothing is defaulted for a required field.
ScenarioFile parse_scenarios(const std::string& yaml_text);
ScenarioFile load_scenario_file(const std::string& path);

std::string emit_scenarios(const ScenarioFile& file);
void save_scenario_file(const std::string& path, const ScenarioFile& file);

// Threshold suited to a joint softmax over `total` scenarios: 1.5 / total
// clamped to [0.3, 0.6] and rounded to 3 decimals; 0.99 for the baseline.
double dynamic_threshold(std::size_t total, bool baseline);

// Applies dynamic_threshold to every scenario using the file's scenario count.
// Returns the ids whose threshold changed.
std::vector<std::string> recalculate_thresholds(ScenarioFile& file);

}  // namespace vigil
