#include "vigil/scenario.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <utility>

namespace vigil {

namespace {
std::string lowercase(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

bool blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}
}  // namespace

std::optional<AlertLevel> parse_alert_level(const std::string& text) {
    const std::string c = lowercase(text);
    if (c == "high") return AlertLevel::HIGH;
    if (c == "medium") return AlertLevel::MEDIUM;
    if (c == "low") return AlertLevel::LOW;
    return std::nullopt;
}

bool operator==(const ScenarioDefinition& a, const ScenarioDefinition& b) {
    return a.id == b.id && a.name == b.name && a.prompt == b.prompt &&
           a.threshold == b.threshold && a.cooldown == b.cooldown &&
           a.consecutive_frames == b.consecutive_frames &&
           a.alert_level == b.alert_level && a.enabled == b.enabled;
}

bool operator!=(const ScenarioDefinition& a, const ScenarioDefinition& b) {
    return !(a == b);
}

std::string validation_error(const ScenarioDefinition& def) {
    std::ostringstream oss;
    if (def.id.empty() || blank(def.id)) {
        return "scenario id must not be empty";
    }
    if (def.prompt.empty() || blank(def.prompt)) {
        oss << "scenario '" << def.id << "': prompt is missing";
    } else if (!std::isfinite(def.threshold) || def.threshold < 0.0 || def.threshold > 1.0) {
        oss << "scenario '" << def.id << "': threshold " << def.threshold << " outside [0,1]";
    } else if (!std::isfinite(def.cooldown) || def.cooldown < 0.0) {
        oss << "scenario '" << def.id << "': cooldown must be a non-negative number of seconds";
    } else if (def.consecutive_frames < 1) {
        oss << "scenario '" << def.id << "': consecutive_frames must be a positive integer";
    }
    return oss.str();
}

bool is_baseline_name(const std::string& name) {
    const std::string c = lowercase(name);
    return c == "normal" || c == "正常" || c == "普通" || c == "正常场景" || c == "正常检测";
}

Scenario::Scenario(ScenarioDefinition def, std::size_t history_capacity)
    : def_(std::move(def)), history_capacity_(std::max<std::size_t>(1, history_capacity)) {}

void Scenario::redefine(ScenarioDefinition def) {
    def_ = std::move(def);
}

void Scenario::reset() {
    state_ = ScenarioRuntime{};
}

bool Scenario::in_cooldown(double timestamp_sec) const {
    return state_.triggered && (timestamp_sec - state_.last_trigger_time) < def_.cooldown;
}

bool Scenario::eligible(double timestamp_sec) const {
    return def_.enabled && !in_cooldown(timestamp_sec) && !def_.prompt.empty();
}

bool Scenario::observe(double confidence) {
    state_.history.push_back(confidence);
    while (state_.history.size() > history_capacity_) state_.history.pop_front();

    if (confidence > def_.threshold) {
        state_.consecutive_count++;
    } else {
        state_.consecutive_count = 0;
    }
    return state_.consecutive_count >= def_.consecutive_frames;
}

void Scenario::trigger(double timestamp_sec) {
    state_.last_trigger_time = timestamp_sec;
    state_.triggered = true;
    state_.consecutive_count = 0;
}

void Scenario::set_history_capacity(std::size_t capacity) {
    history_capacity_ = std::max<std::size_t>(1, capacity);
    while (state_.history.size() > history_capacity_) state_.history.pop_front();
}

}  // namespace vigil
