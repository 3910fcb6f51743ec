#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <stdexcept>
#include <string>

namespace vigil {

enum class AlertLevel { LOW, MEDIUM, HIGH };

inline std::string alert_level_to_string(AlertLevel level) {
    switch (level) {
        case AlertLevel::HIGH: return "high";
        case AlertLevel::MEDIUM: return "medium";
        default: return "low";
    }
}

// Ordinal used for winner selection: high > medium > low.
inline int alert_priority(AlertLevel level) {
    switch (level) {
        case AlertLevel::HIGH: return 2;
        case AlertLevel::MEDIUM: return 1;
        default: return 0;
    }
}

// Case-insensitive; empty optional for anything but high/medium/low.
std::optional<AlertLevel> parse_alert_level(const std::string& text);

// Raised for invalid scenario definitions. Never coerced into a valid value.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ScenarioDefinition {
    std::string id;
    std::string name;
    std::string prompt;
    double threshold{0.25};
    double cooldown{30.0};          // seconds
    int consecutive_frames{1};
    AlertLevel alert_level{AlertLevel::MEDIUM};
    bool enabled{true};
};

bool operator==(const ScenarioDefinition& a, const ScenarioDefinition& b);
bool operator!=(const ScenarioDefinition& a, const ScenarioDefinition& b);

// Empty string when valid, otherwise a message naming the scenario and field.
std::string validation_error(const ScenarioDefinition& def);

// Labels of the "nothing happening" scenario (normal, 正常, ...), case-insensitive.
bool is_baseline_name(const std::string& name);

// Mutated only by the detection engine (and explicit resets).
struct ScenarioRuntime {
    double last_trigger_time{0.0};
    bool triggered{false};          // false until the first trigger; no cooldown before it
    int consecutive_count{0};
    std::deque<double> history;     // recent confidences, diagnostics only
};

class Scenario {
public:
    Scenario(ScenarioDefinition def, std::size_t history_capacity);

    const std::string& id() const { return def_.id; }
    const ScenarioDefinition& definition() const { return def_; }
    const ScenarioRuntime& runtime() const { return state_; }

    // Overwrites static config only.
    void redefine(ScenarioDefinition def);
    void reset();

    bool in_cooldown(double timestamp_sec) const;
    bool eligible(double timestamp_sec) const;

    // Records one evaluated confidence and updates the streak.
    // Returns true when the streak has reached consecutive_frames.
    bool observe(double confidence);
    void trigger(double timestamp_sec);

    void set_history_capacity(std::size_t capacity);
    std::size_t history_capacity() const { return history_capacity_; }

private:
    ScenarioDefinition def_;
    ScenarioRuntime state_;
    std::size_t history_capacity_;
};

}  // namespace vigil
