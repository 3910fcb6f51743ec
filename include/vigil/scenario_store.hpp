#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "vigil/scenario.hpp"

namespace vigil {

struct ReloadReport {
    bool ok{false};
    std::string error;                  // set when ok == false
    std::vector<std::string> added;
    std::vector<std::string> removed;
    std::vector<std::string> updated;   // kept ids whose static config changed
};

// Owns every scenario and its runtime state, in definition order.
// Not synchronized; DetectionEngine serializes access.
class ScenarioStore {
public:
    explicit ScenarioStore(std::size_t history_capacity = 10);

    // Inserts or replaces static config. Runtime state of an existing id is kept.
    // Throws ConfigError for an invalid definition; the store is left untouched.
    void register_scenario(const ScenarioDefinition& def);

    // Drops the scenario and its runtime state. False if the id is unknown.
    bool remove(const std::string& id);

    // Replaces the whole definition set. Validation happens before anything is
    // touched: on failure the report carries the error and the store is unchanged.
    ReloadReport reload(const std::vector<ScenarioDefinition>& defs);

    std::vector<Scenario*> active();
    std::vector<const Scenario*> active() const;

    Scenario* find(const std::string& id);
    const Scenario* find(const std::string& id) const;
    bool contains(const std::string& id) const { return find(id) != nullptr; }

    const std::vector<Scenario>& scenarios() const { return scenarios_; }
    std::vector<ScenarioDefinition> definitions() const;
    std::size_t size() const { return scenarios_.size(); }
    std::size_t enabled_count() const;

    bool reset(const std::string& id);
    void reset_all();

    bool set_enabled(const std::string& id, bool enabled);
    bool set_threshold(const std::string& id, double threshold);

    void set_history_capacity(std::size_t capacity);
    std::size_t history_capacity() const { return history_capacity_; }

private:
    bool update_definition(const ScenarioDefinition& def);

    std::vector<Scenario> scenarios_;
    std::size_t history_capacity_;
};

// Empty string when the set may replace a store's contents.
std::string validate_definitions(const std::vector<ScenarioDefinition>& defs);

}  // namespace vigil
