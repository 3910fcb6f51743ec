#include "vigil/scenario_store.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace vigil {

std::string validate_definitions(const std::vector<ScenarioDefinition>& defs) {
    if (defs.empty()) return "scenario set is empty";
    std::unordered_set<std::string> seen;
    for (const auto& def : defs) {
        std::string err = validation_error(def);
        if (!err.empty()) return err;
        if (!seen.insert(def.id).second) return "duplicate scenario id '" + def.id + "'";
    }
    return {};
}

ScenarioStore::ScenarioStore(std::size_t history_capacity)
    : history_capacity_(std::max<std::size_t>(1, history_capacity)) {}

void ScenarioStore::register_scenario(const ScenarioDefinition& def) {
    std::string err = validation_error(def);
    if (!err.empty()) throw ConfigError(err);
    if (Scenario* existing = find(def.id)) {
        existing->redefine(def);
        return;
    }
    scenarios_.emplace_back(def, history_capacity_);
}

bool ScenarioStore::remove(const std::string& id) {
    auto it = std::find_if(scenarios_.begin(), scenarios_.end(),
                           [&](const Scenario& s) { return s.id() == id; });
    if (it == scenarios_.end()) return false;
    scenarios_.erase(it);
    return true;
}

ReloadReport ScenarioStore::reload(const std::vector<ScenarioDefinition>& defs) {
    ReloadReport report;
    report.error = validate_definitions(defs);
    if (!report.error.empty()) return report;

    std::unordered_set<std::string> incoming;
    for (const auto& def : defs) incoming.insert(def.id);

    // Built beside the live table and swapped in at the end.
    std::vector<Scenario> next;
    next.reserve(defs.size());
    for (const auto& def : defs) {
        if (const Scenario* current = find(def.id)) {
            Scenario kept = *current;
            if (kept.definition() != def) report.updated.push_back(def.id);
            kept.redefine(def);
            next.push_back(std::move(kept));
        } else {
            next.emplace_back(def, history_capacity_);
            report.added.push_back(def.id);
        }
    }
    for (const auto& s : scenarios_) {
        if (!incoming.count(s.id())) report.removed.push_back(s.id());
    }

    scenarios_.swap(next);
    report.ok = true;
    return report;
}

std::vector<Scenario*> ScenarioStore::active() {
    std::vector<Scenario*> out;
    for (auto& s : scenarios_) {
        if (s.definition().enabled) out.push_back(&s);
    }
    return out;
}

std::vector<const Scenario*> ScenarioStore::active() const {
    std::vector<const Scenario*> out;
    for (const auto& s : scenarios_) {
        if (s.definition().enabled) out.push_back(&s);
    }
    return out;
}

Scenario* ScenarioStore::find(const std::string& id) {
    for (auto& s : scenarios_) {
        if (s.id() == id) return &s;
    }
    return nullptr;
}

const Scenario* ScenarioStore::find(const std::string& id) const {
    for (const auto& s : scenarios_) {
        if (s.id() == id) return &s;
    }
    return nullptr;
}

std::vector<ScenarioDefinition> ScenarioStore::definitions() const {
    std::vector<ScenarioDefinition> out;
    out.reserve(scenarios_.size());
    for (const auto& s : scenarios_) out.push_back(s.definition());
    return out;
}

std::size_t ScenarioStore::enabled_count() const {
    return static_cast<std::size_t>(std::count_if(scenarios_.begin(), scenarios_.end(),
                                                  [](const Scenario& s) { return s.definition().enabled; }));
}

bool ScenarioStore::reset(const std::string& id) {
    Scenario* s = find(id);
    if (!s) return false;
    s->reset();
    return true;
}

void ScenarioStore::reset_all() {
    for (auto& s : scenarios_) s.reset();
}

bool ScenarioStore::set_enabled(const std::string& id, bool enabled) {
    const Scenario* s = find(id);
    if (!s) return false;
    ScenarioDefinition def = s->definition();
    def.enabled = enabled;
    return update_definition(def);
}

bool ScenarioStore::set_threshold(const std::string& id, double threshold) {
    const Scenario* s = find(id);
    if (!s) return false;
    ScenarioDefinition def = s->definition();
    def.threshold = threshold;
    return update_definition(def);
}

bool ScenarioStore::update_definition(const ScenarioDefinition& def) {
    if (!validation_error(def).empty()) return false;
    register_scenario(def);
    return true;
}

void ScenarioStore::set_history_capacity(std::size_t capacity) {
    history_capacity_ = std::max<std::size_t>(1, capacity);
    for (auto& s : scenarios_) s.set_history_capacity(history_capacity_);
}

}  // namespace vigil
