#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "vigil/detection_types.hpp"
#include "vigil/scenario_file.hpp"
#include "vigil/scenario_store.hpp"

namespace vigil {

// Scenarios selected for one frame. Holds the engine lock for as long as it
// lives, so the scoring call and the state update see one scenario table.
class FrameBatch {
public:
    FrameBatch(FrameBatch&&) = default;
    FrameBatch& operator=(FrameBatch&&) = default;

    bool empty() const { return scenarios_.empty(); }
    const std::vector<std::string>& prompts() const { return prompts_; }
    double timestamp_sec() const { return timestamp_sec_; }
    float temperature() const { return temperature_; }

private:
    friend class DecisionCore;
    FrameBatch(std::unique_lock<std::mutex> lock, double timestamp_sec, float temperature)
        : lock_(std::move(lock)), timestamp_sec_(timestamp_sec), temperature_(temperature) {}

    std::unique_lock<std::mutex> lock_;
    std::vector<Scenario*> scenarios_;
    std::vector<std::string> prompts_;
    double timestamp_sec_{0.0};
    float temperature_{1.0f};
};

// Frame-independent half of the detection engine: eligibility, normalization,
// debounce, winner selection and hot reload over one ScenarioStore.
// Every public member is serialized on a single mutex.
class DecisionCore {
public:
    explicit DecisionCore(ScenarioStore& store, float temperature = 1.0f);
    virtual ~DecisionCore() = default;

    // Locks the engine and collects the eligible scenarios for this timestamp.
    FrameBatch begin_frame(double timestamp_sec);

    // Consumes the provider's raw scores (same order as batch.prompts()).
    // A length mismatch or non-finite score fails the frame without touching state.
    DetectionResult finish_frame(FrameBatch& batch, const std::vector<float>& raw_scores);
    DetectionResult fail_frame(FrameBatch& batch, const std::string& error);

    ReloadReport reload(const std::vector<ScenarioDefinition>& defs);
    ReloadReport reload(const ScenarioFile& file);
    ReloadReport reload_from_file(const std::string& path);
    ReloadReport reload_from_text(const std::string& yaml_text);

    void register_scenario(const ScenarioDefinition& def);
    bool remove_scenario(const std::string& id);
    bool reset_scenario(const std::string& id);
    void reset_all_scenarios();
    bool enable_scenario(const std::string& id, bool enabled);
    bool update_threshold(const std::string& id, double threshold);

    std::optional<ScenarioStatistics> scenario_statistics(const std::string& id) const;
    std::vector<ScenarioStatistics> statistics() const;
    std::vector<ScenarioDefinition> definitions() const;
    std::vector<std::string> enabled_scenarios() const;
    DetectorInfo core_info() const;

    void set_enabled(bool enabled);
    bool enabled() const;
    // False (and unchanged) unless the value is finite and positive.
    bool set_temperature(float temperature);
    float temperature() const;
    void set_history_capacity(std::size_t capacity);

protected:
    // Called with the engine lock held when a reload, registration or removal
    // leaves prompts that no scenario uses any more.
    virtual void prompts_retired(const std::vector<std::string>& prompts) { (void)prompts; }

private:
    void retire_prompts_locked(const std::vector<std::string>& before);
    ReloadReport reload_locked(const std::vector<ScenarioDefinition>& defs);
    ScenarioStatistics statistics_locked(const Scenario& s) const;

    ScenarioStore& store_;
    mutable std::mutex mu_;
    float temperature_;
    bool enabled_{true};
    double last_timestamp_{0.0};
};

}  // namespace vigil
