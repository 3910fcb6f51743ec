#include "vigil/decision_core.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>

#include "vigil/score_provider.hpp"

namespace vigil {

namespace {
std::string join_ids(const std::vector<std::string>& ids) {
    std::string out;
    for (const auto& id : ids) {
        if (!out.empty()) out += ",";
        out += id;
    }
    return out.empty() ? "-" : out;
}

void log_reload(const ReloadReport& report) {
    if (!report.ok) {
        std::cerr << "[WARN] Scenario reload rejected, keeping current set: " << report.error << std::endl;
        return;
    }
    std::cout << "[INFO] Scenarios reloaded: added=" << join_ids(report.added)
              << " removed=" << join_ids(report.removed)
              << " updated=" << join_ids(report.updated) << std::endl;
}

std::vector<std::string> prompts_of(const ScenarioStore& store) {
    std::vector<std::string> out;
    for (const auto& s : store.scenarios()) out.push_back(s.definition().prompt);
    return out;
}
}  // namespace

std::vector<double> softmax(const std::vector<float>& scores) {
    std::vector<double> out(scores.size(), 0.0);
    if (scores.empty()) return out;
    const double peak = *std::max_element(scores.begin(), scores.end());
    double sum = 0.0;
    for (std::size_t i = 0; i < scores.size(); ++i) {
        out[i] = std::exp(static_cast<double>(scores[i]) - peak);
        sum += out[i];
    }
    for (auto& v : out) v /= sum;
    return out;
}

DecisionCore::DecisionCore(ScenarioStore& store, float temperature)
    : store_(store), temperature_(temperature) {}

FrameBatch DecisionCore::begin_frame(double timestamp_sec) {
    FrameBatch batch{std::unique_lock<std::mutex>(mu_), timestamp_sec, temperature_};
    if (!enabled_) return batch;
    for (Scenario* s : store_.active()) {
        if (!s->eligible(timestamp_sec)) continue;
        batch.scenarios_.push_back(s);
        batch.prompts_.push_back(s->definition().prompt);
    }
    return batch;
}

DetectionResult DecisionCore::fail_frame(FrameBatch& batch, const std::string& error) {
    DetectionResult result;
    result.timestamp_sec = batch.timestamp_sec_;
    result.error = error;
    std::cerr << "[WARN] Scoring failed at t=" << std::fixed << std::setprecision(3)
              << batch.timestamp_sec_ << ": " << error << std::endl;
    return result;
}

DetectionResult DecisionCore::finish_frame(FrameBatch& batch, const std::vector<float>& raw_scores) {
    DetectionResult result;
    result.timestamp_sec = batch.timestamp_sec_;
    last_timestamp_ = std::max(last_timestamp_, batch.timestamp_sec_);
    if (batch.scenarios_.empty()) return result;

    if (raw_scores.size() != batch.scenarios_.size()) {
        std::ostringstream oss;
        oss << "score provider returned " << raw_scores.size() << " scores for "
            << batch.scenarios_.size() << " prompts";
        return fail_frame(batch, oss.str());
    }
    for (float v : raw_scores) {
        if (!std::isfinite(v)) return fail_frame(batch, "score provider returned a non-finite score");
    }

    // Joint softmax over the eligible scenarios only; a lone eligible scenario gets 1.0.
    const std::vector<double> confidences = softmax(raw_scores);

    Scenario* winner = nullptr;
    double winner_conf = 0.0;
    for (std::size_t i = 0; i < batch.scenarios_.size(); ++i) {
        Scenario* s = batch.scenarios_[i];
        const double conf = confidences[i];
        result.all_scores[s->id()] = conf;
        if (!s->observe(conf)) continue;

        if (!winner) {
            winner = s;
            winner_conf = conf;
            continue;
        }
        const int p = alert_priority(s->definition().alert_level);
        const int wp = alert_priority(winner->definition().alert_level);
        if (p > wp || (p == wp && conf > winner_conf)) {
            winner = s;
            winner_conf = conf;
        }
    }

    if (!winner) return result;

    winner->trigger(batch.timestamp_sec_);
    const ScenarioDefinition& def = winner->definition();
    result.detected = true;
    result.scenario_id = def.id;
    result.scenario_name = def.name;
    result.confidence = winner_conf;
    result.alert_level = def.alert_level;
    std::cout << "[INFO] Scenario detected: " << def.name << " (" << def.id << ") confidence="
              << std::fixed << std::setprecision(3) << winner_conf
              << " level=" << alert_level_to_string(def.alert_level) << std::endl;
    return result;
}

ReloadReport DecisionCore::reload_locked(const std::vector<ScenarioDefinition>& defs) {
    const std::vector<std::string> before = prompts_of(store_);
    ReloadReport report = store_.reload(defs);
    log_reload(report);
    if (report.ok) retire_prompts_locked(before);
    return report;
}

void DecisionCore::retire_prompts_locked(const std::vector<std::string>& before) {
    const std::vector<std::string> after = prompts_of(store_);
    const std::set<std::string> live(after.begin(), after.end());
    std::set<std::string> retired;
    for (const auto& p : before) {
        if (!live.count(p)) retired.insert(p);
    }
    if (!retired.empty()) prompts_retired({retired.begin(), retired.end()});
}

ReloadReport DecisionCore::reload(const std::vector<ScenarioDefinition>& defs) {
    std::lock_guard<std::mutex> lock(mu_);
    return reload_locked(defs);
}

ReloadReport DecisionCore::reload(const ScenarioFile& file) {
    std::lock_guard<std::mutex> lock(mu_);
    ReloadReport report = reload_locked(file.scenarios);
    if (!report.ok) return report;
    if (file.temperature) temperature_ = *file.temperature;
    if (file.history_size) store_.set_history_capacity(*file.history_size);
    return report;
}

ReloadReport DecisionCore::reload_from_file(const std::string& path) {
    ScenarioFile file;
    try {
        file = load_scenario_file(path);
    } catch (const ConfigError& e) {
        ReloadReport report;
        report.error = e.what();
        log_reload(report);
        return report;
    }
    return reload(file);
}

ReloadReport DecisionCore::reload_from_text(const std::string& yaml_text) {
    ScenarioFile file;
    try {
        file = parse_scenarios(yaml_text);
    } catch (const ConfigError& e) {
        ReloadReport report;
        report.error = e.what();
        log_reload(report);
        return report;
    }
    return reload(file);
}

void DecisionCore::register_scenario(const ScenarioDefinition& def) {
    std::lock_guard<std::mutex> lock(mu_);
    const std::vector<std::string> before = prompts_of(store_);
    store_.register_scenario(def);
    retire_prompts_locked(before);
}

bool DecisionCore::remove_scenario(const std::string& id) {
    std::lock_guard<std::mutex> lock(mu_);
    const std::vector<std::string> before = prompts_of(store_);
    if (!store_.remove(id)) return false;
    retire_prompts_locked(before);
    return true;
}

bool DecisionCore::reset_scenario(const std::string& id) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!store_.reset(id)) return false;
    std::cout << "[INFO] Scenario " << id << " reset" << std::endl;
    return true;
}

void DecisionCore::reset_all_scenarios() {
    std::lock_guard<std::mutex> lock(mu_);
    store_.reset_all();
    std::cout << "[INFO] All scenarios reset" << std::endl;
}

bool DecisionCore::enable_scenario(const std::string& id, bool enabled) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!store_.set_enabled(id, enabled)) return false;
    std::cout << "[INFO] Scenario " << id << (enabled ? " enabled" : " disabled") << std::endl;
    return true;
}

bool DecisionCore::update_threshold(const std::string& id, double threshold) {
    std::lock_guard<std::mutex> lock(mu_);
    const Scenario* s = store_.find(id);
    if (!s) return false;
    const double old = s->definition().threshold;
    if (!store_.set_threshold(id, threshold)) {
        std::cerr << "[WARN] Rejected threshold " << threshold << " for scenario " << id << std::endl;
        return false;
    }
    std::cout << "[INFO] Scenario " << id << " threshold " << std::fixed << std::setprecision(3)
              << old << " -> " << threshold << std::endl;
    return true;
}

ScenarioStatistics DecisionCore::statistics_locked(const Scenario& s) const {
    const ScenarioDefinition& def = s.definition();
    const ScenarioRuntime& rt = s.runtime();

    ScenarioStatistics st;
    st.scenario_id = def.id;
    st.scenario_name = def.name;
    st.enabled = def.enabled;
    st.threshold = def.threshold;
    st.alert_level = def.alert_level;
    st.consecutive_count = rt.consecutive_count;
    st.last_trigger_time = rt.last_trigger_time;
    st.in_cooldown = s.in_cooldown(last_timestamp_);
    st.history_size = rt.history.size();
    if (rt.history.empty()) return st;

    double sum = 0.0;
    st.min_confidence = rt.history.front();
    st.max_confidence = rt.history.front();
    for (double v : rt.history) {
        sum += v;
        st.min_confidence = std::min(st.min_confidence, v);
        st.max_confidence = std::max(st.max_confidence, v);
    }
    st.mean_confidence = sum / static_cast<double>(rt.history.size());
    double var = 0.0;
    for (double v : rt.history) var += (v - st.mean_confidence) * (v - st.mean_confidence);
    st.std_confidence = std::sqrt(var / static_cast<double>(rt.history.size()));
    return st;
}

std::optional<ScenarioStatistics> DecisionCore::scenario_statistics(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mu_);
    const Scenario* s = store_.find(id);
    if (!s) return std::nullopt;
    return statistics_locked(*s);
}

std::vector<ScenarioStatistics> DecisionCore::statistics() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<ScenarioStatistics> out;
    out.reserve(store_.size());
    for (const auto& s : store_.scenarios()) out.push_back(statistics_locked(s));
    return out;
}

std::vector<ScenarioDefinition> DecisionCore::definitions() const {
    std::lock_guard<std::mutex> lock(mu_);
    return store_.definitions();
}

std::vector<std::string> DecisionCore::enabled_scenarios() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> ids;
    for (const Scenario* s : store_.active()) ids.push_back(s->id());
    return ids;
}

DetectorInfo DecisionCore::core_info() const {
    std::lock_guard<std::mutex> lock(mu_);
    DetectorInfo info;
    info.enabled = enabled_;
    info.temperature = temperature_;
    info.total_scenarios = store_.size();
    info.enabled_scenarios = store_.enabled_count();
    info.history_capacity = store_.history_capacity();
    return info;
}

void DecisionCore::set_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mu_);
    enabled_ = enabled;
}

bool DecisionCore::enabled() const {
    std::lock_guard<std::mutex> lock(mu_);
    return enabled_;
}

bool DecisionCore::set_temperature(float temperature) {
    if (!std::isfinite(temperature) || !(temperature > 0.0f)) {
        std::cerr << "[WARN] Rejected temperature " << temperature << std::endl;
        return false;
    }
    std::lock_guard<std::mutex> lock(mu_);
    temperature_ = temperature;
    return true;
}

float DecisionCore::temperature() const {
    std::lock_guard<std::mutex> lock(mu_);
    return temperature_;
}

void DecisionCore::set_history_capacity(std::size_t capacity) {
    std::lock_guard<std::mutex> lock(mu_);
    store_.set_history_capacity(capacity);
}

}  // namespace vigil
