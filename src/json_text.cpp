#include "vigil/json_text.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace vigil {

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char ch : s) {
        const unsigned char c = static_cast<unsigned char>(ch);
        switch (ch) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out.push_back(ch);
                }
        }
    }
    return out;
}

std::string json_string(const std::string& s) {
    return "\"" + json_escape(s) + "\"";
}

std::string json_number(double v, int precision) {
    if (!std::isfinite(v)) return "null";
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << v;
    return oss.str();
}

std::string json_scores(const std::map<std::string, double>& scores) {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& kv : scores) {
        if (!first) oss << ",";
        first = false;
        oss << json_string(kv.first) << ":" << json_number(kv.second);
    }
    oss << "}";
    return oss.str();
}

std::string json_string_list(const std::vector<std::string>& items) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) oss << ",";
        oss << json_string(items[i]);
    }
    oss << "]";
    return oss.str();
}

namespace {
const char* json_bool(bool b) {
    return b ? "true" : "false";
}
}  // namespace

std::string to_json(const ScenarioDefinition& def) {
    std::ostringstream oss;
    oss << "{"
        << "\"id\":" << json_string(def.id) << ","
        << "\"name\":" << json_string(def.name) << ","
        << "\"prompt\":" << json_string(def.prompt) << ","
        << "\"threshold\":" << json_number(def.threshold) << ","
        << "\"cooldown\":" << json_number(def.cooldown, 3) << ","
        << "\"consecutive_frames\":" << def.consecutive_frames << ","
        << "\"alert_level\":" << json_string(alert_level_to_string(def.alert_level)) << ","
        << "\"enabled\":" << json_bool(def.enabled)
        << "}";
    return oss.str();
}

std::string to_json(const ScenarioStatistics& st) {
    std::ostringstream oss;
    oss << "{"
        << "\"scenario_id\":" << json_string(st.scenario_id) << ","
        << "\"scenario_name\":" << json_string(st.scenario_name) << ","
        << "\"enabled\":" << json_bool(st.enabled) << ","
        << "\"threshold\":" << json_number(st.threshold) << ","
        << "\"alert_level\":" << json_string(alert_level_to_string(st.alert_level)) << ","
        << "\"history_size\":" << st.history_size << ","
        << "\"mean_confidence\":" << json_number(st.mean_confidence) << ","
        << "\"min_confidence\":" << json_number(st.min_confidence) << ","
        << "\"max_confidence\":" << json_number(st.max_confidence) << ","
        << "\"std_confidence\":" << json_number(st.std_confidence) << ","
        << "\"consecutive_count\":" << st.consecutive_count << ","
        << "\"last_trigger_time\":" << json_number(st.last_trigger_time, 3) << ","
        << "\"in_cooldown\":" << json_bool(st.in_cooldown)
        << "}";
    return oss.str();
}

std::string to_json(const DetectorInfo& info) {
    std::ostringstream oss;
    oss << "{"
        << "\"enabled\":" << json_bool(info.enabled) << ","
        << "\"temperature\":" << json_number(info.temperature) << ","
        << "\"total_scenarios\":" << info.total_scenarios << ","
        << "\"enabled_scenarios\":" << info.enabled_scenarios << ","
        << "\"history_capacity\":" << info.history_capacity << ","
        << "\"model\":{";
    bool first = true;
    for (const auto& kv : info.model) {
        if (!first) oss << ",";
        first = false;
        oss << json_string(kv.first) << ":" << json_string(kv.second);
    }
    oss << "}}";
    return oss.str();
}

std::string to_json(const ReloadReport& report) {
    std::ostringstream oss;
    oss << "{"
        << "\"ok\":" << json_bool(report.ok) << ","
        << "\"error\":" << json_string(report.error) << ","
        << "\"added\":" << json_string_list(report.added) << ","
        << "\"removed\":" << json_string_list(report.removed) << ","
        << "\"updated\":" << json_string_list(report.updated)
        << "}";
    return oss.str();
}

std::string to_json(const DetectionResult& result) {
    std::ostringstream oss;
    oss << "{"
        << "\"detected\":" << json_bool(result.detected) << ","
        << "\"scenario_id\":" << json_string(result.scenario_id) << ","
        << "\"scenario_name\":" << json_string(result.scenario_name) << ","
        << "\"confidence\":" << json_number(result.confidence) << ","
        << "\"alert_level\":" << json_string(alert_level_to_string(result.alert_level)) << ","
        << "\"timestamp\":" << json_number(result.timestamp_sec, 3) << ","
        << "\"all_scores\":" << json_scores(result.all_scores);
    if (result.error) oss << ",\"error\":" << json_string(*result.error);
    oss << "}";
    return oss.str();
}

std::string now_iso_utc() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm = *std::gmtime(&t);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%FT%TZ", &tm);
    return std::string(buf);
}

std::string now_compact_local() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&t);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return std::string(buf);
}

}  // namespace vigil
