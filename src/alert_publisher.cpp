#include "vigil/alert_publisher.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "vigil/json_text.hpp"

namespace vigil {

AlertPublisher::AlertPublisher(const std::string& path, bool console, bool use_color)
    : path_(path), console_(console), use_color_(use_color) {}

bool AlertPublisher::is_baseline(const std::string& scenario_name) {
    return is_baseline_name(scenario_name);
}

std::string AlertPublisher::to_json(const AlertRecord& record, const DetectionResult& result) {
    std::ostringstream oss;
    oss << "{";
    oss << "\"type\":\"scenario_alert\",";
    oss << "\"time\":" << json_string(record.time_iso) << ",";
    oss << "\"timestamp\":" << std::fixed << std::setprecision(3) << record.timestamp_sec << ",";
    oss << "\"scenario_id\":" << json_string(record.scenario_id) << ",";
    oss << "\"scenario_name\":" << json_string(record.scenario_name) << ",";
    oss << "\"confidence\":" << json_number(record.confidence) << ",";
    oss << "\"alert_level\":" << json_string(alert_level_to_string(record.alert_level)) << ",";
    oss << "\"all_scores\":" << json_scores(result.all_scores);
    oss << "}";
    return oss.str();
}

bool AlertPublisher::publish(const DetectionResult& result) {
    if (!result.detected) return false;
    if (is_baseline(result.scenario_name)) return false;

    AlertRecord record;
    record.time_iso = now_iso_utc();
    record.timestamp_sec = result.timestamp_sec;
    record.scenario_id = result.scenario_id;
    record.scenario_name = result.scenario_name;
    record.confidence = result.confidence;
    record.alert_level = result.alert_level;
    const std::string line = to_json(record, result);

    std::lock_guard<std::mutex> lock(mu_);
    history_.push_back(record);
    if (console_) print_banner(record);

    std::error_code ec;
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    std::ofstream f(path_, std::ios::app);
    if (!f) {
        std::cerr << "[WARN] Unable to open alerts file: " << path_ << std::endl;
        return true;
    }
    f << line << "\n";
    return true;
}

void AlertPublisher::print_banner(const AlertRecord& record) const {
    const char* color = "";
    const char* bold = "";
    const char* reset = "";
    if (use_color_) {
        bold = "\033[1m";
        reset = "\033[0m";
        switch (record.alert_level) {
            case AlertLevel::HIGH: color = "\033[91m"; break;
            case AlertLevel::MEDIUM: color = "\033[93m"; break;
            default: color = ""; break;
        }
    }
    const std::string rule(60, '=');
    std::cout << "\n" << bold << color << rule << reset << "\n"
              << bold << color << "ALERT: " << record.scenario_name << reset << "\n"
              << "time      : " << record.time_iso << "\n"
              << "scenario  : " << record.scenario_id << "\n"
              << "confidence: " << std::fixed << std::setprecision(3) << record.confidence << "\n"
              << "level     : " << alert_level_to_string(record.alert_level) << "\n"
              << bold << color << rule << reset << "\n"
              << std::endl;
}

AlertStatistics AlertPublisher::statistics() const {
    std::lock_guard<std::mutex> lock(mu_);
    AlertStatistics st;
    st.total_alerts = history_.size();
    if (history_.empty()) return st;
    for (const auto& r : history_) st.by_scenario[r.scenario_name]++;
    st.first_alert = history_.front().time_iso;
    st.last_alert = history_.back().time_iso;
    return st;
}

std::vector<AlertRecord> AlertPublisher::history() const {
    std::lock_guard<std::mutex> lock(mu_);
    return history_;
}

std::string read_alerts_json(const std::string& path) {
    std::ifstream f(path);
    if (!f) return "[]";
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty()) lines.push_back(line);
    }
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < lines.size(); ++i) {
        oss << lines[i];
        if (i + 1 < lines.size()) oss << ",";
    }
    oss << "]";
    return oss.str();
}

}  // namespace vigil
