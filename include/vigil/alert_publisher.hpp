#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "vigil/detection_types.hpp"

namespace vigil {

struct AlertRecord {
    std::string time_iso;
    double timestamp_sec{0.0};
    std::string scenario_id;
    std::string scenario_name;
    double confidence{0.0};
    AlertLevel alert_level{AlertLevel::LOW};
};

struct AlertStatistics {
    std::size_t total_alerts{0};
    std::map<std::string, std::size_t> by_scenario;   // keyed by scenario name
    std::string first_alert;
    std::string last_alert;
};

// Appends one JSONL record per alert and prints a console banner.
class AlertPublisher {
public:
    explicit AlertPublisher(const std::string& path, bool console = true, bool use_color = true);

    // True when the result raised an alert. Baseline scenarios never do.
    bool publish(const DetectionResult& result);

    AlertStatistics statistics() const;
    std::vector<AlertRecord> history() const;
    const std::string& path() const { return path_; }

    static bool is_baseline(const std::string& scenario_name);
    static std::string to_json(const AlertRecord& record, const DetectionResult& result);

private:
    void print_banner(const AlertRecord& record) const;

    std::string path_;
    bool console_;
    bool use_color_;
    mutable std::mutex mu_;
    std::vector<AlertRecord> history_;
};

// Reads back the JSONL alert file as a JSON array; "[]" if missing.
std::string read_alerts_json(const std::string& path);

}  // namespace vigil
