#include "vigil/scenario_file.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unordered_set>

#include <yaml-cpp/yaml.h>

#include "vigil/scenario_store.hpp"

namespace vigil {

namespace {

std::string where(const std::string& id, const char* field) {
    return "scenario '" + id + "': " + field;
}

template <typename T>
T read_field(const YAML::Node& entry, const std::string& id, const char* field) {
    try {
        return entry[field].as<T>();
    } catch (const YAML::Exception&) {
        throw ConfigError(where(id, field) + " has the wrong type");
    }
}

ScenarioDefinition parse_entry(const std::string& id, const YAML::Node& entry) {
    if (!entry.IsMap()) throw ConfigError("scenario '" + id + "' must be a mapping");

    ScenarioDefinition def;
    def.id = id;
    def.name = entry["name"] ? read_field<std::string>(entry, id, "name") : id;

    if (!entry["prompt"] || entry["prompt"].IsNull()) throw ConfigError(where(id, "prompt") + " is missing");
    def.prompt = read_field<std::string>(entry, id, "prompt");

    if (!entry["threshold"]) throw ConfigError(where(id, "threshold") + " is missing");
    def.threshold = read_field<double>(entry, id, "threshold");

    if (entry["cooldown"]) def.cooldown = read_field<double>(entry, id, "cooldown");
    if (entry["consecutive_frames"]) def.consecutive_frames = read_field<int>(entry, id, "consecutive_frames");
    if (entry["enabled"]) def.enabled = read_field<bool>(entry, id, "enabled");

    if (entry["alert_level"]) {
        const std::string text = read_field<std::string>(entry, id, "alert_level");
        auto level = parse_alert_level(text);
        if (!level) throw ConfigError(where(id, "alert_level") + " '" + text + "' is not one of high|medium|low");
        def.alert_level = *level;
    }

    std::string err = validation_error(def);
    if (!err.empty()) throw ConfigError(err);
    return def;
}

// Shortest decimal text that reads back as the same double.
std::string format_number(double value) {
    for (int precision = 6; precision <= 17; ++precision) {
        std::ostringstream oss;
        oss << std::setprecision(precision) << value;
        if (std::stod(oss.str()) == value) return oss.str();
    }
    std::ostringstream oss;
    oss << std::setprecision(17) << value;
    return oss.str();
}

std::string format_number(float value) {
    for (int precision = 6; precision <= 9; ++precision) {
        std::ostringstream oss;
        oss << std::setprecision(precision) << value;
        if (std::stof(oss.str()) == value) return oss.str();
    }
    std::ostringstream oss;
    oss << std::setprecision(9) << value;
    return oss.str();
}

}  // namespace

ScenarioFile parse_scenarios(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("malformed scenario definitions: ") + e.what());
    }
    if (!root.IsMap()) throw ConfigError("scenario definitions must be a mapping");

    YAML::Node scenarios;
    if (root["scenarios"]) {
        scenarios = root["scenarios"];
    } else if (root["detection"] && root["detection"].IsMap() && root["detection"]["scenarios"]) {
        scenarios = root["detection"]["scenarios"];
    } else {
        throw ConfigError("no 'scenarios' section in scenario definitions");
    }
    if (!scenarios.IsMap()) throw ConfigError("'scenarios' must map scenario ids to definitions");

    ScenarioFile file;
    std::unordered_set<std::string> seen;
    for (auto it = scenarios.begin(); it != scenarios.end(); ++it) {
        std::string id;
        try {
            id = it->first.as<std::string>();
        } catch (const YAML::Exception&) {
            throw ConfigError("scenario ids must be strings");
        }
        if (!seen.insert(id).second) throw ConfigError("duplicate scenario id '" + id + "'");
        file.scenarios.push_back(parse_entry(id, it->second));
    }

    std::string err = validate_definitions(file.scenarios);
    if (!err.empty()) throw ConfigError(err);

    try {
        if (root["temperature"]) {
            const float t = root["temperature"].as<float>();
            if (!std::isfinite(t) || t <= 0.0f) throw ConfigError("temperature must be a positive number");
            file.temperature = t;
        }
        if (root["history_size"]) {
            const int n = root["history_size"].as<int>();
            if (n < 1) throw ConfigError("history_size must be a positive integer");
            file.history_size = static_cast<std::size_t>(n);
        }
    } catch (const YAML::Exception&) {
        throw ConfigError("temperature/history_size have the wrong type");
    }
    return file;
}

ScenarioFile load_scenario_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw ConfigError("unable to open scenario file: " + path);
    std::ostringstream oss;
    oss << f.rdbuf();
    return parse_scenarios(oss.str());
}

std::string emit_scenarios(const ScenarioFile& file) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    if (file.temperature) {
        out << YAML::Key << "temperature" << YAML::Value << format_number(*file.temperature);
    }
    if (file.history_size) {
        out << YAML::Key << "history_size" << YAML::Value << *file.history_size;
    }
    out << YAML::Key << "scenarios" << YAML::Value << YAML::BeginMap;
    for (const auto& def : file.scenarios) {
        out << YAML::Key << def.id << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << def.name;
        out << YAML::Key << "prompt" << YAML::Value << def.prompt;
        out << YAML::Key << "threshold" << YAML::Value << format_number(def.threshold);
        out << YAML::Key << "cooldown" << YAML::Value << format_number(def.cooldown);
        out << YAML::Key << "consecutive_frames" << YAML::Value << def.consecutive_frames;
        out << YAML::Key << "alert_level" << YAML::Value << alert_level_to_string(def.alert_level);
        out << YAML::Key << "enabled" << YAML::Value << def.enabled;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

void save_scenario_file(const std::string& path, const ScenarioFile& file) {
    const std::string text = emit_scenarios(file);
    namespace fs = std::filesystem;
    std::error_code ec;
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);

    // Written next to the target and renamed so readers never see half a file.
    const std::string tmp = path + ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f) throw ConfigError("unable to write scenario file: " + tmp);
        f << text;
        if (!f) throw ConfigError("unable to write scenario file: " + tmp);
    }
    fs::rename(tmp, path, ec);
    if (ec) throw ConfigError("unable to replace scenario file " + path + ": " + ec.message());
}

double dynamic_threshold(std::size_t total, bool baseline) {
    if (baseline) return 0.99;
    const double n = static_cast<double>(std::max<std::size_t>(total, 1));
    const double t = std::min(0.6, std::max(0.3, 1.5 / n));
    return std::round(t * 1000.0) / 1000.0;
}

std::vector<std::string> recalculate_thresholds(ScenarioFile& file) {
    std::vector<std::string> changed;
    const std::size_t total = file.scenarios.size();
    for (auto& def : file.scenarios) {
        const bool baseline = is_baseline_name(def.id) || is_baseline_name(def.name);
        const double t = dynamic_threshold(total, baseline);
        if (t == def.threshold) continue;
        std::cout << "[INFO] Scenario " << def.id << " threshold " << def.threshold << " -> " << t << std::endl;
        def.threshold = t;
        changed.push_back(def.id);
    }
    return changed;
}

}  // namespace vigil
