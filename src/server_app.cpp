#include "vigil/server_app.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <unistd.h>

#include <yaml-cpp/yaml.h>

#include "vigil/clip_score_provider.hpp"
#include "vigil/json_text.hpp"
#include "vigil/scenario_file.hpp"

namespace vigil {

namespace {
void reply_error(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    res.set_content("{\"error\":" + json_string(message) + "}", "application/json");
}

// Body of POST /pipeline/start: optional JSON (or YAML) object with "source" and "interval".
PipelineOptions options_from_body(const std::string& body, PipelineOptions opts) {
    if (body.empty()) return opts;
    YAML::Node root = YAML::Load(body);
    if (!root.IsMap()) throw std::invalid_argument("request body must be an object");
    if (root["source"]) opts.source = root["source"].as<std::string>();
    if (root["interval"]) opts.extract_interval = root["interval"].as<double>();
    if (opts.extract_interval < 0.0) throw std::invalid_argument("interval must not be negative");
    return opts;
}
}  // namespace

ServerApp::ServerApp(const AppConfig& cfg)
    : cfg_(cfg), store_(static_cast<std::size_t>(cfg.history_size)) {}

ServerApp::~ServerApp() {
    stop();
}

bool ServerApp::init() {
    ClipModelConfig model;
    model.image_encoder_path = cfg_.image_encoder_path;
    model.text_encoder_path = cfg_.text_encoder_path;
    model.vocab_path = cfg_.vocab_path;
    model.image_size = cfg_.image_size;
    model.use_ort = cfg_.use_ort;

    engine_ = std::make_unique<VideoEngine>(store_, make_score_provider(model), cfg_.temperature);
    ReloadReport report = engine_->reload_from_file(cfg_.scenarios_path);
    if (!report.ok) {
        std::cerr << "[ERROR] Could not load scenarios from " << cfg_.scenarios_path << ": " << report.error << std::endl;
        return false;
    }
    publisher_ = std::make_unique<AlertPublisher>(cfg_.alerts_jsonl);
    if (cfg_.watch_scenarios) {
        watcher_ = std::make_unique<ConfigWatcher>(*engine_, cfg_.scenarios_path, cfg_.watch_interval);
    }
    return true;
}

void ServerApp::start() {
    if (http_running_) return;
    http_srv_ = std::make_unique<httplib::Server>();
    setup_routes();
    if (watcher_) watcher_->start();
    http_running_ = true;
    http_thread_ = std::thread(&ServerApp::run_http, this);
}

void ServerApp::stop() {
    stop_pipeline();
    if (watcher_) watcher_->stop();
    if (http_srv_) http_srv_->stop();
    if (http_thread_.joinable()) http_thread_.join();
    http_running_ = false;
}

void ServerApp::join() {
    if (http_thread_.joinable()) http_thread_.join();
}

void ServerApp::run_http() {
    std::cout << "[INFO] Listening on http://0.0.0.0:" << cfg_.http_port << std::endl;
    if (!http_srv_->listen("0.0.0.0", cfg_.http_port)) {
        std::cerr << "[ERROR] Unable to listen on port " << cfg_.http_port << std::endl;
    }
    http_running_ = false;
}

void ServerApp::setup_routes() {
    http_srv_->Post("/pipeline/start", [this](const httplib::Request& req, httplib::Response& res) {
        PipelineOptions opts;
        opts.source = cfg_.source;
        opts.extract_interval = cfg_.extract_interval;
        opts.target_fps = cfg_.target_fps;
        opts.save_snapshots = cfg_.save_snapshots;
        opts.snapshot_dir = cfg_.snapshot_dir;
        try {
            opts = options_from_body(req.body, opts);
        } catch (const std::exception& e) {
            reply_error(res, 400, e.what());
            return;
        }
        try {
            start_pipeline(opts);
        } catch (const std::runtime_error& e) {
            reply_error(res, 503, e.what());
            return;
        }
        res.set_content(status_json(), "application/json");
    });

    http_srv_->Post("/pipeline/stop", [this](const httplib::Request&, httplib::Response& res) {
        stop_pipeline();
        res.set_content(status_json(), "application/json");
    });

    http_srv_->Get("/pipeline/status", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(status_json(), "application/json");
    });

    http_srv_->Get("/scenarios", [this](const httplib::Request&, httplib::Response& res) {
        std::ostringstream oss;
        oss << "{\"scenarios\":[";
        bool first = true;
        for (const auto& def : engine_->definitions()) {
            auto st = engine_->scenario_statistics(def.id);
            if (!st) continue;  // removed by a concurrent reload
            if (!first) oss << ",";
            first = false;
            oss << "{\"definition\":" << to_json(def) << ",\"statistics\":" << to_json(*st) << "}";
        }
        oss << "]}";
        res.set_content(oss.str(), "application/json");
    });

    http_srv_->Post("/scenarios/reload", [this](const httplib::Request& req, httplib::Response& res) {
        ReloadReport report = req.body.empty() ? engine_->reload_from_file(cfg_.scenarios_path)
                                               : engine_->reload_from_text(req.body);
        res.status = report.ok ? 200 : 422;
        res.set_content(to_json(report), "application/json");
    });

    // Rewrites the scenario file with count-based thresholds, then reloads it.
    http_srv_->Post("/scenarios/thresholds/recalculate", [this](const httplib::Request&, httplib::Response& res) {
        std::vector<std::string> changed;
        try {
            ScenarioFile file = load_scenario_file(cfg_.scenarios_path);
            changed = recalculate_thresholds(file);
            if (!changed.empty()) save_scenario_file(cfg_.scenarios_path, file);
        } catch (const ConfigError& e) {
            reply_error(res, 422, e.what());
            return;
        }
        ReloadReport report = engine_->reload_from_file(cfg_.scenarios_path);
        res.status = report.ok ? 200 : 422;
        res.set_content("{\"changed\":" + json_string_list(changed) + ",\"reload\":" + to_json(report) + "}",
                        "application/json");
    });

    http_srv_->Get(R"(/scenarios/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        auto st = engine_->scenario_statistics(req.matches[1]);
        if (!st) {
            reply_error(res, 404, "unknown scenario: " + std::string(req.matches[1]));
            return;
        }
        res.set_content(to_json(*st), "application/json");
    });

    http_srv_->Post(R"(/scenarios/([^/]+)/reset)", [this](const httplib::Request& req, httplib::Response& res) {
        const std::string id = req.matches[1];
        if (!engine_->reset_scenario(id)) {
            reply_error(res, 404, "unknown scenario: " + id);
            return;
        }
        res.set_content("{\"ok\":true,\"scenario_id\":" + json_string(id) + "}", "application/json");
    });

    http_srv_->Get("/detector", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(to_json(engine_->info()), "application/json");
    });

    http_srv_->Get("/alerts", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(read_alerts_json(cfg_.alerts_jsonl), "application/json");
    });

    http_srv_->Get("/metrics", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(metrics_text(), "text/plain; version=0.0.4");
    });
}

void ServerApp::start_pipeline(const PipelineOptions& opts) {
    std::lock_guard<std::mutex> lock(pipeline_mu_);
    if (pipeline_ && pipeline_->running()) return;
    pipeline_.reset();
    auto pipeline = std::make_unique<Pipeline>(*engine_, *publisher_, opts);
    pipeline->start();
    pipeline_ = std::move(pipeline);
}

void ServerApp::stop_pipeline() {
    std::lock_guard<std::mutex> lock(pipeline_mu_);
    if (pipeline_) pipeline_->stop();
}

PipelineStatus ServerApp::status() const {
    std::lock_guard<std::mutex> lock(pipeline_mu_);
    PipelineStatus st;
    st.pid = static_cast<int>(::getpid());
    st.source = cfg_.source;
    st.extract_interval = cfg_.extract_interval;
    if (pipeline_) {
        st.running = pipeline_->running();
        st.uptime_sec = pipeline_->uptime_sec();
        st.source = pipeline_->options().source;
        st.extract_interval = pipeline_->options().extract_interval;
    }
    return st;
}

std::string ServerApp::status_json() const {
    auto st = status();
    std::ostringstream oss;
    oss << "{\"running\":" << (st.running ? "true" : "false")
        << ",\"uptime_sec\":" << json_number(st.uptime_sec, 1)
        << ",\"pid\":" << st.pid
        << ",\"args\":{"
        << "\"source\":" << json_string(st.source) << ","
        << "\"interval\":" << json_number(st.extract_interval, 3) << ","
        << "\"scenarios\":" << json_string(cfg_.scenarios_path) << ","
        << "\"fps\":" << cfg_.target_fps << ","
        << "\"temperature\":" << json_number(engine_->temperature())
        << "}}";
    return oss.str();
}

std::string ServerApp::metrics_text() const {
    std::ostringstream oss;
    auto gauge = [&](const char* name, double v) {
        oss << "# TYPE " << name << " gauge\n" << name << " " << v << "\n";
    };
    auto counter = [&](const char* name, double v) {
        oss << "# TYPE " << name << " counter\n" << name << " " << v << "\n";
    };

    gauge("vigil_up", 1);
    const DetectorInfo info = engine_->info();
    gauge("vigil_scenarios", static_cast<double>(info.total_scenarios));
    gauge("vigil_scenarios_enabled", static_cast<double>(info.enabled_scenarios));
    if (watcher_) {
        counter("vigil_config_reloads_total", static_cast<double>(watcher_->reloads()));
        counter("vigil_config_reload_failures_total", static_cast<double>(watcher_->failures()));
    }
    counter("vigil_alerts_total", static_cast<double>(publisher_->statistics().total_alerts));

    {
        std::lock_guard<std::mutex> lock(pipeline_mu_);
        gauge("vigil_pipeline_running", pipeline_ && pipeline_->running() ? 1 : 0);
        if (pipeline_) {
            const PipelineMetrics& m = pipeline_->metrics();
            counter("vigil_frames_captured_total", static_cast<double>(m.captured.load()));
            counter("vigil_frames_queued_total", static_cast<double>(m.queued.load()));
            counter("vigil_frames_total", static_cast<double>(m.frames.load()));
            counter("vigil_detections_total", static_cast<double>(m.detections.load()));
            counter("vigil_scoring_failures_total", static_cast<double>(m.failures.load()));
            counter("vigil_frames_dropped_total", static_cast<double>(m.drops.load()));
            gauge("vigil_fps", m.fps.load());
            gauge("vigil_detect_latency_ms", m.latency_ms.load());
        }
    }

    oss << "# TYPE vigil_scenario_mean_confidence gauge\n";
    const auto stats = engine_->statistics();
    for (const auto& st : stats) {
        oss << "vigil_scenario_mean_confidence{scenario=\"" << st.scenario_id << "\"} " << st.mean_confidence << "\n";
    }
    oss << "# TYPE vigil_scenario_consecutive_count gauge\n";
    for (const auto& st : stats) {
        oss << "vigil_scenario_consecutive_count{scenario=\"" << st.scenario_id << "\"} " << st.consecutive_count << "\n";
    }
    return oss.str();
}

}  // namespace vigil
