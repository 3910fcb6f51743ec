#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "httplib.h"

#include "vigil/alert_publisher.hpp"
#include "vigil/config.hpp"
#include "vigil/config_watcher.hpp"
#include "vigil/pipeline.hpp"
#include "vigil/scenario_store.hpp"

namespace vigil {

struct PipelineStatus {
    bool running{false};
    double uptime_sec{0.0};
    int pid{0};
    std::string source;
    double extract_interval{0.0};
};

// HTTP control and introspection surface over one engine and its pipeline.
class ServerApp {
public:
    explicit ServerApp(const AppConfig& cfg);
    ~ServerApp();

    // Loads the scenario file and the model. False if the scenarios cannot be loaded.
    bool init();

    void start();
    void stop();
    void join();

private:
    void run_http();
    void setup_routes();

    void start_pipeline(const PipelineOptions& opts);
    void stop_pipeline();
    PipelineStatus status() const;
    std::string status_json() const;
    std::string metrics_text() const;

    AppConfig cfg_;
    ScenarioStore store_;
    std::unique_ptr<VideoEngine> engine_;
    std::unique_ptr<AlertPublisher> publisher_;
    std::unique_ptr<ConfigWatcher> watcher_;

    std::atomic<bool> http_running_{false};
    std::thread http_thread_;
    std::unique_ptr<httplib::Server> http_srv_;

    mutable std::mutex pipeline_mu_;
    std::unique_ptr<Pipeline> pipeline_;
};

}  // namespace vigil
