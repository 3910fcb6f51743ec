#pragma once

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "vigil/decision_core.hpp"

namespace vigil {

// Polls the scenario file's modification time and hot-reloads the engine when it changes.
class ConfigWatcher {
public:
    ConfigWatcher(DecisionCore& engine, const std::string& path, double interval_sec = 2.0);
    ~ConfigWatcher();

    void start();
    void stop();
    bool running() const { return running_; }

    // One polling step; returns the report when a reload was attempted.
    std::optional<ReloadReport> poll();

    std::size_t reloads() const { return reloads_; }
    std::size_t failures() const { return failures_; }

private:
    void run();

    DecisionCore& engine_;
    std::string path_;
    double interval_sec_;
    std::optional<std::filesystem::file_time_type> last_mtime_;

    std::thread worker_;
    std::atomic<bool> running_{false};
    std::mutex mu_;
    std::condition_variable cv_;
    std::atomic<std::size_t> reloads_{0};
    std::atomic<std::size_t> failures_{0};
};

}  // namespace vigil
