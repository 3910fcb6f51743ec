#include "vigil/config_watcher.hpp"

#include <chrono>
#include <iostream>
#include <system_error>

namespace vigil {

ConfigWatcher::ConfigWatcher(DecisionCore& engine, const std::string& path, double interval_sec)
    : engine_(engine), path_(path), interval_sec_(interval_sec) {
    std::error_code ec;
    auto mtime = std::filesystem::last_write_time(path_, ec);
    if (!ec) last_mtime_ = mtime;
}

ConfigWatcher::~ConfigWatcher() {
    stop();
}

void ConfigWatcher::start() {
    if (running_) return;
    running_ = true;
    worker_ = std::thread(&ConfigWatcher::run, this);
    std::cout << "[INFO] Watching scenario file: " << path_ << " (every " << interval_sec_ << "s)" << std::endl;
}

void ConfigWatcher::stop() {
    if (!running_) return;
    {
        std::lock_guard<std::mutex> lock(mu_);
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

std::optional<ReloadReport> ConfigWatcher::poll() {
    std::error_code ec;
    auto mtime = std::filesystem::last_write_time(path_, ec);
    if (ec) return std::nullopt;   // missing for now, retried on the next poll
    if (last_mtime_ && *last_mtime_ == mtime) return std::nullopt;
    last_mtime_ = mtime;

    std::cout << "[INFO] Scenario file changed: " << path_ << std::endl;
    ReloadReport report = engine_.reload_from_file(path_);
    if (report.ok) {
        reloads_++;
    } else {
        failures_++;
    }
    return report;
}

void ConfigWatcher::run() {
    const auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::duration<double>(interval_sec_));
    std::unique_lock<std::mutex> lock(mu_);
    while (running_) {
        cv_.wait_for(lock, interval, [&] { return !running_; });
        if (!running_) break;
        lock.unlock();
        poll();
        lock.lock();
    }
}

}  // namespace vigil
