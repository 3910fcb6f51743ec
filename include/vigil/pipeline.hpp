#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include <opencv2/core.hpp>

#include "vigil/alert_publisher.hpp"
#include "vigil/detection_engine.hpp"
#include "vigil/frame_buffer.hpp"
#include "vigil/frame_grabber.hpp"
#include "vigil/frame_types.hpp"

namespace vigil {

using VideoEngine = DetectionEngine<cv::Mat>;

struct PipelineOptions {
    std::string source{"0"};
    double extract_interval{0.5};
    int target_fps{30};
    bool save_snapshots{true};
    std::string snapshot_dir{"data/alerts"};
    bool show_window{false};
    std::size_t buffer_size{4};
};

struct PipelineMetrics {
    std::atomic<std::uint64_t> captured{0};      // frames read from the source
    std::atomic<std::uint64_t> queued{0};        // frames that passed sampling
    std::atomic<std::uint64_t> frames{0};        // frames scored
    std::atomic<std::uint64_t> detections{0};
    std::atomic<std::uint64_t> alerts{0};
    std::atomic<std::uint64_t> failures{0};      // frames whose scoring failed
    std::atomic<std::uint64_t> drops{0};         // live frames dropped at the buffer
    std::atomic<double> fps{0.0};
    std::atomic<double> latency_ms{0.0};         // last detect() call
};

// Capture -> detect -> publish. run() blocks on the calling thread;
// start() runs the same loop on a worker thread.
class Pipeline {
public:
    Pipeline(VideoEngine& engine, AlertPublisher& publisher, const PipelineOptions& opts);
    ~Pipeline();

    // Both throw std::runtime_error when the score provider is not ready.
    void run();
    void start();
    void stop();

    bool running() const { return running_; }
    double uptime_sec() const;
    const PipelineMetrics& metrics() const { return metrics_; }
    const PipelineOptions& options() const { return opts_; }

private:
    void check_ready() const;
    void loop();
    void handle(FrameResult& item, double fps);
    void sync_capture_counters();

    VideoEngine& engine_;
    AlertPublisher& publisher_;
    PipelineOptions opts_;
    FrameBuffer<FrameResult> buffer_;
    FrameGrabber grabber_;
    PipelineMetrics metrics_;
    std::atomic<bool> running_{false};
    std::chrono::steady_clock::time_point started_{};
    std::thread worker_;
};

}  // namespace vigil
