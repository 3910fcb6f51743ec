#include "vigil/pipeline.hpp"

#include <iostream>
#include <stdexcept>

#include <opencv2/highgui.hpp>

#include "vigil/overlay.hpp"

namespace vigil {

Pipeline::Pipeline(VideoEngine& engine, AlertPublisher& publisher, const PipelineOptions& opts)
    : engine_(engine),
      publisher_(publisher),
      opts_(opts),
      buffer_(opts.buffer_size),
      grabber_(opts.source, buffer_, opts.extract_interval, opts.target_fps) {}

Pipeline::~Pipeline() {
    stop();
}

void Pipeline::check_ready() const {
    const auto& provider = engine_.provider();
    if (!provider || !provider->ready()) {
        throw std::runtime_error("score provider is not ready; check the model paths");
    }
}

void Pipeline::run() {
    check_ready();
    started_ = std::chrono::steady_clock::now();
    loop();
}

void Pipeline::start() {
    if (running_) return;
    check_ready();
    // Written before running_ is published; uptime_sec() reads it only after.
    started_ = std::chrono::steady_clock::now();
    running_ = true;
    worker_ = std::thread(&Pipeline::loop, this);
}

void Pipeline::stop() {
    running_ = false;
    grabber_.stop();
    if (worker_.joinable()) worker_.join();
}

double Pipeline::uptime_sec() const {
    if (!running_) return 0.0;
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
}

void Pipeline::loop() {
    running_ = true;
    grabber_.start();
    std::cout << "[INFO] Pipeline started on " << opts_.source << std::endl;

    double fps = 0.0;
    int frames = 0;
    auto t0 = std::chrono::steady_clock::now();

    while (running_) {
        FrameResult item;
        if (!buffer_.pop(item)) break;  // capture stopped

        handle(item, fps);

        frames++;
        auto now = std::chrono::steady_clock::now();
        double elapsed = std::chrono::duration<double>(now - t0).count();
        if (elapsed >= 1.0) {
            fps = frames / elapsed;
            metrics_.fps = fps;
            frames = 0;
            t0 = now;
        }

        if (opts_.show_window) {
            cv::imshow("vigil", annotate_frame(item.frame, item.detection, fps));
            int key = cv::waitKey(1);
            if (key == 'q' || key == 27) running_ = false;
        }
    }

    grabber_.stop();
    sync_capture_counters();
    if (opts_.show_window) cv::destroyAllWindows();
    running_ = false;
    std::cout << "[INFO] Pipeline stopped after " << metrics_.frames << " frames ("
              << metrics_.alerts << " alerts)" << std::endl;
}

void Pipeline::sync_capture_counters() {
    metrics_.captured = grabber_.frames_read();
    metrics_.queued = grabber_.frames_queued();
    metrics_.drops = grabber_.frames_dropped();
}

void Pipeline::handle(FrameResult& item, double fps) {
    auto t_start = std::chrono::steady_clock::now();
    item.detection = engine_.detect(item.frame, item.timestamp_sec);
    metrics_.latency_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t_start).count();
    metrics_.frames++;
    sync_capture_counters();

    if (!item.detection.ok()) {
        metrics_.failures++;
        return;
    }
    if (!item.detection.detected) return;

    metrics_.detections++;
    if (!publisher_.publish(item.detection)) return;
    metrics_.alerts++;

    if (opts_.save_snapshots) {
        const std::string path = save_snapshot(annotate_frame(item.frame, item.detection, fps),
                                               opts_.snapshot_dir, item.detection.scenario_id);
        if (!path.empty()) std::cout << "[INFO] Saved snapshot: " << path << std::endl;
    }
}

}  // namespace vigil
