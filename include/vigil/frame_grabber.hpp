#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include <opencv2/videoio.hpp>

#include "vigil/frame_buffer.hpp"
#include "vigil/frame_types.hpp"

namespace vigil {

enum class SourceKind { CAMERA, FILE, STREAM };

SourceKind classify_source(const std::string& source);

// Capture thread for a camera index, video file or RTSP/HTTP URL.
// Only frames at least extract_interval seconds apart are queued.
class FrameGrabber {
public:
    FrameGrabber(const std::string& source, FrameBuffer<FrameResult>& buffer,
                 double extract_interval, int target_fps);
    ~FrameGrabber();

    void start();
    void stop();
    bool running() const { return running_; }

    std::uint64_t frames_read() const { return frames_read_; }
    std::uint64_t frames_queued() const { return frames_queued_; }
    std::uint64_t frames_dropped() const { return frames_dropped_; }

private:
    void run();
    bool open(cv::VideoCapture& cap) const;
    double now_sec() const;

    std::string source_;
    SourceKind kind_;
    FrameBuffer<FrameResult>& buffer_;
    double extract_interval_{0.0};
    int target_fps_{30};
    std::thread worker_;
    std::mutex stop_mu_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> frames_read_{0};
    std::atomic<std::uint64_t> frames_queued_{0};
    std::atomic<std::uint64_t> frames_dropped_{0};
};

}  // namespace vigil
