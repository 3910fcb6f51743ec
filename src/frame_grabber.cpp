#include "vigil/frame_grabber.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <stdexcept>

#include <opencv2/core/utility.hpp>

namespace vigil {

SourceKind classify_source(const std::string& source) {
    if (!source.empty() &&
        std::all_of(source.begin(), source.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return SourceKind::CAMERA;
    }
    if (source.find("://") != std::string::npos) return SourceKind::STREAM;
    return SourceKind::FILE;
}

FrameGrabber::FrameGrabber(const std::string& source, FrameBuffer<FrameResult>& buffer,
                           double extract_interval, int target_fps)
    : source_(source),
      kind_(classify_source(source)),
      buffer_(buffer),
      extract_interval_(extract_interval),
      target_fps_(target_fps) {}

FrameGrabber::~FrameGrabber() {
    stop();
}

void FrameGrabber::start() {
    if (running_) return;
    running_ = true;
    worker_ = std::thread(&FrameGrabber::run, this);
}

void FrameGrabber::stop() {
    std::lock_guard<std::mutex> lock(stop_mu_);
    running_ = false;
    buffer_.stop();
    if (worker_.joinable()) worker_.join();
}

double FrameGrabber::now_sec() const {
    return static_cast<double>(cv::getTickCount()) / cv::getTickFrequency();
}

bool FrameGrabber::open(cv::VideoCapture& cap) const {
    if (kind_ != SourceKind::CAMERA) return cap.open(source_);
    try {
        return cap.open(std::stoi(source_));
    } catch (const std::out_of_range&) {
        std::cerr << "[ERROR] Camera index out of range: " << source_ << std::endl;
        return false;
    }
}

void FrameGrabber::run() {
    cv::VideoCapture cap;
    if (!open(cap) || !cap.isOpened()) {
        std::cerr << "[ERROR] Unable to open video source: " << source_ << std::endl;
        running_ = false;
        buffer_.stop();
        return;
    }

    const bool is_file = kind_ == SourceKind::FILE;
    if (!is_file && target_fps_ > 0) {
        cap.set(cv::CAP_PROP_FPS, target_fps_);
    }
    std::cout << "[INFO] Opened video source: " << source_
              << " (" << (is_file ? "file" : kind_ == SourceKind::CAMERA ? "camera" : "stream") << ")"
              << std::endl;

    // Live capture paces itself; files are read as fast as the worker consumes them.
    const double sleep_ms = (!is_file && target_fps_ > 0) ? 1000.0 / target_fps_ : 0.0;
    bool have_last = false;
    double last_queued = 0.0;
    int read_failures = 0;

    while (running_) {
        cv::Mat frame;
        if (!cap.read(frame) || frame.empty()) {
            if (is_file) {
                std::cout << "[INFO] End of video file: " << source_ << std::endl;
                break;
            }
            if (++read_failures % 50 == 1) {
                std::cerr << "[WARN] Capture read failed, retrying..." << std::endl;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }
        read_failures = 0;
        const std::uint64_t index = frames_read_++;

        const double ts = is_file ? cap.get(cv::CAP_PROP_POS_MSEC) / 1000.0 : now_sec();
        if (!have_last || ts - last_queued >= extract_interval_) {
            FrameResult item;
            item.frame = frame;
            item.timestamp_sec = ts;
            item.index = index;
            const bool queued = is_file ? buffer_.push(std::move(item)) : buffer_.try_push(std::move(item));
            if (queued) {
                frames_queued_++;
                have_last = true;
                last_queued = ts;
            } else if (buffer_.stopped()) {
                break;
            } else {
                frames_dropped_++;
            }
        }

        if (sleep_ms > 0.0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(static_cast<int>(sleep_ms)));
        }
    }

    cap.release();
    running_ = false;
    buffer_.stop();
}

}  // namespace vigil
