#include "vigil/overlay.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "vigil/frame_types.hpp"
#include "vigil/json_text.hpp"

namespace vigil {

namespace {
void tint(cv::Mat& frame, const cv::Scalar& color, double alpha) {
    cv::Mat overlay(frame.size(), frame.type(), color);
    cv::addWeighted(overlay, alpha, frame, 1.0 - alpha, 0, frame);
}
}  // namespace

cv::Mat annotate_frame(const cv::Mat& frame_in, const DetectionResult& result, double fps) {
    cv::Mat frame = frame_in.clone();
    if (frame.empty() || frame.type() != CV_8UC3) return frame;

    const cv::Scalar white(255, 255, 255);
    std::string status = cv::format("FPS: %.1f", fps);
    if (!result.ok()) {
        status += " | scoring failed";
    } else if (result.detected) {
        const cv::Scalar color = alert_level_color(result.alert_level);
        if (result.alert_level == AlertLevel::HIGH) tint(frame, color, 0.2);
        const int border = std::max(4, frame.cols / 120);
        cv::rectangle(frame, cv::Rect(0, 0, frame.cols, frame.rows), color, border);
        const std::string caption = result.scenario_name + " " + cv::format("%.2f", result.confidence) +
                                    " [" + alert_level_to_string(result.alert_level) + "]";
        cv::putText(frame, caption, cv::Point(30, std::max(30, static_cast<int>(0.12 * frame.rows))),
                    cv::FONT_HERSHEY_SIMPLEX, 1.0, color, 3, cv::LINE_AA);
    }
    cv::putText(frame, status, cv::Point(12, frame.rows - 12),
                cv::FONT_HERSHEY_SIMPLEX, 0.7, white, 2);
    return frame;
}

std::string save_snapshot(const cv::Mat& frame, const std::string& dir, const std::string& scenario_id) {
    if (frame.empty()) return "";
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        std::cerr << "[WARN] Unable to create snapshot directory " << dir << ": " << ec.message() << std::endl;
        return "";
    }
    const std::string path =
        (std::filesystem::path(dir) / (scenario_id + "_" + now_compact_local() + ".jpg")).string();
    try {
        if (!cv::imwrite(path, frame)) {
            std::cerr << "[WARN] Unable to write snapshot: " << path << std::endl;
            return "";
        }
    } catch (const cv::Exception& e) {
        std::cerr << "[WARN] Unable to write snapshot " << path << ": " << e.what() << std::endl;
        return "";
    }
    return path;
}

}  // namespace vigil
