#pragma once

#include <string>

#include <opencv2/core.hpp>

#include "vigil/detection_types.hpp"

namespace vigil {

// Copy of the frame with the scenario caption and, for a detection,
// a border coloured by alert level.
cv::Mat annotate_frame(const cv::Mat& frame, const DetectionResult& result, double fps);

// Writes <scenario_id>_<YYYYmmdd_HHMMSS>.jpg under dir. Returns the path, or "" on failure.
std::string save_snapshot(const cv::Mat& frame, const std::string& dir, const std::string& scenario_id);

}  // namespace vigil
