#pragma once

#include <string>

namespace vigil {

struct AppConfig {
    std::string source{"0"};                  // camera index as string, file path or URL/RTSP
    std::string scenarios_path{"config/scenarios.yaml"};
    std::string image_encoder_path{"models/clip_image_encoder.onnx"};
    std::string text_encoder_path{"models/clip_text_encoder.onnx"};
    std::string vocab_path{"models/bpe_simple_vocab_16e6.txt"};
    std::string alerts_jsonl{"alerts.jsonl"};
    std::string snapshot_dir{"data/alerts"};
    int image_size{224};
    float temperature{1.0f};
    double extract_interval{0.5};             // seconds between scored frames, 0 = every frame
    int history_size{10};
    double watch_interval{2.0};               // seconds between scenario file checks
    bool watch_scenarios{true};
    bool save_snapshots{true};
    bool use_ort{true};                       // use ONNX Runtime when available
    bool show_window{false};                  // optional OpenCV window for local debug
    int target_fps{30};
    int http_port{8000};
    bool help{false};
};

// Environment first, then flags. Throws std::invalid_argument on a malformed value.
AppConfig parse_args(int argc, char** argv);

std::string usage();

}  // namespace vigil
