#include "vigil/config.hpp"

#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace vigil {

namespace {
bool arg_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

int to_int(const std::string& name, const std::string& value) {
    std::size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(name + ": expected an integer, got '" + value + "'");
    }
    if (used != value.size()) throw std::invalid_argument(name + ": expected an integer, got '" + value + "'");
    return v;
}

double to_double(const std::string& name, const std::string& value) {
    std::size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(name + ": expected a number, got '" + value + "'");
    }
    if (used != value.size()) throw std::invalid_argument(name + ": expected a number, got '" + value + "'");
    return v;
}

void check(const AppConfig& cfg) {
    if (!(cfg.temperature > 0.0f)) throw std::invalid_argument("temperature must be positive");
    if (cfg.extract_interval < 0.0) throw std::invalid_argument("interval must not be negative");
    if (cfg.history_size < 1) throw std::invalid_argument("history must be at least 1");
    if (cfg.watch_interval <= 0.0) throw std::invalid_argument("watch interval must be positive");
    if (cfg.target_fps < 0) throw std::invalid_argument("fps must not be negative");
    if (cfg.image_size < 1) throw std::invalid_argument("image size must be positive");
    if (cfg.http_port < 1 || cfg.http_port > 65535) throw std::invalid_argument("port must be in 1..65535");
}
}  // namespace

std::string usage() {
    return "Usage: vigil [--source <src>] [--scenarios <yaml>] [--image-encoder <onnx>]\n"
           "             [--text-encoder <onnx>] [--vocab <bpe.txt>] [--img <size>]\n"
           "             [--temperature <t>] [--interval <sec>] [--history <n>]\n"
           "             [--alerts <path>] [--snapshots <dir>] [--no-snapshots]\n"
           "             [--watch-interval <sec>] [--no-watch] [--use-ort|--no-ort]\n"
           "             [--show-window] [--fps <int>] [--port <int>]\n";
}

AppConfig parse_args(int argc, char** argv) {
    AppConfig cfg;

    if (const char* env = std::getenv("VIGIL_SOURCE")) cfg.source = env;
    if (const char* env = std::getenv("VIGIL_SCENARIOS")) cfg.scenarios_path = env;
    if (const char* env = std::getenv("VIGIL_IMAGE_ENCODER")) cfg.image_encoder_path = env;
    if (const char* env = std::getenv("VIGIL_TEXT_ENCODER")) cfg.text_encoder_path = env;
    if (const char* env = std::getenv("VIGIL_VOCAB")) cfg.vocab_path = env;
    if (const char* env = std::getenv("VIGIL_ALERTS")) cfg.alerts_jsonl = env;
    if (const char* env = std::getenv("VIGIL_TEMPERATURE")) cfg.temperature = static_cast<float>(to_double("VIGIL_TEMPERATURE", env));
    if (const char* env = std::getenv("VIGIL_FPS")) cfg.target_fps = to_int("VIGIL_FPS", env);
    if (const char* env = std::getenv("VIGIL_PORT")) cfg.http_port = to_int("VIGIL_PORT", env);

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&](int offset = 1) -> const char* {
            if (i + offset < argc) return argv[i + offset];
            return nullptr;
        };

        if (arg_eq(arg, "--source") && next()) {
            cfg.source = next();
            i++;
        } else if (arg_eq(arg, "--scenarios") && next()) {
            cfg.scenarios_path = next();
            i++;
        } else if (arg_eq(arg, "--image-encoder") && next()) {
            cfg.image_encoder_path = next();
            i++;
        } else if (arg_eq(arg, "--text-encoder") && next()) {
            cfg.text_encoder_path = next();
            i++;
        } else if (arg_eq(arg, "--vocab") && next()) {
            cfg.vocab_path = next();
            i++;
        } else if (arg_eq(arg, "--img") && next()) {
            cfg.image_size = to_int("--img", next());
            i++;
        } else if (arg_eq(arg, "--temperature") && next()) {
            cfg.temperature = static_cast<float>(to_double("--temperature", next()));
            i++;
        } else if (arg_eq(arg, "--interval") && next()) {
            cfg.extract_interval = to_double("--interval", next());
            i++;
        } else if (arg_eq(arg, "--history") && next()) {
            cfg.history_size = to_int("--history", next());
            i++;
        } else if (arg_eq(arg, "--alerts") && next()) {
            cfg.alerts_jsonl = next();
            i++;
        } else if (arg_eq(arg, "--snapshots") && next()) {
            cfg.snapshot_dir = next();
            i++;
        } else if (arg_eq(arg, "--no-snapshots")) {
            cfg.save_snapshots = false;
        } else if (arg_eq(arg, "--watch-interval") && next()) {
            cfg.watch_interval = to_double("--watch-interval", next());
            i++;
        } else if (arg_eq(arg, "--no-watch")) {
            cfg.watch_scenarios = false;
        } else if (arg_eq(arg, "--no-ort")) {
            cfg.use_ort = false;
        } else if (arg_eq(arg, "--use-ort")) {
            cfg.use_ort = true;
        } else if (arg_eq(arg, "--show-window")) {
            cfg.show_window = true;
        } else if (arg_eq(arg, "--fps") && next()) {
            cfg.target_fps = to_int("--fps", next());
            i++;
        } else if (arg_eq(arg, "--port") && next()) {
            cfg.http_port = to_int("--port", next());
            i++;
        } else if (arg_eq(arg, "--help") || arg_eq(arg, "-h")) {
            cfg.help = true;
        } else {
            throw std::invalid_argument(std::string("unknown or incomplete option: ") + arg);
        }
    }

    check(cfg);
    return cfg;
}

}  // namespace vigil
