#include <iostream>
#include <memory>
#include <stdexcept>

#include "vigil/alert_publisher.hpp"
#include "vigil/clip_score_provider.hpp"
#include "vigil/config.hpp"
#include "vigil/config_watcher.hpp"
#include "vigil/pipeline.hpp"

int main(int argc, char** argv) {
    vigil::AppConfig cfg;
    try {
        cfg = vigil::parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ERROR] " << e.what() << "\n" << vigil::usage();
        return 2;
    }
    if (cfg.help) {
        std::cout << vigil::usage();
        return 0;
    }

    std::cout << "[INFO] Starting vigil detection pipeline\n";
    std::cout << "       source   : " << cfg.source << "\n";
    std::cout << "       scenarios: " << cfg.scenarios_path << "\n";
    std::cout << "       encoders : " << cfg.image_encoder_path << ", " << cfg.text_encoder_path << "\n";
    std::cout << "       alerts   : " << cfg.alerts_jsonl << "\n";
    std::cout << "       ORT      : " << (cfg.use_ort ? "enabled" : "disabled (OpenCV DNN fallback)") << "\n";

    vigil::ClipModelConfig model;
    model.image_encoder_path = cfg.image_encoder_path;
    model.text_encoder_path = cfg.text_encoder_path;
    model.vocab_path = cfg.vocab_path;
    model.image_size = cfg.image_size;
    model.use_ort = cfg.use_ort;

    vigil::ScenarioStore store(static_cast<std::size_t>(cfg.history_size));
    vigil::VideoEngine engine(store, vigil::make_score_provider(model), cfg.temperature);
    vigil::ReloadReport report = engine.reload_from_file(cfg.scenarios_path);
    if (!report.ok) {
        std::cerr << "[ERROR] Could not load scenarios from " << cfg.scenarios_path << ": " << report.error << std::endl;
        return 1;
    }

    vigil::AlertPublisher publisher(cfg.alerts_jsonl);
    std::unique_ptr<vigil::ConfigWatcher> watcher;
    if (cfg.watch_scenarios) {
        watcher = std::make_unique<vigil::ConfigWatcher>(engine, cfg.scenarios_path, cfg.watch_interval);
        watcher->start();
    }

    vigil::PipelineOptions opts;
    opts.source = cfg.source;
    opts.extract_interval = cfg.extract_interval;
    opts.target_fps = cfg.target_fps;
    opts.save_snapshots = cfg.save_snapshots;
    opts.snapshot_dir = cfg.snapshot_dir;
    opts.show_window = cfg.show_window;

    vigil::Pipeline pipeline(engine, publisher, opts);
    try {
        pipeline.run();
    } catch (const std::runtime_error& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }
    if (watcher) watcher->stop();

    vigil::AlertStatistics st = publisher.statistics();
    std::cout << "[INFO] Alerts raised: " << st.total_alerts << "\n";
    for (const auto& kv : st.by_scenario) {
        std::cout << "       " << kv.first << ": " << kv.second << "\n";
    }
    std::cout << "[INFO] Stopped vigil pipeline" << std::endl;
    return 0;
}
