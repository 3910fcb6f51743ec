#include "vigil/config.hpp"
#include "vigil/server_app.hpp"

#include <iostream>
#include <stdexcept>

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

    std::cout << "[INFO] Starting vigil server (HTTP + detection)\n";
    vigil::ServerApp app(cfg);
    if (!app.init()) return 1;
    app.start();
    std::cout << "[INFO] Press Ctrl+C to exit\n";
    app.join();
    return 0;
}
