#include "web_server.hpp"
#include "config.hpp"
#include <iostream>
#include <cstdlib>

int main(int argc, char* argv[]) {
    morph::WebServer::Config config;
    config.morphology_path = "data/morphology_de.yaml";
    config.host = "0.0.0.0";
    config.port = 8080;

    std::string config_path;
    std::string morphology_path;
    std::string host;
    int port = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--morphology" && i + 1 < argc) {
            morphology_path = argv[++i];
        } else if (arg == "--host" && i + 1 < argc) {
            host = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            port = std::atoi(argv[++i]);
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [options]\n\n"
                      << "Options:\n"
                      << "  --config PATH      YAML config file\n"
                      << "  --morphology PATH  Morphology data (default: data/morphology_de.yaml)\n"
                      << "  --host HOST        Host (default: 0.0.0.0)\n"
                      << "  --port PORT        Port (default: 8080)\n";
            return 0;
        }
    }

    try {
        if (!config_path.empty()) {
            morph::AppConfig app = morph::load_config(config_path);
            config.morphology_path = app.morphology_path;
            config.host = app.server.host;
            config.port = app.server.port;
        }

        // Флаги командной строки важнее файла конфигурации
        if (!morphology_path.empty()) config.morphology_path = morphology_path;
        if (!host.empty()) config.host = host;
        if (port > 0) config.port = port;

        morph::WebServer server(config);
        server.run();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
