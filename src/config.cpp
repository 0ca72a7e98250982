#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <iostream>

namespace morph {

AppConfig load_config(const std::string& config_path) {
    AppConfig config;

    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        if (yaml["morphology"]) {
            auto morphology = yaml["morphology"];
            config.morphology_path = morphology["data"].as<std::string>(config.morphology_path);
        }

        if (yaml["db"]) {
            auto db = yaml["db"];
            config.db.host = db["host"].as<std::string>("localhost");
            config.db.port = db["port"].as<int>(27017);
            config.db.database = db["database"].as<std::string>();
            config.db.collection = db["collection"].as<std::string>();
            config.db.text_field = db["text_field"].as<std::string>(config.db.text_field);
            config.db.username = db["username"].as<std::string>("");
            config.db.password = db["password"].as<std::string>("");
        }

        if (yaml["server"]) {
            auto server = yaml["server"];
            config.server.host = server["host"].as<std::string>("0.0.0.0");
            config.server.port = server["port"].as<int>(8080);
        }
    } catch (const std::exception& e) {
        std::cerr << "Ошибка загрузки конфигурации: " << e.what() << std::endl;
        throw;
    }

    return config;
}

}
