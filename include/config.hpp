#pragma once

#include <string>

namespace morph {

struct DbConfig {
    std::string host = "localhost";
    int port = 27017;
    std::string database;
    std::string collection;
    std::string text_field = "html_content";  // поле с HTML страницы
    std::string username;
    std::string password;
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
};

struct AppConfig {
    std::string morphology_path = "data/morphology_de.yaml";
    DbConfig db;
    ServerConfig server;
};

AppConfig load_config(const std::string& config_path);

}
