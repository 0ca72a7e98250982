#pragma once

#include <string>
#include <memory>

#include "form_generator.hpp"
#include "morphology_data.hpp"
#include "stemmer.hpp"

namespace morph {

class WebServer {
public:
    struct Config {
        std::string host = "0.0.0.0";
        int port = 8080;
        std::string morphology_path;
    };

    explicit WebServer(const Config& config);
    ~WebServer();

    void run();

    std::string render_index_page() const;
    std::string render_forms_page(const std::string& word, const FormsResult& result) const;

private:
    Config config_;
    MorphologyData data_;
    GermanStemmer stemmer_;
    std::unique_ptr<FormGenerator> generator_;

    std::string html_escape(const std::string& s) const;
};

}
