#include "web_server.hpp"

#include <httplib.h>

#include "forms_json.hpp"

#include <sstream>
#include <stdexcept>
#include <iostream>

namespace morph {

WebServer::WebServer(const Config& config) : config_(config) {
    data_ = load_morphology_data(config_.morphology_path);
    generator_ = std::make_unique<FormGenerator>(data_, stemmer_);
}

WebServer::~WebServer() = default;

std::string WebServer::html_escape(const std::string& s) const {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '&': result += "&amp;"; break;
            case '"': result += "&quot;"; break;
            default: result += c;
        }
    }
    return result;
}

std::string WebServer::render_index_page() const {
    return R"(<!DOCTYPE html>
<html lang="de">
<head>
<meta charset="UTF-8">
<meta name="viewport" content="width=device-width, initial-scale=1.0">
<title>Wortformen</title>
<style>
*{box-sizing:border-box;margin:0;padding:0}
body{font-family:sans-serif;background:#f5f5f5;min-height:100vh;display:flex;align-items:center;justify-content:center}
.container{text-align:center;padding:20px}
h1{font-size:3rem;margin-bottom:30px}
.search-form{display:flex;max-width:600px;margin:0 auto 30px}
input[type="text"]{flex:1;padding:15px 20px;font-size:18px;border:2px solid #ddd;border-radius:25px 0 0 25px;outline:none}
input[type="text"]:focus{border-color:#4a90d9}
button{padding:15px 30px;font-size:18px;background:#4a90d9;color:white;border:none;border-radius:0 25px 25px 0;cursor:pointer}
button:hover{background:#357abd}
.hints{background:white;padding:25px;border-radius:10px;box-shadow:0 2px 10px rgba(0,0,0,0.1);max-width:600px;margin:0 auto;text-align:left}
.hints h3{margin:15px 0 10px;color:#555}
.hints ul{padding-left:20px}
.hints li{margin:5px 0}
.hints code{background:#f0f0f0;padding:2px 6px;border-radius:3px}
</style>
</head>
<body>
<div class="container">
<h1>Wortformen</h1>
<form action="/forms" method="get" class="search-form">
<input type="text" name="word" placeholder="Substantiv eingeben..." autofocus>
<button type="submit">Formen</button>
</form>
<div class="hints">
<h3>Examples:</h3>
<ul>
<li><code>Hauptstadt</code> - compound with an irregular plural</li>
<li><code>Lehrer</code> - regular noun</li>
<li><code>/api/forms?word=Kind</code> - JSON API</li>
</ul>
</div>
</div>
</body>
</html>)";
}

std::string WebServer::render_forms_page(const std::string& word, const FormsResult& result) const {
    std::ostringstream html;

    html << R"(<!DOCTYPE html>
<html lang="de">
<head>
<meta charset="UTF-8">
<meta name="viewport" content="width=device-width, initial-scale=1.0">
<title>)" << html_escape(word) << R"( - Wortformen</title>
<style>
*{box-sizing:border-box;margin:0;padding:0}
body{font-family:sans-serif;background:#f5f5f5;line-height:1.6}
.container{max-width:900px;margin:0 auto;padding:20px}
header{display:flex;align-items:center;gap:20px;margin-bottom:20px;padding-bottom:20px;border-bottom:1px solid #ddd}
header h1{font-size:1.5rem}
header h1 a{color:inherit;text-decoration:none}
.search-form{display:flex;flex:1;max-width:500px}
input[type="text"]{flex:1;padding:10px 15px;font-size:16px;border:2px solid #ddd;border-radius:20px 0 0 20px;outline:none}
button{padding:10px 20px;font-size:16px;background:#4a90d9;color:white;border:none;border-radius:0 20px 20px 0;cursor:pointer}
.stats{color:#666;margin-bottom:20px}
.forms{background:white;padding:20px;border-radius:8px;box-shadow:0 1px 5px rgba(0,0,0,0.1)}
.forms li{margin:4px 0 4px 20px}
</style>
</head>
<body>
<div class="container">
<header>
<h1><a href="/">Wortformen</a></h1>
<form action="/forms" method="get" class="search-form">
<input type="text" name="word" value=")" << html_escape(word) << R"(">
<button type="submit">Formen</button>
</form>
</header>
<div class="stats">
Stem: <strong>)" << html_escape(result.stem) << R"(</strong>,
forms: <strong>)" << result.forms.size() << R"(</strong>
</div>
<div class="forms">
<ul>
)";

    for (const auto& form : result.forms) {
        html << "<li>" << html_escape(form) << "</li>\n";
    }

    html << R"(</ul>
</div>
</div>
</body>
</html>)";

    return html.str();
}

void WebServer::run() {
    std::cout << "Starting web server on http://" << config_.host
              << ":" << config_.port << "\n";
    std::cout << "Morphology: " << config_.morphology_path << " ("
              << data_.nouns.exception_stems_with_full_forms.size() << " full-form exceptions, "
              << data_.nouns.regular_suffixes.size() << " regular suffixes)\n";

    httplib::Server server;

    server.Get("/", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(render_index_page(), "text/html; charset=utf-8");
    });

    server.Get("/forms", [this](const httplib::Request& req, httplib::Response& res) {
        std::string word;

        if (req.has_param("word")) {
            word = req.get_param_value("word");
        }

        if (word.empty()) {
            res.set_redirect("/");
            return;
        }

        try {
            auto result = generator_->generate(word);
            res.set_content(render_forms_page(word, result), "text/html; charset=utf-8");
        } catch (const std::exception& e) {
            std::cerr << "Error generating forms for " << word << ": " << e.what() << "\n";
            res.status = 500;
            res.set_content(error_to_json(e.what()), "application/json; charset=utf-8");
        }
    });

    server.Get("/api/forms", [this](const httplib::Request& req, httplib::Response& res) {
        std::string word;
        if (req.has_param("word")) word = req.get_param_value("word");

        if (word.empty()) {
            res.status = 400;
            res.set_content(error_to_json("missing parameter: word"), "application/json; charset=utf-8");
            return;
        }

        try {
            auto result = generator_->generate(word);
            res.set_content(forms_to_json(word, result), "application/json; charset=utf-8");
        } catch (const std::exception& e) {
            std::cerr << "Error generating forms for " << word << ": " << e.what() << "\n";
            res.status = 500;
            res.set_content(error_to_json(e.what()), "application/json; charset=utf-8");
        }
    });

    if (!server.listen(config_.host.c_str(), config_.port)) {
        throw std::runtime_error("Cannot listen on " + config_.host + ":" + std::to_string(config_.port));
    }
}

}
