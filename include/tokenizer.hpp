#pragma once

#include <string>
#include <vector>
#include <unordered_set>

namespace morph {

class Tokenizer {
public:
    struct Config {
        size_t min_length = 2;
        bool lowercase = false;
        bool remove_stopwords = true;
        bool nouns_only = false;
    };

    Tokenizer();
    explicit Tokenizer(const Config& config);

    std::string extract_text(const std::string& html) const;
    std::vector<std::string> tokenize(const std::string& text) const;
    std::string to_lower(const std::string& str) const;

    static bool is_capitalized(const std::string& token);

private:
    Config config_;
    std::unordered_set<std::string> stop_words_;

    void init_stop_words();
    size_t letter_length(const std::string& text, size_t pos) const;
    bool accept(const std::string& token) const;
};

}
