#include "tokenizer.hpp"
#include <algorithm>
#include <cctype>

namespace morph {

Tokenizer::Tokenizer() : Tokenizer(Config{}) {}

Tokenizer::Tokenizer(const Config& config) : config_(config) {
    init_stop_words();
}

void Tokenizer::init_stop_words() {
    stop_words_ = {
        "der", "die", "das", "den", "dem", "des", "ein", "eine", "einen", "einem", "einer",
        "eines", "und", "oder", "aber", "doch", "nicht", "kein", "keine", "ist", "sind",
        "war", "waren", "wird", "werden", "wurde", "wurden", "hat", "haben", "hatte", "sein",
        "im", "in", "an", "am", "auf", "aus", "bei", "mit", "nach", "von", "vom", "zu", "zum",
        "zur", "für", "über", "unter", "vor", "durch", "gegen", "ohne", "um", "als", "wie",
        "auch", "noch", "nur", "so", "es", "er", "sie", "wir", "ihr", "ich", "du", "man",
        "sich", "dass", "daß", "wenn", "weil", "ob", "da", "hier", "dort", "dies", "diese",
        "dieser", "dieses", "welche", "welcher", "welches", "bis", "seit", "sehr", "mehr"
    };
}

std::string Tokenizer::to_lower(const std::string& str) const {
    std::string result;
    result.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        unsigned char c = str[i];

        if (c < 128) {
            result += static_cast<char>(std::tolower(c));
        } else if (c == 0xC3 && i + 1 < str.size()) {
            unsigned char c2 = str[i + 1];

            // À..Þ -> à..þ, кроме знака умножения
            if (c2 >= 0x80 && c2 <= 0x9E && c2 != 0x97) {
                c2 += 0x20;
            }
            result += static_cast<char>(c);
            result += static_cast<char>(c2);
            ++i;
        } else {
            result += static_cast<char>(c);
        }
    }

    return result;
}

bool Tokenizer::is_capitalized(const std::string& token) {
    if (token.empty()) return false;

    unsigned char c = token[0];
    if (c >= 'A' && c <= 'Z') return true;

    if (c == 0xC3 && token.size() > 1) {
        unsigned char c2 = token[1];
        return c2 >= 0x80 && c2 <= 0x9E && c2 != 0x97;
    }

    return false;
}

size_t Tokenizer::letter_length(const std::string& text, size_t pos) const {
    unsigned char c = text[pos];

    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) {
        return 1;
    }

    // Латиница-1: умлауты, ß и т.п.
    if (c == 0xC3 && pos + 1 < text.size()) {
        unsigned char c2 = text[pos + 1];
        if (c2 >= 0x80 && c2 <= 0xBF && c2 != 0x97 && c2 != 0xB7) {
            return 2;
        }
    }

    // ẞ
    if (c == 0xE1 && pos + 2 < text.size() &&
        static_cast<unsigned char>(text[pos + 1]) == 0xBA &&
        static_cast<unsigned char>(text[pos + 2]) == 0x9E) {
        return 3;
    }

    return 0;
}

bool Tokenizer::accept(const std::string& token) const {
    if (token.size() < config_.min_length) {
        return false;
    }
    if (config_.nouns_only && !is_capitalized(token)) {
        return false;
    }
    if (config_.remove_stopwords && stop_words_.count(to_lower(token)) > 0) {
        return false;
    }
    return true;
}

std::string Tokenizer::extract_text(const std::string& html) const {
    std::string result;
    result.reserve(html.size());

    bool in_tag = false;
    bool in_script = false;
    bool in_style = false;

    for (size_t i = 0; i < html.size(); ++i) {
        char c = html[i];

        if (c == '<') {
            in_tag = true;

            std::string lower;
            for (size_t j = i; j < std::min(i + 10, html.size()); ++j) {
                lower += static_cast<char>(std::tolower(static_cast<unsigned char>(html[j])));
            }

            if (lower.find("<script") == 0) in_script = true;
            else if (lower.find("</script") == 0) in_script = false;
            else if (lower.find("<style") == 0) in_style = true;
            else if (lower.find("</style") == 0) in_style = false;

            continue;
        }

        if (c == '>') {
            in_tag = false;
            result += ' ';
            continue;
        }

        if (!in_tag && !in_script && !in_style) {
            result += c;
        }
    }

    std::string normalized;
    bool last_space = true;
    for (char c : result) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!last_space) {
                normalized += ' ';
                last_space = true;
            }
        } else {
            normalized += c;
            last_space = false;
        }
    }

    if (!normalized.empty() && normalized.back() == ' ') {
        normalized.pop_back();
    }

    return normalized;
}

std::vector<std::string> Tokenizer::tokenize(const std::string& text) const {
    std::vector<std::string> tokens;
    std::string current_token;

    for (size_t i = 0; i < text.size(); ) {
        size_t len = letter_length(text, i);

        if (len > 0) {
            current_token.append(text, i, len);
            i += len;
            continue;
        }

        // Дефис внутри слова: Nord-Süd-Achse
        if (text[i] == '-' && !current_token.empty() && i + 1 < text.size() &&
            letter_length(text, i + 1) > 0) {
            current_token += '-';
            ++i;
            continue;
        }

        if (!current_token.empty()) {
            if (accept(current_token)) {
                tokens.push_back(config_.lowercase ? to_lower(current_token) : current_token);
            }
            current_token.clear();
        }
        ++i;
    }

    if (!current_token.empty() && accept(current_token)) {
        tokens.push_back(config_.lowercase ? to_lower(current_token) : current_token);
    }

    return tokens;
}

}
