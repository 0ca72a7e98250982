#include "stemmer.hpp"
#include <algorithm>
#include <codecvt>
#include <locale>
#include <stdexcept>

namespace morph {

// Группы окончаний для немецкого языка
const std::vector<std::u32string> GermanStemmer::STEP1_A = {
    U"ern", U"em", U"er"
};

const std::vector<std::u32string> GermanStemmer::STEP1_B = {
    U"en", U"es", U"e"
};

const std::vector<std::u32string> GermanStemmer::STEP2_A = {
    U"est", U"en", U"er"
};

// Буквы, после которых допустимо удаление "s" и "st"
const std::u32string GermanStemmer::S_ENDING = U"bdfghklmnrt";
const std::u32string GermanStemmer::ST_ENDING = U"bdfghklmnt";

char32_t GermanStemmer::fold(char32_t ch) {
    if (ch >= U'A' && ch <= U'Z') {
        return ch + (U'a' - U'A');
    }
    switch (ch) {
        case U'Ä': return U'ä';
        case U'Ö': return U'ö';
        case U'Ü': return U'ü';
        default: return ch;
    }
}

bool GermanStemmer::is_vowel(char32_t ch) const {
    static const std::u32string vowels = U"aeiouyäöü";
    return vowels.find(fold(ch)) != std::u32string::npos;
}

bool GermanStemmer::ends_with(const std::u32string& word, const std::u32string& suffix) const {
    if (suffix.size() > word.size()) return false;
    return std::equal(suffix.begin(), suffix.end(), word.end() - suffix.size(),
                      [](char32_t a, char32_t b) { return fold(a) == fold(b); });
}

std::vector<bool> GermanStemmer::vowel_marks(const std::u32string& word) const {
    std::vector<bool> marks(word.size());

    for (size_t i = 0; i < word.size(); ++i) {
        marks[i] = is_vowel(word[i]);

        // "u" и "y" между гласными считаются согласными: Bauer, Feuer, Bayern
        char32_t ch = fold(word[i]);
        if ((ch == U'u' || ch == U'y') && i > 0 && i + 1 < word.size() &&
            marks[i - 1] && is_vowel(word[i + 1])) {
            marks[i] = false;
        }
    }

    return marks;
}

size_t GermanStemmer::find_r1(const std::u32string& word) const {
    size_t r1 = word.size();
    auto vowel = vowel_marks(word);

    // R1 - после первой согласной, следующей за гласной
    for (size_t i = 1; i < word.size(); ++i) {
        if (!vowel[i] && vowel[i - 1]) {
            r1 = i + 1;
            break;
        }
    }

    // Перед R1 должно быть не меньше трёх букв
    return std::max<size_t>(r1, 3);
}

std::u32string GermanStemmer::step1(const std::u32string& word, size_t r1) const {
    // Ищем самое длинное окончание среди всех групп
    std::u32string longest;
    bool group_b = false;

    for (const auto& suffix : STEP1_A) {
        if (ends_with(word, suffix) && suffix.size() > longest.size()) {
            longest = suffix;
            group_b = false;
        }
    }
    for (const auto& suffix : STEP1_B) {
        if (ends_with(word, suffix) && suffix.size() > longest.size()) {
            longest = suffix;
            group_b = true;
        }
    }

    if (!longest.empty()) {
        size_t start = word.size() - longest.size();
        if (start < r1) {
            return word;
        }

        std::u32string result = word.substr(0, start);

        // Kenntnisse -> Kenntniss -> Kenntnis
        if (group_b && ends_with(result, U"niss")) {
            result.pop_back();
        }
        return result;
    }

    // "s" удаляется только после допустимой согласной
    if (ends_with(word, U"s") && word.size() >= 2) {
        size_t start = word.size() - 1;
        if (start >= r1 && S_ENDING.find(fold(word[start - 1])) != std::u32string::npos) {
            return word.substr(0, start);
        }
    }

    return word;
}

std::u32string GermanStemmer::step2(const std::u32string& word, size_t r1) const {
    for (const auto& suffix : STEP2_A) {
        if (ends_with(word, suffix)) {
            size_t start = word.size() - suffix.size();
            if (start >= r1) {
                return word.substr(0, start);
            }
            return word;
        }
    }

    // "st" после допустимой согласной, перед которой ещё минимум 3 буквы
    if (ends_with(word, U"st")) {
        size_t start = word.size() - 2;
        if (start >= r1 && start >= 4 &&
            ST_ENDING.find(fold(word[start - 1])) != std::u32string::npos) {
            return word.substr(0, start);
        }
    }

    return word;
}

std::string GermanStemmer::stem(const std::string& word) const {
    std::wstring_convert<std::codecvt_utf8<char32_t>, char32_t> converter;
    std::u32string word32;

    try {
        word32 = converter.from_bytes(word);
    } catch (const std::range_error&) {
        return word;  // Некорректный UTF-8
    }

    if (word32.size() < 3) {
        return word;  // Слишком короткое слово
    }

    size_t r1 = find_r1(word32);

    std::u32string result = step1(word32, r1);
    result = step2(result, std::min(r1, result.size()));

    return converter.to_bytes(result);
}

} // namespace morph
