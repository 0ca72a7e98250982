#pragma once

#include <string>
#include <vector>

namespace morph {

/**
 * Интерфейс стеммера: слово -> основа
 */
class Stemmer {
public:
    virtual ~Stemmer() = default;

    virtual std::string stem(const std::string& word) const = 0;
};

/**
 * Стеммер для немецкого языка
 * Основан на флективных шагах Snowball German Stemmer (шаги 1 и 2).
 * Регистр и умлауты исходного слова сохраняются.
 */
class GermanStemmer : public Stemmer {
public:
    GermanStemmer() = default;

    /**
     * Применяет стемминг к слову
     * @param word Слово в UTF-8
     * @return Основа слова
     */
    std::string stem(const std::string& word) const override;

private:
    static char32_t fold(char32_t ch);

    bool is_vowel(char32_t ch) const;
    bool ends_with(const std::u32string& word, const std::u32string& suffix) const;

    // Гласные с учётом "u"/"y" между гласными
    std::vector<bool> vowel_marks(const std::u32string& word) const;

    // Начало региона R1
    size_t find_r1(const std::u32string& word) const;

    std::u32string step1(const std::u32string& word, size_t r1) const;
    std::u32string step2(const std::u32string& word, size_t r1) const;

    // Группы окончаний
    static const std::vector<std::u32string> STEP1_A;
    static const std::vector<std::u32string> STEP1_B;
    static const std::vector<std::u32string> STEP2_A;
    static const std::u32string S_ENDING;
    static const std::u32string ST_ENDING;
};

} // namespace morph
