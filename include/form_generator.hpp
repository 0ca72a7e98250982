#pragma once

#include <string>
#include <vector>

#include "morphology_data.hpp"
#include "stemmer.hpp"

namespace morph {

struct FormsResult {
    std::vector<std::string> forms;
    std::string stem;
};

bool ends_with(const std::string& word, const std::string& suffix);

/**
 * Проверяет, есть ли основа в списке исключений с полными формами.
 * Первое совпавшее окончание определяет результат; если перед окончанием
 * есть префикс (Haupt|stadt), он добавляется к каждой форме.
 */
std::vector<std::string> check_full_form_exceptions(
    const std::vector<FullFormException>& exceptions,
    const std::string& stem
);

/**
 * Формы основы с предсказуемыми суффиксами (без самой основы).
 * Пусто, если основа оканчивается на одно из исключающих окончаний.
 */
std::vector<std::string> check_predictable_suffixes(
    const PredictableSuffixException& category,
    const std::string& stem
);

/**
 * Проверяет все списки исключений по порядку приоритета.
 * @return Пустой вектор, если основа не является исключением
 */
std::vector<std::string> check_exceptions(const NounMorphology& nouns, const std::string& stem);

std::vector<std::string> add_suffixes(
    const std::vector<SuffixRule>& additions,
    std::vector<std::string> suffixes,
    const std::string& stem
);

std::vector<std::string> remove_suffixes(
    const std::vector<SuffixRule>& deletions,
    std::vector<std::string> suffixes,
    const std::string& stem
);

/**
 * Список регулярных суффиксов для конкретной основы:
 * сначала все добавления, затем все удаления.
 */
std::vector<std::string> modify_regular_suffixes(const NounMorphology& nouns, const std::string& stem);

// Формы с заменой окончания основы (Ärztinn -> Ärztin)
std::vector<std::string> forms_with_changed_stem(
    const std::vector<StemChange>& changes,
    const std::string& stem
);

std::vector<std::string> unique_forms(const std::vector<std::string>& forms);

FormsResult generate_forms(const std::string& word, const MorphologyData& data, const Stemmer& stemmer);

/**
 * Генератор словоформ немецких существительных.
 * Не владеет данными и стеммером: оба должны пережить генератор.
 */
class FormGenerator {
public:
    FormGenerator(const MorphologyData& data, const Stemmer& stemmer);

    FormsResult generate(const std::string& word) const;
    std::string stem(const std::string& word) const;

private:
    const MorphologyData& data_;
    const Stemmer& stemmer_;
};

} // namespace morph
