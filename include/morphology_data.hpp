#pragma once

#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace morph {

// Исключение с полным набором форм: Stadt -> Stadt, Städte
struct FullFormException {
    std::vector<std::string> stem_endings;
    std::vector<std::string> full_forms;
};

struct PredictableSuffixException {
    std::string name;
    std::vector<std::string> stem_endings;
    std::vector<std::string> suffixes;
    std::vector<std::string> exclusion_endings;
};

// Правило добавления/удаления регулярных суффиксов
struct SuffixRule {
    std::string name;
    std::vector<std::string> trigger_endings;
    std::vector<std::string> suffixes;
};

struct StemChange {
    std::string name;
    std::string match_ending;
    std::string replacement_ending;
};

/**
 * Морфологические данные для существительных.
 * Порядок элементов в каждой таблице задаёт приоритет правил.
 */
struct NounMorphology {
    std::vector<FullFormException> exception_stems_with_full_forms;
    std::vector<PredictableSuffixException> predictable_suffix_exceptions;
    std::vector<std::string> regular_suffixes;
    std::vector<SuffixRule> regular_suffix_additions;
    std::vector<SuffixRule> regular_suffix_deletions;
    std::vector<StemChange> stem_changes;
};

struct MorphologyData {
    NounMorphology nouns;
};

/**
 * Загружает морфологические данные из YAML-файла
 * @throws std::invalid_argument если отсутствует обязательная таблица
 */
MorphologyData load_morphology_data(const std::string& path);

MorphologyData parse_morphology_data(const YAML::Node& root);

} // namespace morph
