#pragma once

#include <string>
#include <vector>
#include <unordered_map>

#include "form_generator.hpp"

namespace morph {

struct FamilyMember {
    std::string token;
    size_t count = 0;
};

struct WordFamily {
    std::string stem;
    std::vector<FamilyMember> members;
    size_t total_count = 0;
};

struct FamilyStats {
    size_t total_tokens = 0;
    size_t distinct_tokens = 0;
    size_t families = 0;
    size_t generated_forms = 0;

    double avg_forms_per_token() const;
};

/**
 * Группирует токены корпуса в семейства словоформ по общей основе
 */
class WordFamilyIndex {
public:
    explicit WordFamilyIndex(const FormGenerator& generator);

    void add(const std::string& token);

    // Семейства по убыванию суммарной частоты
    std::vector<WordFamily> families() const;

    // Встреченные токены, входящие в формы слова
    std::vector<FamilyMember> matches(const std::string& word) const;

    FamilyStats stats() const;

private:
    const FormGenerator& generator_;

    std::unordered_map<std::string, size_t> token_freq_;
    std::unordered_map<std::string, FormsResult> forms_cache_;
    size_t total_tokens_ = 0;
};

}
