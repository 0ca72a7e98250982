#include "word_families.hpp"
#include <algorithm>
#include <map>
#include <unordered_set>

namespace morph {

double FamilyStats::avg_forms_per_token() const {
    if (distinct_tokens == 0) return 0;
    return static_cast<double>(generated_forms) / distinct_tokens;
}

WordFamilyIndex::WordFamilyIndex(const FormGenerator& generator) : generator_(generator) {}

void WordFamilyIndex::add(const std::string& token) {
    ++total_tokens_;

    if (token_freq_[token]++ == 0) {
        forms_cache_.emplace(token, generator_.generate(token));
    }
}

std::vector<WordFamily> WordFamilyIndex::families() const {
    std::map<std::string, WordFamily> by_stem;

    for (const auto& [token, count] : token_freq_) {
        const std::string& stem = forms_cache_.at(token).stem;

        WordFamily& family = by_stem[stem];
        family.stem = stem;
        family.members.push_back({token, count});
        family.total_count += count;
    }

    std::vector<WordFamily> result;
    result.reserve(by_stem.size());

    for (auto& [stem, family] : by_stem) {
        std::sort(family.members.begin(), family.members.end(),
                  [](const auto& a, const auto& b) {
                      return a.count != b.count ? a.count > b.count : a.token < b.token;
                  });
        result.push_back(std::move(family));
    }

    std::stable_sort(result.begin(), result.end(),
                     [](const auto& a, const auto& b) { return a.total_count > b.total_count; });

    return result;
}

std::vector<FamilyMember> WordFamilyIndex::matches(const std::string& word) const {
    std::vector<FamilyMember> result;

    for (const auto& form : generator_.generate(word).forms) {
        auto it = token_freq_.find(form);
        if (it != token_freq_.end()) {
            result.push_back({it->first, it->second});
        }
    }

    return result;
}

FamilyStats WordFamilyIndex::stats() const {
    FamilyStats stats;
    stats.total_tokens = total_tokens_;
    stats.distinct_tokens = token_freq_.size();

    std::unordered_set<std::string> stems;
    for (const auto& [token, result] : forms_cache_) {
        stats.generated_forms += result.forms.size();
        stems.insert(result.stem);
    }
    stats.families = stems.size();

    return stats;
}

}
