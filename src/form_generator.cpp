#include "form_generator.hpp"
#include <algorithm>
#include <functional>
#include <unordered_set>

namespace morph {

namespace {

bool ends_with_any(const std::string& word, const std::vector<std::string>& endings) {
    return std::any_of(endings.begin(), endings.end(),
                       [&word](const std::string& ending) { return ends_with(word, ending); });
}

}

bool ends_with(const std::string& word, const std::string& suffix) {
    if (suffix.size() > word.size()) return false;
    return word.compare(word.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> check_full_form_exceptions(
    const std::vector<FullFormException>& exceptions,
    const std::string& stem
) {
    for (const auto& exception : exceptions) {
        for (const auto& ending : exception.stem_endings) {
            if (!ends_with(stem, ending)) continue;

            // "Haupt".size() = "Hauptstadt".size() - "stadt".size()
            size_t preceding_length = stem.size() - ending.size();

            if (preceding_length > 0) {
                std::string preceding = stem.substr(0, preceding_length);

                std::vector<std::string> forms;
                forms.reserve(exception.full_forms.size());
                for (const auto& form : exception.full_forms) {
                    forms.push_back(preceding + form);
                }
                return forms;
            }

            return exception.full_forms;
        }
    }

    return {};
}

std::vector<std::string> check_predictable_suffixes(
    const PredictableSuffixException& category,
    const std::string& stem
) {
    if (ends_with_any(stem, category.exclusion_endings)) {
        return {};
    }

    if (!ends_with_any(stem, category.stem_endings)) {
        return {};
    }

    std::vector<std::string> forms;
    forms.reserve(category.suffixes.size() + 1);
    for (const auto& suffix : category.suffixes) {
        forms.push_back(stem + suffix);
    }
    return forms;
}

std::vector<std::string> check_exceptions(const NounMorphology& nouns, const std::string& stem) {
    using Check = std::function<std::vector<std::string>()>;

    // Порядок проверок = приоритет: полные формы, затем категории по порядку
    std::vector<Check> checks;
    checks.reserve(nouns.predictable_suffix_exceptions.size() + 1);

    checks.push_back([&nouns, &stem] {
        return check_full_form_exceptions(nouns.exception_stems_with_full_forms, stem);
    });

    for (const auto& category : nouns.predictable_suffix_exceptions) {
        checks.push_back([&category, &stem] {
            auto forms = check_predictable_suffixes(category, stem);
            if (!forms.empty()) {
                // Сама основа - форма единственного числа
                forms.push_back(stem);
            }
            return forms;
        });
    }

    for (const auto& check : checks) {
        auto forms = check();
        if (!forms.empty()) {
            return forms;
        }
    }

    return {};
}

std::vector<std::string> add_suffixes(
    const std::vector<SuffixRule>& additions,
    std::vector<std::string> suffixes,
    const std::string& stem
) {
    for (const auto& rule : additions) {
        if (ends_with_any(stem, rule.trigger_endings)) {
            suffixes.insert(suffixes.end(), rule.suffixes.begin(), rule.suffixes.end());
        }
    }
    return suffixes;
}

std::vector<std::string> remove_suffixes(
    const std::vector<SuffixRule>& deletions,
    std::vector<std::string> suffixes,
    const std::string& stem
) {
    for (const auto& rule : deletions) {
        if (!ends_with_any(stem, rule.trigger_endings)) continue;

        suffixes.erase(
            std::remove_if(suffixes.begin(), suffixes.end(), [&rule](const std::string& suffix) {
                return std::find(rule.suffixes.begin(), rule.suffixes.end(), suffix) != rule.suffixes.end();
            }),
            suffixes.end()
        );
    }
    return suffixes;
}

std::vector<std::string> modify_regular_suffixes(const NounMorphology& nouns, const std::string& stem) {
    auto suffixes = add_suffixes(nouns.regular_suffix_additions, nouns.regular_suffixes, stem);
    return remove_suffixes(nouns.regular_suffix_deletions, std::move(suffixes), stem);
}

std::vector<std::string> forms_with_changed_stem(
    const std::vector<StemChange>& changes,
    const std::string& stem
) {
    std::vector<std::string> forms;

    for (const auto& change : changes) {
        if (ends_with(stem, change.match_ending)) {
            std::string without_ending = stem.substr(0, stem.size() - change.match_ending.size());
            forms.push_back(without_ending + change.replacement_ending);
        }
    }

    return forms;
}

std::vector<std::string> unique_forms(const std::vector<std::string>& forms) {
    std::vector<std::string> result;
    std::unordered_set<std::string> seen;
    result.reserve(forms.size());

    for (const auto& form : forms) {
        if (seen.insert(form).second) {
            result.push_back(form);
        }
    }
    return result;
}

FormsResult generate_forms(const std::string& word, const MorphologyData& data, const Stemmer& stemmer) {
    const NounMorphology& nouns = data.nouns;
    std::string stem = stemmer.stem(word);

    auto exceptions = check_exceptions(nouns, stem);
    if (!exceptions.empty()) {
        // Исходное слово добавляется на всякий случай
        exceptions.push_back(word);
        return {unique_forms(exceptions), stem};
    }

    auto suffixes = modify_regular_suffixes(nouns, stem);

    std::vector<std::string> forms;
    forms.reserve(suffixes.size() + nouns.stem_changes.size() + 1);
    for (const auto& suffix : suffixes) {
        forms.push_back(stem + suffix);
    }
    // Основа сама может быть словоформой
    forms.push_back(stem);

    auto changed = forms_with_changed_stem(nouns.stem_changes, stem);
    forms.insert(forms.end(), changed.begin(), changed.end());

    return {unique_forms(forms), stem};
}

FormGenerator::FormGenerator(const MorphologyData& data, const Stemmer& stemmer)
    : data_(data), stemmer_(stemmer) {}

FormsResult FormGenerator::generate(const std::string& word) const {
    return generate_forms(word, data_, stemmer_);
}

std::string FormGenerator::stem(const std::string& word) const {
    return stemmer_.stem(word);
}

} // namespace morph
