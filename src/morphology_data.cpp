#include "morphology_data.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace morph {

namespace {

YAML::Node require(const YAML::Node& node, const std::string& key, const std::string& path) {
    YAML::Node child = node[key];
    if (!child) {
        throw std::invalid_argument("Missing field: " + path + "." + key);
    }
    return child;
}

YAML::Node require_sequence(const YAML::Node& node, const std::string& key, const std::string& path) {
    YAML::Node child = require(node, key, path);
    if (!child.IsSequence()) {
        throw std::invalid_argument("Expected a list: " + path + "." + key);
    }
    return child;
}

YAML::Node require_map(const YAML::Node& node, const std::string& path) {
    if (!node.IsMap()) {
        throw std::invalid_argument("Expected a map: " + path);
    }
    return node;
}

std::vector<std::string> read_strings(const YAML::Node& list, const std::string& path) {
    std::vector<std::string> result;
    result.reserve(list.size());

    for (const auto& item : list) {
        // "- " без значения трактуется как пустой суффикс
        if (item.IsNull()) {
            result.emplace_back();
            continue;
        }
        if (!item.IsScalar()) {
            throw std::invalid_argument("Expected a string in " + path);
        }
        result.push_back(item.as<std::string>());
    }
    return result;
}

std::vector<std::string> read_string_list(const YAML::Node& node, const std::string& key,
                                          const std::string& path) {
    return read_strings(require_sequence(node, key, path), path + "." + key);
}

std::string read_string(const YAML::Node& node, const std::string& key, const std::string& path) {
    YAML::Node child = require(node, key, path);
    if (child.IsNull()) {
        return std::string();
    }
    if (!child.IsScalar()) {
        throw std::invalid_argument("Expected a string: " + path + "." + key);
    }
    return child.as<std::string>();
}

std::string entry_path(const std::string& table, size_t index) {
    return table + "[" + std::to_string(index) + "]";
}

std::vector<SuffixRule> read_suffix_rules(const YAML::Node& nouns, const std::string& key) {
    std::vector<SuffixRule> rules;
    const std::string table = "nouns." + key;

    YAML::Node list = require_sequence(nouns, key, "nouns");
    for (size_t i = 0; i < list.size(); ++i) {
        std::string path = entry_path(table, i);
        YAML::Node entry = require_map(list[i], path);

        SuffixRule rule;
        rule.name = read_string(entry, "name", path);
        rule.trigger_endings = read_string_list(entry, "endings", path);
        rule.suffixes = read_string_list(entry, "suffixes", path);
        rules.push_back(std::move(rule));
    }
    return rules;
}

}

MorphologyData parse_morphology_data(const YAML::Node& root) {
    MorphologyData data;

    if (!root.IsMap()) {
        throw std::invalid_argument("Morphology data must be a map");
    }
    YAML::Node nouns = require_map(require(root, "nouns", ""), "nouns");
    NounMorphology& out = data.nouns;

    out.regular_suffixes = read_string_list(nouns, "regular_suffixes", "nouns");

    YAML::Node full_forms = require_sequence(nouns, "exception_stems_with_full_forms", "nouns");
    for (size_t i = 0; i < full_forms.size(); ++i) {
        std::string path = entry_path("nouns.exception_stems_with_full_forms", i);
        YAML::Node entry = require_map(full_forms[i], path);

        FullFormException exception;
        exception.stem_endings = read_string_list(entry, "stems", path);
        exception.full_forms = read_string_list(entry, "forms", path);
        out.exception_stems_with_full_forms.push_back(std::move(exception));
    }

    YAML::Node predictable = require_sequence(nouns, "predictable_suffix_exceptions", "nouns");
    for (size_t i = 0; i < predictable.size(); ++i) {
        std::string path = entry_path("nouns.predictable_suffix_exceptions", i);
        YAML::Node entry = require_map(predictable[i], path);

        PredictableSuffixException exception;
        exception.name = read_string(entry, "name", path);
        exception.stem_endings = read_string_list(entry, "stems", path);
        exception.suffixes = read_string_list(entry, "suffixes", path);
        if (entry["exclusions"]) {
            exception.exclusion_endings = read_string_list(entry, "exclusions", path);
        }
        out.predictable_suffix_exceptions.push_back(std::move(exception));
    }

    out.regular_suffix_additions = read_suffix_rules(nouns, "regular_suffix_additions");
    out.regular_suffix_deletions = read_suffix_rules(nouns, "regular_suffix_deletions");

    YAML::Node changes = require_sequence(nouns, "stem_changes", "nouns");
    for (size_t i = 0; i < changes.size(); ++i) {
        std::string path = entry_path("nouns.stem_changes", i);
        YAML::Node entry = require_map(changes[i], path);

        StemChange change;
        change.name = read_string(entry, "name", path);
        change.match_ending = read_string(entry, "ending", path);
        change.replacement_ending = read_string(entry, "replacement", path);
        out.stem_changes.push_back(std::move(change));
    }

    return data;
}

MorphologyData load_morphology_data(const std::string& path) {
    return parse_morphology_data(YAML::LoadFile(path));
}

} // namespace morph
