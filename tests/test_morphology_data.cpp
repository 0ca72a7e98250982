#include "form_generator.hpp"
#include "morphology_data.hpp"
#include "stemmer.hpp"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <stdexcept>

using namespace morph;

namespace {

const char* const VALID_DATA = R"(
nouns:
  regular_suffixes: ["", e, en]
  exception_stems_with_full_forms:
    - stems: [stadt, städt]
      forms: [stadt, städte]
  predictable_suffix_exceptions:
    - name: feminine
      stems: [in]
      suffixes: [nen]
      exclusions: [ein]
    - name: ung
      stems: [ung]
      suffixes: [en]
  regular_suffix_additions:
    - name: weak
      endings: [ent]
      suffixes: [en]
  regular_suffix_deletions:
    - name: vowel
      endings: [a, o]
      suffixes: [e, en]
    - name: sibilant
      endings: [s]
      suffixes: [s]
  stem_changes:
    - name: um
      ending: um
      replacement: en
)";

bool contains(const std::vector<std::string>& forms, const std::string& form) {
    return std::find(forms.begin(), forms.end(), form) != forms.end();
}

std::string error_for(const std::string& yaml) {
    try {
        parse_morphology_data(YAML::Load(yaml));
    } catch (const std::invalid_argument& e) {
        return e.what();
    }
    return "";
}

}

TEST(MorphologyData, ParsesAllTablesInOrder) {
    auto data = parse_morphology_data(YAML::Load(VALID_DATA));
    const auto& nouns = data.nouns;

    EXPECT_EQ(nouns.regular_suffixes, (std::vector<std::string>{"", "e", "en"}));

    ASSERT_EQ(nouns.exception_stems_with_full_forms.size(), 1u);
    EXPECT_EQ(nouns.exception_stems_with_full_forms[0].stem_endings,
              (std::vector<std::string>{"stadt", "städt"}));
    EXPECT_EQ(nouns.exception_stems_with_full_forms[0].full_forms,
              (std::vector<std::string>{"stadt", "städte"}));

    ASSERT_EQ(nouns.predictable_suffix_exceptions.size(), 2u);
    EXPECT_EQ(nouns.predictable_suffix_exceptions[0].name, "feminine");
    EXPECT_EQ(nouns.predictable_suffix_exceptions[0].exclusion_endings,
              (std::vector<std::string>{"ein"}));
    EXPECT_EQ(nouns.predictable_suffix_exceptions[1].name, "ung");
    EXPECT_TRUE(nouns.predictable_suffix_exceptions[1].exclusion_endings.empty());

    ASSERT_EQ(nouns.regular_suffix_additions.size(), 1u);
    EXPECT_EQ(nouns.regular_suffix_additions[0].trigger_endings, (std::vector<std::string>{"ent"}));

    ASSERT_EQ(nouns.regular_suffix_deletions.size(), 2u);
    EXPECT_EQ(nouns.regular_suffix_deletions[0].name, "vowel");
    EXPECT_EQ(nouns.regular_suffix_deletions[1].name, "sibilant");

    ASSERT_EQ(nouns.stem_changes.size(), 1u);
    EXPECT_EQ(nouns.stem_changes[0].match_ending, "um");
    EXPECT_EQ(nouns.stem_changes[0].replacement_ending, "en");
}

TEST(MorphologyData, NullItemIsEmptySuffix) {
    auto data = parse_morphology_data(YAML::Load(R"(
nouns:
  regular_suffixes:
    -
    - s
  exception_stems_with_full_forms: []
  predictable_suffix_exceptions: []
  regular_suffix_additions: []
  regular_suffix_deletions: []
  stem_changes: []
)"));

    EXPECT_EQ(data.nouns.regular_suffixes, (std::vector<std::string>{"", "s"}));
}

TEST(MorphologyData, MissingNounsIsRejected) {
    EXPECT_THROW(parse_morphology_data(YAML::Load("verbs: {}")), std::invalid_argument);
    EXPECT_THROW(parse_morphology_data(YAML::Load("- nouns")), std::invalid_argument);
}

TEST(MorphologyData, MissingTableNamesThePath) {
    std::string yaml = VALID_DATA;
    yaml.replace(yaml.find("  regular_suffixes"), std::string("  regular_suffixes").size(), "  suffixes");

    EXPECT_NE(error_for(yaml).find("nouns.regular_suffixes"), std::string::npos);
}

TEST(MorphologyData, MissingEntryFieldNamesTheEntry) {
    std::string yaml = VALID_DATA;
    yaml.replace(yaml.find("      replacement: en"), std::string("      replacement: en").size(), "");

    EXPECT_NE(error_for(yaml).find("nouns.stem_changes[0].replacement"), std::string::npos);
}

TEST(MorphologyData, WrongShapesAreRejected) {
    EXPECT_FALSE(error_for(R"(
nouns:
  regular_suffixes: s
)").empty());

    EXPECT_FALSE(error_for(R"(
nouns:
  regular_suffixes: [""]
  exception_stems_with_full_forms:
    - stadt
)").empty());

    EXPECT_FALSE(error_for(R"(
nouns:
  regular_suffixes: [[s]]
)").empty());
}

TEST(MorphologyData, MissingFileThrows) {
    EXPECT_THROW(load_morphology_data("/nonexistent/morphology.yaml"), YAML::Exception);
}

TEST(MorphologyData, ShippedGermanData) {
    auto data = load_morphology_data(std::string(MORPH_DATA_DIR) + "/morphology_de.yaml");
    GermanStemmer stemmer;
    FormGenerator generator(data, stemmer);

    EXPECT_FALSE(data.nouns.regular_suffixes.empty());
    EXPECT_FALSE(data.nouns.exception_stems_with_full_forms.empty());

    auto capital = generator.generate("Hauptstädte");
    EXPECT_EQ(capital.stem, "Hauptstädt");
    EXPECT_TRUE(contains(capital.forms, "Hauptstadt"));
    EXPECT_TRUE(contains(capital.forms, "Hauptstädte"));
    EXPECT_TRUE(contains(capital.forms, "Hauptstädten"));

    auto city = generator.generate("Stadt");
    EXPECT_EQ(city.forms, (std::vector<std::string>{"Stadt", "Städte", "Städten"}));

    auto newspaper = generator.generate("Zeitungen");
    EXPECT_EQ(newspaper.stem, "Zeitung");
    EXPECT_TRUE(contains(newspaper.forms, "Zeitung"));
    EXPECT_TRUE(contains(newspaper.forms, "Zeitungen"));

    auto lehrerinnen = generator.generate("Lehrerinnen");
    EXPECT_TRUE(contains(lehrerinnen.forms, "Lehrerin"));
    EXPECT_TRUE(contains(lehrerinnen.forms, "Lehrerinnen"));

    auto museum = generator.generate("Museum");
    EXPECT_TRUE(contains(museum.forms, "Museen"));

    auto name = generator.generate("Namen");
    EXPECT_EQ(name.stem, "Nam");
    EXPECT_TRUE(contains(name.forms, "Namens"));

    auto farmers = generator.generate("Bauern");
    EXPECT_EQ(farmers.stem, "Bau");
    EXPECT_TRUE(contains(farmers.forms, "Bauer"));
    EXPECT_TRUE(contains(farmers.forms, "Bauern"));

    auto igloo = generator.generate("Iglu");
    EXPECT_TRUE(contains(igloo.forms, "Iglus"));
    EXPECT_FALSE(contains(igloo.forms, "Igluen"));

    auto car = generator.generate("Auto");
    EXPECT_TRUE(contains(car.forms, "Autos"));
    EXPECT_FALSE(contains(car.forms, "Autoen"));
}
