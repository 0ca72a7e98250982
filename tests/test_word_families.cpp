#include "word_families.hpp"

#include <gtest/gtest.h>

#include <set>

using namespace morph;

class WordFamilyIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        data_.nouns.regular_suffixes = {"", "e", "es", "er", "ern"};
    }

    MorphologyData data_;
    GermanStemmer stemmer_;
};

TEST_F(WordFamilyIndexTest, GroupsTokensByStem) {
    FormGenerator generator(data_, stemmer_);
    WordFamilyIndex index(generator);

    for (const std::string token : {"Kind", "Kindes", "Kinder", "Kind", "Haus"}) {
        index.add(token);
    }

    auto families = index.families();
    ASSERT_EQ(families.size(), 2u);

    EXPECT_EQ(families[0].stem, "Kind");
    EXPECT_EQ(families[0].total_count, 4u);
    ASSERT_EQ(families[0].members.size(), 3u);
    EXPECT_EQ(families[0].members[0].token, "Kind");
    EXPECT_EQ(families[0].members[0].count, 2u);
    EXPECT_EQ(families[0].members[1].token, "Kinder");
    EXPECT_EQ(families[0].members[2].token, "Kindes");

    EXPECT_EQ(families[1].stem, "Haus");
    EXPECT_EQ(families[1].total_count, 1u);
}

TEST_F(WordFamilyIndexTest, MatchesObservedForms) {
    FormGenerator generator(data_, stemmer_);
    WordFamilyIndex index(generator);

    for (const std::string token : {"Kind", "Kindes", "Kinder", "Kind", "Haus"}) {
        index.add(token);
    }

    std::set<std::string> found;
    for (const auto& member : index.matches("Kindern")) {
        found.insert(member.token);
    }

    EXPECT_EQ(found, (std::set<std::string>{"Kind", "Kindes", "Kinder"}));
    EXPECT_TRUE(index.matches("Baum").empty());
}

TEST_F(WordFamilyIndexTest, Stats) {
    FormGenerator generator(data_, stemmer_);
    WordFamilyIndex index(generator);

    EXPECT_EQ(index.stats().avg_forms_per_token(), 0.0);

    for (const std::string token : {"Kind", "Kindes", "Kinder", "Kind", "Haus"}) {
        index.add(token);
    }

    auto stats = index.stats();
    EXPECT_EQ(stats.total_tokens, 5u);
    EXPECT_EQ(stats.distinct_tokens, 4u);
    EXPECT_EQ(stats.families, 2u);
    EXPECT_GT(stats.avg_forms_per_token(), 1.0);
}
