#include "tokenizer.hpp"

#include <gtest/gtest.h>

using morph::Tokenizer;

TEST(Tokenizer, SplitsGermanTextAndDropsStopWords) {
    Tokenizer tokenizer;

    auto tokens = tokenizer.tokenize("Die Städte und die Häuser, die Straße.");

    EXPECT_EQ(tokens, (std::vector<std::string>{"Städte", "Häuser", "Straße"}));
}

TEST(Tokenizer, KeepsWordInternalHyphens) {
    Tokenizer tokenizer;

    EXPECT_EQ(tokenizer.tokenize("Die Nord-Süd-Achse"), (std::vector<std::string>{"Nord-Süd-Achse"}));
    EXPECT_EQ(tokenizer.tokenize("Ein- und Ausgang"), (std::vector<std::string>{"Ausgang"}));
}

TEST(Tokenizer, NounsOnly) {
    Tokenizer::Config config;
    config.nouns_only = true;
    Tokenizer tokenizer(config);

    EXPECT_EQ(tokenizer.tokenize("Der Hund bellt laut im Überfluss"),
              (std::vector<std::string>{"Hund", "Überfluss"}));
}

TEST(Tokenizer, LowercaseAndMinLength) {
    Tokenizer::Config config;
    config.lowercase = true;
    config.min_length = 3;
    config.remove_stopwords = false;
    Tokenizer tokenizer(config);

    EXPECT_EQ(tokenizer.tokenize("ÄRZTE ab Öl"), (std::vector<std::string>{"ärzte", "öl"}));
}

TEST(Tokenizer, ExtractText) {
    Tokenizer tokenizer;

    std::string html = "<html><head><script>var x = 1;</script><style>p{}</style></head>"
                       "<body><p>Das   Haus</p>\n<p>am See</p></body></html>";

    EXPECT_EQ(tokenizer.extract_text(html), "Das Haus am See");
}

TEST(Tokenizer, IsCapitalized) {
    EXPECT_TRUE(Tokenizer::is_capitalized("Haus"));
    EXPECT_TRUE(Tokenizer::is_capitalized("Übung"));
    EXPECT_FALSE(Tokenizer::is_capitalized("übung"));
    EXPECT_FALSE(Tokenizer::is_capitalized(""));
}
