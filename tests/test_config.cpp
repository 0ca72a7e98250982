#include "config.hpp"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <cstdio>
#include <fstream>
#include <string>

using namespace morph;

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        std::remove(path_.c_str());
    }

    std::string write(const std::string& yaml) {
        std::ofstream out(path_);
        out << yaml;
        return path_;
    }

    std::string path_ = ::testing::TempDir() + "morph_config_test.yaml";
};

TEST_F(ConfigTest, TextFieldDefaultsToHtmlContent) {
    auto config = load_config(write(R"(
db:
  database: wiki_de
  collection: pages
)"));

    EXPECT_EQ(config.db.database, "wiki_de");
    EXPECT_EQ(config.db.collection, "pages");
    EXPECT_EQ(config.db.text_field, "html_content");
    EXPECT_EQ(config.db.port, 27017);
    EXPECT_EQ(config.morphology_path, "data/morphology_de.yaml");
}

TEST_F(ConfigTest, ReadsAllSections) {
    auto config = load_config(write(R"(
morphology:
  data: /srv/morphology.yaml
db:
  host: mongo
  port: 27018
  database: corpus
  collection: articles
  text_field: body
server:
  port: 9090
)"));

    EXPECT_EQ(config.morphology_path, "/srv/morphology.yaml");
    EXPECT_EQ(config.db.host, "mongo");
    EXPECT_EQ(config.db.port, 27018);
    EXPECT_EQ(config.db.text_field, "body");
    EXPECT_EQ(config.server.host, "0.0.0.0");
    EXPECT_EQ(config.server.port, 9090);
}

TEST_F(ConfigTest, MissingCollectionThrows) {
    EXPECT_THROW(load_config(write("db:\n  database: corpus\n")), YAML::Exception);
}
