#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

#include "config.hpp"
#include "errors.hpp"

using namespace attribution;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_config_path_ = (std::filesystem::temp_directory_path() /
                             ("attribution_config_" + std::to_string(::testing::UnitTest::GetInstance()
                                                                      ->random_seed()) + ".yml")).string();
    }

    void TearDown() override {
        if (std::filesystem::exists(temp_config_path_))
            std::filesystem::remove(temp_config_path_);
    }

    void writeConfig(const std::string& text) {
        std::ofstream f(temp_config_path_);
        f << text;
    }

    std::string temp_config_path_;
};

TEST_F(ConfigTest, MinimalFileUsesDefaults)
{
    writeConfig(R"(
categories:
  Manhole: { kind: point }
rules: []
)");
    const AttributorConfig cfg = loadConfig(temp_config_path_);
    EXPECT_EQ(cfg.logging.level, "info");
    EXPECT_EQ(cfg.editor.authoritative, "COSPW");
    EXPECT_EQ(cfg.editor.engine, "ATTRIBUTOR");
    EXPECT_EQ(cfg.codes.primaryOwner, 1);
    EXPECT_EQ(cfg.codes.privateOwner, -2);
    EXPECT_EQ(cfg.codes.asBuiltStage, 0);
    EXPECT_EQ(cfg.fingerprint.padWidth, 6);
    EXPECT_EQ(cfg.sequence.width, 3);
    EXPECT_EQ(cfg.sequence.separators, "-");
    EXPECT_EQ(cfg.sequence.stripTokens, (std::vector<std::string>{"SD"}));
    EXPECT_FALSE(cfg.sequence.fingerprintFallback);
    EXPECT_EQ(cfg.endpoints.categories, (std::vector<std::string>{"Manhole"}));
    EXPECT_DOUBLE_EQ(cfg.endpoints.tolerance, 0.0);
    EXPECT_EQ(cfg.defaultStrategy, "FingerprintOnly");
}

TEST_F(ConfigTest, OverridesAreRead)
{
    writeConfig(R"(
logging: { level: debug }
editor: { authoritative: CITY, engine: BOT }
codes: { primary_owner: 7, water_types: { SAN: 1, STM: 3 } }
sequence: { width: 4, separators: "-_", fingerprint_fallback: true }
endpoints: { categories: [Manhole, Fitting], tolerance: 0.01 }
default_strategy: Deferred
categories:
  Manhole: { kind: point }
rules: []
)");
    const AttributorConfig cfg = loadConfig(temp_config_path_);
    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_EQ(cfg.editor.authoritative, "CITY");
    EXPECT_EQ(cfg.editor.engine, "BOT");
    EXPECT_EQ(cfg.codes.primaryOwner, 7);
    EXPECT_EQ(cfg.codes.waterCode("STM"), 3);
    EXPECT_EQ(cfg.codes.waterCode("SS"), 0);
    EXPECT_EQ(cfg.sequence.width, 4);
    EXPECT_EQ(cfg.sequence.separators, "-_");
    EXPECT_TRUE(cfg.sequence.fingerprintFallback);
    EXPECT_EQ(cfg.endpoints.categories.size(), 2u);
    EXPECT_DOUBLE_EQ(cfg.endpoints.tolerance, 0.01);
    EXPECT_EQ(cfg.defaultStrategy, "Deferred");
}

TEST_F(ConfigTest, InvalidValuesRejected)
{
    writeConfig("fingerprint: { pad_width: 3 }\ncategories: { A: { kind: point } }\nrules: []\n");
    EXPECT_THROW(loadConfig(temp_config_path_), ConfigError);

    writeConfig("sequence: { width: twelve }\ncategories: { A: { kind: point } }\nrules: []\n");
    EXPECT_THROW(loadConfig(temp_config_path_), ConfigError);

    writeConfig("rules: []\n");
    EXPECT_THROW(loadConfig(temp_config_path_), ConfigError);

    writeConfig("categories: { A: { kind: point } }\n");
    EXPECT_THROW(loadConfig(temp_config_path_), ConfigError);
}

TEST_F(ConfigTest, MissingFileIsConfigError)
{
    EXPECT_THROW(loadConfig("/nonexistent/attribution.yml"), ConfigError);
}

TEST(DefaultConfigTest, ShippedFileLoads)
{
    const AttributorConfig cfg = loadConfig(ATTRIBUTION_DEFAULT_CONFIG);
    EXPECT_EQ(cfg.codes.waterCode("SS"), 1);
    EXPECT_EQ(cfg.codes.waterCode("CB"), 2);
    EXPECT_EQ(cfg.codes.waterCode("SW"), 3);
    EXPECT_EQ(cfg.codes.waterCode(""), 0);
    EXPECT_TRUE(cfg.rules.IsSequence());
    EXPECT_TRUE(cfg.categories.IsMap());
}
