#include <gtest/gtest.h>

#include <cstdlib>

#include <cvpipe/config/config_helpers.h>
#include "../../common/test_helpers.h"

using namespace cvpipe;
using namespace cvpipe::config;

class ConfigHelpersTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = test::make_temp_dir("cvpipe_cfg_"); }
    void TearDown() override { std::filesystem::remove_all(dir_); }

    std::filesystem::path dir_;
};

TEST_F(ConfigHelpersTest, ParsesSectionsCommentsAndQuotes) {
    auto path = test::write_file(dir_ / "config.toml", "# top comment\n"
                                                       "\n"
                                                       "[extraction]\n"
                                                       "method = \"poppler\"   # engine\n"
                                                       "ocr_languages = [\"eng\", \"deu\"]\n"
                                                       "\n"
                                                       "[pipeline]\n"
                                                       "note = \"keep # inside quotes\"\n"
                                                       "workers=4\n");
    auto sections = parse_config_file(path);
    ASSERT_TRUE(sections) << sections.error().message;
    const auto& s = sections.value();
    EXPECT_EQ(s.at("extraction").at("method"), "poppler");
    EXPECT_EQ(s.at("extraction").at("ocr_languages"), "[\"eng\", \"deu\"]");
    EXPECT_EQ(s.at("pipeline").at("note"), "keep # inside quotes");
    EXPECT_EQ(s.at("pipeline").at("workers"), "4");
}

TEST_F(ConfigHelpersTest, DottedTopLevelKeys) {
    auto path = test::write_file(dir_ / "dotted.toml", "pipeline.workers = 2\n");
    auto sections = parse_config_file(path);
    ASSERT_TRUE(sections);
    EXPECT_EQ(sections.value().at("pipeline").at("workers"), "2");
}

TEST_F(ConfigHelpersTest, MalformedLinesAreRejected) {
    auto noEquals = parse_config_file(test::write_file(dir_ / "a.toml", "[pipeline]\nworkers\n"));
    ASSERT_FALSE(noEquals);
    EXPECT_EQ(noEquals.error().code, ErrorCode::InvalidArgument);
    EXPECT_NE(noEquals.error().message.find(":2:"), std::string::npos);

    auto header = parse_config_file(test::write_file(dir_ / "b.toml", "[pipeline\n"));
    ASSERT_FALSE(header);
    EXPECT_EQ(header.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ConfigHelpersTest, MissingFile) {
    auto result = parse_config_file(dir_ / "nope.toml");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::FileNotFound);
    EXPECT_EQ(parse_config_value(dir_ / "nope.toml", "pipeline", "workers"), "");
}

TEST_F(ConfigHelpersTest, ParseConfigValueLooksUpOneKey) {
    auto path = test::write_file(dir_ / "c.toml", "[logging]\nlevel = 'debug'\n");
    EXPECT_EQ(parse_config_value(path, "logging", "level"), "debug");
    EXPECT_EQ(parse_config_value(path, "logging", "file"), "");
    EXPECT_EQ(parse_config_value(path, "other", "level"), "");
}

TEST(ConfigValueTest, StringLists) {
    EXPECT_EQ(parse_string_list("[\"eng\", 'fra']"), (std::vector<std::string>{"eng", "fra"}));
    EXPECT_EQ(parse_string_list("eng,deu , spa"),
              (std::vector<std::string>{"eng", "deu", "spa"}));
    EXPECT_TRUE(parse_string_list("[]").empty());
}

TEST(ConfigValueTest, Booleans) {
    EXPECT_EQ(parse_bool("TRUE"), true);
    EXPECT_EQ(parse_bool(" yes "), true);
    EXPECT_EQ(parse_bool("off"), false);
    EXPECT_EQ(parse_bool("0"), false);
    EXPECT_FALSE(parse_bool("maybe").has_value());
}

TEST(ConfigValueTest, TrimAndUnquote) {
    std::string s = "  padded\t";
    trim(s);
    EXPECT_EQ(s, "padded");
    EXPECT_EQ(unquote(" \"quoted\" "), "quoted");
    EXPECT_EQ(unquote("'single'"), "single");
    EXPECT_EQ(unquote("\"unbalanced"), "\"unbalanced");
}

TEST(ConfigPathTest, OverrideAndXdg) {
    EXPECT_EQ(get_config_path("/etc/cvpipe.toml"), std::filesystem::path("/etc/cvpipe.toml"));

    const char* previous = std::getenv("XDG_CONFIG_HOME");
    std::string saved = previous ? previous : "";
    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
    EXPECT_EQ(get_config_path(), std::filesystem::path("/tmp/xdg/cvpipe/config.toml"));
    if (previous) {
        ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    } else {
        ::unsetenv("XDG_CONFIG_HOME");
    }
}
