//! # Configuration Tests
//!
//! Parsing of the `[errlens]` section and loading `errlens.toml` from disk.

#include "cli/config.hpp"

#include <fstream>
#include <gtest/gtest.h>
#include <string>

using namespace errlens;
using namespace errlens::cli;

// ============================================================================
// Parsing
// ============================================================================

TEST(ConfigParseTest, EmptyContentGivesDefaults) {
    auto result = parse_config("");
    ASSERT_TRUE(is_ok(result));

    const auto& config = unwrap(result);
    EXPECT_EQ(config.colors, ColorMode::Auto);
    EXPECT_EQ(config.policy, classify::DispatchPolicy::StopAtFirstMatch);
    EXPECT_EQ(config.format, OutputFormat::Text);
    EXPECT_EQ(config.log_level, log::LogLevel::Warn);
    EXPECT_TRUE(config.log_filter.empty());
}

TEST(ConfigParseTest, ReadsAllKeys) {
    auto result = parse_config(R"(
# errlens settings
[errlens]
colors = false
policy = "fall-through"   # try later kinds
format = "json"
log_level = "debug"
log_filter = "classify=trace,*=warn"
)");
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result);

    const auto& config = unwrap(result);
    EXPECT_EQ(config.colors, ColorMode::Never);
    EXPECT_EQ(config.policy, classify::DispatchPolicy::FallThroughOnNoRewrite);
    EXPECT_EQ(config.format, OutputFormat::JSON);
    EXPECT_EQ(config.log_level, log::LogLevel::Debug);
    EXPECT_EQ(config.log_filter, "classify=trace,*=warn");
}

TEST(ConfigParseTest, ColorModes) {
    EXPECT_EQ(unwrap(parse_config("[errlens]\ncolors = true")).colors, ColorMode::Always);
    EXPECT_EQ(unwrap(parse_config("[errlens]\ncolors = \"always\"")).colors, ColorMode::Always);
    EXPECT_EQ(unwrap(parse_config("[errlens]\ncolors = \"never\"")).colors, ColorMode::Never);
    EXPECT_EQ(unwrap(parse_config("[errlens]\ncolors = \"auto\"")).colors, ColorMode::Auto);
}

TEST(ConfigParseTest, OtherSectionsAreIgnored) {
    auto result = parse_config(R"(
[tool]
colors = "purple"

[errlens]
format = "json"

[other]
format = "yaml"
)");
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result);
    EXPECT_EQ(unwrap(result).format, OutputFormat::JSON);
}

TEST(ConfigParseTest, UnknownKeysAreSkipped) {
    auto result = parse_config("[errlens]\ntheme = \"dark\"\nformat = \"json\"\n");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).format, OutputFormat::JSON);
}

TEST(ConfigParseTest, HashInsideQuotesIsNotAComment) {
    auto result = parse_config("[errlens]\nlog_filter = \"classify#1=debug\" # trailing\n");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).log_filter, "classify#1=debug");
}

TEST(ConfigParseTest, InvalidValueNamesLineAndKey) {
    auto result = parse_config("[errlens]\n\npolicy = \"sometimes\"\n");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result), "line 3: invalid value 'sometimes' for 'policy'");
}

TEST(ConfigParseTest, InvalidLogLevel) {
    auto result = parse_config("[errlens]\nlog_level = \"chatty\"\n");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result), "line 2: invalid value 'chatty' for 'log_level'");
}

TEST(ConfigParseTest, LogFilterMustBeQuoted) {
    auto result = parse_config("[errlens]\nlog_filter = classify=debug\n");
    ASSERT_TRUE(is_err(result));
}

TEST(ConfigParseTest, UnterminatedSection) {
    auto result = parse_config("[errlens\ncolors = true\n");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result), "line 1: unterminated section header");
}

TEST(ConfigParseTest, MissingEquals) {
    auto result = parse_config("[errlens]\ncolors\n");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result), "line 2: expected 'key = value'");
}

TEST(ConfigParseTest, HandlerOptionsFollowConfig) {
    ErrlensConfig config;
    config.colors = ColorMode::Always;
    config.policy = classify::DispatchPolicy::FallThroughOnNoRewrite;

    auto options = config.handler_options();
    EXPECT_TRUE(options.colors);
    EXPECT_EQ(options.policy, classify::DispatchPolicy::FallThroughOnNoRewrite);

    config.colors = ColorMode::Never;
    EXPECT_FALSE(config.handler_options().colors);
}

// ============================================================================
// Loading
// ============================================================================

class ConfigLoadTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "errlens_config_test";
        fs::remove_all(temp_dir);
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        fs::remove_all(temp_dir);
    }

    void write_config(const std::string& content) {
        std::ofstream file(temp_dir / CONFIG_FILE_NAME);
        file << content;
    }
};

TEST_F(ConfigLoadTest, MissingFileGivesDefaults) {
    auto result = load_config_from_dir(temp_dir);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).format, OutputFormat::Text);
}

TEST_F(ConfigLoadTest, LoadsFromDirectory) {
    write_config("[errlens]\nformat = \"json\"\ncolors = false\n");

    auto result = load_config_from_dir(temp_dir);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result);
    EXPECT_EQ(unwrap(result).format, OutputFormat::JSON);
    EXPECT_EQ(unwrap(result).colors, ColorMode::Never);
}

TEST_F(ConfigLoadTest, ExplicitMissingPathIsError) {
    auto result = load_config(temp_dir / "nope.toml");
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).find("cannot open config file"), std::string::npos);
}

TEST_F(ConfigLoadTest, ParseErrorIsPrefixedWithPath) {
    write_config("[errlens]\nformat = \"xml\"\n");

    auto path = temp_dir / CONFIG_FILE_NAME;
    auto result = load_config(path);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result), path.string() + ": line 2: invalid value 'xml' for 'format'");
}
