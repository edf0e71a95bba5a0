// ==============================================================================
// test_config_gtest.cpp - Тесты конфигурации (GoogleTest)
// ==============================================================================
//
// Значения по умолчанию, разбор YAML, отклонение неизвестных ключей
//
// ==============================================================================

#include "artifacts/config.hpp"
#include "artifacts/platform.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <system_error>

namespace artifacts::test {

// ==============================================================================
// parse_config
// ==============================================================================

TEST(ConfigTest, EmptyDocument_Defaults) {
    auto result = parse_config("");

    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_TRUE(result.config.validate_checksums);
    EXPECT_TRUE(result.config.record_recovery == RecoveryPolicy::Stop);
    EXPECT_EQ(result.config.message_separator, " | ");
    EXPECT_EQ(result.config.message_limit, 200u);
    EXPECT_EQ(result.config.max_diagnostics, 256u);
    EXPECT_FALSE(result.config.output.quiet);
    EXPECT_EQ(result.config.output.verbose, 0);
    EXPECT_FALSE(result.config.output.log_path.has_value());
}

TEST(ConfigTest, FullDocument) {
    const std::string yaml = R"(
validate_checksums: false
record_recovery: scan
message_separator: "; "
message_limit: 80
max_diagnostics: 16
output:
  quiet: true
  verbose: 2
  log_path: /tmp/reader.log
)";

    auto result = parse_config(yaml);

    ASSERT_TRUE(result.ok) << result.error.format();
    const ReaderConfig& c = result.config;
    EXPECT_FALSE(c.validate_checksums);
    EXPECT_TRUE(c.record_recovery == RecoveryPolicy::Scan);
    EXPECT_EQ(c.message_separator, "; ");
    EXPECT_EQ(c.message_limit, 80u);
    EXPECT_EQ(c.max_diagnostics, 16u);
    EXPECT_TRUE(c.output.quiet);
    EXPECT_EQ(c.output.verbose, 2);
    ASSERT_TRUE(c.output.log_path.has_value());
    EXPECT_EQ(platform::path_to_utf8(*c.output.log_path), "/tmp/reader.log");
}

TEST(ConfigTest, UnknownKey_Rejected) {
    auto result = parse_config("validate_checksum: true\n");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.context, "validate_checksum");
    EXPECT_EQ(result.error.format(), "validate_checksum: unknown key");
}

TEST(ConfigTest, UnknownNestedKey_Rejected) {
    auto result = parse_config("output:\n  foo: 1\n");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.context, "output.foo");
}

TEST(ConfigTest, BadRecoveryPolicy_Rejected) {
    auto result = parse_config("record_recovery: retry\n");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.context, "record_recovery");
    EXPECT_NE(result.error.message.find("'retry'"), std::string::npos);
}

TEST(ConfigTest, NonPositiveLimit_Rejected) {
    EXPECT_FALSE(parse_config("message_limit: 0\n").ok);
    EXPECT_FALSE(parse_config("max_diagnostics: -3\n").ok);
}

TEST(ConfigTest, WrongValueType_Rejected) {
    auto result = parse_config("validate_checksums: maybe\n");
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.error.message.empty());
}

TEST(ConfigTest, NonMappingRoot_Rejected) {
    EXPECT_FALSE(parse_config("- a\n- b\n").ok);
}

TEST(ConfigTest, MalformedYaml_Rejected) {
    EXPECT_FALSE(parse_config("output: [unclosed\n").ok);
}

TEST(ConfigTest, ExtractorOptions) {
    auto result = parse_config("message_separator: \",\"\nmessage_limit: 10\n");
    ASSERT_TRUE(result.ok);

    ExtractorOptions options = result.config.extractor_options();
    EXPECT_EQ(options.separator, ",");
    EXPECT_EQ(options.message_limit, 10u);
}

// ==============================================================================
// load_config
// ==============================================================================

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override { path_ = platform::make_temp_file("artifacts_config_", ".yml"); }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    void write(const std::string& text) {
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        out << text;
    }

    std::filesystem::path path_;
};

TEST_F(ConfigFileTest, LoadsFromFile) {
    write("record_recovery: scan\noutput:\n  verbose: 1\n");

    auto result = load_config(path_);

    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_TRUE(result.config.record_recovery == RecoveryPolicy::Scan);
    EXPECT_EQ(result.config.output.verbose, 1);
}

TEST_F(ConfigFileTest, ErrorContextNamesFileAndKey) {
    write("bogus: 1\n");

    auto result = load_config(path_);

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.context, platform::path_to_utf8(path_) + ": bogus");
}

TEST(ConfigLoadTest, MissingFile_Error) {
    auto result = load_config("/nonexistent-dir/reader.yml");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.context, "/nonexistent-dir/reader.yml");
}

}  // namespace artifacts::test
