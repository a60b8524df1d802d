#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>

#include "hlid/config/config.hpp"
#include "test_helpers.hpp"

using namespace hlid::config;
using namespace hlid::test;
using hlid::ErrorCode;

class ConfigTest : public TempDirTest {
 protected:
  std::filesystem::path writeConfig(const std::string& content) {
    auto path = temp_dir_ / "config.toml";
    std::ofstream file(path);
    file << content;
    return path;
  }
};

TEST_F(ConfigTest, Defaults) {
  Config config;
  EXPECT_EQ(config.user_data, "00");
  EXPECT_TRUE(config.secret.empty());
  EXPECT_EQ(config.output, Config::OutputFormat::kText);
  EXPECT_EQ(config.log_level, "warn");
  EXPECT_FALSE(config.log_to_file);
  EXPECT_OK(config.validate());
}

TEST_F(ConfigTest, LoadsAllKeys) {
  auto path = writeConfig(R"(
user_data = "0a"
secret = "0123456789abcdef0123456789abcdef"
output = "json"
log_level = "debug"
log_to_file = true
)");

  auto config = Config::fromFile(path);
  ASSERT_OK(config);
  EXPECT_EQ(config->user_data, "0a");
  EXPECT_EQ(config->resolvedSecret(), kTestSecret);
  EXPECT_EQ(config->output, Config::OutputFormat::kJson);
  EXPECT_EQ(config->log_level, "debug");
  EXPECT_TRUE(config->log_to_file);
  EXPECT_EQ(config->configPath(), path);
  EXPECT_OK(config->validate());
}

TEST_F(ConfigTest, PartialFileKeepsDefaults) {
  auto path = writeConfig("user_data = \"ff\"\n");

  auto config = Config::fromFile(path);
  ASSERT_OK(config);
  EXPECT_EQ(config->user_data, "ff");
  EXPECT_EQ(config->log_level, "warn");
  EXPECT_EQ(config->output, Config::OutputFormat::kText);
}

TEST_F(ConfigTest, ResolvesEnvSecret) {
  setenv("HLID_TEST_CONFIG_SECRET", "abcdefghijklmnopqrstuvwxyz", 1);
  auto path = writeConfig("secret = \"env:HLID_TEST_CONFIG_SECRET\"\n");

  auto config = Config::fromFile(path);
  ASSERT_OK(config);
  EXPECT_EQ(config->secret, "env:HLID_TEST_CONFIG_SECRET");
  EXPECT_EQ(config->resolvedSecret(), "abcdefghijklmnopqrstuvwxyz");

  unsetenv("HLID_TEST_CONFIG_SECRET");
  EXPECT_EQ(config->resolvedSecret(), "");
}

TEST_F(ConfigTest, MissingExplicitFileIsError) {
  auto result = Config::fromFile(temp_dir_ / "does-not-exist.toml");
  EXPECT_ERROR(result, ErrorCode::kConfigError);
}

TEST_F(ConfigTest, InvalidTomlIsError) {
  auto path = writeConfig("user_data = \"00\nthis is not toml");
  EXPECT_ERROR(Config::fromFile(path), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, InvalidOutputIsError) {
  auto path = writeConfig("output = \"yaml\"\n");
  EXPECT_ERROR(Config::fromFile(path), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, ValidateRejectsBadValues) {
  Config bad_user_data;
  bad_user_data.user_data = "AA";
  EXPECT_ERROR(bad_user_data.validate(), ErrorCode::kConfigError);

  Config bad_level;
  bad_level.log_level = "chatty";
  EXPECT_ERROR(bad_level.validate(), ErrorCode::kConfigError);

  Config off;
  off.log_level = "off";
  EXPECT_OK(off.validate());
}

TEST_F(ConfigTest, OutputFormatNames) {
  EXPECT_EQ(Config::outputFormatToString(Config::OutputFormat::kText), "text");
  EXPECT_EQ(Config::outputFormatToString(Config::OutputFormat::kJson), "json");
  EXPECT_EQ(Config::stringToOutputFormat("json"), Config::OutputFormat::kJson);
  EXPECT_FALSE(Config::stringToOutputFormat("xml").has_value());
}
