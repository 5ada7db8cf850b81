/**
 * @file test_inspector_config.cc
 * @brief Tests for inspector settings files and validation
 */

#include <cstdlib>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "dumpscope/config/inspector_config.h"
#include "dumpscope/logging/logger_registry.h"
#include "test_filesystem_utils.h"

namespace dumpscope {
namespace config {
namespace testing {

using namespace dumpscope::testing::fs_utils;
using json::JsonValue;
using ::testing::HasSubstr;

class InspectorConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = createUniqueTempDirectory("dumpscope_config_test");
    ASSERT_FALSE(test_dir_.empty());
    unsetenv(kConfigPathEnv);
    logging::LoggerRegistry::instance().setSink(
        logging::SinkFactory::createNullSink());
  }

  void TearDown() override {
    if (pathExists(test_dir_)) {
      removeDirectoryRecursive(test_dir_);
    }
    unsetenv(kConfigPathEnv);
    logging::LoggerRegistry::instance().reset();
  }

  // Expects ConfigValidationError naming the given field
  void expectInvalid(const InspectorConfig& config, const std::string& field) {
    try {
      config.validate();
      FAIL() << "Expected ConfigValidationError for " << field;
    } catch (const ConfigValidationError& e) {
      EXPECT_EQ(e.field(), field);
    }
  }

  std::string test_dir_;
};

TEST_F(InspectorConfigTest, Defaults) {
  InspectorConfig config;
  EXPECT_EQ(config.log_level, "warning");
  EXPECT_EQ(config.log_format, "text");
  EXPECT_EQ(config.output, "short");
  EXPECT_TRUE(config.filter().empty());
  EXPECT_NO_THROW(config.validate());
}

TEST_F(InspectorConfigTest, FromJson) {
  auto config = InspectorConfig::fromJson(JsonValue::parse(R"({
    "log_level": "debug",
    "output": "json",
    "filter": {"address": "10.0.0.1", "port": 8080, "type": "HTTP"},
    "unknown_key": 1
  })"));

  EXPECT_EQ(config.log_level, "debug");
  EXPECT_EQ(config.log_format, "text");
  EXPECT_EQ(config.output, "json");
  EXPECT_EQ(config.address, "10.0.0.1");
  EXPECT_EQ(config.port, 8080u);
  EXPECT_EQ(config.type, "HTTP");

  auto filter = config.filter();
  EXPECT_EQ(filter.address, "10.0.0.1");
  EXPECT_EQ(filter.port, 8080u);
  EXPECT_EQ(filter.type, "HTTP");
}

TEST_F(InspectorConfigTest, FromJsonWrongTypes) {
  try {
    InspectorConfig::fromJson(JsonValue::parse(R"({"output": 3})"));
    FAIL() << "Expected ConfigValidationError";
  } catch (const ConfigValidationError& e) {
    EXPECT_EQ(e.field(), "output");
  }

  try {
    InspectorConfig::fromJson(JsonValue::parse(R"({"filter": {"port": "80"}})"));
    FAIL() << "Expected ConfigValidationError";
  } catch (const ConfigValidationError& e) {
    EXPECT_EQ(e.field(), "filter.port");
  }

  EXPECT_THROW(InspectorConfig::fromJson(JsonValue::parse(R"({"filter": 1})")),
               ConfigValidationError);
  EXPECT_THROW(InspectorConfig::fromJson(JsonValue::parse("[]")),
               ConfigValidationError);
}

TEST_F(InspectorConfigTest, Validate) {
  InspectorConfig config;

  config.output = "yaml";
  expectInvalid(config, "output");

  config = InspectorConfig();
  config.log_format = "xml";
  expectInvalid(config, "log_format");

  config = InspectorConfig();
  config.log_level = "loud";
  expectInvalid(config, "log_level");

  config = InspectorConfig();
  config.port = 65536;
  expectInvalid(config, "filter.port");

  config.port = 65535;
  EXPECT_NO_THROW(config.validate());
}

TEST_F(InspectorConfigTest, ToJsonRoundTrip) {
  InspectorConfig config;
  config.log_level = "info";
  config.output = "json";
  config.address = "::1";
  config.port = 15001;
  config.type = "tcp";

  auto restored = InspectorConfig::fromJson(config.toJson());
  EXPECT_EQ(restored, config);
}

TEST_F(InspectorConfigTest, LoadYamlFile) {
  auto path = writeFile(test_dir_, "dumpscope.yaml",
                        "log_level: debug\n"
                        "log_format: json\n"
                        "filter:\n"
                        "  address: 10.0.0.2\n"
                        "  port: 9000\n"
                        "  type: TCP\n");

  auto config = InspectorConfig::fromFile(path);
  EXPECT_EQ(config.log_level, "debug");
  EXPECT_EQ(config.log_format, "json");
  EXPECT_EQ(config.output, "short");
  EXPECT_EQ(config.address, "10.0.0.2");
  EXPECT_EQ(config.port, 9000u);
  EXPECT_EQ(config.type, "TCP");
}

TEST_F(InspectorConfigTest, YamlQuotedNumberStaysString) {
  auto path = writeFile(test_dir_, "quoted.yaml",
                        "filter:\n"
                        "  address: \"10\"\n");
  auto config = InspectorConfig::fromFile(path);
  EXPECT_EQ(config.address, "10");

  auto bad = writeFile(test_dir_, "quoted_port.yaml",
                       "filter:\n"
                       "  port: \"8080\"\n");
  EXPECT_THROW(InspectorConfig::fromFile(bad), ConfigValidationError);
}

TEST_F(InspectorConfigTest, LoadJsonFile) {
  auto path = writeFile(test_dir_, "dumpscope.json",
                        R"({"output": "json", "filter": {"port": 15006}})");

  auto config = InspectorConfig::fromFile(path);
  EXPECT_EQ(config.output, "json");
  EXPECT_EQ(config.port, 15006u);
}

TEST_F(InspectorConfigTest, EmptyYamlFileUsesDefaults) {
  auto path = writeFile(test_dir_, "empty.yaml", "");
  EXPECT_EQ(InspectorConfig::fromFile(path), InspectorConfig());
}

TEST_F(InspectorConfigTest, FileErrors) {
  try {
    InspectorConfig::fromFile(joinPath(test_dir_, "missing.yaml"));
    FAIL() << "Expected ConfigValidationError";
  } catch (const ConfigValidationError& e) {
    EXPECT_EQ(e.field(), "config_file");
    EXPECT_THAT(e.reason(), HasSubstr("Cannot open config file"));
  }

  auto bad_json = writeFile(test_dir_, "bad.json", "{\"output\": ");
  try {
    InspectorConfig::fromFile(bad_json);
    FAIL() << "Expected ConfigValidationError";
  } catch (const ConfigValidationError& e) {
    EXPECT_THAT(e.reason(), HasSubstr("JSON parse error"));
  }

  auto bad_yaml = writeFile(test_dir_, "bad.yaml", "filter: [unclosed\n");
  try {
    InspectorConfig::fromFile(bad_yaml);
    FAIL() << "Expected ConfigValidationError";
  } catch (const ConfigValidationError& e) {
    EXPECT_THAT(e.reason(), HasSubstr("YAML parse error at line"));
  }
}

TEST_F(InspectorConfigTest, FileValuesAreValidated) {
  auto path = writeFile(test_dir_, "invalid.yaml", "output: table\n");
  EXPECT_THROW(InspectorConfig::fromFile(path), ConfigValidationError);
}

TEST_F(InspectorConfigTest, ResolveConfigPath) {
  EXPECT_EQ(resolveConfigPath(""), "");

  setenv(kConfigPathEnv, "/etc/dumpscope/env.yaml", 1);
  EXPECT_EQ(resolveConfigPath(""), "/etc/dumpscope/env.yaml");
  EXPECT_EQ(resolveConfigPath("flag.yaml"), "flag.yaml");

  setenv(kConfigPathEnv, "", 1);
  EXPECT_EQ(resolveConfigPath(""), "");
}

}  // namespace testing
}  // namespace config
}  // namespace dumpscope
