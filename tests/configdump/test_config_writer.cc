/**
 * @file test_config_writer.cc
 * @brief Tests for listener summary and dump output
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>

#include "dumpscope/configdump/config_writer.h"
#include "dumpscope/configdump/listener_renderer.h"
#include "dumpscope/logging/logger_registry.h"

#include "dump_fixtures.h"

using namespace dumpscope;
using namespace dumpscope::configdump;
using namespace dumpscope::configdump::test;
using ::testing::HasSubstr;

namespace {

constexpr char kTwoListenerSummary[] =
    "ADDRESS      PORT     TYPE\n"
    "10.0.0.1     8080     HTTP\n"
    "10.0.0.2     9000     TCP\n";

}  // namespace

class ConfigWriterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    logging::LoggerRegistry::instance().setSink(
        logging::SinkFactory::createNullSink());
  }

  void TearDown() override { logging::LoggerRegistry::instance().reset(); }

  void prime(const std::string& bytes) {
    auto result = writer_.prime(bytes);
    ASSERT_TRUE(is_success(result)) << get_error(result)->message;
  }

  std::ostringstream out_;
  ConfigWriter writer_{out_};
};

TEST_F(ConfigWriterTest, NotPrimedByDefault) {
  EXPECT_FALSE(writer_.isPrimed());

  auto result = writer_.printListenerSummary(ListenerFilter{});
  ASSERT_TRUE(is_error(result));
  EXPECT_EQ(get_error(result)->code, ErrorCode::NotPrimed);
  EXPECT_TRUE(out_.str().empty());

  auto listeners = writer_.retrieveListeners();
  ASSERT_TRUE(is_error(listeners));
  EXPECT_EQ(get_error(listeners)->code, ErrorCode::NotPrimed);
}

TEST_F(ConfigWriterTest, PrimeRejectsInvalidBytes) {
  auto result = writer_.prime("{\"configs\": [");
  ASSERT_TRUE(is_error(result));
  EXPECT_EQ(get_error(result)->code, ErrorCode::InvalidDump);
  EXPECT_FALSE(writer_.isPrimed());
}

TEST_F(ConfigWriterTest, FailedPrimeKeepsPreviousDump) {
  prime(twoListenerDump());
  ASSERT_TRUE(is_error(writer_.prime("42")));
  EXPECT_TRUE(writer_.isPrimed());

  auto listeners = writer_.retrieveListeners();
  ASSERT_TRUE(is_success(listeners));
  EXPECT_EQ(get_value(listeners)->size(), 2u);
}

TEST_F(ConfigWriterTest, SummaryDynamicThenStatic) {
  prime(twoListenerDump());
  auto result = writer_.printListenerSummary(ListenerFilter{});
  ASSERT_TRUE(is_success(result));
  EXPECT_EQ(out_.str(), kTwoListenerSummary);
}

TEST_F(ConfigWriterTest, SummaryFilteredByType) {
  prime(twoListenerDump());
  ListenerFilter filter;
  filter.type = "TCP";
  ASSERT_TRUE(is_success(writer_.printListenerSummary(filter)));
  EXPECT_EQ(out_.str(),
            "ADDRESS      PORT     TYPE\n"
            "10.0.0.2     9000     TCP\n");
}

TEST_F(ConfigWriterTest, SummaryFilteredByPort) {
  prime(twoListenerDump());
  ListenerFilter filter;
  filter.port = 8080;
  ASSERT_TRUE(is_success(writer_.printListenerSummary(filter)));
  EXPECT_EQ(out_.str(),
            "ADDRESS      PORT     TYPE\n"
            "10.0.0.1     8080     HTTP\n");
}

TEST_F(ConfigWriterTest, SummaryWithNoMatchesPrintsHeader) {
  prime(twoListenerDump());
  ListenerFilter filter;
  filter.address = "192.168.0.1";
  ASSERT_TRUE(is_success(writer_.printListenerSummary(filter)));
  EXPECT_EQ(out_.str(), "ADDRESS     PORT     TYPE\n");
}

TEST_F(ConfigWriterTest, SummaryColumnsPaddedByAtLeastFiveSpaces) {
  prime(makeDump({listenerJson("wide", "fd00:1234:5678::1", 15006,
                               {chain({httpFilter()})})},
                 {}));
  ASSERT_TRUE(is_success(writer_.printListenerSummary(ListenerFilter{})));

  std::istringstream lines(out_.str());
  std::string header;
  std::string row;
  ASSERT_TRUE(static_cast<bool>(std::getline(lines, header)));
  ASSERT_TRUE(static_cast<bool>(std::getline(lines, row)));
  EXPECT_EQ(row, "fd00:1234:5678::1     15006     HTTP");
  EXPECT_EQ(header.find("PORT"), row.find("15006"));
  EXPECT_EQ(header.find("TYPE"), row.find("HTTP"));
}

TEST_F(ConfigWriterTest, DumpRoundTripsFullListeners) {
  prime(twoListenerDump());
  ASSERT_TRUE(is_success(writer_.printListenerDump(ListenerFilter{})));

  const std::string text = out_.str();
  ASSERT_FALSE(text.empty());
  EXPECT_EQ(text.back(), '\n');
  EXPECT_THAT(text, HasSubstr("\n    {\n        \"name\": \"10.0.0.1_8080\""));

  auto parsed = json::JsonValue::parse(text);
  ASSERT_TRUE(parsed.isArray());
  ASSERT_EQ(parsed.size(), 2u);
  EXPECT_EQ(parsed[0]["name"].getString(), "10.0.0.1_8080");
  EXPECT_EQ(parsed[1]["name"].getString(), "10.0.0.2_9000");
  // Fields the classifier never reads survive
  EXPECT_EQ(parsed[0]["filter_chains"][0]["filters"][0]["typed_config"]["rds"]
                   ["route_config_name"]
                       .getString(),
            "8080");
  EXPECT_FALSE(parsed[0].contains("@type"));
}

TEST_F(ConfigWriterTest, DumpHonorsFilter) {
  prime(twoListenerDump());
  ListenerFilter filter;
  filter.address = "10.0.0.2";
  ASSERT_TRUE(is_success(writer_.printListenerDump(filter)));

  auto parsed = json::JsonValue::parse(out_.str());
  ASSERT_EQ(parsed.size(), 1u);
  EXPECT_EQ(parsed[0]["address"]["socket_address"]["port_value"].getInt(),
            9000);
}

TEST_F(ConfigWriterTest, DumpWithNoMatchesIsEmptyArray) {
  prime(twoListenerDump());
  ListenerFilter filter;
  filter.type = "UNKNOWN";
  ASSERT_TRUE(is_success(writer_.printListenerDump(filter)));
  EXPECT_EQ(out_.str(), "[]\n");
}

TEST_F(ConfigWriterTest, NothingPrintedOnDecodeFailure) {
  prime(makeDump({listenerJson("ok", "10.0.0.1", 80, {chain({httpFilter()})})},
                 {R"({"name": ["bad"]})"}));

  auto summary = writer_.printListenerSummary(ListenerFilter{});
  ASSERT_TRUE(is_error(summary));
  EXPECT_EQ(get_error(summary)->code, ErrorCode::DecodeFailure);

  auto dump = writer_.printListenerDump(ListenerFilter{});
  ASSERT_TRUE(is_error(dump));
  EXPECT_EQ(get_error(dump)->code, ErrorCode::DecodeFailure);

  EXPECT_TRUE(out_.str().empty());
}

TEST_F(ConfigWriterTest, EmptyDumpFails) {
  prime(makeDump({}, {}));
  auto result = writer_.printListenerSummary(ListenerFilter{});
  ASSERT_TRUE(is_error(result));
  EXPECT_EQ(get_error(result)->code, ErrorCode::EmptyResult);
  EXPECT_TRUE(out_.str().empty());
}

TEST_F(ConfigWriterTest, BadOutputStreamIsRenderFailure) {
  prime(twoListenerDump());
  out_.setstate(std::ios::badbit);
  auto result = writer_.printListenerSummary(ListenerFilter{});
  ASSERT_TRUE(is_error(result));
  EXPECT_EQ(get_error(result)->code, ErrorCode::RenderFailure);
}

TEST(ListenerRendererTest, DumpReportsMarshalFailure) {
  // Invalid UTF-8 cannot be serialized strictly
  auto listener = decodeListener(R"({"name": "ok"})");
  listener.raw.set("name", json::JsonValue(std::string("bad\xFF")));

  std::ostringstream out;
  auto result = renderListenerDump({listener}, ListenerFilter{}, out);
  ASSERT_TRUE(is_error(result));
  EXPECT_EQ(get_error(result)->code, ErrorCode::RenderFailure);
  EXPECT_THAT(get_error(result)->message,
              HasSubstr("failed to marshal listeners: "));
  EXPECT_TRUE(out.str().empty());
}
