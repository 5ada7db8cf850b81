/**
 * @file test_listener_filter.cc
 * @brief Unit tests for listener matching
 */

#include <gtest/gtest.h>

#include <vector>

#include "dumpscope/configdump/listener_classifier.h"
#include "dumpscope/configdump/listener_filter.h"

#include "dump_fixtures.h"

using namespace dumpscope::configdump;
using namespace dumpscope::configdump::test;

class ListenerFilterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    listeners_.push_back(decodeListener(
        listenerJson("http", "10.0.0.1", 8080, {chain({httpFilter()})})));
    listeners_.push_back(decodeListener(listenerJson(
        "tcp", "10.0.0.2", 9000, {chain({tcpFilter("outbound|9000||db")})})));
    listeners_.push_back(decodeListener(
        listenerJson("virtual", "0.0.0.0", 15001,
                     {chain({tcpFilter(kBlackHoleCluster)})})));
  }

  std::vector<std::string> matching(const ListenerFilter& filter) const {
    std::vector<std::string> names;
    for (const auto& listener : listeners_) {
      if (filter.verify(listener)) {
        names.push_back(listener.name);
      }
    }
    return names;
  }

  std::vector<Listener> listeners_;
};

TEST_F(ListenerFilterTest, EmptyFilterMatchesEverything) {
  ListenerFilter filter;
  EXPECT_TRUE(filter.empty());
  EXPECT_EQ(matching(filter),
            (std::vector<std::string>{"http", "tcp", "virtual"}));
}

TEST_F(ListenerFilterTest, ByAddress) {
  ListenerFilter filter;
  filter.address = "10.0.0.2";
  EXPECT_FALSE(filter.empty());
  EXPECT_EQ(matching(filter), (std::vector<std::string>{"tcp"}));
}

TEST_F(ListenerFilterTest, AddressIsCaseInsensitive) {
  Listener listener = decodeListener(
      listenerJson("v6", "FE80::1", 80, {chain({httpFilter()})}));
  ListenerFilter filter;
  filter.address = "fe80::1";
  EXPECT_TRUE(filter.verify(listener));
}

TEST_F(ListenerFilterTest, ByPort) {
  ListenerFilter filter;
  filter.port = 8080;
  EXPECT_EQ(matching(filter), (std::vector<std::string>{"http"}));
}

TEST_F(ListenerFilterTest, ByType) {
  ListenerFilter filter;
  filter.type = "TCP";
  EXPECT_EQ(matching(filter), (std::vector<std::string>{"tcp"}));

  filter.type = "unknown";
  EXPECT_EQ(matching(filter), (std::vector<std::string>{"virtual"}));

  filter.type = "http+tcp";
  EXPECT_TRUE(matching(filter).empty());
}

TEST_F(ListenerFilterTest, AllChecksMustPass) {
  ListenerFilter filter;
  filter.address = "10.0.0.1";
  filter.port = 9000;
  EXPECT_TRUE(matching(filter).empty());

  filter.port = 8080;
  filter.type = "http";
  EXPECT_EQ(matching(filter), (std::vector<std::string>{"http"}));

  filter.type = "tcp";
  EXPECT_TRUE(matching(filter).empty());
}

TEST_F(ListenerFilterTest, RepeatedFilteringIsStable) {
  ListenerFilter filter;
  filter.type = "TCP";
  EXPECT_EQ(matching(filter), matching(filter));
}
