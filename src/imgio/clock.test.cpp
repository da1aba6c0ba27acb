//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <imgio/clock.hpp>
//
#include <imgio/clock.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <batteries/stream_util.hpp>

#include <chrono>
#include <ios>
#include <sstream>
#include <thread>

namespace {

using namespace imgio::int_types;

using imgio::ClockSpan;
using imgio::MetricsClock;
using imgio::NullClock;

TEST(ClockTest, NullClock)
{
  ClockSpan span = NullClock::instance().run("read");
  span.add_bytes(100);

  EXPECT_EQ(span.bytes(), 100);
}

TEST(ClockTest, MetricsClock)
{
  MetricsClock clock;

  EXPECT_EQ(clock.get("operation"), nullptr);
  {
    ClockSpan operation = clock.run("operation");
    for (int i = 0; i < 3; ++i) {
      ClockSpan read = clock.run("read");
      read.add_bytes(1000);
    }
    {
      ClockSpan write = clock.run("write");
      write.add_bytes(3000);
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
  }

  EXPECT_THAT(clock.names(), ::testing::ElementsAre("operation", "read", "write"));

  ASSERT_NE(clock.get("operation"), nullptr);
  EXPECT_EQ(clock.get("operation")->count(), 1u);
  EXPECT_EQ(clock.get("operation")->bytes.load(), 0);
  EXPECT_GT(clock.get("operation")->elapsed_seconds(), 0.0);

  ASSERT_NE(clock.get("read"), nullptr);
  EXPECT_EQ(clock.get("read")->count(), 3u);
  EXPECT_EQ(clock.get("read")->bytes.load(), 3000);

  ASSERT_NE(clock.get("write"), nullptr);
  EXPECT_EQ(clock.get("write")->count(), 1u);
  EXPECT_EQ(clock.get("write")->bytes.load(), 3000);
  EXPECT_GE(clock.get("write")->elapsed_seconds(), 0.001);

  const std::string printed = batt::to_string(clock);

  EXPECT_THAT(printed, ::testing::StartsWith("[operation 1 ops, "));
  EXPECT_THAT(printed, ::testing::HasSubstr("[read 3 ops, "));
  EXPECT_THAT(printed, ::testing::HasSubstr(", 3000 bytes"));
}

TEST(ClockTest, PrintKeepsStreamFormat)
{
  MetricsClock clock;
  {
    ClockSpan span = clock.run("read");
    span.add_bytes(1000);
  }

  std::ostringstream oss;
  oss.precision(3);

  oss << clock << " " << 0.5;

  EXPECT_EQ(oss.precision(), 3);
  EXPECT_EQ(oss.flags() & std::ios_base::floatfield, std::ios_base::fmtflags{});
  EXPECT_THAT(oss.str(), ::testing::EndsWith("] 0.5"));
}

}  // namespace
