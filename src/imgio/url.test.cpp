//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <imgio/url.hpp>
//
#include <imgio/url.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <batteries/stream_util.hpp>

namespace {

using imgio::StatusCode;
using imgio::StatusOr;
using imgio::Url;

TEST(UrlTest, ParseFile)
{
  for (const char* text : {"file:/var/tmp/disk.raw", "file:///var/tmp/disk.raw",
                           "file://localhost/var/tmp/disk.raw", "FILE:/var/tmp/disk.raw"}) {
    StatusOr<Url> url = Url::parse(text);
    ASSERT_TRUE(url.ok()) << BATT_INSPECT(url.status()) << BATT_INSPECT_STR(text);

    EXPECT_EQ(url->scheme, "file") << BATT_INSPECT_STR(text);
    EXPECT_EQ(url->host, "") << BATT_INSPECT_STR(text);
    EXPECT_EQ(url->path, "/var/tmp/disk.raw") << BATT_INSPECT_STR(text);
  }
}

TEST(UrlTest, ParseOtherScheme)
{
  StatusOr<Url> url = Url::parse("nbd://server.example/export");
  ASSERT_TRUE(url.ok()) << BATT_INSPECT(url.status());

  EXPECT_EQ(url->scheme, "nbd");
  EXPECT_EQ(url->host, "server.example");
  EXPECT_EQ(url->path, "/export");
}

TEST(UrlTest, Invalid)
{
  for (const char* text : {"", "/var/tmp/disk.raw", "file:", "file:relative/path",
                           "file://remote.host/var/tmp/disk.raw", ":/no/scheme"}) {
    StatusOr<Url> url = Url::parse(text);

    EXPECT_EQ(url.status(), imgio::make_status(StatusCode::kInvalidUrl))
        << BATT_INSPECT_STR(text);
  }
}

TEST(UrlTest, Equality)
{
  StatusOr<Url> a = Url::parse("file:/a");
  StatusOr<Url> b = Url::parse("file:///a");
  StatusOr<Url> c = Url::parse("file:/b");
  StatusOr<Url> d = Url::parse("file://localhost/a");

  ASSERT_TRUE(a.ok() && b.ok() && c.ok() && d.ok());

  EXPECT_EQ(*a, *b);
  EXPECT_EQ(*a, *d);
  EXPECT_NE(*a, *c);
}

}  // namespace
