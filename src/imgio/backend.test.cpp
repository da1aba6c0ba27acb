//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <imgio/backend.hpp>
//
#include <imgio/backend.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <imgio/backend_mock.hpp>
#include <imgio/testing/util.hpp>

#include <batteries/stream_util.hpp>

#include <utility>
#include <vector>

#include <errno.h>

namespace {

using namespace imgio::int_types;

using imgio::Backend;
using imgio::BackendMock;
using imgio::ConstBuffer;
using imgio::OpenMode;
using imgio::Status;
using imgio::StatusCode;
using imgio::StatusOr;
using imgio::testing::TempFile;

using ::testing::_;
using ::testing::Return;

TEST(BackendTest, ParseOpenMode)
{
  for (const auto& [text, expected] : std::vector<std::pair<const char*, OpenMode>>{
           {"r", OpenMode::kReadOnly},
           {"w", OpenMode::kWriteOnly},
           {"r+", OpenMode::kReadWrite},
       }) {
    StatusOr<OpenMode> mode = imgio::parse_open_mode(text);
    ASSERT_TRUE(mode.ok()) << BATT_INSPECT(mode.status()) << BATT_INSPECT_STR(text);
    EXPECT_EQ(*mode, expected);
  }

  for (const char* mode : {"", "rw", "a", "w+", "R"}) {
    EXPECT_EQ(imgio::parse_open_mode(mode).status(),
              imgio::make_status(StatusCode::kInvalidOpenMode))
        << BATT_INSPECT_STR(mode);
  }
}

TEST(BackendTest, PrintOpenMode)
{
  EXPECT_EQ(batt::to_string(OpenMode::kReadOnly), "r");
  EXPECT_EQ(batt::to_string(OpenMode::kWriteOnly), "w");
  EXPECT_EQ(batt::to_string(OpenMode::kReadWrite), "r+");
}

TEST(BackendTest, OpenFileUrl)
{
  TempFile file;
  ASSERT_TRUE(file.write(std::string(1024, 'x')).ok());

  StatusOr<std::unique_ptr<Backend>> backend = imgio::open_backend(file.url(), "r+");
  ASSERT_TRUE(backend.ok()) << BATT_INSPECT(backend.status());

  EXPECT_EQ((*backend)->name(), "file");
  EXPECT_TRUE((*backend)->readable());
  EXPECT_TRUE((*backend)->writable());
  EXPECT_FALSE((*backend)->sparse());
  EXPECT_EQ((*backend)->block_size(), 512);

  StatusOr<i64> size = (*backend)->size();
  ASSERT_TRUE(size.ok()) << BATT_INSPECT(size.status());
  EXPECT_EQ(*size, 1024);

  EXPECT_TRUE((*backend)->close().ok());
}

TEST(BackendTest, OpenSparse)
{
  TempFile file;

  StatusOr<std::unique_ptr<Backend>> backend =
      imgio::open_backend(file.url(), "w", /*sparse=*/true);
  ASSERT_TRUE(backend.ok()) << BATT_INSPECT(backend.status());

  EXPECT_TRUE((*backend)->sparse());
  EXPECT_FALSE((*backend)->readable());
}

TEST(BackendTest, OpenMissing)
{
  for (const char* mode : {"r", "r+"}) {
    StatusOr<std::unique_ptr<Backend>> backend = imgio::open_backend("file:/no/such/path", mode);

    EXPECT_EQ(backend.status(), imgio::status_from_errno(ENOENT)) << BATT_INSPECT_STR(mode);
  }
}

TEST(BackendTest, OpenErrors)
{
  EXPECT_EQ(imgio::open_backend("nbd://server/export", "r").status(),
            imgio::make_status(StatusCode::kUnsupportedUrlScheme));

  EXPECT_EQ(imgio::open_backend("not a url", "r").status(),
            imgio::make_status(StatusCode::kInvalidUrl));

  EXPECT_EQ(imgio::open_backend("file:/tmp/x", "rw").status(),
            imgio::make_status(StatusCode::kInvalidOpenMode));
}

TEST(BackendTest, WriteAllRetriesShortWrites)
{
  BackendMock backend;
  const std::string data(100, 'x');

  EXPECT_CALL(backend, write(_))
      .WillOnce(Return(StatusOr<i64>{i64{30}}))
      .WillOnce(Return(StatusOr<i64>{i64{30}}))
      .WillOnce(Return(StatusOr<i64>{i64{40}}));

  Status status = imgio::write_all(backend, ConstBuffer{data.data(), data.size()});

  EXPECT_TRUE(status.ok()) << BATT_INSPECT(status);
}

TEST(BackendTest, WriteAllZeroLength)
{
  BackendMock backend;
  const std::string data(100, 'x');

  EXPECT_CALL(backend, write(_))
      .WillOnce(Return(StatusOr<i64>{i64{50}}))
      .WillOnce(Return(StatusOr<i64>{i64{0}}));

  EXPECT_EQ(imgio::write_all(backend, ConstBuffer{data.data(), data.size()}),
            imgio::make_status(StatusCode::kZeroLengthTransfer));
}

TEST(BackendTest, WriteAllError)
{
  BackendMock backend;
  const std::string data(100, 'x');

  EXPECT_CALL(backend, write(_)).WillOnce(Return(StatusOr<i64>{imgio::status_from_errno(ENOSPC)}));

  EXPECT_EQ(imgio::write_all(backend, ConstBuffer{data.data(), data.size()}),
            imgio::status_from_errno(ENOSPC));
}

}  // namespace
