//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <imgio/filesystem.hpp>
//
#include <imgio/filesystem.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <imgio/aligned_buffer.hpp>
#include <imgio/testing/util.hpp>

#include <batteries/finally.hpp>
#include <batteries/stream_util.hpp>

#include <set>
#include <string>

#include <errno.h>
#include <fcntl.h>

namespace {

using namespace imgio::int_types;

using imgio::AlignedBuffer;
using imgio::ConstBuffer;
using imgio::MutableBuffer;
using imgio::Status;
using imgio::StatusOr;
using imgio::testing::TempFile;

TEST(FilesystemTest, OpenCloseFd)
{
  StatusOr<std::set<int>> before_fds = imgio::testing::get_open_fds();
  ASSERT_TRUE(before_fds.ok()) << BATT_INSPECT(before_fds.status());

  StatusOr<int> fd = imgio::open_fd(__FILE__, O_RDONLY);
  ASSERT_TRUE(fd.ok()) << BATT_INSPECT(fd.status());
  EXPECT_EQ(before_fds->count(*fd), 0u);

  StatusOr<std::set<int>> open_fds = imgio::testing::get_open_fds();
  ASSERT_TRUE(open_fds.ok()) << BATT_INSPECT(open_fds.status());
  EXPECT_EQ(open_fds->count(*fd), 1u);

  ASSERT_TRUE(imgio::close_fd(*fd).ok());

  StatusOr<std::set<int>> after_fds = imgio::testing::get_open_fds();
  ASSERT_TRUE(after_fds.ok()) << BATT_INSPECT(after_fds.status());
  EXPECT_EQ(before_fds, after_fds)
      << BATT_INSPECT_RANGE(*before_fds) << BATT_INSPECT_RANGE(*after_fds);
}

TEST(FilesystemTest, WriteReadFile)
{
  TempFile file;

  ASSERT_TRUE(imgio::write_file(file.path(), "hello").ok());

  StatusOr<std::string> contents = imgio::read_file(file.path());
  ASSERT_TRUE(contents.ok()) << BATT_INSPECT(contents.status());
  EXPECT_EQ(*contents, "hello");

  StatusOr<i64> size = imgio::sizeof_file(file.path());
  ASSERT_TRUE(size.ok()) << BATT_INSPECT(size.status());
  EXPECT_EQ(*size, 5);

  ASSERT_TRUE(imgio::truncate_file(file.path(), 4096).ok());

  size = imgio::sizeof_file(file.path());
  ASSERT_TRUE(size.ok()) << BATT_INSPECT(size.status());
  EXPECT_EQ(*size, 4096);

  ASSERT_TRUE(imgio::delete_file(file.path()).ok());
  EXPECT_EQ(imgio::read_file(file.path()).status(), imgio::status_from_errno(ENOENT));
}

TEST(FilesystemTest, ReadFdShortRead)
{
  TempFile file;
  ASSERT_TRUE(file.write(std::string(100, 'x')).ok());

  StatusOr<int> fd = imgio::open_fd(file.path(), O_RDONLY);
  ASSERT_TRUE(fd.ok()) << BATT_INSPECT(fd.status());
  auto on_scope_exit = batt::finally([&] {
    EXPECT_TRUE(imgio::close_fd(*fd).ok());
  });

  std::string buffer(1000, '?');

  StatusOr<i64> n = imgio::read_fd(*fd, MutableBuffer{buffer.data(), buffer.size()}, 50);
  ASSERT_TRUE(n.ok()) << BATT_INSPECT(n.status());
  EXPECT_EQ(*n, 50);

  n = imgio::read_fd(*fd, MutableBuffer{buffer.data(), buffer.size()}, 1000);
  ASSERT_TRUE(n.ok()) << BATT_INSPECT(n.status());
  EXPECT_EQ(*n, 0);
}

TEST(FilesystemTest, WriteFdAtOffset)
{
  TempFile file;
  ASSERT_TRUE(file.write(std::string(10, 'x')).ok());
  {
    StatusOr<int> fd = imgio::open_fd(file.path(), O_RDWR);
    ASSERT_TRUE(fd.ok()) << BATT_INSPECT(fd.status());
    auto on_scope_exit = batt::finally([&] {
      EXPECT_TRUE(imgio::close_fd(*fd).ok());
    });

    const std::string data = "yy";
    Status status = imgio::write_fd(*fd, ConstBuffer{data.data(), data.size()}, 12);
    ASSERT_TRUE(status.ok()) << BATT_INSPECT(status);

    StatusOr<i64> size = imgio::sizeof_fd(*fd);
    ASSERT_TRUE(size.ok()) << BATT_INSPECT(size.status());
    EXPECT_EQ(*size, 14);

    EXPECT_TRUE(imgio::sync_fd(*fd).ok());
  }
  StatusOr<std::string> contents = file.read();
  ASSERT_TRUE(contents.ok()) << BATT_INSPECT(contents.status());
  EXPECT_EQ(*contents, std::string(10, 'x') + std::string(2, '\0') + "yy");
}

TEST(FilesystemTest, FileStatusFlags)
{
  TempFile file;
  ASSERT_TRUE(file.write("").ok());

  StatusOr<int> fd = imgio::open_fd(file.path(), O_RDWR);
  ASSERT_TRUE(fd.ok()) << BATT_INSPECT(fd.status());
  auto on_scope_exit = batt::finally([&] {
    EXPECT_TRUE(imgio::close_fd(*fd).ok());
  });

  ASSERT_TRUE(imgio::update_file_status_flags(*fd, imgio::EnableFileFlags{O_APPEND},
                                              imgio::DisableFileFlags{0})
                  .ok());

  StatusOr<i32> flags = imgio::get_file_status_flags(*fd);
  ASSERT_TRUE(flags.ok()) << BATT_INSPECT(flags.status());
  EXPECT_NE(*flags & O_APPEND, 0);

  ASSERT_TRUE(imgio::update_file_status_flags(*fd, imgio::EnableFileFlags{0},
                                              imgio::DisableFileFlags{O_APPEND})
                  .ok());

  flags = imgio::get_file_status_flags(*fd);
  ASSERT_TRUE(flags.ok()) << BATT_INSPECT(flags.status());
  EXPECT_EQ(*flags & O_APPEND, 0);

  // Direct I/O may not be supported by the test filesystem (e.g., tmpfs); when it can be enabled,
  // it must be reported as enabled.
  //
  Status raw_io_status = imgio::enable_raw_io_fd(*fd, true);
  if (raw_io_status.ok()) {
    StatusOr<bool> enabled = imgio::is_raw_io_enabled_fd(*fd);
    ASSERT_TRUE(enabled.ok()) << BATT_INSPECT(enabled.status());
    EXPECT_TRUE(*enabled);
  }
}

TEST(FilesystemTest, PunchHole)
{
  TempFile file;
  ASSERT_TRUE(file.write(std::string(65536, 'x')).ok());

  StatusOr<int> fd = imgio::open_fd(file.path(), O_RDWR);
  ASSERT_TRUE(fd.ok()) << BATT_INSPECT(fd.status());
  auto on_scope_exit = batt::finally([&] {
    EXPECT_TRUE(imgio::close_fd(*fd).ok());
  });

  Status status = imgio::punch_hole_fd(*fd, 0, 65536);
  if (status == imgio::status_from_errno(EOPNOTSUPP)) {
    GTEST_SKIP() << "hole punching is not supported by the test filesystem";
  }
  ASSERT_TRUE(status.ok()) << BATT_INSPECT(status);

  StatusOr<i64> size = imgio::sizeof_fd(*fd);
  ASSERT_TRUE(size.ok()) << BATT_INSPECT(size.status());
  EXPECT_EQ(*size, 65536);

  StatusOr<i64> allocated = imgio::allocated_bytes_of_fd(*fd);
  ASSERT_TRUE(allocated.ok()) << BATT_INSPECT(allocated.status());
  EXPECT_LT(*allocated, 65536);
}

}  // namespace
