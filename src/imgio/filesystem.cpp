//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <imgio/filesystem.hpp>
//

#include <batteries/checked_cast.hpp>
#include <batteries/finally.hpp>
#include <batteries/syscall_retry.hpp>

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#ifdef IMGIO_PLATFORM_IS_LINUX
#include <linux/falloc.h>
#endif

namespace imgio {

using ::batt::syscall_retry;

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<int> open_fd(std::string_view file_name, int flags, mode_t mode)
{
  const std::string path{file_name};

  const int fd = syscall_retry([&] {
    return ::open(path.c_str(), flags | O_CLOEXEC, mode);
  });
  BATT_REQUIRE_OK(batt::status_from_retval(fd));

  return fd;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status close_fd(int fd)
{
  // close(2) must not be retried on EINTR; the fd is released either way.
  //
  const int retval = ::close(fd);
  if (retval != 0 && errno == EINTR) {
    return OkStatus();
  }
  return batt::status_from_retval(retval);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status truncate_fd(int fd, u64 size)
{
  const int retval = syscall_retry([&] {
    return ::ftruncate(fd, size);
  });
  return batt::status_from_retval(retval);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<i64> sizeof_fd(int fd)
{
  // lseek(SEEK_END) rather than fstat so that block devices report their capacity.
  //
  const auto original = syscall_retry([&] {
    return ::lseek(fd, 0, SEEK_CUR);
  });
  BATT_REQUIRE_OK(batt::status_from_retval(original));

  const auto retval = syscall_retry([&] {
    return ::lseek(fd, 0, SEEK_END);
  });
  BATT_REQUIRE_OK(batt::status_from_retval(retval));

  const auto restore = syscall_retry([&] {
    return ::lseek(fd, original, SEEK_SET);
  });
  BATT_REQUIRE_OK(batt::status_from_retval(restore));

  return retval;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<i64> allocated_bytes_of_fd(int fd)
{
  struct stat st;
  const int retval = syscall_retry([&] {
    return ::fstat(fd, &st);
  });
  BATT_REQUIRE_OK(batt::status_from_retval(retval));

  // st_blocks is always in units of 512 bytes, regardless of st_blksize.
  //
  return static_cast<i64>(st.st_blocks) * 512;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<i64> read_fd(int fd, MutableBuffer buffer, i64 offset)
{
  i64 total = 0;
  while (buffer.size() > 0) {
    const usize requested = buffer.size();
    const auto bytes_read = syscall_retry([&] {
      return ::pread(fd, buffer.data(), buffer.size(), offset + total);
    });
    BATT_REQUIRE_OK(batt::status_from_retval(bytes_read));

    total += bytes_read;
    buffer += bytes_read;

    // A short read from a regular file or block device means end-of-file.  Don't try again: with
    // O_DIRECT the follow-up read would be misaligned.
    //
    if (bytes_read == 0 || static_cast<usize>(bytes_read) < requested) {
      break;
    }
  }

  return total;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status write_fd(int fd, ConstBuffer buffer, i64 offset)
{
  while (buffer.size() > 0) {
    const auto bytes_written = syscall_retry([&] {
      return ::pwrite(fd, buffer.data(), buffer.size(), offset);
    });
    BATT_REQUIRE_OK(batt::status_from_retval(bytes_written));

    // Something has gone wrong...
    //
    if (bytes_written == 0) {
      return make_status(StatusCode::kZeroLengthTransfer);
    }

    buffer += bytes_written;
    offset += bytes_written;
  }

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status sync_fd(int fd)
{
  const int retval = syscall_retry([&] {
    return ::fsync(fd);
  });
  return batt::status_from_retval(retval);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status punch_hole_fd(int fd, i64 offset, i64 size)
{
#ifdef IMGIO_PLATFORM_IS_LINUX
  const int retval = syscall_retry([&] {
    return ::fallocate(fd, FALLOC_FL_PUNCH_HOLE | FALLOC_FL_KEEP_SIZE, offset, size);
  });
  return batt::status_from_retval(retval);
#else
  (void)fd;
  (void)offset;
  (void)size;
  return batt::status_from_errno(EOPNOTSUPP);
#endif
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status zero_range_fd(int fd, i64 offset, i64 size)
{
#ifdef IMGIO_PLATFORM_IS_LINUX
  const int retval = syscall_retry([&] {
    return ::fallocate(fd, FALLOC_FL_ZERO_RANGE, offset, size);
  });
  return batt::status_from_retval(retval);
#else
  (void)fd;
  (void)offset;
  (void)size;
  return batt::status_from_errno(EOPNOTSUPP);
#endif
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<i32> get_file_status_flags(int fd)
{
  const int retval = batt::syscall_retry([&] {
    return ::fcntl(fd, F_GETFL);
  });
  BATT_REQUIRE_OK(batt::status_from_retval(retval));

  return retval;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status set_file_status_flags(int fd, i32 flags)
{
  const int retval = batt::syscall_retry([&] {
    return ::fcntl(fd, F_SETFL, flags);
  });
  return batt::status_from_retval(retval);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status update_file_status_flags(int fd, EnableFileFlags enable_flags,
                                DisableFileFlags disable_flags)
{
  StatusOr<i32> current_flags = get_file_status_flags(fd);
  BATT_REQUIRE_OK(current_flags);

  const i32 desired_flags = (*current_flags | i32{enable_flags}) & ~i32{disable_flags};
  return set_file_status_flags(fd, desired_flags);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status enable_raw_io_fd(int fd, bool enabled)
{
#ifdef IMGIO_PLATFORM_IS_LINUX  //----- --- -- -  -  -   -

  if (enabled) {
    return update_file_status_flags(fd, EnableFileFlags{O_DIRECT}, DisableFileFlags{0});
  } else {
    return update_file_status_flags(fd, EnableFileFlags{0}, DisableFileFlags{O_DIRECT});
  }

#else  //----- --- -- -  -  -   -

  (void)fd;
  (void)enabled;

  IMGIO_LOG_WARNING() << "enable_raw_io_fd only supported on Linux!";

  return OkStatus();

#endif  //----- --- -- -  -  -   -
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<bool> is_raw_io_enabled_fd(int fd)
{
#ifdef IMGIO_PLATFORM_IS_LINUX
  StatusOr<i32> flags = get_file_status_flags(fd);
  BATT_REQUIRE_OK(flags);

  return (*flags & O_DIRECT) != 0;
#else
  (void)fd;
  return false;
#endif
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::string> read_file(std::string_view file_name)
{
  StatusOr<int> fd = open_fd(file_name, O_RDONLY);
  BATT_REQUIRE_OK(fd);

  // Don't leak the file descriptor!
  //
  auto closer = batt::finally([&] {
    IMGIO_WARN_IF_NOT_OK(close_fd(*fd));
  });

  StatusOr<i64> size = sizeof_fd(*fd);
  BATT_REQUIRE_OK(size);

  std::string contents(BATT_CHECKED_CAST(usize, *size), '\0');

  StatusOr<i64> bytes_read = read_fd(*fd, MutableBuffer{contents.data(), contents.size()}, 0);
  BATT_REQUIRE_OK(bytes_read);

  contents.resize(BATT_CHECKED_CAST(usize, *bytes_read));

  return contents;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status write_file(std::string_view file_name, std::string_view contents)
{
  StatusOr<int> fd = open_fd(file_name, O_WRONLY | O_CREAT | O_TRUNC);
  BATT_REQUIRE_OK(fd);

  auto closer = batt::finally([&] {
    IMGIO_WARN_IF_NOT_OK(close_fd(*fd));
  });

  return write_fd(*fd, ConstBuffer{contents.data(), contents.size()}, /*offset=*/0);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status truncate_file(std::string_view file_name, u64 size)
{
  StatusOr<int> fd = open_fd(file_name, O_RDWR | O_CREAT);
  BATT_REQUIRE_OK(fd);

  auto closer = batt::finally([&] {
    IMGIO_WARN_IF_NOT_OK(close_fd(*fd));
  });

  return truncate_fd(*fd, size);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<i64> sizeof_file(std::string_view file_name)
{
  StatusOr<int> fd = open_fd(file_name, O_RDONLY);
  BATT_REQUIRE_OK(fd);

  auto closer = batt::finally([&] {
    IMGIO_WARN_IF_NOT_OK(close_fd(*fd));
  });

  return sizeof_fd(*fd);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<i64> allocated_bytes_of_file(std::string_view file_name)
{
  StatusOr<int> fd = open_fd(file_name, O_RDONLY);
  BATT_REQUIRE_OK(fd);

  auto closer = batt::finally([&] {
    IMGIO_WARN_IF_NOT_OK(close_fd(*fd));
  });

  return allocated_bytes_of_fd(*fd);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status delete_file(std::string_view file_name)
{
  const std::string path{file_name};

  return batt::status_from_retval(syscall_retry([&] {
    return ::unlink(path.c_str());
  }));
}

}  // namespace imgio
