//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <imgio/testing/util.hpp>
//
#include <imgio/filesystem.hpp>
#include <imgio/testing/test_config.hpp>

#include <batteries/stream_util.hpp>

#include <atomic>
#include <filesystem>
#include <optional>
#include <system_error>

#include <errno.h>

#include <fcntl.h>
#include <unistd.h>

namespace imgio {
namespace testing {

namespace {

Status delete_file_if_exists(const std::string& path)
{
  Status status = delete_file(path);
  if (status == status_from_errno(ENOENT)) {
    return OkStatus();
  }
  return status;
}

}  //namespace

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*explicit*/ TempFile::TempFile(std::string_view name_prefix)
{
  static std::atomic<u64> next_id{0};

  TestConfig test_config;
  this->path_ = (test_config.tmp_dir() / (std::string{name_prefix} + "_" +
                                          std::to_string(::getpid()) + "_" +
                                          std::to_string(next_id.fetch_add(1))))
                    .string();

  // Start from a clean slate in case a previous (crashed) run left this file behind.
  //
  IMGIO_WARN_IF_NOT_OK(delete_file_if_exists(this->path_));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TempFile::~TempFile() noexcept
{
  IMGIO_WARN_IF_NOT_OK(delete_file_if_exists(this->path_));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::string TempFile::url() const
{
  return "file:" + this->path_;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status TempFile::write(std::string_view contents) const
{
  return write_file(this->path_, contents);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::string> TempFile::read() const
{
  return read_file(this->path_);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<AlignedBuffer> make_filled_buffer(usize size, char fill_byte)
{
  StatusOr<AlignedBuffer> buffer = AlignedBuffer::allocate(size);
  BATT_REQUIRE_OK(buffer);

  buffer->fill(static_cast<u8>(fill_byte));

  return buffer;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::set<int>> get_open_fds()
{
  std::set<int> result;
  std::error_code ec;

  // The iterator holds its own fd on the directory while scanning; it is closed again by the time
  // the loop ends, so drop any entry that no longer refers to an open fd.
  //
  std::set<int> listed;
  for (std::filesystem::directory_iterator iter{"/proc/self/fd", ec}, last; !ec && iter != last;
       iter.increment(ec)) {
    std::optional<int> fd = batt::from_string<int>(iter->path().filename().string());
    if (fd) {
      listed.emplace(*fd);
    }
  }
  if (ec) {
    return status_from_errno(ec.value());
  }

  for (int fd : listed) {
    if (::fcntl(fd, F_GETFD) != -1) {
      result.emplace(fd);
    }
  }

  return result;
}

}  //namespace testing
}  //namespace imgio
