//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <imgio/file_backend.hpp>
//

#include <imgio/filesystem.hpp>
#include <imgio/logging.hpp>

#include <batteries/checked_cast.hpp>
#include <batteries/env.hpp>
#include <batteries/finally.hpp>
#include <batteries/stream_util.hpp>

#include <algorithm>
#include <cstring>

#include <errno.h>

namespace imgio {

namespace {

// Returns true if `status` means the filesystem/device lacks the requested feature (as opposed to
// a real I/O error).
//
bool is_not_supported(const Status& status)
{
  return status == batt::status_from_errno(EOPNOTSUPP) ||
         status == batt::status_from_errno(ENOTSUP) ||  //
         status == batt::status_from_errno(ENOSYS) ||   //
         status == batt::status_from_errno(ENODEV);
}

bool is_all_zero(const u8* data, usize size)
{
  return std::all_of(data, data + size, [](u8 b) {
    return b == 0;
  });
}

}  // namespace

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ auto FileBackend::Options::with_default_values() -> Options
{
  return Options{
      .sparse = false,
      .direct_io = batt::getenv_as<int>("IMGIO_DIRECT_IO").value_or(1) != 0,
      .block_size = kDefaultBlockSize,
  };
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ StatusOr<std::unique_ptr<FileBackend>> FileBackend::open(std::string_view path,
                                                                     OpenMode mode)
{
  return FileBackend::open(path, mode, Options::with_default_values());
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ StatusOr<std::unique_ptr<FileBackend>> FileBackend::open(std::string_view path,
                                                                     OpenMode mode,
                                                                     const Options& options)
{
  if (!is_power_of_two(options.block_size)) {
    return make_status(StatusCode::kInvalidBlockSize);
  }

  // A write-only backend still needs read access to the file for read-modify-write of partial
  // blocks; `readable()` reports the mode the caller asked for.
  //
  int flags = 0;
  switch (mode) {
    case OpenMode::kReadOnly:
      flags = O_RDONLY;
      break;
    case OpenMode::kWriteOnly:
      flags = O_RDWR | O_CREAT;
      break;
    case OpenMode::kReadWrite:
      flags = O_RDWR;
      break;
  }

  StatusOr<int> fd = open_fd(path, flags);
  BATT_REQUIRE_OK(fd) << BATT_INSPECT_STR(path) << BATT_INSPECT(mode);

  bool success = false;
  auto close_on_failure = batt::finally([&] {
    if (!success) {
      IMGIO_WARN_IF_NOT_OK(close_fd(*fd));
    }
  });

  if (mode == OpenMode::kWriteOnly) {
    BATT_REQUIRE_OK(truncate_fd(*fd, 0));
  }

  bool direct_io = false;
  if (options.direct_io) {
    Status enable_status = enable_raw_io_fd(*fd, true);
    if (enable_status.ok()) {
      StatusOr<bool> enabled = is_raw_io_enabled_fd(*fd);
      BATT_REQUIRE_OK(enabled);
      direct_io = *enabled;
    } else {
      IMGIO_LOG_WARNING_FIRST_N(10)
          << "Direct I/O is not supported for " << path << " (" << enable_status
          << "); using buffered I/O";
    }
  }

  success = true;

  IMGIO_VLOG(1) << "FileBackend::open(" << BATT_INSPECT_STR(path) << ", " << BATT_INSPECT(mode)
                << ")" << BATT_INSPECT(options.sparse) << BATT_INSPECT(direct_io)
                << BATT_INSPECT(options.block_size) << BATT_INSPECT(*fd);

  return std::unique_ptr<FileBackend>{new FileBackend{*fd, path, mode, options, direct_io}};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*explicit*/ FileBackend::FileBackend(int fd, std::string_view path, OpenMode mode,
                                      const Options& options, bool direct_io) noexcept
    : fd_{fd}
    , path_{path}
    , mode_{mode}
    , sparse_{options.sparse}
    , direct_io_{direct_io}
    , block_size_{options.block_size}
{
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
FileBackend::~FileBackend() noexcept
{
  if (this->fd_ >= 0) {
    IMGIO_WARN_IF_NOT_OK(this->close());
  }
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status FileBackend::require_open() const
{
  if (this->fd_ < 0) {
    return make_status(StatusCode::kBackendClosed);
  }
  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status FileBackend::require_readable() const
{
  BATT_REQUIRE_OK(this->require_open());

  if (!this->readable()) {
    return make_status(StatusCode::kBackendNotReadable);
  }
  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status FileBackend::require_writable() const
{
  BATT_REQUIRE_OK(this->require_open());

  if (!this->writable()) {
    return make_status(StatusCode::kBackendNotWritable);
  }
  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
usize FileBackend::io_align() const
{
  return std::max(BATT_CHECKED_CAST(usize, this->block_size_), kDirectIOBlockAlign);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<i64> FileBackend::read_into(const MutableBuffer& buffer) /*override*/
{
  BATT_REQUIRE_OK(this->require_readable());

  if (buffer.size() == 0) {
    return 0;
  }

  const bool fast_path = this->position_is_aligned() &&
                         is_aligned(buffer.data(), this->io_align()) &&
                         static_cast<i64>(buffer.size()) >= this->block_size_;

  StatusOr<i64> n_read = fast_path ? this->read_aligned(buffer) : this->read_unaligned(buffer);
  BATT_REQUIRE_OK(n_read);

  // Never leave stale data after the bytes actually read.
  //
  std::memset(static_cast<u8*>(buffer.data()) + *n_read, 0, buffer.size() - *n_read);

  this->position_ += *n_read;

  return n_read;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<i64> FileBackend::read_aligned(const MutableBuffer& buffer)
{
  const i64 count = align_down(buffer.size(), this->block_size_);

  return read_fd(this->fd_, resize_buffer(buffer, count), this->position_);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<i64> FileBackend::read_unaligned(const MutableBuffer& buffer)
{
  const i64 block_start = align_down(this->position_, this->block_size_);
  const i64 offset_in_block = this->position_ - block_start;

  StatusOr<AlignedBuffer> block = AlignedBuffer::allocate(this->block_size_, this->io_align());
  BATT_REQUIRE_OK(block);

  StatusOr<i64> n_read = read_fd(this->fd_, block->as_mutable_buffer(), block_start);
  BATT_REQUIRE_OK(n_read);

  const i64 available = std::max<i64>(0, *n_read - offset_in_block);
  const i64 count = std::min<i64>(buffer.size(), available);

  std::memcpy(buffer.data(), block->data() + offset_in_block, count);

  IMGIO_VLOG(2) << "Unaligned read" << BATT_INSPECT(this->position_) << BATT_INSPECT(block_start)
                << BATT_INSPECT(count);

  return count;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<i64> FileBackend::write(const ConstBuffer& data) /*override*/
{
  BATT_REQUIRE_OK(this->require_writable());

  if (data.size() == 0) {
    return 0;
  }

  StatusOr<i64> n_written =
      (this->position_is_aligned() && static_cast<i64>(data.size()) >= this->block_size_)
          ? this->write_aligned(data)
          : this->write_unaligned(data.data(), data.size());

  BATT_REQUIRE_OK(n_written);

  this->position_ += *n_written;
  this->dirty_ = true;

  return n_written;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<i64> FileBackend::write_aligned(const ConstBuffer& data)
{
  const i64 count = align_down(data.size(), this->block_size_);

  if (is_aligned(data.data(), this->io_align())) {
    BATT_REQUIRE_OK(write_fd(this->fd_, resize_buffer(data, count), this->position_));
    return count;
  }

  // The caller's memory is not aligned; copy (a bounded amount of) it into an aligned buffer.
  //
  const i64 bounce_size =
      std::min(count, std::max(this->block_size_,
                               align_down(kMaxBounceBufferSize, this->block_size_)));

  StatusOr<AlignedBuffer> bounce = AlignedBuffer::allocate(bounce_size, this->io_align());
  BATT_REQUIRE_OK(bounce);

  std::memcpy(bounce->data(), data.data(), bounce_size);

  BATT_REQUIRE_OK(write_fd(this->fd_, bounce->as_const_buffer(), this->position_));

  return bounce_size;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<i64> FileBackend::write_unaligned(const void* src, i64 size)
{
  const i64 block_start = align_down(this->position_, this->block_size_);
  const i64 offset_in_block = this->position_ - block_start;
  const i64 count = std::min(size, this->block_size_ - offset_in_block);

  IMGIO_VLOG(2) << "Unaligned write" << BATT_INSPECT(this->position_)
                << BATT_INSPECT(block_start) << BATT_INSPECT(count) << BATT_INSPECT(src == nullptr);

  StatusOr<AlignedBuffer> block = AlignedBuffer::allocate(this->block_size_, this->io_align());
  BATT_REQUIRE_OK(block);

  // 1. Read the current block; past end-of-file the buffer stays zero.
  //
  StatusOr<i64> n_read = read_fd(this->fd_, block->as_mutable_buffer(), block_start);
  BATT_REQUIRE_OK(n_read);

  // 2. Overlay the new bytes.
  //
  if (src != nullptr) {
    std::memcpy(block->data() + offset_in_block, src, count);
  } else {
    std::memset(block->data() + offset_in_block, 0, count);
  }

  // 3. Write the block back, or deallocate it if zeroing a sparse file made it all zeros.
  //
  if (src == nullptr && this->sparse_ && is_all_zero(block->data(), block->size())) {
    Status punch_status = punch_hole_fd(this->fd_, block_start, this->block_size_);
    if (punch_status.ok()) {
      BATT_REQUIRE_OK(this->truncate_at_least(block_start + this->block_size_));
      return count;
    }
    if (!is_not_supported(punch_status)) {
      return punch_status;
    }
  }

  BATT_REQUIRE_OK(write_fd(this->fd_, block->as_const_buffer(), block_start));

  return count;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<i64> FileBackend::zero(i64 count) /*override*/
{
  BATT_REQUIRE_OK(this->require_writable());

  if (count <= 0) {
    return 0;
  }

  i64 n_zeroed = 0;
  if (this->position_is_aligned() && count >= this->block_size_) {
    n_zeroed = align_down(count, this->block_size_);
    BATT_REQUIRE_OK(this->zero_aligned(this->position_, n_zeroed));
  } else {
    StatusOr<i64> n_written = this->write_unaligned(nullptr, count);
    BATT_REQUIRE_OK(n_written);
    n_zeroed = *n_written;
  }

  this->position_ += n_zeroed;
  this->dirty_ = true;

  return n_zeroed;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status FileBackend::zero_aligned(i64 offset, i64 count)
{
  if (this->sparse_) {
    Status punch_status = punch_hole_fd(this->fd_, offset, count);
    if (punch_status.ok()) {
      // The hole was punched with KEEP_SIZE; a range past the end must still grow the file.
      //
      return this->truncate_at_least(offset + count);
    }
    if (!is_not_supported(punch_status)) {
      return punch_status;
    }
    IMGIO_LOG_WARNING_FIRST_N(10) << "Cannot deallocate space in " << this->path_ << " ("
                                  << punch_status << "); zeroing instead";
  }

  Status zero_status = zero_range_fd(this->fd_, offset, count);
  if (zero_status.ok()) {
    return OkStatus();
  }
  if (!is_not_supported(zero_status)) {
    return zero_status;
  }

  IMGIO_VLOG(1) << "FALLOC_FL_ZERO_RANGE not supported for " << this->path_
                << "; writing zeros";

  return this->write_zeros(offset, count);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status FileBackend::write_zeros(i64 offset, i64 count)
{
  const i64 buffer_size = std::min(
      count, std::max(this->block_size_, align_down(kZeroWriteBufferSize, this->block_size_)));

  StatusOr<AlignedBuffer> zeros = AlignedBuffer::allocate(buffer_size, this->io_align());
  BATT_REQUIRE_OK(zeros);

  while (count > 0) {
    const i64 step = std::min(count, buffer_size);
    BATT_REQUIRE_OK(write_fd(this->fd_, resize_buffer(zeros->as_const_buffer(), step), offset));
    offset += step;
    count -= step;
  }

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status FileBackend::truncate_at_least(i64 minimum_size)
{
  StatusOr<i64> current_size = sizeof_fd(this->fd_);
  BATT_REQUIRE_OK(current_size);

  if (*current_size < minimum_size) {
    return truncate_fd(this->fd_, BATT_CHECKED_CAST(u64, minimum_size));
  }

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status FileBackend::seek(i64 position) /*override*/
{
  BATT_REQUIRE_OK(this->require_open());

  if (position < 0) {
    return make_status(StatusCode::kNegativeSeekPosition);
  }
  this->position_ = position;

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status FileBackend::flush() /*override*/
{
  BATT_REQUIRE_OK(this->require_open());
  BATT_REQUIRE_OK(sync_fd(this->fd_));

  this->dirty_ = false;

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<i64> FileBackend::size() /*override*/
{
  BATT_REQUIRE_OK(this->require_open());

  return sizeof_fd(this->fd_);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status FileBackend::close() /*override*/
{
  if (this->fd_ < 0) {
    return OkStatus();
  }

  IMGIO_VLOG(1) << "FileBackend::close()" << BATT_INSPECT_STR(this->path_)
                << BATT_INSPECT(this->fd_) << BATT_INSPECT(this->dirty_);

  const int fd = this->fd_;
  this->fd_ = -1;

  return close_fd(fd);
}

}  // namespace imgio
