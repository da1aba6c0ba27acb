//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef IMGIO_FILE_BACKEND_HPP
#define IMGIO_FILE_BACKEND_HPP

#include <imgio/config.hpp>
//
#include <imgio/aligned_buffer.hpp>
#include <imgio/backend.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace imgio {

// A Backend for a regular file or block device, accessed with direct (unbuffered) I/O.
//
// Direct I/O requires the file offset, memory address, and length of every transfer to be
// block-aligned.  FileBackend accepts arbitrary positions and lengths from its callers:
//
//  - Fast path: when the position is block-aligned and at least one block is requested, whole
//    blocks are transferred directly (a write of 3073 bytes writes 3072 and returns 3072).
//  - Slow path: otherwise the block containing the position is read into a staging buffer,
//    modified, and written back (read-modify-write); only the bytes up to the end of that block
//    are transferred (a write of 100 bytes at offset 500 writes 12 bytes and returns 12).
//
// Callers must be prepared to handle short writes/zeros by calling again with the remainder.
//
class FileBackend : public Backend
{
 public:
  struct Options {
    // Returns the default options; `direct_io` may be overridden via the env var
    // `IMGIO_DIRECT_IO`.
    //
    static Options with_default_values();

    // If true, `zero` deallocates (punches holes in) whole blocks instead of writing zeros.
    //
    bool sparse;

    // If true, try to open the file for direct I/O (O_DIRECT).  If the filesystem does not
    // support it, the file is used with buffered I/O and a warning is logged.
    //
    bool direct_io;

    // The alignment unit for all I/O; must be a power of two.
    //
    i64 block_size;
  };

  // Opens the file at `path`.  kReadOnly and kReadWrite require the file to exist (ENOENT
  // otherwise); kWriteOnly creates the file if necessary and truncates it to zero length.
  //
  static StatusOr<std::unique_ptr<FileBackend>> open(std::string_view path, OpenMode mode,
                                                     const Options& options);

  static StatusOr<std::unique_ptr<FileBackend>> open(std::string_view path, OpenMode mode);

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  ~FileBackend() noexcept override;

  std::string_view name() const override
  {
    return "file";
  }

  bool readable() const override
  {
    return this->mode_ != OpenMode::kWriteOnly;
  }

  bool writable() const override
  {
    return this->mode_ != OpenMode::kReadOnly;
  }

  bool sparse() const override
  {
    return this->sparse_;
  }

  bool dirty() const override
  {
    return this->dirty_;
  }

  i64 block_size() const override
  {
    return this->block_size_;
  }

  // Whether direct I/O is in effect (it may have been requested but not supported).
  //
  bool direct_io() const
  {
    return this->direct_io_;
  }

  const std::string& path() const
  {
    return this->path_;
  }

  OpenMode mode() const
  {
    return this->mode_;
  }

  bool is_open() const
  {
    return this->fd_ >= 0;
  }

  StatusOr<i64> read_into(const MutableBuffer& buffer) override;

  StatusOr<i64> write(const ConstBuffer& data) override;

  StatusOr<i64> zero(i64 count) override;

  Status seek(i64 position) override;

  i64 tell() const override
  {
    return this->position_;
  }

  Status flush() override;

  StatusOr<i64> size() override;

  Status close() override;

 private:
  explicit FileBackend(int fd, std::string_view path, OpenMode mode, const Options& options,
                       bool direct_io) noexcept;

  Status require_open() const;

  Status require_readable() const;

  Status require_writable() const;

  // Memory alignment required for buffers passed to the kernel.
  //
  usize io_align() const;

  bool position_is_aligned() const
  {
    return is_aligned(this->position_, this->block_size_);
  }

  StatusOr<i64> read_aligned(const MutableBuffer& buffer);

  StatusOr<i64> read_unaligned(const MutableBuffer& buffer);

  StatusOr<i64> write_aligned(const ConstBuffer& data);

  // Read-modify-write of the block containing the current position.  Copies bytes from `src`,
  // or zeros if `src` is null.
  //
  StatusOr<i64> write_unaligned(const void* src, i64 size);

  Status zero_aligned(i64 offset, i64 count);

  Status write_zeros(i64 offset, i64 count);

  // Grows the file (never shrinks it) so that it is at least `minimum_size` bytes.
  //
  Status truncate_at_least(i64 minimum_size);

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  int fd_;
  std::string path_;
  OpenMode mode_;
  bool sparse_;
  bool direct_io_;
  i64 block_size_;
  i64 position_ = 0;
  bool dirty_ = false;
};

}  // namespace imgio

#endif  // IMGIO_FILE_BACKEND_HPP
