//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef IMGIO_BACKEND_HPP
#define IMGIO_BACKEND_HPP

#include <imgio/buffer.hpp>
#include <imgio/int_types.hpp>
#include <imgio/status.hpp>
#include <imgio/url.hpp>

#include <memory>
#include <ostream>
#include <string_view>

namespace imgio {

enum struct OpenMode {
  kReadOnly,
  kWriteOnly,
  kReadWrite,
};

// Parses the open mode strings "r" (read-only), "w" (write-only; truncates the target), and "r+"
// (read-write; preserves existing content).
//
StatusOr<OpenMode> parse_open_mode(std::string_view mode);

std::ostream& operator<<(std::ostream& out, OpenMode t);

// A storage target or stream that data can be read from and/or written to, with a cursor.
//
// This is the only interface the operations in <imgio/operation.hpp> use to move data; a file, a
// block device, or an in-memory stream may all act as source or destination.
//
// Backends are not thread-safe: exactly one caller at a time may drive a backend's cursor.
//
class Backend
{
 public:
  Backend(const Backend&) = delete;
  Backend& operator=(const Backend&) = delete;

  virtual ~Backend() = default;

  // A short name identifying the kind of backend ("file", "memory", ...).
  //
  virtual std::string_view name() const = 0;

  virtual bool readable() const = 0;

  virtual bool writable() const = 0;

  // Whether `zero` deallocates space instead of writing physical zeros.
  //
  virtual bool sparse() const = 0;

  // True iff data has been written or zeroed since the last successful flush.
  //
  virtual bool dirty() const = 0;

  // The alignment unit for efficient I/O.  Streams that have no alignment requirements return 1.
  //
  virtual i64 block_size() const = 0;

  // Reads at most `buffer.size()` bytes at the current position into `buffer`, advancing the
  // position by the number of bytes read.  Returns the number of bytes read (0 at end of data).
  // Bytes in `buffer` past the returned count are unspecified (FileBackend zeroes them).
  //
  virtual StatusOr<i64> read_into(const MutableBuffer& buffer) = 0;

  // Writes at most `data.size()` bytes at the current position, advancing the position by the
  // number of bytes written.  May write fewer bytes than requested (a short write); the caller is
  // responsible for retrying with the remainder.
  //
  virtual StatusOr<i64> write(const ConstBuffer& data) = 0;

  // Writes at most `count` zero bytes at the current position, advancing the position.  Like
  // `write`, may zero fewer bytes than requested.
  //
  virtual StatusOr<i64> zero(i64 count) = 0;

  // Sets the current (absolute) position.  Seeking past the end is allowed.
  //
  virtual Status seek(i64 position) = 0;

  virtual i64 tell() const = 0;

  // Makes all written data durable and clears the dirty flag.
  //
  virtual Status flush() = 0;

  // Returns the current size of the target, including extensions made since the last flush.
  //
  virtual StatusOr<i64> size() = 0;

  // Releases the underlying resources; any later call (except close) fails.
  //
  virtual Status close() = 0;

 protected:
  Backend() = default;
};

// Opens the backend addressed by `url` (currently only `file:`).
//
StatusOr<std::unique_ptr<Backend>> open_backend(const Url& url, OpenMode mode,
                                                bool sparse = false);

StatusOr<std::unique_ptr<Backend>> open_backend(std::string_view url, std::string_view mode,
                                                bool sparse = false);

// Calls `backend.write` until all of `data` has been written.
//
Status write_all(Backend& backend, const ConstBuffer& data);

}  // namespace imgio

#endif  // IMGIO_BACKEND_HPP
