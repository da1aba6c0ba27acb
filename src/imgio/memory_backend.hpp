//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef IMGIO_MEMORY_BACKEND_HPP
#define IMGIO_MEMORY_BACKEND_HPP

#include <imgio/backend.hpp>
#include <imgio/optional.hpp>

#include <string>
#include <string_view>

namespace imgio {

// A byte stream held in memory.  Has no alignment requirements (block_size() == 1).
//
// Used as the client-side source or sink of a transfer, and in tests.  If `max_transfer_size` is
// set, every read/write/zero call moves at most that many bytes, which exercises callers' handling
// of short transfers.
//
class MemoryBackend : public Backend
{
 public:
  explicit MemoryBackend(OpenMode mode = OpenMode::kReadWrite,
                         Optional<i64> max_transfer_size = None) noexcept;

  explicit MemoryBackend(std::string_view contents, OpenMode mode = OpenMode::kReadWrite,
                         Optional<i64> max_transfer_size = None) noexcept;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  std::string_view name() const override
  {
    return "memory";
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
    return false;
  }

  bool dirty() const override
  {
    return this->dirty_;
  }

  i64 block_size() const override
  {
    return 1;
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

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  const std::string& data() const
  {
    return this->data_;
  }

  // The number of times flush() has succeeded.
  //
  usize flush_count() const
  {
    return this->flush_count_;
  }

 private:
  Status require_open() const;

  i64 limit(i64 count) const;

  // Makes sure data_ has at least `minimum_size` bytes, zero-filling any gap.
  //
  void grow_to(i64 minimum_size);

  std::string data_;
  OpenMode mode_;
  Optional<i64> max_transfer_size_;
  i64 position_ = 0;
  bool dirty_ = false;
  bool closed_ = false;
  usize flush_count_ = 0;
};

}  // namespace imgio

#endif  // IMGIO_MEMORY_BACKEND_HPP
