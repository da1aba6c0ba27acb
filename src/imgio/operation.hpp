//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef IMGIO_OPERATION_HPP
#define IMGIO_OPERATION_HPP

#include <imgio/aligned_buffer.hpp>
#include <imgio/backend.hpp>
#include <imgio/clock.hpp>
#include <imgio/int_types.hpp>
#include <imgio/optional.hpp>
#include <imgio/status.hpp>

#include <ostream>
#include <string_view>

namespace imgio {

// Outcome of a single chunk transfer step.  `kEnded` means the source ran out of data before the
// requested size was reached and no size was requested, so the operation completes early.
//
enum struct ChunkResult {
  kContinue,
  kEnded,
};

/** \brief A single byte-range transfer request, executed once via `run()`.
 *
 * Operations hold non-owning references to their backends, buffer, and clock; all of these must
 * outlive the Operation.  `done()` is updated as each chunk completes, so it reports how many bytes
 * were transferred even when `run()` fails.
 */
class Operation
{
 public:
  Operation(const Operation&) = delete;
  Operation& operator=(const Operation&) = delete;

  virtual ~Operation() = default;

  /** \brief Executes the operation inside an "operation" span.
   *
   * A transfer with a requested size that ends before `done() == *size()` fails with
   * StatusCode::kPartialContent.  Calling run a second time returns
   * StatusCode::kOperationAlreadyRun.
   */
  Status run();

  virtual std::string_view name() const = 0;

  /** \brief The total number of bytes to transfer; None means "until the source is exhausted".
   */
  const Optional<i64>& size() const
  {
    return this->size_;
  }

  i64 offset() const
  {
    return this->offset_;
  }

  i64 done() const
  {
    return this->done_;
  }

 protected:
  explicit Operation(const Optional<i64>& size, i64 offset, usize buffer_size, Clock& clock);

  // Bytes left to transfer.  With no size, a bounded default step is returned so that unsized
  // transfers proceed in chunks until the source ends.
  //
  i64 todo() const;

  // Called when the source has no more data; ends the operation cleanly if no size was requested
  // or all of it was transferred, otherwise reports partial content.
  //
  StatusOr<ChunkResult> end_of_data() const;

  virtual Status run_impl() = 0;

  Clock& clock_;
  Optional<i64> size_;
  i64 offset_;
  i64 done_ = 0;
  usize buffer_size_;
  bool started_ = false;
};

std::ostream& operator<<(std::ostream& out, const Operation& t);

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

/** \brief Copies data from a source backend (starting at `offset`) to a destination stream.
 *
 * `buffer` must hold at least one source block; run() fails with kInvalidArgument otherwise.
 */
class Send : public Operation
{
 public:
  explicit Send(Backend& src, Backend& dst, AlignedBuffer& buffer, const Optional<i64>& size = None,
                i64 offset = 0, Clock& clock = NullClock::instance());

  std::string_view name() const override
  {
    return "Send";
  }

 private:
  Status run_impl() override;

  StatusOr<ChunkResult> send_chunk(i64 skip);

  Backend& src_;
  Backend& dst_;
  AlignedBuffer& buffer_;
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

/** \brief Copies data from a source stream into a destination backend, starting at `offset`.
 */
class Receive : public Operation
{
 public:
  explicit Receive(Backend& dst, Backend& src, AlignedBuffer& buffer,
                   const Optional<i64>& size = None, i64 offset = 0, bool flush = true,
                   Clock& clock = NullClock::instance());

  std::string_view name() const override
  {
    return "Receive";
  }

 private:
  Status run_impl() override;

  Status receive_data();

  StatusOr<ChunkResult> receive_chunk(i64 count);

  Backend& dst_;
  Backend& src_;
  AlignedBuffer& buffer_;
  bool flush_;
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

/** \brief Zeroes `size` bytes of the destination starting at `offset`.
 *
 * The range is zeroed in steps of at most kMaxZeroStep bytes so that `done()` advances at bounded
 * granularity on slow media.
 */
class Zero : public Operation
{
 public:
  explicit Zero(Backend& dst, i64 size, i64 offset = 0, bool flush = false,
                Clock& clock = NullClock::instance());

  std::string_view name() const override
  {
    return "Zero";
  }

  /** \brief Flushes the destination inside a "flush" span.
   */
  Status flush();

 private:
  Status run_impl() override;

  Backend& dst_;
  bool flush_;
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

/** \brief Flushes previously received data to storage.
 */
class Flush : public Operation
{
 public:
  explicit Flush(Backend& dst, Clock& clock = NullClock::instance());

  std::string_view name() const override
  {
    return "Flush";
  }

 private:
  Status run_impl() override;

  Backend& dst_;
};

}  // namespace imgio

#endif  // IMGIO_OPERATION_HPP
