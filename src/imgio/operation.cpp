//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <imgio/operation.hpp>
//

#include <imgio/buffer.hpp>
#include <imgio/config.hpp>
#include <imgio/logging.hpp>

#include <batteries/checked_cast.hpp>
#include <batteries/stream_util.hpp>

#include <algorithm>

namespace imgio {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*explicit*/ Operation::Operation(const Optional<i64>& size, i64 offset, usize buffer_size,
                                  Clock& clock)
    : clock_{clock}
    , size_{size}
    , offset_{offset}
    , buffer_size_{buffer_size}
{
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Operation::run()
{
  if (this->started_) {
    return make_status(StatusCode::kOperationAlreadyRun);
  }
  this->started_ = true;

  ClockSpan span = this->clock_.run("operation");

  Status status = this->run_impl();
  if (!status.ok()) {
    IMGIO_VLOG(1) << *this << " failed: " << status;
  } else {
    IMGIO_VLOG(1) << *this << " completed";
  }
  return status;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
i64 Operation::todo() const
{
  if (this->size_) {
    return *this->size_ - this->done_;
  }
  if (this->buffer_size_ != 0) {
    return static_cast<i64>(this->buffer_size_);
  }
  return kDefaultOperationBufferSize;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<ChunkResult> Operation::end_of_data() const
{
  if (!this->size_ || this->done_ >= *this->size_) {
    return ChunkResult::kEnded;
  }
  IMGIO_LOG_WARNING() << *this << " ended early;" << BATT_INSPECT(*this->size_)
                      << BATT_INSPECT(this->done_);

  return make_status(StatusCode::kPartialContent);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const Operation& t)
{
  out << "<" << t.name() << " size=";
  if (t.size()) {
    out << *t.size();
  } else {
    out << "None";
  }
  return out << " offset=" << t.offset() << " done=" << t.done() << ">";
}

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
// class Send

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*explicit*/ Send::Send(Backend& src, Backend& dst, AlignedBuffer& buffer,
                        const Optional<i64>& size, i64 offset, Clock& clock)
    : Operation{size, offset, buffer.size(), clock}
    , src_{src}
    , dst_{dst}
    , buffer_{buffer}
{
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Send::run_impl() /*override*/
{
  // A buffer smaller than a source block would leave the source cursor inside a block after the
  // first read.
  //
  if (this->buffer_.size() == 0 ||
      BATT_CHECKED_CAST(i64, this->buffer_.size()) < this->src_.block_size()) {
    return batt::StatusCode::kInvalidArgument;
  }

  // Start reading at the block boundary preceding `offset`; the leading `skip` bytes of the first
  // chunk are dropped.
  //
  const i64 skip = this->offset_ % this->src_.block_size();
  BATT_REQUIRE_OK(this->src_.seek(this->offset_ - skip));

  if (skip != 0 && this->todo() > 0) {
    BATT_ASSIGN_OK_RESULT(const ChunkResult result, this->send_chunk(skip));
    if (result == ChunkResult::kEnded) {
      return OkStatus();
    }
  }

  while (this->todo() > 0) {
    BATT_ASSIGN_OK_RESULT(const ChunkResult result, this->send_chunk(/*skip=*/0));
    if (result == ChunkResult::kEnded) {
      break;
    }
  }

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<ChunkResult> Send::send_chunk(i64 skip)
{
  // A short read that did not end on a block boundary means the previous chunk hit the end of the
  // source.
  //
  if (this->src_.tell() % this->src_.block_size() != 0) {
    return this->end_of_data();
  }

  i64 count = 0;
  {
    ClockSpan span = this->clock_.run("read");
    StatusOr<i64> n_read = this->src_.read_into(this->buffer_.as_mutable_buffer());
    BATT_REQUIRE_OK(n_read);
    count = *n_read;
    span.add_bytes(count);
  }
  if (count <= skip) {
    return this->end_of_data();
  }

  const i64 size = std::min(count - skip, this->todo());
  {
    ClockSpan span = this->clock_.run("write");
    BATT_REQUIRE_OK(write_all(this->dst_, slice_buffer(this->buffer_.as_const_buffer(),
                                                       BATT_CHECKED_CAST(usize, skip),
                                                       BATT_CHECKED_CAST(usize, size))));
    span.add_bytes(size);
  }
  this->done_ += size;

  return ChunkResult::kContinue;
}

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
// class Receive

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*explicit*/ Receive::Receive(Backend& dst, Backend& src, AlignedBuffer& buffer,
                              const Optional<i64>& size, i64 offset, bool flush, Clock& clock)
    : Operation{size, offset, buffer.size(), clock}
    , dst_{dst}
    , src_{src}
    , buffer_{buffer}
    , flush_{flush}
{
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Receive::run_impl() /*override*/
{
  if (this->buffer_.size() == 0) {
    return batt::StatusCode::kInvalidArgument;
  }

  BATT_REQUIRE_OK(this->receive_data());

  if (this->flush_) {
    ClockSpan span = this->clock_.run("sync");
    BATT_REQUIRE_OK(this->dst_.flush());
  }

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Receive::receive_data()
{
  BATT_REQUIRE_OK(this->dst_.seek(this->offset_));

  // If offset is not aligned to the destination's block size, receive a partial chunk up to the
  // start of the next block so that all following chunks are aligned.
  //
  const i64 block_size = this->dst_.block_size();
  const i64 unaligned = this->offset_ % block_size;
  if (unaligned != 0) {
    const i64 count = std::min(this->todo(), block_size - unaligned);
    BATT_ASSIGN_OK_RESULT(const ChunkResult result, this->receive_chunk(count));
    if (result == ChunkResult::kEnded) {
      return OkStatus();
    }
  }

  const i64 buffer_size = BATT_CHECKED_CAST(i64, this->buffer_.size());
  while (this->todo() > 0) {
    const i64 count = std::min(this->todo(), buffer_size);
    BATT_ASSIGN_OK_RESULT(const ChunkResult result, this->receive_chunk(count));
    if (result == ChunkResult::kEnded) {
      break;
    }
  }

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<ChunkResult> Receive::receive_chunk(i64 count)
{
  const MutableBuffer view = resize_buffer(this->buffer_.as_mutable_buffer(),
                                           BATT_CHECKED_CAST(usize, count));

  // Accumulate reads until the chunk is full or the source ends.
  //
  i64 n_read = 0;
  while (n_read < count) {
    ClockSpan span = this->clock_.run("read");
    StatusOr<i64> n = this->src_.read_into(view + BATT_CHECKED_CAST(usize, n_read));
    BATT_REQUIRE_OK(n);
    span.add_bytes(*n);
    if (*n == 0) {
      break;
    }
    n_read += *n;
  }

  i64 n_written = 0;
  while (n_written < n_read) {
    ClockSpan span = this->clock_.run("write");
    StatusOr<i64> n =
        this->dst_.write(slice_buffer(ConstBuffer{view}, BATT_CHECKED_CAST(usize, n_written),
                                      BATT_CHECKED_CAST(usize, n_read - n_written)));
    BATT_REQUIRE_OK(n);
    if (*n <= 0) {
      return make_status(StatusCode::kZeroLengthTransfer);
    }
    span.add_bytes(*n);
    n_written += *n;
  }

  this->done_ += n_read;

  if (n_read < count) {
    return this->end_of_data();
  }
  return ChunkResult::kContinue;
}

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
// class Zero

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*explicit*/ Zero::Zero(Backend& dst, i64 size, i64 offset, bool flush, Clock& clock)
    : Operation{size, offset, /*buffer_size=*/0, clock}
    , dst_{dst}
    , flush_{flush}
{
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Zero::run_impl() /*override*/
{
  BATT_REQUIRE_OK(this->dst_.seek(this->offset_));

  while (this->todo() > 0) {
    const i64 step = std::min(this->todo(), kMaxZeroStep);

    ClockSpan span = this->clock_.run("zero");
    StatusOr<i64> n_zeroed = this->dst_.zero(step);
    BATT_REQUIRE_OK(n_zeroed);
    if (*n_zeroed <= 0) {
      return make_status(StatusCode::kZeroLengthTransfer);
    }
    span.add_bytes(*n_zeroed);
    this->done_ += *n_zeroed;
  }

  if (this->flush_) {
    BATT_REQUIRE_OK(this->flush());
  }

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Zero::flush()
{
  ClockSpan span = this->clock_.run("flush");
  return this->dst_.flush();
}

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
// class Flush

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*explicit*/ Flush::Flush(Backend& dst, Clock& clock)
    : Operation{/*size=*/None, /*offset=*/0, /*buffer_size=*/0, clock}
    , dst_{dst}
{
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Flush::run_impl() /*override*/
{
  ClockSpan span = this->clock_.run("flush");
  return this->dst_.flush();
}

}  // namespace imgio
