//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <imgio/aligned_buffer.hpp>
//

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <utility>

namespace imgio {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ auto AlignedBuffer::metrics() -> Metrics&
{
  static Metrics metrics_;
  return metrics_;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ StatusOr<AlignedBuffer> AlignedBuffer::allocate(usize size, usize align)
{
  if (!is_power_of_two(static_cast<i64>(align))) {
    return make_status(StatusCode::kInvalidBlockSize);
  }

  // aligned_alloc requires the allocation size to be a multiple of the alignment; allocate at
  // least one block so that data() is never null for a zero-length buffer.
  //
  const usize capacity =
      static_cast<usize>(align_up(static_cast<i64>(std::max<usize>(size, 1)), align));

  void* const ptr = std::aligned_alloc(align, capacity);
  if (!ptr) {
    return batt::status_from_errno(ENOMEM);
  }
  std::memset(ptr, 0, capacity);

  metrics().allocate_count.add(1);
  metrics().allocate_bytes.add(static_cast<i64>(capacity));

  return AlignedBuffer{static_cast<u8*>(ptr), size, capacity, align};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
AlignedBuffer::AlignedBuffer(u8* data, usize size, usize capacity, usize align) noexcept
    : data_{data}
    , size_{size}
    , capacity_{capacity}
    , align_{align}
{
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
AlignedBuffer::AlignedBuffer(AlignedBuffer&& that) noexcept
    : data_{std::exchange(that.data_, nullptr)}
    , size_{std::exchange(that.size_, 0)}
    , capacity_{std::exchange(that.capacity_, 0)}
    , align_{std::exchange(that.align_, 0)}
{
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
AlignedBuffer& AlignedBuffer::operator=(AlignedBuffer&& that) noexcept
{
  if (this != &that) {
    this->release();
    this->data_ = std::exchange(that.data_, nullptr);
    this->size_ = std::exchange(that.size_, 0);
    this->capacity_ = std::exchange(that.capacity_, 0);
    this->align_ = std::exchange(that.align_, 0);
  }
  return *this;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
AlignedBuffer::~AlignedBuffer() noexcept
{
  this->release();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void AlignedBuffer::release() noexcept
{
  if (this->data_ == nullptr) {
    return;
  }
  std::free(this->data_);

  metrics().deallocate_count.add(1);
  metrics().deallocate_bytes.add(static_cast<i64>(this->capacity_));

  this->data_ = nullptr;
  this->size_ = 0;
  this->capacity_ = 0;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void AlignedBuffer::fill(u8 value) noexcept
{
  if (this->data_) {
    std::memset(this->data_, value, this->size_);
  }
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void AlignedBuffer::clear() noexcept
{
  this->fill(0);
}

}  // namespace imgio
