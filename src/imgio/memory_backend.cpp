//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <imgio/memory_backend.hpp>
//

#include <batteries/checked_cast.hpp>

#include <algorithm>
#include <cstring>

namespace imgio {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*explicit*/ MemoryBackend::MemoryBackend(OpenMode mode, Optional<i64> max_transfer_size) noexcept
    : data_{}
    , mode_{mode}
    , max_transfer_size_{max_transfer_size}
{
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*explicit*/ MemoryBackend::MemoryBackend(std::string_view contents, OpenMode mode,
                                          Optional<i64> max_transfer_size) noexcept
    : data_{contents}
    , mode_{mode}
    , max_transfer_size_{max_transfer_size}
{
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status MemoryBackend::require_open() const
{
  if (this->closed_) {
    return make_status(StatusCode::kBackendClosed);
  }
  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
i64 MemoryBackend::limit(i64 count) const
{
  if (this->max_transfer_size_) {
    return std::min(count, *this->max_transfer_size_);
  }
  return count;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void MemoryBackend::grow_to(i64 minimum_size)
{
  if (static_cast<i64>(this->data_.size()) < minimum_size) {
    this->data_.resize(BATT_CHECKED_CAST(usize, minimum_size), '\0');
  }
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<i64> MemoryBackend::read_into(const MutableBuffer& buffer) /*override*/
{
  BATT_REQUIRE_OK(this->require_open());
  if (!this->readable()) {
    return make_status(StatusCode::kBackendNotReadable);
  }

  const i64 available = std::max<i64>(0, static_cast<i64>(this->data_.size()) - this->position_);
  const i64 count = this->limit(std::min<i64>(available, buffer.size()));

  if (count > 0) {
    std::memcpy(buffer.data(), this->data_.data() + this->position_, count);
    this->position_ += count;
  }

  return count;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<i64> MemoryBackend::write(const ConstBuffer& data) /*override*/
{
  BATT_REQUIRE_OK(this->require_open());
  if (!this->writable()) {
    return make_status(StatusCode::kBackendNotWritable);
  }

  const i64 count = this->limit(data.size());

  this->grow_to(this->position_ + count);
  std::memcpy(this->data_.data() + this->position_, data.data(), count);
  this->position_ += count;
  this->dirty_ = true;

  return count;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<i64> MemoryBackend::zero(i64 count) /*override*/
{
  BATT_REQUIRE_OK(this->require_open());
  if (!this->writable()) {
    return make_status(StatusCode::kBackendNotWritable);
  }
  if (count <= 0) {
    return 0;
  }

  count = this->limit(count);

  this->grow_to(this->position_ + count);
  std::memset(this->data_.data() + this->position_, 0, count);
  this->position_ += count;
  this->dirty_ = true;

  return count;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status MemoryBackend::seek(i64 position) /*override*/
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
Status MemoryBackend::flush() /*override*/
{
  BATT_REQUIRE_OK(this->require_open());

  this->dirty_ = false;
  this->flush_count_ += 1;

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<i64> MemoryBackend::size() /*override*/
{
  BATT_REQUIRE_OK(this->require_open());

  return static_cast<i64>(this->data_.size());
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status MemoryBackend::close() /*override*/
{
  this->closed_ = true;
  return OkStatus();
}

}  // namespace imgio
