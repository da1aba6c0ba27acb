//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef IMGIO_ALIGNED_BUFFER_HPP
#define IMGIO_ALIGNED_BUFFER_HPP

#include <imgio/config.hpp>
//
#include <imgio/buffer.hpp>
#include <imgio/int_types.hpp>
#include <imgio/metrics.hpp>
#include <imgio/status.hpp>

#include <cstdint>

namespace imgio {

inline bool is_power_of_two(i64 n)
{
  return n > 0 && (n & (n - 1)) == 0;
}

// Return the greatest multiple of `align` not greater than n.  `align` must be a power of two.
//
inline i64 align_down(i64 n, i64 align)
{
  return n & ~(align - 1);
}

// Return the least multiple of `align` not less than n.  `align` must be a power of two.
//
inline i64 align_up(i64 n, i64 align)
{
  return (n + align - 1) & ~(align - 1);
}

inline bool is_aligned(i64 n, i64 align)
{
  return (n & (align - 1)) == 0;
}

inline bool is_aligned(const void* ptr, i64 align)
{
  return (static_cast<i64>(reinterpret_cast<std::uintptr_t>(ptr)) & (align - 1)) == 0;
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
/** \brief A zero-initialized heap buffer whose start address is a multiple of the direct I/O
 * alignment.
 *
 * The capacity is rounded up to the alignment, but size() reports exactly the requested length,
 * so a buffer may be aligned in address while not being a whole number of blocks long (e.g.,
 * 3073 bytes).  AlignedBuffer is move-only; the memory is released when the owning object goes
 * out of scope.
 */
class AlignedBuffer
{
 public:
  /** \brief Process-wide allocation counters.
   */
  struct Metrics {
    CountMetric<i64> allocate_count{0};
    CountMetric<i64> allocate_bytes{0};
    CountMetric<i64> deallocate_count{0};
    CountMetric<i64> deallocate_bytes{0};

    /** \brief Returns an estimate of the number of currently existing buffers.
     */
    i64 estimate_active_count() const
    {
      const i64 observed_dealloc = this->deallocate_count.load();
      return this->allocate_count.load() - observed_dealloc;
    }
  };

  static Metrics& metrics();

  /** \brief Allocates a new buffer of `size` bytes aligned to `align` (which must be a power of
   * two).
   */
  static StatusOr<AlignedBuffer> allocate(usize size, usize align = kDirectIOBlockAlign);

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  AlignedBuffer() noexcept = default;

  AlignedBuffer(const AlignedBuffer&) = delete;
  AlignedBuffer& operator=(const AlignedBuffer&) = delete;

  AlignedBuffer(AlignedBuffer&& that) noexcept;
  AlignedBuffer& operator=(AlignedBuffer&& that) noexcept;

  ~AlignedBuffer() noexcept;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  u8* data() const noexcept
  {
    return this->data_;
  }

  usize size() const noexcept
  {
    return this->size_;
  }

  usize capacity() const noexcept
  {
    return this->capacity_;
  }

  usize alignment() const noexcept
  {
    return this->align_;
  }

  explicit operator bool() const noexcept
  {
    return this->data_ != nullptr;
  }

  MutableBuffer as_mutable_buffer() const noexcept
  {
    return MutableBuffer{this->data_, this->size_};
  }

  ConstBuffer as_const_buffer() const noexcept
  {
    return ConstBuffer{this->data_, this->size_};
  }

  // Sets every byte in the buffer to `value`.
  //
  void fill(u8 value) noexcept;

  // Sets every byte in the buffer to zero.
  //
  void clear() noexcept;

 private:
  AlignedBuffer(u8* data, usize size, usize capacity, usize align) noexcept;

  void release() noexcept;

  u8* data_ = nullptr;
  usize size_ = 0;
  usize capacity_ = 0;
  usize align_ = 0;
};

}  // namespace imgio

#endif  // IMGIO_ALIGNED_BUFFER_HPP
