//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef IMGIO_BUFFER_HPP
#define IMGIO_BUFFER_HPP

#include <imgio/int_types.hpp>

#include <batteries/buffer.hpp>

namespace imgio {

using batt::ConstBuffer;
using batt::MutableBuffer;
using batt::resize_buffer;

// Returns the sub-range [offset, offset + size) of `buffer`, clamped to the buffer's extent.
//
template <typename BufferT>
inline BufferT slice_buffer(const BufferT& buffer, usize offset, usize size)
{
  return resize_buffer(buffer + offset, size);
}

}  // namespace imgio

#endif  // IMGIO_BUFFER_HPP
