//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef IMGIO_CONFIG_HPP
#define IMGIO_CONFIG_HPP

#include <imgio/int_types.hpp>

#include <batteries/constants.hpp>
#include <batteries/static_assert.hpp>

namespace imgio {

namespace constants = ::batt::constants;

using namespace constants;

//+++++++++++-+-+--+----- --- -- -  -  -   -
#ifdef __linux__
#define IMGIO_PLATFORM_IS_LINUX 1
#else
#undef IMGIO_PLATFORM_IS_LINUX
#endif

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

// The alignment unit for direct I/O.  4K-sector devices are not supported by default; pass a
// different block size to FileBackend::Options to override.
//
constexpr i64 kDefaultBlockSize = 512;
constexpr usize kDirectIOBlockAlign = 512;

BATT_STATIC_ASSERT_EQ(kDefaultBlockSize, static_cast<i64>(kDirectIOBlockAlign));

// The number of bytes an Operation moves per step when neither a total size nor a working buffer
// bounds the transfer.
//
constexpr i64 kDefaultOperationBufferSize = 1 * kMiB;

// Zero operations advance in steps of at most this many bytes so that progress (`done`) is updated
// frequently enough, even on slow storage.
//
constexpr i64 kMaxZeroStep = 1 * kGiB;

// Upper bound on the staging buffer used when a block-aligned write comes from memory that is not
// itself aligned.
//
constexpr usize kMaxBounceBufferSize = 1 * kMiB;

// The buffer used when non-sparse zeroing falls back to writing physical zeros.
//
constexpr usize kZeroWriteBufferSize = 1 * kMiB;

// Used in the code to react to debug/release builds.
//
#ifndef NDEBUG
constexpr bool kDebugBuild = true;
#else
constexpr bool kDebugBuild = false;
#endif

// Logging configuration; uncomment one of the lines below to select the logging implementation.
//
//+++++++++++-+-+--+----- --- -- -  -  -   -
#if !defined(IMGIO_DISABLE_LOGGING) && !defined(IMGIO_USE_BOOST_LOG) && !defined(IMGIO_USE_GLOG)
//#define IMGIO_DISABLE_LOGGING
//#define IMGIO_USE_BOOST_LOG
#define IMGIO_USE_GLOG
#endif
//+++++++++++-+-+--+----- --- -- -  -  -   -

}  // namespace imgio

#endif  // IMGIO_CONFIG_HPP
