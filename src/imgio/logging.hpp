//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -
//
#pragma once
#ifndef IMGIO_LOGGING_HPP
#define IMGIO_LOGGING_HPP

#include <imgio/config.hpp>

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#if defined(IMGIO_DISABLE_LOGGING)

// Nothing to include!

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#elif defined(IMGIO_USE_GLOG)

#include <glog/logging.h>

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#elif defined(IMGIO_USE_BOOST_LOG)

#include <batteries/assert.hpp>
#include <batteries/suppress.hpp>

BATT_SUPPRESS_IF_GCC("-Wdeprecated-copy")

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

BATT_UNSUPPRESS_IF_GCC()

#include <boost/preprocessor/cat.hpp>

#include <atomic>

#include <errno.h>

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#else

#error No Logging Impl Selected!

#endif

#include <ostream>

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++

namespace imgio {

namespace detail {
struct NullStream {
  template <typename Arg>
  const NullStream& operator<<(Arg&&) const noexcept
  {
    return *this;
  }

  const NullStream& operator<<(std::ostream& (*)(std::ostream&)) const noexcept
  {
    return *this;
  }
};
}  // namespace detail

#define IMGIO_LOG_NO_OUTPUT()                                                                      \
  if (false)                                                                                       \
  (::imgio::detail::NullStream{})

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#if defined(IMGIO_DISABLE_LOGGING)

#define IMGIO_LOG_ERROR() IMGIO_LOG_NO_OUTPUT()
#define IMGIO_LOG_WARNING() IMGIO_LOG_NO_OUTPUT()
#define IMGIO_LOG_INFO() IMGIO_LOG_NO_OUTPUT()
#define IMGIO_VLOG(verbosity) IMGIO_LOG_NO_OUTPUT()
#define IMGIO_PLOG_ERROR() IMGIO_LOG_NO_OUTPUT()
#define IMGIO_PLOG_WARNING() IMGIO_LOG_NO_OUTPUT()
#define IMGIO_LOG_WARNING_IF(condition) IMGIO_LOG_NO_OUTPUT()
#define IMGIO_LOG_WARNING_FIRST_N(n) IMGIO_LOG_NO_OUTPUT()
#define IMGIO_LOG_INFO_FIRST_N(n) IMGIO_LOG_NO_OUTPUT()

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#elif defined(IMGIO_USE_GLOG)

#define IMGIO_LOG_ERROR() LOG(ERROR)
#define IMGIO_LOG_WARNING() LOG(WARNING)
#define IMGIO_LOG_INFO() LOG(INFO)
#define IMGIO_VLOG(verbosity) VLOG((verbosity))
#define IMGIO_PLOG_ERROR() PLOG(ERROR)
#define IMGIO_PLOG_WARNING() PLOG(WARNING)
#define IMGIO_LOG_WARNING_IF(condition) LOG_IF(WARNING, (condition))
#define IMGIO_LOG_WARNING_FIRST_N(n) LOG_FIRST_N(WARNING, (n))
#define IMGIO_LOG_INFO_FIRST_N(n) LOG_FIRST_N(INFO, (n))

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#elif defined(IMGIO_USE_BOOST_LOG)

#define IMGIO_LOG_ERROR() BOOST_LOG_TRIVIAL(error)
#define IMGIO_LOG_WARNING() BOOST_LOG_TRIVIAL(warning)
#define IMGIO_LOG_INFO() BOOST_LOG_TRIVIAL(info)
#define IMGIO_VLOG(verbosity) BOOST_LOG_TRIVIAL(debug)

#define IMGIO_PLOG_ERROR() IMGIO_LOG_ERROR() << BATT_INSPECT(errno)
#define IMGIO_PLOG_WARNING() IMGIO_LOG_WARNING() << BATT_INSPECT(errno)

#define IMGIO_LOG_WARNING_IF(condition)                                                            \
  if (condition)                                                                                   \
  IMGIO_LOG_WARNING()

#define IMGIO_LOG_SEVERITY_FIRST_N(n, severity)                                                    \
  static std::atomic<int> BOOST_PP_CAT(imgio_log_counter_, __LINE__){(n)};                         \
  if (BOOST_PP_CAT(imgio_log_counter_, __LINE__).fetch_sub(1) > 0)                                 \
  BOOST_LOG_TRIVIAL(severity)

#define IMGIO_LOG_WARNING_FIRST_N(n) IMGIO_LOG_SEVERITY_FIRST_N((n), warning)
#define IMGIO_LOG_INFO_FIRST_N(n) IMGIO_LOG_SEVERITY_FIRST_N((n), info)

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -

inline const bool kBoostLoggingInitialized = [] {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= boost::log::trivial::info);
  return true;
}();

#endif

//+++++++++++-+-+--+----- --- -- -  -  -   -

#define IMGIO_DLOG_WARNING()                                                                       \
  if (::imgio::kDebugBuild)                                                                        \
  IMGIO_LOG_WARNING()

#define IMGIO_DLOG_INFO()                                                                          \
  if (::imgio::kDebugBuild)                                                                        \
  IMGIO_LOG_INFO()

#define IMGIO_DVLOG(verbosity)                                                                     \
  if (::imgio::kDebugBuild)                                                                        \
  IMGIO_VLOG((verbosity))

}  // namespace imgio

#endif  // IMGIO_LOGGING_HPP
