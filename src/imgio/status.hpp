//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef IMGIO_STATUS_HPP
#define IMGIO_STATUS_HPP

#include <imgio/logging.hpp>
#include <imgio/status_code.hpp>

#include <batteries/hint.hpp>
#include <batteries/optional.hpp>
#include <batteries/status.hpp>

#include <boost/preprocessor/cat.hpp>
#include <boost/preprocessor/stringize.hpp>

namespace imgio {

using batt::OkStatus;
using batt::Status;
using batt::status_from_errno;
using batt::status_from_retval;
using batt::StatusOr;

// Logs a warning if `expr` does not evaluate to an ok Status; used where an error can not be
// returned to the caller (e.g., destructors).
//
#define IMGIO_WARN_IF_NOT_OK(expr)                                                                 \
  for (auto BOOST_PP_CAT(imgio_TmpStatusResult, __LINE__) = ::batt::make_optional((expr));         \
       BATT_HINT_FALSE(BOOST_PP_CAT(imgio_TmpStatusResult, __LINE__) &&                            \
                       !BOOST_PP_CAT(imgio_TmpStatusResult, __LINE__)->ok());                      \
       BOOST_PP_CAT(imgio_TmpStatusResult, __LINE__) = ::batt::None)                               \
  IMGIO_LOG_WARNING() << "Expected OK result, but got: \n\n"                                       \
                      << BOOST_PP_STRINGIZE((expr)) << " == "                                      \
                      << *BOOST_PP_CAT(imgio_TmpStatusResult, __LINE__) << "\n\n"

}  // namespace imgio

#endif  // IMGIO_STATUS_HPP
