//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef IMGIO_STATUS_CODE_HPP
#define IMGIO_STATUS_CODE_HPP

#include <batteries/status.hpp>

namespace imgio {

enum struct StatusCode {
  kOk = 0,
  kPartialContent = 1,
  kBackendClosed = 2,
  kBackendNotReadable = 3,
  kBackendNotWritable = 4,
  kInvalidOpenMode = 5,
  kUnsupportedUrlScheme = 6,
  kInvalidUrl = 7,
  kInvalidBlockSize = 8,
  kNegativeSeekPosition = 9,
  kZeroLengthTransfer = 10,
  kOperationAlreadyRun = 11,
};

bool initialize_status_codes();

::batt::Status make_status(StatusCode code);

}  // namespace imgio

#endif  // IMGIO_STATUS_CODE_HPP
