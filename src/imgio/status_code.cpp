//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <imgio/status_code.hpp>
//

#include <batteries/status.hpp>

namespace imgio {

#define CODE_WITH_MSG_(code, msg)                                                                  \
  {                                                                                                \
    code, msg " (" #code ")"                                                                       \
  }

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool initialize_status_codes()
{
  static bool const initialized = batt::Status::register_codes<StatusCode>({
      CODE_WITH_MSG_(StatusCode::kOk, "Ok"),  // 0
      CODE_WITH_MSG_(StatusCode::kPartialContent,
                     "The transfer ended before the requested number of bytes was moved"),  // 1
      CODE_WITH_MSG_(StatusCode::kBackendClosed, "The backend has been closed"),            // 2
      CODE_WITH_MSG_(StatusCode::kBackendNotReadable,
                     "The backend was not opened for reading"),  // 3
      CODE_WITH_MSG_(StatusCode::kBackendNotWritable,
                     "The backend was not opened for writing"),  // 4
      CODE_WITH_MSG_(StatusCode::kInvalidOpenMode,
                     "Open mode must be one of \"r\", \"w\", or \"r+\""),  // 5
      CODE_WITH_MSG_(StatusCode::kUnsupportedUrlScheme,
                     "No backend is available for the URL scheme"),  // 6
      CODE_WITH_MSG_(StatusCode::kInvalidUrl,
                     "Backend URL must name an absolute path (file:/path)"),  // 7
      CODE_WITH_MSG_(StatusCode::kInvalidBlockSize,
                     "Block size (alignment) must be a non-zero power of two"),  // 8
      CODE_WITH_MSG_(StatusCode::kNegativeSeekPosition,
                     "Can not seek to a negative position"),  // 9
      CODE_WITH_MSG_(StatusCode::kZeroLengthTransfer,
                     "The backend accepted zero bytes; the transfer can not make progress"),  // 10
      CODE_WITH_MSG_(StatusCode::kOperationAlreadyRun,
                     "An operation may only be run once"),  // 11
  });
  return initialized;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
::batt::Status make_status(StatusCode code)
{
  initialize_status_codes();

  return ::batt::Status{code};
}

}  // namespace imgio
