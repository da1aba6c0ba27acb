//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef IMGIO_URL_HPP
#define IMGIO_URL_HPP

#include <imgio/status.hpp>

#include <ostream>
#include <string>
#include <string_view>

namespace imgio {

/** \brief The address of a storage backend, e.g. `file:/var/lib/images/disk.raw`.
 */
struct Url {
  /** \brief Parses `text` as `<scheme>:<path>` or `<scheme>://<host><path>`.
   *
   * The path must be absolute.  For the `file` scheme the host must be empty or `localhost`.
   */
  static StatusOr<Url> parse(std::string_view text);

  std::string scheme;
  std::string host;
  std::string path;
};

bool operator==(const Url& l, const Url& r);

bool operator!=(const Url& l, const Url& r);

std::ostream& operator<<(std::ostream& out, const Url& t);

}  // namespace imgio

#endif  // IMGIO_URL_HPP
