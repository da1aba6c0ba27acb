//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef IMGIO_TESTING_UTIL_HPP
#define IMGIO_TESTING_UTIL_HPP

#include <imgio/config.hpp>
//
#include <imgio/aligned_buffer.hpp>
#include <imgio/int_types.hpp>
#include <imgio/status.hpp>

#include <set>
#include <string>
#include <string_view>

namespace imgio {
namespace testing {

/** \brief A uniquely named scratch file path under TestConfig::tmp_dir(); the file (if it was
 * created) is deleted when this object goes out of scope.
 *
 * The file itself is not created by the constructor.
 */
class TempFile
{
 public:
  explicit TempFile(std::string_view name_prefix = "imgio_test");

  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  ~TempFile() noexcept;

  const std::string& path() const noexcept
  {
    return this->path_;
  }

  /** \brief The URL form of path(): `file:/...`.
   */
  std::string url() const;

  /** \brief Replaces the contents of the file with `contents`.
   */
  Status write(std::string_view contents) const;

  /** \brief Returns the current contents of the file.
   */
  StatusOr<std::string> read() const;

 private:
  std::string path_;
};

/** \brief Allocates an aligned buffer of `size` bytes, each set to `fill_byte`.
 */
StatusOr<AlignedBuffer> make_filled_buffer(usize size, char fill_byte);

/** \brief Returns the file descriptors currently open in this process (from /proc/self/fd).
 */
StatusOr<std::set<int>> get_open_fds();

}  //namespace testing
}  //namespace imgio

#endif  // IMGIO_TESTING_UTIL_HPP
