//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

// Utilities for dealing with the OS filesystem.
//
#pragma once
#ifndef IMGIO_FILESYSTEM_HPP
#define IMGIO_FILESYSTEM_HPP

#include <imgio/buffer.hpp>
#include <imgio/int_types.hpp>
#include <imgio/status.hpp>

#include <batteries/strong_typedef.hpp>

#include <string>
#include <string_view>

#include <fcntl.h>
#include <sys/types.h>

namespace imgio {

StatusOr<int> open_fd(std::string_view file_name, int flags, mode_t mode = 0644);

Status close_fd(int fd);

Status truncate_fd(int fd, u64 size);

StatusOr<i64> sizeof_fd(int fd);

// Returns the number of bytes actually allocated on disk for the file (from `st_blocks`).
//
StatusOr<i64> allocated_bytes_of_fd(int fd);

// Reads from `offset` until `buffer` is full or end-of-file is reached; returns the number of bytes
// read.
//
StatusOr<i64> read_fd(int fd, MutableBuffer buffer, i64 offset);

// Writes all of `buffer` at `offset`.
//
Status write_fd(int fd, ConstBuffer buffer, i64 offset);

Status sync_fd(int fd);

// Deallocates the byte range [offset, offset + size) without changing the file size.  Fails with
// EOPNOTSUPP if the filesystem can not punch holes.
//
Status punch_hole_fd(int fd, i64 offset, i64 size);

// Zeroes the byte range [offset, offset + size), allocating space and extending the file as
// necessary.  Fails with EOPNOTSUPP if the filesystem has no native zero-range support.
//
Status zero_range_fd(int fd, i64 offset, i64 size);

BATT_STRONG_TYPEDEF(i32, EnableFileFlags);
BATT_STRONG_TYPEDEF(i32, DisableFileFlags);

StatusOr<i32> get_file_status_flags(int fd);

Status set_file_status_flags(int fd, i32 flags);

Status update_file_status_flags(int fd, EnableFileFlags enable_flags,
                                DisableFileFlags disable_flags);

// Turns direct (unbuffered, page cache bypassing) I/O on or off for the passed fd.
//
Status enable_raw_io_fd(int fd, bool enabled = true);

StatusOr<bool> is_raw_io_enabled_fd(int fd);

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Whole-file helpers.

StatusOr<std::string> read_file(std::string_view file_name);

Status write_file(std::string_view file_name, std::string_view contents);

Status truncate_file(std::string_view file_name, u64 size);

StatusOr<i64> sizeof_file(std::string_view file_name);

StatusOr<i64> allocated_bytes_of_file(std::string_view file_name);

Status delete_file(std::string_view file_name);

}  // namespace imgio

#endif  // IMGIO_FILESYSTEM_HPP
