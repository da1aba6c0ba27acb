//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <imgio/backend.hpp>
//

#include <imgio/file_backend.hpp>

namespace imgio {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<OpenMode> parse_open_mode(std::string_view mode)
{
  if (mode == "r") {
    return OpenMode::kReadOnly;
  }
  if (mode == "w") {
    return OpenMode::kWriteOnly;
  }
  if (mode == "r+") {
    return OpenMode::kReadWrite;
  }
  return make_status(StatusCode::kInvalidOpenMode);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, OpenMode t)
{
  switch (t) {
    case OpenMode::kReadOnly:
      return out << "r";
    case OpenMode::kWriteOnly:
      return out << "w";
    case OpenMode::kReadWrite:
      return out << "r+";
  }
  return out << "(bad OpenMode:" << static_cast<int>(t) << ")";
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::unique_ptr<Backend>> open_backend(const Url& url, OpenMode mode, bool sparse)
{
  if (url.scheme == "file") {
    FileBackend::Options options = FileBackend::Options::with_default_values();
    options.sparse = sparse;

    StatusOr<std::unique_ptr<FileBackend>> file = FileBackend::open(url.path, mode, options);
    BATT_REQUIRE_OK(file);

    std::unique_ptr<Backend> backend = std::move(*file);
    return {std::move(backend)};
  }

  return make_status(StatusCode::kUnsupportedUrlScheme);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::unique_ptr<Backend>> open_backend(std::string_view url, std::string_view mode,
                                                bool sparse)
{
  StatusOr<Url> parsed_url = Url::parse(url);
  BATT_REQUIRE_OK(parsed_url);

  StatusOr<OpenMode> parsed_mode = parse_open_mode(mode);
  BATT_REQUIRE_OK(parsed_mode);

  return open_backend(*parsed_url, *parsed_mode, sparse);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status write_all(Backend& backend, const ConstBuffer& data)
{
  ConstBuffer remaining = data;
  while (remaining.size() != 0) {
    StatusOr<i64> n_written = backend.write(remaining);
    BATT_REQUIRE_OK(n_written);

    if (*n_written <= 0) {
      return make_status(StatusCode::kZeroLengthTransfer);
    }
    remaining += *n_written;
  }
  return OkStatus();
}

}  // namespace imgio
