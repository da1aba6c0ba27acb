//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <imgio/url.hpp>
//

#include <algorithm>
#include <cctype>

namespace imgio {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ StatusOr<Url> Url::parse(std::string_view text)
{
  const usize colon = text.find(':');
  if (colon == std::string_view::npos || colon == 0) {
    return make_status(StatusCode::kInvalidUrl);
  }

  Url url;
  url.scheme = std::string{text.substr(0, colon)};
  std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });

  std::string_view rest = text.substr(colon + 1);

  // Authority component (`//host`), if present.
  //
  if (rest.substr(0, 2) == "//") {
    rest.remove_prefix(2);
    const usize slash = rest.find('/');
    url.host = std::string{rest.substr(0, slash)};
    rest = (slash == std::string_view::npos) ? std::string_view{} : rest.substr(slash);
  }

  if (rest.empty() || rest.front() != '/') {
    return make_status(StatusCode::kInvalidUrl);
  }
  url.path = std::string{rest};

  if (url.scheme == "file") {
    if (url.host == "localhost") {
      url.host.clear();
    } else if (!url.host.empty()) {
      return make_status(StatusCode::kInvalidUrl);
    }
  }

  return url;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool operator==(const Url& l, const Url& r)
{
  return l.scheme == r.scheme && l.host == r.host && l.path == r.path;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool operator!=(const Url& l, const Url& r)
{
  return !(l == r);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const Url& t)
{
  out << t.scheme << ":";
  if (!t.host.empty()) {
    out << "//" << t.host;
  }
  return out << t.path;
}

}  // namespace imgio
