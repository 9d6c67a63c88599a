#ifndef TREEUP_URL_HPP
#define TREEUP_URL_HPP

#include <string>
#include <utility>
#include <vector>

namespace treeup {

// Percent-encode a string for use in a query string or form body (RFC 3986 unreserved set kept).
std::string url_encode(const std::string& value);

// Encode key/value pairs as application/x-www-form-urlencoded.
// A pair with an empty value is written as a bare key ("get_file_hash").
std::string form_encode(const std::vector<std::pair<std::string, std::string>>& fields);

class url {
  std::string _url;

 public:
  explicit url(const std::string& url) : _url(url) {}

  std::string scheme() const {
    size_t pos = _url.find("://");
    if (pos == std::string::npos) return "";
    return _url.substr(0, pos);
  }

  std::string host() const {
    size_t pos = _url.find("://");
    pos = pos == std::string::npos ? 0 : pos + 3;
    size_t end = _url.find_first_of("/?", pos);
    if (end == std::string::npos) return _url.substr(pos);
    return _url.substr(pos, end - pos);
  }

  std::string path() const {
    size_t pos = _url.find("://");
    pos = pos == std::string::npos ? 0 : pos + 3;
    size_t begin = _url.find('/', pos);
    if (begin == std::string::npos) return "/";
    size_t end = _url.find('?', begin);
    return _url.substr(begin, end == std::string::npos ? std::string::npos : end - begin);
  }

  std::string query() const {
    size_t pos = _url.find('?');
    if (pos == std::string::npos) return "";
    return _url.substr(pos + 1);
  }

  // Appends a path to the url, avoiding duplicate slashes.
  url join(const std::string& path) const;

  // Returns a copy with the encoded query parameters appended.
  url with_query(const std::vector<std::pair<std::string, std::string>>& params) const;

  const std::string& string() const { return _url; }
};

}  // namespace treeup

#endif  // TREEUP_URL_HPP
