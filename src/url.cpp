#include "url.hpp"

#include <cctype>
#include <string>

namespace treeup {

std::string url_encode(const std::string& value) {
  static const char hex[] = "0123456789ABCDEF";

  std::string encoded;
  encoded.reserve(value.size());
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      encoded += static_cast<char>(c);
    }
    else {
      encoded += '%';
      encoded += hex[c >> 4];
      encoded += hex[c & 0x0f];
    }
  }
  return encoded;
}

std::string form_encode(const std::vector<std::pair<std::string, std::string>>& fields) {
  std::string body;
  for (const auto& field : fields) {
    if (!body.empty()) body += '&';
    body += url_encode(field.first);
    if (!field.second.empty()) {
      body += '=';
      body += url_encode(field.second);
    }
  }
  return body;
}

url url::join(const std::string& path) const {
  std::string base = _url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }

  size_t start = 0;
  while (start < path.size() && path[start] == '/') {
    ++start;
  }

  return url(base + "/" + path.substr(start));
}

url url::with_query(const std::vector<std::pair<std::string, std::string>>& params) const {
  if (params.empty()) return *this;

  std::string result = _url;
  result += _url.find('?') == std::string::npos ? '?' : '&';
  result += form_encode(params);
  return url(result);
}

}  // namespace treeup
