#include "remote.hpp"

#include "exception.hpp"
#include "remote_http.hpp"
#include "url.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>

namespace treeup {

std::string to_string(access_type type) {
  switch (type) {
    case access_type::link:
      return "LINK";
    case access_type::private_access:
      return "PRIVATE";
  }
  return "LINK";
}

access_type parse_access_type(const std::string& value) {
  std::string s = value;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });

  if (s == "LINK") return access_type::link;
  if (s == "PRIVATE") return access_type::private_access;

  throw std::invalid_argument("invalid access type: " + value);
}

// remote_client::create

std::unique_ptr<remote_client> remote_client::create(const url& address, const remote_options& options) {
  if (address.scheme() == "http" || address.scheme() == "https") {
    return std::make_unique<remote_http>(address, options);
  }

  throw unsupported_operation("unsupported remote scheme: " + address.scheme());
}

}  // namespace treeup
