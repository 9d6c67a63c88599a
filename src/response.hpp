#pragma once

#include "remote.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace treeup {

// Classified body of a file upload response.
class upload_response {
 public:
  enum class kind {
    acknowledged,   // literal "d", plain upload
    hash_returned,  // alphanumeric content hash, at least 6 characters, hash requested
    malformed,      // anything else: empty body, HTML, JSON error object
    http_error,     // non-success HTTP status
  };

  upload_response(kind k, long status, std::string body) : _kind(k), _status(status), _body(std::move(body)) {}

  kind type() const { return _kind; }
  long status() const { return _status; }

  // Trimmed response body. For acknowledged and hash_returned this is the identifier.
  const std::string& body() const { return _body; }

  bool ok() const { return _kind == kind::acknowledged || _kind == kind::hash_returned; }

  // Human readable reason for failed responses.
  std::string describe() const;

 private:
  kind _kind;
  long _status;
  std::string _body;
};

// Classify a raw upload response. Without `want_hash` only the literal "d" is a success,
// with `want_hash` only a content hash is.
upload_response classify_upload_response(long status, const std::string& body, bool want_hash);

// Returns true if `value` is an alphanumeric string of at least 6 characters.
bool is_content_hash(const std::string& value);

// Parse a folder creation payload. Throws folder_create_error.
remote_folder parse_folder_response(const std::string& body);

// Parse a folder listing payload. Throws remote_error.
std::vector<remote_entry> parse_folder_listing(const std::string& body);

// Parse a semicolon-delimited key=value string. Whitespace around keys and values is removed.
std::map<std::string, std::string> parse_key_values(const std::string& text);

// Parse a login response body. The session cookie, if any, takes precedence over a session field.
// Throws remote_error.
login_result parse_login_response(const std::string& body, const std::string& session_cookie);

// Strip leading and trailing whitespace.
std::string trim(const std::string& s);

}  // namespace treeup
