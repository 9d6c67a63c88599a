#include "response.hpp"

#include "exception.hpp"

#include <cctype>
#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace treeup {

namespace {

// Returns a short excerpt of a response body for error messages.
std::string excerpt(const std::string& body) {
  constexpr size_t max_length = 80;
  if (body.size() <= max_length) return body;
  return body.substr(0, max_length) + "...";
}

std::string string_field(const json& object, const char* name) {
  auto it = object.find(name);
  if (it == object.end() || !it->is_string()) return "";
  return it->get<std::string>();
}

// Service errors come either as {"error": "text"} or {"error": {"message": "text"}}.
std::string error_field(const json& object) {
  auto it = object.find("error");
  if (it == object.end()) return "";
  if (it->is_string()) return it->get<std::string>();
  if (it->is_object() && it->contains("message") && (*it)["message"].is_string()) {
    return (*it)["message"].get<std::string>();
  }
  return it->dump();
}

}  // namespace

std::string trim(const std::string& s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return s.substr(begin, end - begin);
}

bool is_content_hash(const std::string& value) {
  if (value.size() < 6) return false;
  for (unsigned char c : value) {
    if (!std::isalnum(c)) return false;
  }
  return true;
}

std::string upload_response::describe() const {
  switch (_kind) {
    case kind::acknowledged:
      return "acknowledged";
    case kind::hash_returned:
      return "hash returned: " + _body;
    case kind::http_error:
      return "HTTP " + std::to_string(_status);
    case kind::malformed:
      if (_body.empty()) return "empty response";
      return "unexpected response: " + excerpt(_body);
  }
  return "unknown response";
}

upload_response classify_upload_response(long status, const std::string& body, bool want_hash) {
  std::string trimmed = trim(body);

  if (status < 200 || status >= 300) {
    return upload_response(upload_response::kind::http_error, status, trimmed);
  }

  // A plain upload is acknowledged with "d" only, a hash is only valid if one was asked for.
  if (!want_hash && trimmed == "d") {
    return upload_response(upload_response::kind::acknowledged, status, trimmed);
  }

  if (want_hash && is_content_hash(trimmed)) {
    return upload_response(upload_response::kind::hash_returned, status, trimmed);
  }

  // JSON error objects, HTML error pages and empty bodies all end up here.
  json payload = json::parse(trimmed, nullptr, false);
  if (!payload.is_discarded() && payload.is_object()) {
    std::string error = error_field(payload);
    if (!error.empty()) {
      return upload_response(upload_response::kind::malformed, status, "error: " + error);
    }
  }

  return upload_response(upload_response::kind::malformed, status, trimmed);
}

remote_folder parse_folder_response(const std::string& body) {
  json payload = json::parse(body, nullptr, false);
  if (payload.is_discarded()) {
    throw folder_create_error("malformed folder response: " + excerpt(trim(body)));
  }
  if (!payload.is_object()) {
    throw folder_create_error("malformed folder response: expected an object");
  }

  std::string error = error_field(payload);
  if (!error.empty()) {
    throw folder_create_error("folder creation rejected: " + error);
  }

  remote_folder folder;
  folder.hash = string_field(payload, "hash");
  folder.add_key = string_field(payload, "add_key");
  folder.edit_key = string_field(payload, "edit_key");

  if (folder.hash.empty()) {
    throw folder_create_error("malformed folder response: missing hash");
  }
  if (folder.add_key.empty() && folder.edit_key.empty()) {
    throw folder_create_error("malformed folder response: missing add_key and edit_key");
  }

  return folder;
}

std::vector<remote_entry> parse_folder_listing(const std::string& body) {
  json payload = json::parse(body, nullptr, false);
  if (payload.is_discarded()) {
    throw remote_error("malformed folder listing: " + excerpt(trim(body)));
  }

  if (payload.is_object()) {
    std::string error = error_field(payload);
    if (!error.empty()) {
      throw remote_error("folder listing rejected: " + error);
    }
    throw remote_error("malformed folder listing: expected an array");
  }
  if (!payload.is_array()) {
    throw remote_error("malformed folder listing: expected an array");
  }

  std::vector<remote_entry> entries;
  entries.reserve(payload.size());

  for (const auto& item : payload) {
    if (!item.is_object()) {
      throw remote_error("malformed folder listing: entry is not an object");
    }

    remote_entry entry;
    entry.name = string_field(item, "name");
    entry.hash = string_field(item, "hash");
    if (entry.name.empty() || entry.hash.empty()) {
      throw remote_error("malformed folder listing: entry without name or hash");
    }

    // Sizes are numbers or numeric strings depending on the endpoint version.
    auto size = item.find("size");
    if (size != item.end()) {
      if (size->is_number_unsigned()) {
        entry.size = size->get<uint64_t>();
      }
      else if (size->is_string()) {
        try {
          entry.size = std::stoull(size->get<std::string>());
        }
        catch (const std::exception&) {
          throw remote_error("malformed folder listing: invalid size for " + entry.name);
        }
      }
    }

    entry.is_folder = string_field(item, "type") == "folder" || item.value("is_folder", false);
    entries.push_back(std::move(entry));
  }

  return entries;
}

std::map<std::string, std::string> parse_key_values(const std::string& text) {
  std::map<std::string, std::string> values;

  size_t pos = 0;
  while (pos <= text.size()) {
    size_t end = text.find(';', pos);
    if (end == std::string::npos) end = text.size();

    std::string pair = text.substr(pos, end - pos);
    size_t eq = pair.find('=');
    if (eq != std::string::npos) {
      std::string key = trim(pair.substr(0, eq));
      if (!key.empty()) {
        values[key] = trim(pair.substr(eq + 1));
      }
    }

    pos = end + 1;
  }

  return values;
}

login_result parse_login_response(const std::string& body, const std::string& session_cookie) {
  std::string trimmed = trim(body);
  if (trimmed.empty()) {
    throw remote_error("login failed: empty response");
  }

  auto values = parse_key_values(trimmed);
  if (values.empty()) {
    throw remote_error("login failed: unexpected response: " + excerpt(trimmed));
  }

  auto status = values.find("status");
  if (status != values.end() && status->second != "ok") {
    std::string message = values.count("error") ? values["error"] : status->second;
    throw remote_error("login failed: " + message);
  }

  login_result result;
  result.base_folder.hash = values["hash"];
  result.base_folder.add_key = values.count("add_key") ? values["add_key"] : values["key"];
  result.base_folder.edit_key = values["edit_key"];
  result.session = session_cookie.empty() ? values["session"] : session_cookie;

  if (result.base_folder.hash.empty()) {
    throw remote_error("login failed: response does not contain a base folder hash");
  }

  return result;
}

}  // namespace treeup
