#include "remote_http.hpp"

#include "exception.hpp"
#include "log.hpp"
#include "response.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>

#include <curl/curl.h>
#include <strings.h>

namespace treeup {

namespace {

const char* const login_path = "/api_v2/login.php";
const char* const create_folder_path = "/api_v2/create_folder.php";
const char* const upload_path = "/save_file.php";
const char* const list_path = "/api_v2/get_file_list.php";
const char* const session_cookie_name = "PHPSESSID";

// RAII wrapper for CURL
class CURLHandle {
 public:
  CURLHandle() : handle_(curl_easy_init()) {
    if (!handle_) {
      throw remote_error("failed to initialize CURL");
    }
  }

  ~CURLHandle() {
    if (handle_) {
      curl_easy_cleanup(handle_);
    }
  }

  CURLHandle(const CURLHandle&) = delete;
  CURLHandle& operator=(const CURLHandle&) = delete;

  CURL* get() const { return handle_; }

 private:
  CURL* handle_;
};

// RAII wrapper for a multipart form
class MimeHandle {
 public:
  explicit MimeHandle(CURL* curl) : mime_(curl_mime_init(curl)) {
    if (!mime_) {
      throw upload_error("failed to initialize multipart form");
    }
  }

  ~MimeHandle() { curl_mime_free(mime_); }

  MimeHandle(const MimeHandle&) = delete;
  MimeHandle& operator=(const MimeHandle&) = delete;

  curl_mime* get() const { return mime_; }

 private:
  curl_mime* mime_;
};

// Callback to collect the response body into a string
size_t StringWriteCallback(char* ptr, size_t size, size_t nmemb, void* userp) {
  static_cast<std::string*>(userp)->append(ptr, size * nmemb);
  return size * nmemb;
}

// Callback to pick the session cookie out of the response headers
size_t CookieHeaderCallback(char* buffer, size_t size, size_t nitems, void* userp) {
  std::string header(buffer, size * nitems);
  std::string* cookie = static_cast<std::string*>(userp);

  const std::string prefix = "set-cookie:";
  if (header.size() > prefix.size() && strncasecmp(header.c_str(), prefix.c_str(), prefix.size()) == 0) {
    auto values = parse_key_values(header.substr(prefix.size()));
    auto it = values.find(session_cookie_name);
    if (it != values.end()) {
      *cookie = it->second;
    }
  }
  return size * nitems;
}

// Callback forwarding upload progress
int TransferInfoCallback(void* userp, curl_off_t, curl_off_t, curl_off_t ultotal, curl_off_t ulnow) {
  const transfer_callback* progress = static_cast<const transfer_callback*>(userp);
  if (*progress && ultotal > 0) {
    (*progress)(static_cast<uint64_t>(ulnow), static_cast<uint64_t>(ultotal));
  }
  return 0;
}

// Global libcurl state, initialized once per process.
struct CURLGlobal {
  CURLGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
  ~CURLGlobal() { curl_global_cleanup(); }
};

void set_common_options(CURL* curl, const remote_options& options, std::string* body) {
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.connect_timeout.count()));
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(options.timeout.count()));
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);
  curl_easy_setopt(curl, CURLOPT_VERBOSE, 0L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, StringWriteCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, body);
}

}  // namespace

remote_http::remote_http(const url& remote_url, const remote_options& options)
    : _remote_url(remote_url), _options(options) {
  static CURLGlobal global;
}

remote_http::~remote_http() = default;

url remote_http::login_url() const { return _remote_url.join(login_path); }

url remote_http::create_folder_url() const { return _remote_url.join(create_folder_path); }

url remote_http::upload_url(const std::string& folder_hash, const std::string& key, bool want_hash) const {
  std::vector<std::pair<std::string, std::string>> params = {{"up_id", folder_hash}, {"key", key}};
  if (want_hash) {
    params.emplace_back("get_file_hash", "");
  }
  return _remote_url.join(upload_path).with_query(params);
}

url remote_http::list_url(const std::string& folder_hash, bool include_folders) const {
  std::vector<std::pair<std::string, std::string>> params = {{"hash", folder_hash}};
  if (include_folders) {
    params.emplace_back("include_folders", "1");
  }
  return _remote_url.join(list_path).with_query(params);
}

remote_http::response remote_http::post_form(
    const url& endpoint, const std::vector<std::pair<std::string, std::string>>& fields) {
  CURLHandle curl;
  response res;
  std::string body = form_encode(fields);

  curl_easy_setopt(curl.get(), CURLOPT_URL, endpoint.string().c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, CookieHeaderCallback);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &res.session_cookie);
  set_common_options(curl.get(), _options, &res.body);

  CURLcode code = curl_easy_perform(curl.get());
  if (code != CURLE_OK) {
    throw remote_error("request failed: " + endpoint.path() + ": CURL error: " + curl_easy_strerror(code));
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &res.status);
  return res;
}

remote_http::response remote_http::get(const url& endpoint) {
  CURLHandle curl;
  response res;

  curl_easy_setopt(curl.get(), CURLOPT_URL, endpoint.string().c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  set_common_options(curl.get(), _options, &res.body);

  CURLcode code = curl_easy_perform(curl.get());
  if (code != CURLE_OK) {
    throw remote_error("request failed: " + endpoint.path() + ": CURL error: " + curl_easy_strerror(code));
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &res.status);
  return res;
}

login_result remote_http::login(const credentials& creds) {
  log(log_level::debug) << "logging in as " << creds.username << std::endl;

  response res = post_form(login_url(), {{"user", creds.username}, {"pass", creds.password}});
  if (res.status != 200) {
    throw remote_error("login failed: HTTP " + std::to_string(res.status));
  }

  return parse_login_response(res.body, res.session_cookie);
}

remote_folder remote_http::create_folder(
    const std::string& name, const std::string& parent_hash, const credentials& creds, access_type access) {
  log(log_level::debug) << "creating folder: " << name << " in " << parent_hash << std::endl;

  response res;
  try {
    res = post_form(
        create_folder_url(),
        {{"user", creds.username},
         {"pass", creds.password},
         {"folder_name", name},
         {"parent_hash", parent_hash},
         {"access_type", to_string(access)}});
  }
  catch (const remote_error& e) {
    throw folder_create_error("failed to create folder: " + name + ": " + e.what());
  }

  if (res.status != 200 && res.status != 201) {
    throw folder_create_error("failed to create folder: " + name + ": HTTP " + std::to_string(res.status));
  }

  return parse_folder_response(res.body);
}

std::string remote_http::upload_file(
    const std::filesystem::path& path,
    const std::string& folder_hash,
    const std::string& key,
    bool want_hash,
    const transfer_callback& progress) {
  // Probe the file first, libcurl only reports unreadable files as a generic read error.
  {
    std::ifstream infile(path, std::ios::binary);
    if (!infile.is_open()) {
      throw upload_error("failed to open file for reading: " + path.string() + ": " + std::strerror(errno));
    }
  }

  url endpoint = upload_url(folder_hash, key, want_hash);
  CURLHandle curl;
  MimeHandle form(curl.get());
  std::string body;

  curl_mimepart* part = curl_mime_addpart(form.get());
  curl_mime_name(part, "file");
  CURLcode code = curl_mime_filedata(part, path.c_str());
  if (code != CURLE_OK) {
    throw upload_error("failed to attach file: " + path.string() + ": " + curl_easy_strerror(code));
  }
  curl_mime_filename(part, path.filename().c_str());

  curl_easy_setopt(curl.get(), CURLOPT_URL, endpoint.string().c_str());
  curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, form.get());
  set_common_options(curl.get(), _options, &body);

  if (progress) {
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, TransferInfoCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &progress);
  }

  code = curl_easy_perform(curl.get());
  if (code != CURLE_OK) {
    throw upload_error("failed to upload file: " + path.string() + ": CURL error: " + curl_easy_strerror(code));
  }

  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);

  upload_response result = classify_upload_response(status, body, want_hash);
  if (!result.ok()) {
    throw upload_error("failed to upload file: " + path.string() + ": " + result.describe());
  }

  return result.body();
}

std::vector<remote_entry> remote_http::list_folder(const std::string& folder_hash, bool include_folders) {
  response res = get(list_url(folder_hash, include_folders));
  if (res.status != 200) {
    throw remote_error("failed to list folder: " + folder_hash + ": HTTP " + std::to_string(res.status));
  }

  return parse_folder_listing(res.body);
}

}  // namespace treeup
