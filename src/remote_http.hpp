#pragma once

#include "remote.hpp"
#include "url.hpp"

#include <string>
#include <utility>
#include <vector>

namespace treeup {

// Remote client speaking the file host's HTTP API through libcurl.
// Every call blocks until the request completes or times out.
class remote_http : public remote_client {
 public:
  remote_http(const url& remote_url, const remote_options& options);
  ~remote_http() override;

  login_result login(const credentials& creds) override;

  remote_folder create_folder(
      const std::string& name,
      const std::string& parent_hash,
      const credentials& creds,
      access_type access) override;

  std::string upload_file(
      const std::filesystem::path& path,
      const std::string& folder_hash,
      const std::string& key,
      bool want_hash,
      const transfer_callback& progress = nullptr) override;

  std::vector<remote_entry> list_folder(const std::string& folder_hash, bool include_folders) override;

  // Endpoint URLs, exposed for tests.
  url login_url() const;
  url create_folder_url() const;
  url upload_url(const std::string& folder_hash, const std::string& key, bool want_hash) const;
  url list_url(const std::string& folder_hash, bool include_folders) const;

 private:
  struct response {
    long status = 0;
    std::string body;
    std::string session_cookie;
  };

  // POST an url-encoded form and collect the response. Throws remote_error on transport errors.
  response post_form(const url& endpoint, const std::vector<std::pair<std::string, std::string>>& fields);

  // GET an url and collect the response. Throws remote_error on transport errors.
  response get(const url& endpoint);

 private:
  url _remote_url;
  remote_options _options;
};

}  // namespace treeup
