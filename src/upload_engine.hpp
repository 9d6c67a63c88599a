#pragma once

#include "path_mapper.hpp"
#include "progress.hpp"
#include "remote.hpp"
#include "upload_result.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <string>

namespace treeup {

// Cooperative cancellation flag. May be set from a signal handler or another thread;
// the engine checks it before each file upload and before each descent.
class cancel_token {
  std::atomic<bool> _cancelled{false};

 public:
  void cancel() { _cancelled.store(true); }
  bool cancelled() const { return _cancelled.load(); }
};

// State of one upload invocation: who we are, where the tree goes, and
// which local directories already have a remote folder. Create one per
// invocation; pass the same context again to reuse its folder cache.
// The client must be the one of the engine the context is passed to.
struct upload_context {
  credentials creds;
  remote_folder base_folder;
  path_mapper mapper;
  bool want_hashes = false;
  const cancel_token* cancel = nullptr;

  upload_context(
      remote_client& client, const credentials& creds, const remote_folder& base_folder,
      access_type access = access_type::link)
      : creds(creds), base_folder(base_folder), mapper(client, access) {}

  bool cancelled() const { return cancel != nullptr && cancel->cancelled(); }
};

// Uploads files and directory trees, one network operation at a time.
class upload_engine {
  remote_client& _client;
  progress_sink& _sink;

 public:
  upload_engine(remote_client& client, progress_sink& sink);

  // Uploads one file directly into an existing remote folder. No folders are created.
  // The returned identifier is recorded in `uploaded` regardless of hash tracking.
  upload_result upload_single_file(
      const std::filesystem::path& path,
      const std::string& folder_hash,
      const std::string& folder_key,
      bool want_hash = false,
      const cancel_token* cancel = nullptr);

  // Mirrors the directory `root` below the remote folder `parent_hash` and uploads every regular file.
  upload_result upload_folder_recursive(
      const std::filesystem::path& root,
      const std::string& parent_hash,
      const credentials& creds,
      bool want_hashes);

  // As above, using an explicit context. Directories already present in the
  // context's folder cache are reused without contacting the remote.
  // A context created for another client is rejected without any remote call.
  upload_result upload_folder_recursive(const std::filesystem::path& path, upload_context& context);

 private:
  struct run_state;

  upload_result upload_directory(const std::filesystem::path& dir, const remote_folder& parent, run_state& run);
  void upload_file(const std::filesystem::path& path, uint64_t size, const remote_folder& folder, run_state& run,
                   upload_result& result);
};

}  // namespace treeup
