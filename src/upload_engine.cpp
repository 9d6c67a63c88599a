#include "upload_engine.hpp"

#include "directory_listing.hpp"
#include "exception.hpp"
#include "filesystem.hpp"
#include "log.hpp"

#include <memory>
#include <string>

namespace treeup {

struct upload_engine::run_state {
  upload_context& context;
  progress_tracker& tracker;
  size_t items_done = 0;
};

upload_engine::upload_engine(remote_client& client, progress_sink& sink) : _client(client), _sink(sink) {}

upload_result upload_engine::upload_single_file(
    const std::filesystem::path& path,
    const std::string& folder_hash,
    const std::string& folder_key,
    bool want_hash,
    const cancel_token* cancel) {
  if (folder_hash.empty()) return upload_result::aborted("configuration error: missing base folder hash");
  if (folder_key.empty()) return upload_result::aborted("configuration error: missing folder key");

  file_stat st;
  try {
    treeup::stat(path, st);
  }
  catch (const traversal_error& e) {
    return upload_result::aborted(e.what());
  }
  if (st.type == entry_type::missing) return upload_result::aborted("no such file: " + path.string());
  if (st.type != entry_type::regular) return upload_result::aborted("not a regular file: " + path.string());

  upload_result result;
  if (cancel != nullptr && cancel->cancelled()) {
    result.cancelled = true;
    result.finalize();
    return result;
  }

  {
    progress_tracker tracker(_sink, path.string(), st.size);
    try {
      std::string id = _client.upload_file(
          path, folder_hash, folder_key, want_hash, [&tracker](uint64_t sent, uint64_t total) {
            tracker.update(sent, total);
          });
      tracker.update(st.size, st.size);
      result.add_success(path, id, true);
      log(log_level::debug) << "uploaded " << path.string() << ": " << id << std::endl;
    }
    catch (const exception& e) {
      result.add_failure(path, e.what(), failure_kind::file);
      log(log_level::warn) << e.what() << std::endl;
    }
  }

  result.finalize();
  log(log_level::info) << path.string() << ": " << result.summary() << std::endl;
  return result;
}

upload_result upload_engine::upload_folder_recursive(
    const std::filesystem::path& root,
    const std::string& parent_hash,
    const credentials& creds,
    bool want_hashes) {
  remote_folder parent;
  parent.hash = parent_hash;

  upload_context context(_client, creds, parent);
  context.want_hashes = want_hashes;
  return upload_folder_recursive(root, context);
}

upload_result upload_engine::upload_folder_recursive(const std::filesystem::path& path, upload_context& context) {
  if (&context.mapper.client() != &_client) {
    return upload_result::aborted("upload context belongs to a different remote client");
  }
  if (context.creds.username.empty()) return upload_result::aborted("configuration error: missing username");
  if (context.creds.password.empty()) return upload_result::aborted("configuration error: missing password");
  if (context.base_folder.hash.empty()) {
    return upload_result::aborted("configuration error: missing base folder hash");
  }

  std::filesystem::path root;
  file_stat st;
  try {
    root = path_mapper::normalize(path);
    treeup::stat(root, st);
  }
  catch (const traversal_error& e) {
    return upload_result::aborted(e.what());
  }
  if (st.type == entry_type::missing) return upload_result::aborted("no such directory: " + root.string());
  if (st.type != entry_type::directory) return upload_result::aborted("not a directory: " + root.string());

  upload_result result;
  {
    progress_tracker tracker(_sink, root.string(), count_files(root));
    run_state run{context, tracker};

    result = upload_directory(root, context.base_folder, run);
  }

  if (const remote_folder* folder = context.mapper.find(root)) {
    result.root_folder = *folder;
  }

  result.finalize();
  log(log_level::info) << root.string() << ": " << result.summary() << std::endl;
  return result;
}

upload_result upload_engine::upload_directory(
    const std::filesystem::path& dir, const remote_folder& parent, run_state& run) {
  upload_result result;

  if (run.context.cancelled()) {
    result.cancelled = true;
    return result;
  }

  // Resolve the remote folder. Any failure here skips the whole subtree.
  remote_folder folder;
  {
    progress_tracker tracker(_sink, "folder " + dir.string(), 1);
    try {
      file_stat st;
      treeup::stat(dir, st);
      if (st.type != entry_type::directory) {
        throw traversal_error("directory vanished: " + dir.string());
      }

      bool cached = run.context.mapper.contains(dir);
      folder = run.context.mapper.resolve(dir, parent, run.context.creds);
      if (!cached) {
        ++result.folders_created;
      }
      tracker.update(1);
    }
    catch (const exception& e) {
      result.add_failure(dir, e.what(), failure_kind::folder);
      log(log_level::warn) << "skipping " << dir.string() << ": " << e.what() << std::endl;
      return result;
    }
  }

  std::unique_ptr<directory_listing> listing;
  try {
    listing = std::make_unique<directory_listing>(dir);
  }
  catch (const traversal_error& e) {
    result.add_failure(dir, e.what(), failure_kind::folder);
    log(log_level::warn) << "skipping " << dir.string() << ": " << e.what() << std::endl;
    return result;
  }

  // Files of this level first, then descend.
  for (const auto& file : listing->files()) {
    if (run.context.cancelled()) {
      result.cancelled = true;
      return result;
    }
    upload_file(file.path, file.size, folder, run, result);
  }

  for (const auto& child : listing->directories()) {
    if (run.context.cancelled()) {
      result.cancelled = true;
      return result;
    }
    result.merge(upload_directory(child.path, folder, run));
  }

  return result;
}

void upload_engine::upload_file(
    const std::filesystem::path& path, uint64_t size, const remote_folder& folder, run_state& run,
    upload_result& result) {
  {
    progress_tracker tracker(_sink, path.string(), size);
    try {
      file_stat st;
      treeup::stat(path, st);
      if (st.type != entry_type::regular) {
        throw traversal_error("file vanished: " + path.string());
      }

      std::string id = _client.upload_file(
          path, folder.hash, folder.upload_key(), run.context.want_hashes, [&tracker](uint64_t sent, uint64_t total) {
            tracker.update(sent, total);
          });
      tracker.update(st.size, st.size);
      result.add_success(path, id, run.context.want_hashes);
      log(log_level::debug) << "uploaded " << path.string() << ": " << id << std::endl;
    }
    catch (const exception& e) {
      result.add_failure(path, e.what(), failure_kind::file);
      log(log_level::warn) << e.what() << std::endl;
    }
  }

  run.tracker.update(++run.items_done);
}

}  // namespace treeup
