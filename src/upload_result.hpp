#pragma once

#include "remote.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace treeup {

enum class failure_kind {
  file,    // upload failed or the file vanished
  folder,  // remote folder creation failed or the directory vanished; its subtree was skipped
};

struct upload_failure {
  std::filesystem::path path;
  std::string message;
  failure_kind kind = failure_kind::file;
};

struct uploaded_file {
  std::filesystem::path path;
  std::string identifier;  // "d" or the content hash
};

// Aggregate outcome of one upload invocation.
struct upload_result {
  bool success = false;
  size_t files_attempted = 0;
  size_t files_succeeded = 0;
  size_t folders_created = 0;
  bool cancelled = false;

  // Fatal precondition failure (configuration, missing root). No work was done if set.
  std::string error;

  // Remote folder the local root was mapped to. Empty for single file uploads.
  remote_folder root_folder;

  std::vector<uploaded_file> uploaded;
  std::vector<upload_failure> failures;

  void add_success(const std::filesystem::path& path, const std::string& identifier, bool track);
  void add_failure(const std::filesystem::path& path, const std::string& message, failure_kind kind);

  // Fold a partial result of a subtree into this one.
  void merge(const upload_result& other);

  // Compute the success flag from the collected counters.
  void finalize();

  size_t files_failed() const { return files_attempted - files_succeeded; }
  size_t count_failures(failure_kind kind) const;

  // One line summary, e.g. "uploaded 3 of 4 files, 2 folders created, 1 failure".
  std::string summary() const;

  static upload_result aborted(const std::string& message);
};

}  // namespace treeup
