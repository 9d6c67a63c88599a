#include "upload_result.hpp"

#include <algorithm>
#include <sstream>

namespace treeup {

void upload_result::add_success(const std::filesystem::path& path, const std::string& identifier, bool track) {
  ++files_attempted;
  ++files_succeeded;
  if (track) {
    uploaded.push_back(uploaded_file{path, identifier});
  }
}

void upload_result::add_failure(const std::filesystem::path& path, const std::string& message, failure_kind kind) {
  if (kind == failure_kind::file) {
    ++files_attempted;
  }
  failures.push_back(upload_failure{path, message, kind});
}

void upload_result::merge(const upload_result& other) {
  files_attempted += other.files_attempted;
  files_succeeded += other.files_succeeded;
  folders_created += other.folders_created;
  cancelled = cancelled || other.cancelled;
  uploaded.insert(uploaded.end(), other.uploaded.begin(), other.uploaded.end());
  failures.insert(failures.end(), other.failures.begin(), other.failures.end());
}

void upload_result::finalize() {
  success = error.empty() && !cancelled && failures.empty() && files_attempted == files_succeeded;
}

size_t upload_result::count_failures(failure_kind kind) const {
  return std::count_if(failures.begin(), failures.end(), [kind](const upload_failure& f) { return f.kind == kind; });
}

std::string upload_result::summary() const {
  std::ostringstream ss;
  if (!error.empty()) {
    ss << "aborted: " << error;
    return ss.str();
  }

  ss << "uploaded " << files_succeeded << " of " << files_attempted << " file" << (files_attempted == 1 ? "" : "s");
  if (folders_created > 0) {
    ss << ", " << folders_created << " folder" << (folders_created == 1 ? "" : "s") << " created";
  }
  if (!failures.empty()) {
    ss << ", " << failures.size() << " failure" << (failures.size() == 1 ? "" : "s");
  }
  if (cancelled) {
    ss << ", cancelled";
  }
  return ss.str();
}

upload_result upload_result::aborted(const std::string& message) {
  upload_result result;
  result.error = message;
  result.success = false;
  return result;
}

}  // namespace treeup
