#pragma once

#include <stdexcept>
#include <string>

namespace treeup {

class exception : public std::runtime_error {
 public:
  explicit exception(const std::string& message) : std::runtime_error(message) {}
};

class unsupported_operation : public exception {
 public:
  explicit unsupported_operation(const std::string& message) : exception(message) {}
};

// Missing or incomplete credentials or target folder identity.
class configuration_error : public exception {
 public:
  explicit configuration_error(const std::string& message) : exception(message) {}
};

// Remote folder creation failed or the service returned a malformed payload.
class folder_create_error : public exception {
 public:
  explicit folder_create_error(const std::string& message) : exception(message) {}
};

// A single file upload failed.
class upload_error : public exception {
 public:
  explicit upload_error(const std::string& message) : exception(message) {}
};

// A local path vanished or became unreadable during a run.
class traversal_error : public exception {
 public:
  explicit traversal_error(const std::string& message) : exception(message) {}
};

// Login, listing or transport failure outside of the upload engine.
class remote_error : public exception {
 public:
  explicit remote_error(const std::string& message) : exception(message) {}
};

}  // namespace treeup
