#pragma once

#include <stdexcept>
#include <string>

namespace modstore::util {

/*
  Central error types.

  The worker pool maps these to version status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed module graph. Not retried until the producer resubmits.
class InvalidModule : public std::runtime_error {
 public:
  explicit InvalidModule(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The store already holds unit or license paths that the new graph lacks.
class IncompleteResubmission : public InvalidModule {
 public:
  explicit IncompleteResubmission(const std::string& msg) : InvalidModule(msg) {
  }
};

// Connection, busy, serialization or deadlock failures. Retried with backoff.
class TransientStoreFailure : public std::runtime_error {
 public:
  explicit TransientStoreFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The fetched module declares a different canonical path.
class AlternativeModule : public std::runtime_error {
 public:
  AlternativeModule(const std::string& msg, std::string canonical_path)
      : std::runtime_error(msg), canonical_path_(std::move(canonical_path)) {
  }

  const std::string& CanonicalPath() const {
    return canonical_path_;
  }

 private:
  std::string canonical_path_;
};

class NotInTransaction : public std::logic_error {
 public:
  explicit NotInTransaction(const std::string& msg) : std::logic_error(msg) {
  }
};

} // namespace modstore::util
