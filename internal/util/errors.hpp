#pragma once

#include <stdexcept>
#include <string>

namespace expiringdict::util {

/*
  Central error types.

  Everything the library throws derives from std::runtime_error.
  NotFound is ordinary control flow; the rest abort the operation
  (and, through Session, the transaction).
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& key) : std::runtime_error("key not found: " + key), key_(key) {
  }

  const std::string& Key() const {
    return key_;
  }

 private:
  std::string key_;
};

class InvalidIdentifier : public std::runtime_error {
 public:
  explicit InvalidIdentifier(const std::string& msg) : std::runtime_error(msg) {
  }
};

class IncompatibleFile : public std::runtime_error {
 public:
  explicit IncompatibleFile(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnsupportedSchema : public std::runtime_error {
 public:
  explicit UnsupportedSchema(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ReadOnlyViolation : public std::runtime_error {
 public:
  explicit ReadOnlyViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DirectoryNotFound : public std::runtime_error {
 public:
  explicit DirectoryNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ReentrancyViolation : public std::runtime_error {
 public:
  explicit ReentrancyViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SerializationError : public std::runtime_error {
 public:
  explicit SerializationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// sqlite failure; Code() is the sqlite (extended) result code
class DatabaseError : public std::runtime_error {
 public:
  DatabaseError(const std::string& msg, int code) : std::runtime_error(msg), code_(code) {
  }

  int Code() const {
    return code_;
  }

 private:
  int code_;
};

} // namespace expiringdict::util
