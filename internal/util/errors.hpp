#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace relaystore::util {

/*
  Central error types.

  All of these are fatal to startup; main() logs them and exits non-zero.
*/

class DatabaseError : public std::runtime_error {
 public:
  explicit DatabaseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MalformedEvent : public std::runtime_error {
 public:
  explicit MalformedEvent(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MigrationFailed : public std::runtime_error {
 public:
  MigrationFailed(int64_t serial_number, const std::string& msg)
      : std::runtime_error("migration " + std::to_string(serial_number) + " failed: " + msg), serial_number_(serial_number) {
  }

  int64_t serial_number() const {
    return serial_number_;
  }

 private:
  int64_t serial_number_;
};

class BackfillFailed : public std::runtime_error {
 public:
  explicit BackfillFailed(const std::string& msg) : std::runtime_error("backfill failed: " + msg) {
  }
};

} // namespace relaystore::util
