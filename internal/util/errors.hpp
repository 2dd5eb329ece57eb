#pragma once

#include <stdexcept>
#include <string>

namespace pgshadow::util {

/*
  Central error types.

  main() maps these to exit codes:
    ValidationError, ConfigError, MigrationConflict -> 1 (user error)
    everything else                                 -> 2 (fatal / aborted)
*/

// Bad DDL, missing table, missing primary key, unsupported dependents.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Bad configuration or a role lacking a required capability.
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Another migration already owns the table.
class MigrationConflict : public std::runtime_error {
 public:
  explicit MigrationConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Retryable database condition that outlived its retry budget.
class TransientError : public std::runtime_error {
 public:
  explicit TransientError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Swap failed; the catalog may need operator attention.
class CutoverError : public std::runtime_error {
 public:
  explicit CutoverError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace pgshadow::util
