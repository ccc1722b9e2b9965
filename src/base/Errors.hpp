#ifndef __BURROW_ERRORS__
#define __BURROW_ERRORS__

#include <stdint.h>

#include <stdexcept>
#include <string>

namespace burrow {
/**
 * @brief Base for failures that are reported back to the caller of a command
 * instead of being fatal. `kind()` is the tag sent over the wire.
 */
class CommandError : public std::runtime_error {
 public:
  explicit CommandError(const std::string& what)
      : std::runtime_error(what) {}
  virtual ~CommandError() {}
  virtual const char* kind() const { return "BadCommand"; }
};

/** @brief The session id is not (or no longer) in the registry. */
class SessionNotFoundError : public CommandError {
 public:
  explicit SessionNotFoundError(const std::string& sessionId)
      : CommandError("Session not found: " + sessionId) {}
  const char* kind() const override { return "SessionNotFound"; }
};

/** @brief The shell process could not be created. */
class SpawnFailureError : public CommandError {
 public:
  explicit SpawnFailureError(const std::string& what) : CommandError(what) {}
  const char* kind() const override { return "SpawnFailure"; }
};

/** @brief A read/write/resize syscall failed on an established session. */
class IoError : public CommandError {
 public:
  explicit IoError(const std::string& what) : CommandError(what) {}
  const char* kind() const override { return "IoError"; }
};

/** @brief A search with the same id is still running. */
class DuplicateSearchError : public CommandError {
 public:
  explicit DuplicateSearchError(uint32_t searchId)
      : CommandError("Search already running: " + std::to_string(searchId)) {}
  const char* kind() const override { return "DuplicateSearch"; }
};
}  // namespace burrow

#endif  // __BURROW_ERRORS__
