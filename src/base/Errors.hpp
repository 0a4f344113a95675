#ifndef __PT_ERRORS__
#define __PT_ERRORS__

#include "Headers.hpp"

namespace pt {
/** @brief Raised by write/getBuffer when the session id is not registered. */
class SessionNotFound : public std::runtime_error {
 public:
  explicit SessionNotFound(const string& id)
      : std::runtime_error("Terminal not found: " + id), sessionId(id) {}

  const string& getSessionId() const { return sessionId; }

 protected:
  string sessionId;
};

/** @brief The pty or the child process could not be created. */
class SpawnFailure : public std::runtime_error {
 public:
  explicit SpawnFailure(const string& what) : std::runtime_error(what) {}
};

/** @brief Transient: opening or handshaking the relay socket failed. */
class RelayConnectFailure : public std::runtime_error {
 public:
  explicit RelayConnectFailure(const string& what) : std::runtime_error(what) {}
};

/** @brief An inbound relay frame could not be decoded. */
class ProtocolDecodeError : public std::runtime_error {
 public:
  explicit ProtocolDecodeError(const string& what) : std::runtime_error(what) {}
};

/** @brief Relay configuration could not be read from or written to storage. */
class ConfigPersistenceError : public std::runtime_error {
 public:
  explicit ConfigPersistenceError(const string& what)
      : std::runtime_error(what) {}
};
}  // namespace pt

#endif  // __PT_ERRORS__
