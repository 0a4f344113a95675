#ifndef __PT_TERMINAL_SESSION__
#define __PT_TERMINAL_SESSION__

#include "Headers.hpp"
#include "PseudoTerminal.hpp"
#include "RingBuffer.hpp"

namespace pt {
enum class SessionKind { SHELL, ASSISTANT };

inline string sessionKindToString(SessionKind kind) {
  return kind == SessionKind::ASSISTANT ? "assistant" : "shell";
}

/** @brief Parameters for `SessionRegistry::spawn`. */
struct SpawnRequest {
  /** @brief Command line; empty means the user's login shell. */
  string shell;
  string cwd;
  /** @brief Zero means the 80x24 default. */
  int cols = 0;
  int rows = 0;
  /** @brief When set, passed verbatim instead of splitting `shell`. */
  optional<vector<string>> args;
  /** @brief When unset the kind is detected from the program name. */
  optional<SessionKind> kind;
};

/** @brief Row returned by `SessionRegistry::list`. */
struct SessionInfo {
  string id;
  string title;
  string cwd;
  SessionKind kind;
};

/**
 * @brief Live state of one managed pseudo-terminal process.
 *
 * Owned by the registry; the pump and supervisor workers keep a reference
 * only for as long as they run.
 */
struct TerminalSession {
  string id;
  string title;
  string cwd;
  SessionKind kind;
  uint64_t sequence;
  shared_ptr<PseudoTerminal> terminal;
  shared_ptr<RingBuffer> output;
  /** @brief Serializes writers so input chunks are never interleaved. */
  mutex writeMutex;
  /** @brief Fulfilled by the output pump once it has stopped reading. */
  promise<void> pumpFinished;
  shared_future<void> drained;

  SessionInfo info() const { return SessionInfo{id, title, cwd, kind}; }
};
}  // namespace pt

#endif  // __PT_TERMINAL_SESSION__
