#ifndef __PT_COMMAND_RESOLVER__
#define __PT_COMMAND_RESOLVER__

#include "Headers.hpp"
#include "PseudoTerminal.hpp"
#include "TerminalSession.hpp"

namespace pt {
/** @brief A launch plan plus the metadata shown for the session. */
struct ResolvedCommand {
  LaunchPlan plan;
  string title;
  SessionKind kind;
};

/**
 * @brief Turns a `SpawnRequest` into something `execve` can run.
 *
 * Desktop hosts are often started without the user's interactive PATH, so the
 * search path is widened with the usual per-user tool directories. Programs
 * that still cannot be found are handed to the user's shell, which may know
 * them as functions or aliases.
 */
class CommandResolver {
 public:
  CommandResolver();
  /** @brief Resolves against an explicit environment (`KEY=VALUE` entries). */
  CommandResolver(const vector<string>& _environment, const string& _homeDir);
  virtual ~CommandResolver() {}

  virtual ResolvedCommand resolve(const SpawnRequest& request) const;

  /** @brief PATH of the parent plus the per-user tool directories. */
  string augmentedPath() const;

  /** @brief Absolute path of `program` if it names an executable in PATH. */
  optional<string> findInPath(const string& program) const;

  /** @brief `$SHELL`, or `/bin/bash` when unset. */
  string userShell() const;

  optional<string> getEnv(const string& key) const;

  static bool isAssistantProgram(const string& program);

  /** @brief Single-quotes `arg` for a POSIX shell command line. */
  static string shellQuote(const string& arg);

 protected:
  vector<string> childEnvironment() const;

  vector<string> environment;
  string homeDir;
};
}  // namespace pt

#endif  // __PT_COMMAND_RESOLVER__
