#ifndef __PT_PSEUDO_TERMINAL__
#define __PT_PSEUDO_TERMINAL__

#include "Headers.hpp"

namespace pt {
/**
 * @brief Fully resolved program launch: what to exec, with which argv and
 * environment, and in which directory.
 */
struct LaunchPlan {
  string program;
  vector<string> argv;
  vector<string> environment;
  string cwd;
};

/**
 * @brief A child process attached to the subordinate side of a pty.
 *
 * The object owns the master descriptor, which doubles as the input writer.
 * `hangup()` closes it so children that ignore SIGHUP still see end-of-file
 * on their input. When a reader is inside `readOutput()` the close is left to
 * that reader, which finishes within one poll interval.
 */
class PseudoTerminal {
 public:
  PseudoTerminal();
  virtual ~PseudoTerminal();

  /**
   * @brief Opens the pty, forks and execs the plan.
   * @throws SpawnFailure when the pty cannot be opened, the working directory
   * cannot be entered or the program cannot be executed. Nothing is left
   * running in that case.
   */
  void start(const LaunchPlan& plan, int cols, int rows);

  /**
   * @brief Blocks until output is available and copies it into `buf`.
   * @return Bytes read, or 0 once the terminal reached end-of-stream or was
   * closed through `hangup()`.
   */
  ssize_t readOutput(char* buf, size_t count);

  /**
   * @brief Writes every byte to the terminal's input.
   * @throws std::runtime_error when the write fails or the terminal was closed.
   */
  void writeInput(const char* buf, size_t count);

  /** @brief Applies a new window size (TIOCSWINSZ). */
  void setSize(int cols, int rows);

  /**
   * @brief Sends SIGHUP to the child's whole process group and closes the
   * master descriptor.
   */
  void hangup();

  /** @brief SIGKILL to the process group and close, used on shutdown. */
  void forceKill();

  /**
   * @brief Reaps the child, blocking until it exits.
   * @return The raw wait status.
   */
  int waitForExit();

  inline pid_t getPid() const { return childPid; }
  inline bool isClosed() const { return closed; }
  inline bool hasExited() const { return exited; }

 protected:
  void signalGroup(int signum);
  ssize_t readFromMaster(int fd, char* buf, size_t count);
  void closeMaster();

  // Guards masterFd and readerActive
  mutex fdMutex;
  int masterFd;
  bool readerActive;
  pid_t childPid;
  atomic<bool> closed;
  atomic<bool> exited;
};
}  // namespace pt

#endif  // __PT_PSEUDO_TERMINAL__
