#include "PseudoTerminal.hpp"

#include "Errors.hpp"

namespace pt {
namespace {
// Stage tags written through the error pipe by a child that failed to start
const int CHILD_STAGE_CHDIR = 1;
const int CHILD_STAGE_EXEC = 2;

struct ChildFailure {
  int stage;
  int err;
};

// Serializes fork with the close-on-exec setup of descriptors opened around
// it, so no sibling child inherits another session's master
mutex forkMutex;

vector<char*> toCStrings(const vector<string>& strings) {
  vector<char*> result;
  result.reserve(strings.size() + 1);
  for (const auto& s : strings) {
    result.push_back(const_cast<char*>(s.c_str()));
  }
  result.push_back(NULL);
  return result;
}

void reportChildFailure(int fd, int stage) {
  ChildFailure failure = {stage, errno};
  ssize_t ignored = ::write(fd, &failure, sizeof(failure));
  (void)ignored;
  _exit(127);
}
}  // namespace

PseudoTerminal::PseudoTerminal()
    : masterFd(-1),
      readerActive(false),
      childPid(-1),
      closed(false),
      exited(false) {}

PseudoTerminal::~PseudoTerminal() {
  lock_guard<mutex> guard(fdMutex);
  if (masterFd >= 0) {
    ::close(masterFd);
    masterFd = -1;
  }
}

void PseudoTerminal::start(const LaunchPlan& plan, int cols, int rows) {
  if (plan.argv.empty()) {
    throw SpawnFailure("Empty argument vector for " + plan.program);
  }

  // Everything the child touches is prepared before fork: only
  // async-signal-safe calls are allowed on the other side.
  vector<char*> argv = toCStrings(plan.argv);
  vector<char*> envp = toCStrings(plan.environment);
  const char* program = plan.program.c_str();
  const char* cwd = plan.cwd.empty() ? NULL : plan.cwd.c_str();

  winsize win;
  memset(&win, 0, sizeof(win));
  win.ws_col = (unsigned short)cols;
  win.ws_row = (unsigned short)rows;

  lock_guard<mutex> guard(forkMutex);
  int errorPipe[2];
  if (::pipe(errorPipe) == -1) {
    throw SpawnFailure(string("Could not create pipe: ") +
                       strerror(GetErrno()));
  }
  FATAL_FAIL(::fcntl(errorPipe[0], F_SETFD, FD_CLOEXEC));
  FATAL_FAIL(::fcntl(errorPipe[1], F_SETFD, FD_CLOEXEC));

  int fd = -1;
  pid_t pid = forkpty(&fd, NULL, NULL, &win);
  if (pid == -1) {
    int err = GetErrno();
    ::close(errorPipe[0]);
    ::close(errorPipe[1]);
    throw SpawnFailure(string("Could not open pty: ") + strerror(err));
  }
  if (pid == 0) {
    // child
    ::close(errorPipe[0]);
    if (cwd != NULL && ::chdir(cwd) == -1) {
      reportChildFailure(errorPipe[1], CHILD_STAGE_CHDIR);
    }
    // Shells remember an ignored SIGCHLD/SIGPIPE as the original disposition,
    // so hand them the defaults.
    signal(SIGCHLD, SIG_DFL);
    signal(SIGPIPE, SIG_DFL);
    signal(SIGHUP, SIG_DFL);
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    // The daemon blocks termination signals to sigwait on them
    sigset_t emptyMask;
    sigemptyset(&emptyMask);
    sigprocmask(SIG_SETMASK, &emptyMask, NULL);
    ::execve(program, &argv[0], &envp[0]);
    reportChildFailure(errorPipe[1], CHILD_STAGE_EXEC);
  }

  // parent
  ::close(errorPipe[1]);
  FATAL_FAIL(::fcntl(fd, F_SETFD, FD_CLOEXEC));
  // Writers poll instead of blocking so a hangup can always interrupt them
  int flags = ::fcntl(fd, F_GETFL, 0);
  FATAL_FAIL(flags);
  FATAL_FAIL(::fcntl(fd, F_SETFL, flags | O_NONBLOCK));

  ChildFailure failure;
  ssize_t rc;
  do {
    rc = ::read(errorPipe[0], &failure, sizeof(failure));
  } while (rc == -1 && GetErrno() == EINTR);
  ::close(errorPipe[0]);

  if (rc > 0) {
    // The exec never happened: reap the child and release the pty
    int status;
    while (::waitpid(pid, &status, 0) == -1 && GetErrno() == EINTR) {
    }
    ::close(fd);
    string reason = rc == (ssize_t)sizeof(failure) ? strerror(failure.err)
                                                   : "unknown error";
    if (rc == (ssize_t)sizeof(failure) &&
        failure.stage == CHILD_STAGE_CHDIR) {
      throw SpawnFailure("Failed to enter directory " + plan.cwd + ": " +
                         reason);
    }
    throw SpawnFailure("Failed to execute " + plan.program + ": " + reason);
  }

  {
    lock_guard<mutex> fdGuard(fdMutex);
    masterFd = fd;
  }
  childPid = pid;
  VLOG(1) << "Started " << plan.program << " as pid " << childPid << " on fd "
          << masterFd;
}

ssize_t PseudoTerminal::readOutput(char* buf, size_t count) {
  int fd;
  {
    lock_guard<mutex> guard(fdMutex);
    if (masterFd < 0 || closed) {
      return 0;
    }
    fd = masterFd;
    readerActive = true;
  }
  ssize_t result = readFromMaster(fd, buf, count);
  {
    lock_guard<mutex> guard(fdMutex);
    readerActive = false;
  }
  if (closed) {
    // The hangup found us reading and left the close to us
    closeMaster();
  }
  return result;
}

ssize_t PseudoTerminal::readFromMaster(int fd, char* buf, size_t count) {
  while (!closed) {
    fd_set rfd;
    timeval tv;
    FD_ZERO(&rfd);
    FD_SET(fd, &rfd);
    tv.tv_sec = 0;
    tv.tv_usec = 100000;
    int selectResult = ::select(fd + 1, &rfd, NULL, NULL, &tv);
    if (selectResult == -1) {
      if (GetErrno() == EINTR) {
        continue;
      }
      LOG(ERROR) << "select() on terminal failed: " << strerror(GetErrno());
      return 0;
    }
    if (selectResult == 0 || closed) {
      continue;
    }

    ssize_t rc = ::read(fd, buf, count);
    if (rc > 0) {
      return rc;
    }
    if (rc == 0) {
      return 0;
    }
    int err = GetErrno();
    if (err == EINTR || err == EAGAIN) {
      continue;
    }
    if (err != EIO) {
      // EIO is how Linux reports that the last subordinate closed
      LOG(ERROR) << "Error reading from terminal: " << strerror(err);
    }
    return 0;
  }
  return 0;
}

void PseudoTerminal::writeInput(const char* buf, size_t count) {
  lock_guard<mutex> guard(fdMutex);
  size_t bytesWritten = 0;
  while (bytesWritten < count) {
    if (closed || masterFd < 0) {
      throw std::runtime_error("Write to terminal failed: terminal closed");
    }
    ssize_t rc = ::write(masterFd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      int err = GetErrno();
      if (err == EINTR) {
        continue;
      }
      if (err == EAGAIN) {
        // Input queue is full: wait for room, rechecking for a hangup
        fd_set wfd;
        timeval tv;
        FD_ZERO(&wfd);
        FD_SET(masterFd, &wfd);
        tv.tv_sec = 0;
        tv.tv_usec = 100000;
        ::select(masterFd + 1, NULL, &wfd, NULL, &tv);
        continue;
      }
      throw std::runtime_error(string("Write to terminal failed: ") +
                               strerror(err));
    }
    bytesWritten += rc;
  }
}

void PseudoTerminal::setSize(int cols, int rows) {
  winsize win;
  memset(&win, 0, sizeof(win));
  win.ws_col = (unsigned short)cols;
  win.ws_row = (unsigned short)rows;
  lock_guard<mutex> guard(fdMutex);
  if (masterFd < 0) {
    throw std::runtime_error("Resize failed: terminal closed");
  }
  if (::ioctl(masterFd, TIOCSWINSZ, &win) == -1) {
    throw std::runtime_error(string("Resize failed: ") + strerror(GetErrno()));
  }
}

void PseudoTerminal::hangup() {
  closed = true;
  signalGroup(SIGHUP);
  // Wake up stopped jobs so they see the hangup
  signalGroup(SIGCONT);
  closeMaster();
}

void PseudoTerminal::forceKill() {
  closed = true;
  signalGroup(SIGKILL);
  closeMaster();
}

void PseudoTerminal::closeMaster() {
  lock_guard<mutex> guard(fdMutex);
  if (readerActive || masterFd < 0) {
    return;
  }
  // Closing the master hangs up the subordinate side: reads there see EOF
  ::close(masterFd);
  masterFd = -1;
}

int PseudoTerminal::waitForExit() {
  int status = 0;
  while (::waitpid(childPid, &status, 0) == -1) {
    if (GetErrno() != EINTR) {
      LOG(WARNING) << "waitpid(" << childPid
                   << ") failed: " << strerror(GetErrno());
      break;
    }
  }
  exited = true;
  return status;
}

void PseudoTerminal::signalGroup(int signum) {
  if (childPid <= 0 || exited) {
    return;
  }
  // forkpty made the child a session leader, so its pid names the group
  if (::killpg(childPid, signum) == -1 && GetErrno() != ESRCH) {
    LOG(WARNING) << "killpg(" << childPid << ", " << signum
                 << ") failed: " << strerror(GetErrno());
  }
}
}  // namespace pt
