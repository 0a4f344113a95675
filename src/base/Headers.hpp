#ifndef __PT_HEADERS__
#define __PT_HEADERS__

#if __APPLE__
#include <util.h>
#elif __FreeBSD__
#include <libutil.h>
#elif __NetBSD__  // do not need pty.h on NetBSD
#include <util.h>
#else
#include <pty.h>
#endif

#include <arpa/inet.h>
#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <paths.h>
#include <pthread.h>
#include <pwd.h>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <termios.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <sodium.h>

#include "base64.h"
#include "easylogging++.h"
#include "sago/platform_folders.h"
#include "sole.hpp"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

#ifndef PT_VERSION
#define PT_VERSION "unknown"
#endif

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

inline int GetErrno() { return errno; }

inline void SetErrno(int e) { errno = e; }

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

namespace pt {
/** @brief Default byte capacity of a session's replay buffer. */
const size_t DEFAULT_OUTPUT_BUFFER_BYTES = 100 * 1024;

/** @brief Fixed pause between relay connection attempts. */
const int RELAY_RECONNECT_DELAY_SECONDS = 5;

template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

/** @brief Splits on runs of spaces/tabs, dropping empty tokens. */
inline std::vector<std::string> splitWhitespace(const std::string &s) {
  std::vector<std::string> elems;
  std::istringstream iss(s);
  std::string item;
  while (iss >> item) {
    elems.push_back(item);
  }
  return elems;
}

inline string genRandomDigits(int len) {
  string s(len, '0');
  for (int i = 0; i < len; ++i) {
    s[i] = char('0' + randombytes_uniform(10));
  }
  return s;
}

inline string genRandomHex(int len) {
  static const char hexDigits[] = "0123456789abcdef";
  string s(len, '\0');
  for (int i = 0; i < len; ++i) {
    s[i] = hexDigits[randombytes_uniform(16)];
  }
  return s;
}

/** @brief Milliseconds since the unix epoch, used for wire timestamps. */
inline int64_t nowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline string GetHostName() {
  char buf[256];
  if (::gethostname(buf, sizeof(buf)) != 0) {
    return "Desktop";
  }
  buf[sizeof(buf) - 1] = '\0';
  string name(buf);
  return name.empty() ? "Desktop" : name;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}
}  // namespace pt

#endif  // __PT_HEADERS__
