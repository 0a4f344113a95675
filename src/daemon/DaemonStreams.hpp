#ifndef __PT_DAEMON_STREAMS__
#define __PT_DAEMON_STREAMS__

#include "Headers.hpp"
#include "PortalContext.hpp"

namespace pt {
/**
 * @brief Picks where the daemon writes host events and where it writes
 * messages meant for a person.
 *
 * Events go to the events file when one is given and to stdout otherwise.
 * Human-readable text never shares a stream with the events, so a consumer
 * reading JSON lines from stdout sees nothing else there.
 */
class DaemonStreams {
 public:
  /**
   * @param eventsPath File that receives the JSON lines, appended to. Empty
   * means stdout.
   * @throws std::runtime_error when the events file cannot be opened.
   */
  explicit DaemonStreams(const string& eventsPath,
                         std::ostream& _stdoutStream = std::cout,
                         std::ostream& _stderrStream = std::cerr);

  std::ostream& events() { return *eventsOut; }
  std::ostream& console() { return *consoleOut; }
  bool eventsOnStdout() const { return !eventsFile.is_open(); }

 protected:
  std::ofstream eventsFile;
  std::ostream* eventsOut;
  std::ostream* consoleOut;
};

/** @brief Device identity, pairing secrets and relay state, one per line. */
void printPairing(std::ostream& out, const PortalStatus& status);
}  // namespace pt

#endif  // __PT_DAEMON_STREAMS__
