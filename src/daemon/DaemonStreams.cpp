#include "DaemonStreams.hpp"

namespace pt {
DaemonStreams::DaemonStreams(const string& eventsPath,
                             std::ostream& _stdoutStream,
                             std::ostream& _stderrStream) {
  if (eventsPath.empty()) {
    eventsOut = &_stdoutStream;
    consoleOut = &_stderrStream;
    return;
  }
  eventsFile.open(eventsPath, std::ios::out | std::ios::app);
  if (!eventsFile.is_open()) {
    throw std::runtime_error("Could not open events file " + eventsPath +
                             ": " + strerror(GetErrno()));
  }
  eventsOut = &eventsFile;
  consoleOut = &_stdoutStream;
}

void printPairing(std::ostream& out, const PortalStatus& status) {
  out << "Device:     " << status.deviceName << " (" << status.deviceId << ")"
      << endl;
  out << "Pairing:    " << status.pairingCode << endl;
  out << "Passphrase: " << status.pairingPassphrase << endl;
  out << "Relay:      " << (status.isEnabled ? "enabled" : "disabled") << ", "
      << status.linkedDevices.size() << " linked devices" << endl;
}
}  // namespace pt
