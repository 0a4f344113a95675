#ifndef __PT_HOST_EVENTS__
#define __PT_HOST_EVENTS__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace pt {
/** @brief Closed set of notifications the core pushes to the host. */
enum class HostEventKind {
  SESSION_OUTPUT,
  SESSION_EXITED,
  RELAY_CONNECTIVITY_CHANGED,
  RELAY_INBOUND_COMMAND,
  RELAY_DEVICES_UPDATED,
  RELAY_ERROR,
};

/** @brief Channel name used by hosts that route events by string. */
inline const char* hostEventName(HostEventKind kind) {
  switch (kind) {
    case HostEventKind::SESSION_OUTPUT:
      return "session-output";
    case HostEventKind::SESSION_EXITED:
      return "session-exited";
    case HostEventKind::RELAY_CONNECTIVITY_CHANGED:
      return "relay-connectivity-changed";
    case HostEventKind::RELAY_INBOUND_COMMAND:
      return "relay-inbound-command";
    case HostEventKind::RELAY_DEVICES_UPDATED:
      return "relay-devices-updated";
    case HostEventKind::RELAY_ERROR:
      return "relay-error";
  }
  return "unknown";
}

/**
 * @brief One notification. Which fields are meaningful depends on `kind`:
 * output carries `sessionId`/`data`, connectivity carries `connected`, the
 * relay kinds carry `payload`.
 */
struct HostEvent {
  HostEventKind kind;
  string sessionId;
  string data;
  bool connected = false;
  json payload;

  static HostEvent sessionOutput(const string& id, const string& bytes) {
    HostEvent e{HostEventKind::SESSION_OUTPUT};
    e.sessionId = id;
    e.data = bytes;
    return e;
  }

  static HostEvent sessionExited(const string& id) {
    HostEvent e{HostEventKind::SESSION_EXITED};
    e.sessionId = id;
    return e;
  }

  static HostEvent connectivityChanged(bool connected) {
    HostEvent e{HostEventKind::RELAY_CONNECTIVITY_CHANGED};
    e.connected = connected;
    return e;
  }

  static HostEvent withPayload(HostEventKind kind, const json& payload) {
    HostEvent e{kind};
    e.payload = payload;
    return e;
  }
};

/**
 * @brief Output port to the host application (GUI, daemon, test double).
 *
 * Called from worker threads; implementations must be thread-safe and must
 * not block for long.
 */
class HostEventSink {
 public:
  virtual ~HostEventSink() {}

  virtual void emit(const HostEvent& event) = 0;
};

/** @brief Sink that drops everything. */
class NullHostEventSink : public HostEventSink {
 public:
  virtual void emit(const HostEvent& event) {}
};
}  // namespace pt

#endif  // __PT_HOST_EVENTS__
