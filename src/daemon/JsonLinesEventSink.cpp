#include "JsonLinesEventSink.hpp"

namespace pt {
json JsonLinesEventSink::toJson(const HostEvent& event) {
  json j;
  j["event"] = hostEventName(event.kind);
  switch (event.kind) {
    case HostEventKind::SESSION_OUTPUT: {
      string encoded;
      if (!Base64::Encode(event.data, &encoded)) {
        STERROR << "Could not encode " << event.data.size() << " bytes";
      }
      j["sessionId"] = event.sessionId;
      j["data"] = encoded;
    } break;
    case HostEventKind::SESSION_EXITED:
      j["sessionId"] = event.sessionId;
      break;
    case HostEventKind::RELAY_CONNECTIVITY_CHANGED:
      j["connected"] = event.connected;
      break;
    default:
      j["payload"] = event.payload;
      break;
  }
  return j;
}

void JsonLinesEventSink::emit(const HostEvent& event) {
  string line = dumpJson(toJson(event));
  lock_guard<mutex> guard(outMutex);
  out << line << "\n";
  out.flush();
}
}  // namespace pt
