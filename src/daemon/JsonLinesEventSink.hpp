#ifndef __PT_JSON_LINES_EVENT_SINK__
#define __PT_JSON_LINES_EVENT_SINK__

#include "Headers.hpp"
#include "HostEvents.hpp"

namespace pt {
/**
 * @brief Writes every host event as one JSON object per line.
 *
 * Session output is base64 encoded under `data` so arbitrary terminal bytes
 * survive the trip.
 */
class JsonLinesEventSink : public HostEventSink {
 public:
  explicit JsonLinesEventSink(std::ostream& _out) : out(_out) {}

  virtual void emit(const HostEvent& event);

  static json toJson(const HostEvent& event);

 protected:
  std::ostream& out;
  mutex outMutex;
};
}  // namespace pt

#endif  // __PT_JSON_LINES_EVENT_SINK__
