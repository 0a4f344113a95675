#ifndef __PT_RELAY_OUTBOX__
#define __PT_RELAY_OUTBOX__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace pt {
/**
 * @brief Fire-and-forget sending side of the relay connection.
 *
 * Lets the terminal layer and the command bridge push messages without
 * depending on the connection state machine.
 */
class RelayOutbox {
 public:
  virtual ~RelayOutbox() {}

  /** @brief True while a registered connection can accept messages. */
  virtual bool isRegistered() = 0;

  /**
   * @brief Queues a message; silently dropped when not registered.
   */
  virtual void send(const json& message) = 0;
};
}  // namespace pt

#endif  // __PT_RELAY_OUTBOX__
