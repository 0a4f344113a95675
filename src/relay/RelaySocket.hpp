#ifndef __PT_RELAY_SOCKET__
#define __PT_RELAY_SOCKET__

#include "Headers.hpp"

namespace pt {
/**
 * @brief One message-oriented connection to the relay.
 *
 * `receive` is called from one thread and `send` from another, while `close`
 * may be called from any thread at any time to abort whatever is pending.
 */
class RelaySocket {
 public:
  virtual ~RelaySocket() {}

  /** @throws RelayConnectFailure */
  virtual void connect() = 0;

  /** @throws std::runtime_error when the connection is gone. */
  virtual void send(const string& text) = 0;

  /**
   * @brief Blocks for the next text frame.
   * @return false when the peer closed the connection cleanly.
   * @throws std::runtime_error on any other failure, including `close()`.
   */
  virtual bool receive(string* text) = 0;

  /** @brief Abandons the connection without a closing handshake. */
  virtual void close() = 0;
};

class RelaySocketFactory {
 public:
  virtual ~RelaySocketFactory() {}

  /**
   * @brief Creates an unconnected socket for `url`.
   * @throws RelayConnectFailure when the url is unusable.
   */
  virtual shared_ptr<RelaySocket> create(const string& url) = 0;
};
}  // namespace pt

#endif  // __PT_RELAY_SOCKET__
