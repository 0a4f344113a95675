#ifndef __PT_WEBSOCKET_RELAY_SOCKET__
#define __PT_WEBSOCKET_RELAY_SOCKET__

#include "Headers.hpp"
#include "RelaySocket.hpp"

#include <boost/asio/ssl/context.hpp>

namespace pt {
/**
 * @brief Creates Boost.Beast WebSocket connections, over TLS for `wss://`.
 *
 * Every socket runs its own io_context on a private thread; the blocking
 * `RelaySocket` calls post work there and wait for the completion.
 */
class WebSocketRelaySocketFactory : public RelaySocketFactory {
 public:
  WebSocketRelaySocketFactory();

  virtual shared_ptr<RelaySocket> create(const string& url);

 protected:
  shared_ptr<boost::asio::ssl::context> sslContext;
};
}  // namespace pt

#endif  // __PT_WEBSOCKET_RELAY_SOCKET__
