#ifndef __PT_RELAY_URL__
#define __PT_RELAY_URL__

#include "Headers.hpp"

namespace pt {
/** @brief A `ws://` or `wss://` endpoint split into what the transport needs. */
struct RelayUrl {
  bool secure = false;
  string host;
  int port = 0;
  /** @brief Request target, always starting with `/`. */
  string target;

  /**
   * @brief Parses `ws[s]://host[:port][/path]`. Ports default to 80/443.
   * @throws std::runtime_error on any other shape.
   */
  static RelayUrl parse(const string& url);

  /**
   * @brief The relay's socket endpoint: `<url>/ws`, without doubling the
   * slash.
   */
  static string socketEndpoint(const string& relayUrl);

  string toString() const;
};
}  // namespace pt

#endif  // __PT_RELAY_URL__
