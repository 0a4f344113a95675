#ifndef __PT_REMOTE_ATTACHMENTS__
#define __PT_REMOTE_ATTACHMENTS__

#include "Headers.hpp"
#include "RelayOutbox.hpp"
#include "RingBuffer.hpp"

namespace pt {
/**
 * @brief The set of session ids a remote device is currently watching.
 *
 * Output pumps consult it for every chunk; the command bridge edits it. The
 * same lock also covers ring-buffer appends done through `recordOutput`, so
 * an attach that replays a snapshot can never lose or duplicate a chunk.
 */
class RemoteAttachments {
 public:
  RemoteAttachments() {}

  /** @brief Where live output goes. May be unset until the relay exists. */
  void setOutbox(shared_ptr<RelayOutbox> _outbox);

  void attach(const string& id);
  void detach(const string& id);
  bool isAttached(const string& id);
  set<string> getAttached();
  void clear();

  /**
   * @brief Pump side: appends `chunk` to `buffer` and, when `id` is attached
   * and the relay is registered, forwards it as `terminal_output`.
   */
  void recordOutput(const string& id, RingBuffer* buffer, const string& chunk);

  /**
   * @brief Bridge side: sends the buffered history of `id` as one
   * `terminal_output` (skipped when empty) and then attaches `id`, atomically
   * with respect to `recordOutput`.
   */
  void attachWithReplay(const string& id, const RingBuffer& buffer);

 protected:
  recursive_mutex attachMutex;
  set<string> attached;
  shared_ptr<RelayOutbox> outbox;
};
}  // namespace pt

#endif  // __PT_REMOTE_ATTACHMENTS__
