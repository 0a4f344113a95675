#include "RemoteAttachments.hpp"

#include "RelayMessage.hpp"

namespace pt {
void RemoteAttachments::setOutbox(shared_ptr<RelayOutbox> _outbox) {
  lock_guard<recursive_mutex> guard(attachMutex);
  outbox = _outbox;
}

void RemoteAttachments::attach(const string& id) {
  lock_guard<recursive_mutex> guard(attachMutex);
  attached.insert(id);
}

void RemoteAttachments::detach(const string& id) {
  lock_guard<recursive_mutex> guard(attachMutex);
  attached.erase(id);
}

bool RemoteAttachments::isAttached(const string& id) {
  lock_guard<recursive_mutex> guard(attachMutex);
  return attached.find(id) != attached.end();
}

set<string> RemoteAttachments::getAttached() {
  lock_guard<recursive_mutex> guard(attachMutex);
  return attached;
}

void RemoteAttachments::clear() {
  lock_guard<recursive_mutex> guard(attachMutex);
  attached.clear();
}

void RemoteAttachments::recordOutput(const string& id, RingBuffer* buffer,
                                     const string& chunk) {
  lock_guard<recursive_mutex> guard(attachMutex);
  buffer->append(chunk);
  if (outbox.get() == NULL || attached.find(id) == attached.end()) {
    return;
  }
  if (outbox->isRegistered()) {
    VLOG(2) << "Forwarding " << chunk.size() << " bytes of " << id;
    outbox->send(makeTerminalOutput(id, chunk));
  }
}

void RemoteAttachments::attachWithReplay(const string& id,
                                         const RingBuffer& buffer) {
  lock_guard<recursive_mutex> guard(attachMutex);
  string history = buffer.snapshot();
  if (!history.empty() && outbox.get() != NULL) {
    VLOG(1) << "Replaying " << history.size() << " bytes of " << id;
    outbox->send(makeTerminalOutput(id, history));
  }
  attached.insert(id);
}
}  // namespace pt
