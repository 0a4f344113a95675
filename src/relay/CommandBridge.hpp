#ifndef __PT_COMMAND_BRIDGE__
#define __PT_COMMAND_BRIDGE__

#include "Headers.hpp"
#include "HostEvents.hpp"
#include "ProjectCatalog.hpp"
#include "RelayClient.hpp"
#include "RelayConfig.hpp"
#include "RelayOutbox.hpp"
#include "RemoteAttachments.hpp"
#include "SessionRegistry.hpp"

namespace pt {
/**
 * @brief Applies inbound relay messages to the session registry, the
 * attachment set and the stored config, and hands everything the core does
 * not own to the host as events.
 */
class CommandBridge : public RelayMessageHandler {
 public:
  CommandBridge(shared_ptr<SessionRegistry> _registry,
                shared_ptr<RemoteAttachments> _attachments,
                shared_ptr<RelayConfigStore> _configStore,
                shared_ptr<ProjectCatalog> _catalog,
                shared_ptr<HostEventSink> _sink);

  /** @brief Where replies go. Must be set before messages arrive. */
  void setOutbox(shared_ptr<RelayOutbox> _outbox);

  virtual void handleMessage(const RelayMessage& message);

 protected:
  void handleDeviceList(const RelayMessage& message);
  void handleRequestStatus();
  void handleTerminalInput(const RelayMessage& message);
  void handleAttachTerminal(const RelayMessage& message);
  void handleError(const RelayMessage& message);

  shared_ptr<SessionRegistry> registry;
  shared_ptr<RemoteAttachments> attachments;
  shared_ptr<RelayConfigStore> configStore;
  shared_ptr<ProjectCatalog> catalog;
  shared_ptr<HostEventSink> sink;
  shared_ptr<RelayOutbox> outbox;
};
}  // namespace pt

#endif  // __PT_COMMAND_BRIDGE__
