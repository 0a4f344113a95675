#include "PortalContext.hpp"

namespace pt {
void to_json(json& j, const PortalStatus& status) {
  j = json{{"isEnabled", status.isEnabled},
           {"isConnected", status.isConnected},
           {"deviceId", status.deviceId},
           {"deviceName", status.deviceName},
           {"pairingCode", status.pairingCode},
           {"pairingPassphrase", status.pairingPassphrase},
           {"linkedDevices", status.linkedDevices}};
}

PortalContext::PortalContext(shared_ptr<KeyValueStore> store,
                             shared_ptr<RelaySocketFactory> socketFactory,
                             shared_ptr<ProjectCatalog> _catalog,
                             shared_ptr<HostEventSink> _sink,
                             const PortalOptions& options)
    : sink(_sink), catalog(_catalog) {
  configStore.reset(new RelayConfigStore(store));
  attachments.reset(new RemoteAttachments());
  registry.reset(
      new SessionRegistry(sink, attachments, options.bufferCapacity));
  relayClient.reset(
      new RelayClient(socketFactory, sink, options.reconnectDelay));
  bridge.reset(
      new CommandBridge(registry, attachments, configStore, catalog, sink));
  bridge->setOutbox(relayClient);
  attachments->setOutbox(relayClient);
  relayClient->setHandler(bridge);

  RelayConfig config = configStore->load();
  if (options.autoConnect && config.enabled) {
    LOG(INFO) << "Relay was enabled last time, reconnecting";
    relayClient->enable(config);
  }
}

PortalContext::~PortalContext() {
  relayClient->shutdown();
  // Break the client <-> bridge reference cycle
  relayClient->setHandler(shared_ptr<RelayMessageHandler>());
  bridge->setOutbox(shared_ptr<RelayOutbox>());
  attachments->setOutbox(shared_ptr<RelayOutbox>());
  registry->shutdown();
}

void PortalContext::enable() {
  lock_guard<recursive_mutex> guard(hostMutex);
  RelayConfig config =
      configStore->update([](RelayConfig& c) { c.enabled = true; });
  relayClient->enable(config);
}

void PortalContext::disable() {
  lock_guard<recursive_mutex> guard(hostMutex);
  relayClient->disable();
  attachments->clear();
  configStore->update([](RelayConfig& c) { c.enabled = false; });
}

RelayConfig PortalContext::regeneratePairing() {
  lock_guard<recursive_mutex> guard(hostMutex);
  RelayConfig config = configStore->update([](RelayConfig& c) {
    c.pairingCode = generatePairingCode();
    c.pairingPassphrase = generatePassphrase();
    c.linkedDevices.clear();
  });
  LOG(INFO) << "Pairing secrets regenerated";
  if (relayClient->isEnabled()) {
    restartRelay(config);
  }
  return config;
}

PortalStatus PortalContext::getStatus() {
  RelayConfig config = configStore->load();
  PortalStatus status;
  status.isEnabled = relayClient->isEnabled();
  status.isConnected = relayClient->isConnected();
  status.deviceId = config.deviceId;
  status.deviceName = config.deviceName;
  status.pairingCode = config.pairingCode;
  status.pairingPassphrase = config.pairingPassphrase;
  status.linkedDevices = config.linkedDevices;
  return status;
}

RelayConfig PortalContext::getConfig() { return configStore->load(); }

void PortalContext::setConfig(const RelayConfig& config) {
  lock_guard<recursive_mutex> guard(hostMutex);
  configStore->save(config);
  if (!config.enabled) {
    relayClient->disable();
    attachments->clear();
  } else {
    restartRelay(config);
  }
}

bool PortalContext::registerRemoteTerminal(const string& id) {
  shared_ptr<TerminalSession> session = registry->find(id);
  if (session.get() == NULL) {
    return false;
  }
  attachments->attachWithReplay(id, *(session->output));
  return true;
}

void PortalContext::notifyProjectChanged(const string& projectId) {
  relayClient->send(makeProjectChanged(projectId));
}

void PortalContext::notifyGitFilesChanged(const string& repoPath) {
  relayClient->send(makeGitFilesChanged(repoPath));
}

void PortalContext::sendCommandResponse(const string& requestId, bool success,
                                        const optional<json>& result,
                                        const optional<string>& error) {
  relayClient->send(makeCommandResponse(requestId, success, result, error));
}

void PortalContext::restartRelay(const RelayConfig& config) {
  relayClient->disable();
  attachments->clear();
  relayClient->enable(config);
}
}  // namespace pt
