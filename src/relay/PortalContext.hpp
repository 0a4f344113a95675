#ifndef __PT_PORTAL_CONTEXT__
#define __PT_PORTAL_CONTEXT__

#include "CommandBridge.hpp"
#include "Headers.hpp"
#include "HostEvents.hpp"
#include "KeyValueStore.hpp"
#include "ProjectCatalog.hpp"
#include "RelayClient.hpp"
#include "RelayConfig.hpp"
#include "RelaySocket.hpp"
#include "RemoteAttachments.hpp"
#include "SessionRegistry.hpp"

namespace pt {
/** @brief Snapshot returned by `PortalContext::getStatus`. */
struct PortalStatus {
  bool isEnabled;
  bool isConnected;
  string deviceId;
  string deviceName;
  string pairingCode;
  string pairingPassphrase;
  vector<LinkedDevice> linkedDevices;
};

void to_json(json& j, const PortalStatus& status);

/** @brief Construction parameters for `PortalContext`. */
struct PortalOptions {
  size_t bufferCapacity = DEFAULT_OUTPUT_BUFFER_BYTES;
  std::chrono::milliseconds reconnectDelay =
      std::chrono::seconds(RELAY_RECONNECT_DELAY_SECONDS);
  /** @brief Connect right away if the stored config says enabled. */
  bool autoConnect = true;
};

/**
 * @brief The single object a host builds at startup. Owns the session
 * registry, the relay client and everything between them, and is the only
 * entry point the host needs.
 */
class PortalContext {
 public:
  PortalContext(shared_ptr<KeyValueStore> store,
                shared_ptr<RelaySocketFactory> socketFactory,
                shared_ptr<ProjectCatalog> catalog,
                shared_ptr<HostEventSink> sink,
                const PortalOptions& options = PortalOptions());
  virtual ~PortalContext();

  // Sessions
  string spawn(const SpawnRequest& request) {
    return registry->spawn(request);
  }
  void write(const string& id, const string& data) { registry->write(id, data); }
  void resize(const string& id, int cols, int rows) {
    registry->resize(id, cols, rows);
  }
  void kill(const string& id) { registry->kill(id); }
  void killMany(const vector<string>& ids) { registry->killMany(ids); }
  void killAll() { registry->killAll(); }
  vector<SessionInfo> list() { return registry->list(); }
  string getBuffer(const string& id) { return registry->getBuffer(id); }

  // Relay
  /** @brief Persists enabled=true and starts connecting. */
  void enable();
  /** @brief Persists enabled=false and drops the connection. */
  void disable();
  /**
   * @brief New pairing code and passphrase, linked devices forgotten. A live
   * connection is restarted so the relay learns the new secrets.
   */
  RelayConfig regeneratePairing();
  PortalStatus getStatus();
  RelayConfig getConfig();
  /**
   * @brief Stores `config`. The connection is restarted when it is enabled,
   * and stopped when `config.enabled` is false.
   */
  void setConfig(const RelayConfig& config);

  /** @brief Raw passthrough; dropped unless registered. */
  void sendMessage(const json& message) { relayClient->send(message); }
  /**
   * @brief Attaches a session on behalf of the remote, replaying its buffer.
   * @return false when `id` is unknown.
   */
  bool registerRemoteTerminal(const string& id);
  void notifyProjectChanged(const string& projectId);
  void notifyGitFilesChanged(const string& repoPath);
  void sendCommandResponse(const string& requestId, bool success,
                           const optional<json>& result,
                           const optional<string>& error);

  shared_ptr<SessionRegistry> getRegistry() { return registry; }
  shared_ptr<RelayClient> getRelayClient() { return relayClient; }
  shared_ptr<RemoteAttachments> getAttachments() { return attachments; }
  shared_ptr<RelayConfigStore> getConfigStore() { return configStore; }

 protected:
  void restartRelay(const RelayConfig& config);

  shared_ptr<HostEventSink> sink;
  shared_ptr<ProjectCatalog> catalog;
  shared_ptr<RelayConfigStore> configStore;
  shared_ptr<RemoteAttachments> attachments;
  shared_ptr<SessionRegistry> registry;
  shared_ptr<RelayClient> relayClient;
  shared_ptr<CommandBridge> bridge;
  // Serializes enable/disable/regenerate/setConfig
  recursive_mutex hostMutex;
};
}  // namespace pt

#endif  // __PT_PORTAL_CONTEXT__
