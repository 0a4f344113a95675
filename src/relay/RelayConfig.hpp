#ifndef __PT_RELAY_CONFIG__
#define __PT_RELAY_CONFIG__

#include "Errors.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "KeyValueStore.hpp"

namespace pt {
const string DEFAULT_RELAY_URL = "wss://relay.chell.app";
const string RELAY_CONFIG_KEY = "relay_config";

/** @brief A remote device paired with this desktop, as reported by the relay. */
struct LinkedDevice {
  string id;
  string name;
  string deviceType;
  string pairedAt;
};

void to_json(json& j, const LinkedDevice& device);
/** @brief Accepts `type` or `deviceType`, and a numeric or string `pairedAt`. */
void from_json(const json& j, LinkedDevice& device);

/** @brief Everything the relay client needs to identify and pair itself. */
struct RelayConfig {
  bool enabled = false;
  string relayUrl;
  string deviceId;
  string deviceName;
  string pairingCode;
  string pairingPassphrase;
  vector<LinkedDevice> linkedDevices;

  /** @brief Fresh identity: new device id and pairing secrets, disabled. */
  static RelayConfig generateDefaults();
};

void to_json(json& j, const RelayConfig& config);
void from_json(const json& j, RelayConfig& config);

/** @brief 32 lowercase hex characters. */
string generateDeviceId();
/** @brief 6 decimal digits, leading zeros kept. */
string generatePairingCode();
/** @brief 6 dictionary words joined with `-`. */
string generatePassphrase();
/** @brief The dictionary `generatePassphrase` draws from. */
const vector<string>& passphraseWords();

/**
 * @brief Reads and writes the relay config document of a `KeyValueStore`.
 */
class RelayConfigStore {
 public:
  explicit RelayConfigStore(shared_ptr<KeyValueStore> _store);

  /**
   * @brief Returns the persisted config, generating and persisting defaults
   * the first time.
   * @throws ConfigPersistenceError when the stored document is unusable or
   * cannot be written.
   */
  RelayConfig load();

  /** @throws ConfigPersistenceError */
  void save(const RelayConfig& config);

  /**
   * @brief Loads, applies `mutator` and saves, atomically with respect to
   * other users of this store.
   * @return The config as saved.
   */
  RelayConfig update(const function<void(RelayConfig&)>& mutator);

 protected:
  shared_ptr<KeyValueStore> store;
  recursive_mutex configMutex;
};
}  // namespace pt

#endif  // __PT_RELAY_CONFIG__
