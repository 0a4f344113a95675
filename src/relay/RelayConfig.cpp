#include "RelayConfig.hpp"

namespace pt {
namespace {
const int DEVICE_ID_LENGTH = 32;
const int PAIRING_CODE_LENGTH = 6;
const int PASSPHRASE_WORD_COUNT = 6;

string stringOr(const json& j, const char* key, const string& fallback) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return fallback;
  }
  return it->get<string>();
}
}  // namespace

const vector<string>& passphraseWords() {
  static const vector<string> words = {
      "apple",  "banana",  "cherry", "dolphin", "eagle",    "forest",
      "garden", "harbor",  "island", "jungle",  "kitten",   "lemon",
      "mountain", "nectar", "ocean", "palace",  "quartz",   "river",
      "sunset", "temple",  "umbrella", "valley", "willow",  "yellow"};
  return words;
}

string generateDeviceId() { return genRandomHex(DEVICE_ID_LENGTH); }

string generatePairingCode() { return genRandomDigits(PAIRING_CODE_LENGTH); }

string generatePassphrase() {
  const vector<string>& words = passphraseWords();
  string passphrase;
  for (int i = 0; i < PASSPHRASE_WORD_COUNT; ++i) {
    if (i) passphrase += "-";
    passphrase += words[randombytes_uniform(uint32_t(words.size()))];
  }
  return passphrase;
}

RelayConfig RelayConfig::generateDefaults() {
  RelayConfig config;
  config.enabled = false;
  config.relayUrl = DEFAULT_RELAY_URL;
  config.deviceId = generateDeviceId();
  config.deviceName = GetHostName();
  config.pairingCode = generatePairingCode();
  config.pairingPassphrase = generatePassphrase();
  return config;
}

void to_json(json& j, const LinkedDevice& device) {
  j = json{{"id", device.id},
           {"name", device.name},
           {"deviceType", device.deviceType},
           {"pairedAt", device.pairedAt}};
}

void from_json(const json& j, LinkedDevice& device) {
  device.id = stringOr(j, "id", "");
  device.name = stringOr(j, "name", "");
  device.deviceType = stringOr(j, "deviceType", stringOr(j, "type", ""));
  auto pairedAt = j.find("pairedAt");
  if (pairedAt == j.end() || pairedAt->is_null()) {
    device.pairedAt = "";
  } else if (pairedAt->is_string()) {
    device.pairedAt = pairedAt->get<string>();
  } else {
    device.pairedAt = pairedAt->dump();
  }
}

void to_json(json& j, const RelayConfig& config) {
  j = json{{"enabled", config.enabled},
           {"relayUrl", config.relayUrl},
           {"deviceId", config.deviceId},
           {"deviceName", config.deviceName},
           {"pairingCode", config.pairingCode},
           {"pairingPassphrase", config.pairingPassphrase},
           {"linkedDevices", config.linkedDevices}};
}

void from_json(const json& j, RelayConfig& config) {
  auto enabled = j.find("enabled");
  config.enabled = enabled != j.end() && enabled->is_boolean() &&
                   enabled->get<bool>();
  config.relayUrl = stringOr(j, "relayUrl", DEFAULT_RELAY_URL);
  config.deviceId = stringOr(j, "deviceId", "");
  config.deviceName = stringOr(j, "deviceName", "");
  config.pairingCode = stringOr(j, "pairingCode", "");
  config.pairingPassphrase = stringOr(j, "pairingPassphrase", "");
  config.linkedDevices.clear();
  auto devices = j.find("linkedDevices");
  if (devices != j.end() && devices->is_array()) {
    config.linkedDevices = devices->get<vector<LinkedDevice>>();
  }
}

RelayConfigStore::RelayConfigStore(shared_ptr<KeyValueStore> _store)
    : store(_store) {}

RelayConfig RelayConfigStore::load() {
  lock_guard<recursive_mutex> guard(configMutex);
  optional<string> raw = store->get(RELAY_CONFIG_KEY);
  if (!raw) {
    LOG(INFO) << "No relay config stored, generating a new identity";
    RelayConfig config = RelayConfig::generateDefaults();
    save(config);
    return config;
  }

  RelayConfig config;
  try {
    json document = json::parse(*raw);
    if (!document.is_object()) {
      throw ConfigPersistenceError("Stored relay config is not an object");
    }
    config = document.get<RelayConfig>();
  } catch (const json::exception& je) {
    throw ConfigPersistenceError(string("Stored relay config is invalid: ") +
                                 je.what());
  }

  // Fill in anything an older document lacks
  bool repaired = false;
  if (config.deviceId.empty()) {
    config.deviceId = generateDeviceId();
    repaired = true;
  }
  if (config.deviceName.empty()) {
    config.deviceName = GetHostName();
    repaired = true;
  }
  if (config.pairingCode.empty()) {
    config.pairingCode = generatePairingCode();
    repaired = true;
  }
  if (config.pairingPassphrase.empty()) {
    config.pairingPassphrase = generatePassphrase();
    repaired = true;
  }
  if (repaired) {
    save(config);
  }
  return config;
}

void RelayConfigStore::save(const RelayConfig& config) {
  lock_guard<recursive_mutex> guard(configMutex);
  json j = config;
  store->set(RELAY_CONFIG_KEY, dumpJson(j));
}

RelayConfig RelayConfigStore::update(
    const function<void(RelayConfig&)>& mutator) {
  lock_guard<recursive_mutex> guard(configMutex);
  RelayConfig config = load();
  mutator(config);
  save(config);
  return config;
}
}  // namespace pt
