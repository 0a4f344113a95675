#ifndef __PT_KEY_VALUE_STORE__
#define __PT_KEY_VALUE_STORE__

#include "Errors.hpp"
#include "Headers.hpp"

namespace pt {
/**
 * @brief Opaque persistence collaborator for small string documents.
 *
 * Implementations throw `ConfigPersistenceError` when the backing storage
 * cannot be read or written.
 */
class KeyValueStore {
 public:
  virtual ~KeyValueStore() {}

  virtual optional<string> get(const string& key) = 0;
  virtual void set(const string& key, const string& value) = 0;
};

/** @brief Process-local store, nothing survives a restart. */
class MemoryKeyValueStore : public KeyValueStore {
 public:
  virtual optional<string> get(const string& key) {
    lock_guard<mutex> guard(storeMutex);
    auto it = values.find(key);
    if (it == values.end()) {
      return nullopt;
    }
    return it->second;
  }

  virtual void set(const string& key, const string& value) {
    lock_guard<mutex> guard(storeMutex);
    values[key] = value;
  }

 protected:
  map<string, string> values;
  mutex storeMutex;
};

/**
 * @brief Stores every key in one JSON object on disk.
 *
 * Writes go to a temporary file that is renamed over the old one so a crash
 * never leaves a half-written document behind.
 */
class FileKeyValueStore : public KeyValueStore {
 public:
  explicit FileKeyValueStore(const string& _path);

  virtual optional<string> get(const string& key);
  virtual void set(const string& key, const string& value);

  const string& getPath() const { return path; }

  /** @brief `<config home>/portalterm/store.json`. */
  static string defaultPath();

 protected:
  string path;
  mutex storeMutex;
};
}  // namespace pt

#endif  // __PT_KEY_VALUE_STORE__
