#include "KeyValueStore.hpp"

#include "JsonLib.hpp"

namespace pt {
namespace {
json loadDocument(const string& path) {
  if (!fs::exists(path)) {
    return json::object();
  }
  std::ifstream in(path);
  if (!in) {
    throw ConfigPersistenceError("Cannot open store: " + path);
  }
  try {
    json doc = json::parse(in);
    if (!doc.is_object()) {
      throw ConfigPersistenceError("Store is not a JSON object: " + path);
    }
    return doc;
  } catch (const json::parse_error& pe) {
    throw ConfigPersistenceError("Corrupt store " + path + ": " + pe.what());
  }
}
}  // namespace

FileKeyValueStore::FileKeyValueStore(const string& _path) : path(_path) {}

string FileKeyValueStore::defaultPath() {
  return sago::getConfigHome() + "/portalterm/store.json";
}

optional<string> FileKeyValueStore::get(const string& key) {
  lock_guard<mutex> guard(storeMutex);
  json doc = loadDocument(path);
  auto it = doc.find(key);
  if (it == doc.end() || !it->is_string()) {
    return nullopt;
  }
  return it->get<string>();
}

void FileKeyValueStore::set(const string& key, const string& value) {
  lock_guard<mutex> guard(storeMutex);
  json doc = loadDocument(path);
  doc[key] = value;

  try {
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
      fs::create_directories(parent);
    }
  } catch (const fs::filesystem_error& fse) {
    throw ConfigPersistenceError(string("Cannot create store directory: ") +
                                 fse.what());
  }

  string tmpPath = path + ".tmp";
  {
    std::ofstream out(tmpPath, std::ios::trunc);
    if (!out) {
      throw ConfigPersistenceError("Cannot write store: " + tmpPath);
    }
    out << doc.dump(2);
    out.flush();
    if (!out) {
      throw ConfigPersistenceError("Short write to store: " + tmpPath);
    }
  }
  if (::rename(tmpPath.c_str(), path.c_str()) != 0) {
    throw ConfigPersistenceError("Cannot replace store " + path + ": " +
                                 strerror(GetErrno()));
  }
  VLOG(1) << "Persisted key " << key << " to " << path;
}
}  // namespace pt
