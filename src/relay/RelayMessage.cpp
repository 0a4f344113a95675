#include "RelayMessage.hpp"

namespace pt {
namespace {
const pair<RelayMessageType, const char*> TYPE_NAMES[] = {
    {RelayMessageType::REGISTER_DESKTOP, "register_desktop"},
    {RelayMessageType::DEVICE_LIST, "device_list"},
    {RelayMessageType::REQUEST_STATUS, "request_status"},
    {RelayMessageType::STATUS_UPDATE, "status_update"},
    {RelayMessageType::COMMAND, "command"},
    {RelayMessageType::COMMAND_RESPONSE, "command_response"},
    {RelayMessageType::TERMINAL_INPUT, "terminal_input"},
    {RelayMessageType::TERMINAL_OUTPUT, "terminal_output"},
    {RelayMessageType::ATTACH_TERMINAL, "attach_terminal"},
    {RelayMessageType::ATTACH_TERMINAL_RESPONSE, "attach_terminal_response"},
    {RelayMessageType::DETACH_TERMINAL, "detach_terminal"},
    {RelayMessageType::KILL_TERMINAL, "kill_terminal"},
    {RelayMessageType::SELECT_PROJECT, "select_project"},
    {RelayMessageType::PROJECT_CHANGED, "project_changed"},
    {RelayMessageType::GIT_FILES_CHANGED, "git_files_changed"},
    {RelayMessageType::ERROR, "error"},
};

json newMessage(RelayMessageType type) {
  json j;
  j["type"] = relayMessageTypeName(type);
  j["id"] = sole::uuid4().str();
  return j;
}
}  // namespace

string relayMessageTypeName(RelayMessageType type) {
  for (const auto& it : TYPE_NAMES) {
    if (it.first == type) {
      return it.second;
    }
  }
  return "unknown";
}

RelayMessageType relayMessageTypeFromName(const string& name) {
  for (const auto& it : TYPE_NAMES) {
    if (name == it.second) {
      return it.first;
    }
  }
  return RelayMessageType::UNKNOWN;
}

RelayMessage RelayMessage::parse(const string& text) {
  json body;
  try {
    body = json::parse(text);
  } catch (const json::parse_error& pe) {
    throw ProtocolDecodeError(string("Invalid JSON frame: ") + pe.what());
  }
  if (!body.is_object()) {
    throw ProtocolDecodeError("Frame is not a JSON object");
  }
  auto it = body.find("type");
  if (it == body.end() || !it->is_string()) {
    throw ProtocolDecodeError("Frame has no type tag");
  }
  RelayMessage message;
  message.type = relayMessageTypeFromName(it->get<string>());
  message.body = std::move(body);
  return message;
}

string RelayMessage::getString(const string& key) const {
  auto it = body.find(key);
  if (it == body.end() || !it->is_string()) {
    return "";
  }
  return it->get<string>();
}

void to_json(json& j, const ProjectFolderInfo& folder) {
  j = json{{"id", folder.id}, {"name", folder.name}, {"path", folder.path}};
}

void to_json(json& j, const ProjectInfo& project) {
  j = json{{"id", project.id},
           {"name", project.name},
           {"path", project.path},
           {"lastOpened", project.lastOpened}};
  if (project.folders) {
    j["folders"] = *project.folders;
  }
}

json makeRegisterDesktop(const string& deviceId, const string& deviceName,
                         const string& pairingCode,
                         const string& pairingPassphrase) {
  json j = newMessage(RelayMessageType::REGISTER_DESKTOP);
  j["deviceId"] = deviceId;
  j["deviceName"] = deviceName;
  j["pairingCode"] = pairingCode;
  j["pairingPassphrase"] = pairingPassphrase;
  return j;
}

json makeStatusUpdate(const vector<ProjectInfo>& projects,
                      const optional<string>& activeProjectId,
                      const vector<SessionInfo>& terminals) {
  json j = newMessage(RelayMessageType::STATUS_UPDATE);
  j["timestamp"] = nowMillis();
  j["connectionStatus"] = "connected";
  j["projects"] = projects;
  if (activeProjectId) {
    j["activeProjectId"] = *activeProjectId;
  } else {
    j["activeProjectId"] = nullptr;
  }
  json terminalRows = json::array();
  for (const auto& info : terminals) {
    terminalRows.push_back({{"id", info.id},
                            {"title", info.title},
                            {"cwd", info.cwd},
                            {"type", sessionKindToString(info.kind)}});
  }
  j["terminals"] = terminalRows;
  return j;
}

json makeTerminalOutput(const string& terminalId, const string& data) {
  json j = newMessage(RelayMessageType::TERMINAL_OUTPUT);
  j["terminalId"] = terminalId;
  j["data"] = data;
  j["timestamp"] = nowMillis();
  return j;
}

json makeAttachTerminalResponse(const string& terminalId, bool success,
                                const optional<string>& error) {
  json j = newMessage(RelayMessageType::ATTACH_TERMINAL_RESPONSE);
  j["terminalId"] = terminalId;
  j["success"] = success;
  if (error) {
    j["error"] = *error;
  }
  return j;
}

json makeCommandResponse(const string& requestId, bool success,
                         const optional<json>& result,
                         const optional<string>& error) {
  json j = newMessage(RelayMessageType::COMMAND_RESPONSE);
  j["requestId"] = requestId;
  j["success"] = success;
  if (result) {
    j["result"] = *result;
  }
  if (error) {
    j["error"] = *error;
  }
  return j;
}

json makeProjectChanged(const string& projectId) {
  json j = newMessage(RelayMessageType::PROJECT_CHANGED);
  j["projectId"] = projectId;
  j["timestamp"] = nowMillis();
  return j;
}

json makeGitFilesChanged(const string& repoPath) {
  json j = newMessage(RelayMessageType::GIT_FILES_CHANGED);
  j["repoPath"] = repoPath;
  return j;
}
}  // namespace pt
