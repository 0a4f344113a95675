#ifndef __PT_RELAY_MESSAGE__
#define __PT_RELAY_MESSAGE__

#include "Errors.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "TerminalSession.hpp"

namespace pt {
/** @brief Every `type` tag the relay protocol knows about. */
enum class RelayMessageType {
  REGISTER_DESKTOP,
  DEVICE_LIST,
  REQUEST_STATUS,
  STATUS_UPDATE,
  COMMAND,
  COMMAND_RESPONSE,
  TERMINAL_INPUT,
  TERMINAL_OUTPUT,
  ATTACH_TERMINAL,
  ATTACH_TERMINAL_RESPONSE,
  DETACH_TERMINAL,
  KILL_TERMINAL,
  SELECT_PROJECT,
  PROJECT_CHANGED,
  GIT_FILES_CHANGED,
  ERROR,
  UNKNOWN,
};

/** @brief Wire name, e.g. `attach_terminal`. */
string relayMessageTypeName(RelayMessageType type);

/** @brief Inverse of `relayMessageTypeName`; unrecognized names are UNKNOWN. */
RelayMessageType relayMessageTypeFromName(const string& name);

/**
 * @brief One decoded inbound frame: the tag plus the full JSON object so that
 * passthrough kinds can be forwarded untouched.
 */
struct RelayMessage {
  RelayMessageType type;
  json body;

  /**
   * @brief Decodes one text frame.
   * @throws ProtocolDecodeError when the text is not a JSON object with a
   * string `type`.
   */
  static RelayMessage parse(const string& text);

  /** @brief String field or empty when absent or of another type. */
  string getString(const string& key) const;
};

/** @brief Project row as sent inside `status_update`. */
struct ProjectFolderInfo {
  string id;
  string name;
  string path;
};

struct ProjectInfo {
  string id;
  string name;
  string path;
  string lastOpened;
  optional<vector<ProjectFolderInfo>> folders;
};

void to_json(json& j, const ProjectFolderInfo& folder);
void to_json(json& j, const ProjectInfo& project);

// Builders for outbound frames. Each one stamps a fresh UUIDv4 `id`.
json makeRegisterDesktop(const string& deviceId, const string& deviceName,
                         const string& pairingCode,
                         const string& pairingPassphrase);
json makeStatusUpdate(const vector<ProjectInfo>& projects,
                      const optional<string>& activeProjectId,
                      const vector<SessionInfo>& terminals);
json makeTerminalOutput(const string& terminalId, const string& data);
json makeAttachTerminalResponse(const string& terminalId, bool success,
                                const optional<string>& error = nullopt);
json makeCommandResponse(const string& requestId, bool success,
                         const optional<json>& result,
                         const optional<string>& error);
json makeProjectChanged(const string& projectId);
json makeGitFilesChanged(const string& repoPath);
}  // namespace pt

#endif  // __PT_RELAY_MESSAGE__
