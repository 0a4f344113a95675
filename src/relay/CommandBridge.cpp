#include "CommandBridge.hpp"

namespace pt {
CommandBridge::CommandBridge(shared_ptr<SessionRegistry> _registry,
                             shared_ptr<RemoteAttachments> _attachments,
                             shared_ptr<RelayConfigStore> _configStore,
                             shared_ptr<ProjectCatalog> _catalog,
                             shared_ptr<HostEventSink> _sink)
    : registry(_registry),
      attachments(_attachments),
      configStore(_configStore),
      catalog(_catalog),
      sink(_sink) {}

void CommandBridge::setOutbox(shared_ptr<RelayOutbox> _outbox) {
  outbox = _outbox;
}

void CommandBridge::handleMessage(const RelayMessage& message) {
  VLOG(1) << "Relay message: " << relayMessageTypeName(message.type);
  switch (message.type) {
    case RelayMessageType::DEVICE_LIST:
      handleDeviceList(message);
      break;
    case RelayMessageType::REQUEST_STATUS:
      handleRequestStatus();
      break;
    case RelayMessageType::COMMAND:
    case RelayMessageType::SELECT_PROJECT:
      sink->emit(HostEvent::withPayload(HostEventKind::RELAY_INBOUND_COMMAND,
                                        message.body));
      break;
    case RelayMessageType::TERMINAL_INPUT:
      handleTerminalInput(message);
      break;
    case RelayMessageType::ATTACH_TERMINAL:
      handleAttachTerminal(message);
      break;
    case RelayMessageType::DETACH_TERMINAL:
      attachments->detach(message.getString("terminalId"));
      break;
    case RelayMessageType::KILL_TERMINAL: {
      string id = message.getString("terminalId");
      attachments->detach(id);
      registry->kill(id);
    } break;
    case RelayMessageType::ERROR:
      handleError(message);
      break;
    default:
      LOG(INFO) << "Ignoring relay message of type "
                << message.getString("type");
      break;
  }
}

void CommandBridge::handleDeviceList(const RelayMessage& message) {
  vector<LinkedDevice> devices;
  auto it = message.body.find("devices");
  if (it != message.body.end() && it->is_array()) {
    devices = it->get<vector<LinkedDevice>>();
  }
  configStore->update(
      [&devices](RelayConfig& config) { config.linkedDevices = devices; });
  LOG(INFO) << "Relay reports " << devices.size() << " linked devices";
  json payload = devices;
  sink->emit(
      HostEvent::withPayload(HostEventKind::RELAY_DEVICES_UPDATED, payload));
}

void CommandBridge::handleRequestStatus() {
  outbox->send(makeStatusUpdate(catalog->getAllProjects(),
                                catalog->getActiveProjectId(),
                                registry->list()));
}

void CommandBridge::handleTerminalInput(const RelayMessage& message) {
  string id = message.getString("terminalId");
  attachments->attach(id);
  try {
    registry->write(id, message.getString("data"));
  } catch (const SessionNotFound& snf) {
    VLOG(1) << "Dropping input for unknown terminal " << id;
    attachments->detach(id);
  }
}

void CommandBridge::handleAttachTerminal(const RelayMessage& message) {
  string id = message.getString("terminalId");
  shared_ptr<TerminalSession> session = registry->find(id);
  if (session.get() == NULL) {
    LOG(WARNING) << "Remote tried to attach to unknown terminal " << id;
    outbox->send(makeAttachTerminalResponse(
        id, false, string(SessionNotFound(id).what())));
    return;
  }
  attachments->attachWithReplay(id, *(session->output));
  outbox->send(makeAttachTerminalResponse(id, true));
  LOG(INFO) << "Remote attached to terminal " << id;
}

void CommandBridge::handleError(const RelayMessage& message) {
  string code = message.getString("code");
  string text = message.getString("message");
  json payload = {{"code", code.empty() ? "unknown" : code},
                  {"message", text.empty() ? "Unknown error" : text}};
  LOG(WARNING) << "Relay error " << payload["code"].get<string>() << ": "
               << payload["message"].get<string>();
  sink->emit(HostEvent::withPayload(HostEventKind::RELAY_ERROR, payload));
}
}  // namespace pt
