#include "RelayClient.hpp"

#include "RelayUrl.hpp"

namespace pt {
string relayStateName(RelayState state) {
  switch (state) {
    case RelayState::DISABLED:
      return "disabled";
    case RelayState::CONNECTING:
      return "connecting";
    case RelayState::REGISTERED:
      return "registered";
    case RelayState::DISCONNECTED:
      return "disconnected";
  }
  return "unknown";
}

RelayClient::RelayClient(shared_ptr<RelaySocketFactory> _socketFactory,
                         shared_ptr<HostEventSink> _sink,
                         std::chrono::milliseconds _reconnectDelay)
    : socketFactory(_socketFactory),
      sink(_sink),
      reconnectDelay(_reconnectDelay),
      generation(0),
      state(RelayState::DISABLED),
      connected(false) {}

RelayClient::~RelayClient() { shutdown(); }

void RelayClient::shutdown() {
  disable();
  lock_guard<mutex> lifecycleGuard(lifecycleMutex);
  retireLoopThread();
  for (auto& retired : retiredLoops) {
    if (retired->get_id() == this_thread::get_id()) {
      retired->detach();
    } else {
      retired->join();
    }
  }
  retiredLoops.clear();
}

void RelayClient::retireLoopThread() {
  if (!loopThread) {
    return;
  }
  if (loopThread->get_id() == this_thread::get_id()) {
    // Called from a message handler: the loop unwinds after it returns
    retiredLoops.push_back(loopThread);
  } else {
    loopThread->join();
  }
  loopThread.reset();
}

void RelayClient::setHandler(shared_ptr<RelayMessageHandler> _handler) {
  lock_guard<mutex> guard(stateMutex);
  handler = _handler;
}

void RelayClient::enable(const RelayConfig& config) {
  lock_guard<mutex> lifecycleGuard(lifecycleMutex);
  {
    lock_guard<mutex> guard(stateMutex);
    if (state != RelayState::DISABLED) {
      VLOG(1) << "Relay already enabled";
      return;
    }
  }
  // A previous loop may still be unwinding after disable()
  retireLoopThread();

  uint64_t myGeneration;
  {
    lock_guard<mutex> guard(stateMutex);
    myGeneration = ++generation;
    state = RelayState::CONNECTING;
  }
  LOG(INFO) << "Relay enabled, connecting to " << config.relayUrl;
  loopThread.reset(new thread(&RelayClient::run, this, myGeneration, config));
}

void RelayClient::disable() {
  lock_guard<mutex> lifecycleGuard(lifecycleMutex);
  lock_guard<mutex> eventGuard(eventMutex);
  shared_ptr<RelaySocket> socket;
  shared_ptr<OutboundQueue> queue;
  bool wasConnected;
  {
    lock_guard<mutex> guard(stateMutex);
    if (state == RelayState::DISABLED) {
      return;
    }
    ++generation;
    state = RelayState::DISABLED;
    socket = activeSocket;
    activeSocket.reset();
    queue = outbound;
    outbound.reset();
    wasConnected = connected;
    connected = false;
  }
  stateCv.notify_all();

  if (queue) {
    queue->close();
  }
  if (socket) {
    socket->close();
  }
  if (wasConnected) {
    sink->emit(HostEvent::connectivityChanged(false));
  }
  LOG(INFO) << "Relay disabled";
}

bool RelayClient::isEnabled() {
  lock_guard<mutex> guard(stateMutex);
  return state != RelayState::DISABLED;
}

bool RelayClient::isConnected() {
  lock_guard<mutex> guard(stateMutex);
  return connected;
}

RelayState RelayClient::getState() {
  lock_guard<mutex> guard(stateMutex);
  return state;
}

bool RelayClient::isRegistered() {
  lock_guard<mutex> guard(stateMutex);
  return state == RelayState::REGISTERED && outbound;
}

void RelayClient::send(const json& message) {
  shared_ptr<OutboundQueue> queue;
  {
    lock_guard<mutex> guard(stateMutex);
    if (state != RelayState::REGISTERED || !outbound) {
      VLOG(2) << "Dropping outbound message, relay not registered";
      return;
    }
    queue = outbound;
  }
  queue->push(dumpJson(message));
}

void RelayClient::run(uint64_t myGeneration, RelayConfig config) {
  el::Helpers::setThreadName("relay-loop");
  string endpoint = RelayUrl::socketEndpoint(config.relayUrl);
  while (true) {
    try {
      serve(myGeneration, endpoint, config);
    } catch (const RelayConnectFailure& rcf) {
      LOG(WARNING) << "Relay connection failed: " << rcf.what();
    } catch (const std::runtime_error& re) {
      LOG(WARNING) << "Relay connection lost: " << re.what();
    }
    markDisconnected(myGeneration);

    unique_lock<mutex> lock(stateMutex);
    if (generation != myGeneration) {
      break;
    }
    VLOG(1) << "Reconnecting to relay in " << reconnectDelay.count() << "ms";
    if (stateCv.wait_for(lock, reconnectDelay, [this, myGeneration] {
          return generation != myGeneration;
        })) {
      break;
    }
    state = RelayState::CONNECTING;
  }
  VLOG(1) << "Relay loop finished";
}

void RelayClient::serve(uint64_t myGeneration, const string& endpoint,
                        const RelayConfig& config) {
  shared_ptr<RelaySocket> socket = socketFactory->create(endpoint);
  {
    lock_guard<mutex> guard(stateMutex);
    if (generation != myGeneration) {
      return;
    }
    activeSocket = socket;
  }

  socket->connect();
  {
    lock_guard<mutex> guard(stateMutex);
    if (generation != myGeneration) {
      // Disabled while connecting: this socket must not register
      VLOG(1) << "Dropping relay connection that finished after disable";
      return;
    }
  }
  socket->send(dumpJson(makeRegisterDesktop(config.deviceId, config.deviceName,
                                            config.pairingCode,
                                            config.pairingPassphrase)));

  shared_ptr<OutboundQueue> queue(new OutboundQueue());
  {
    lock_guard<mutex> eventGuard(eventMutex);
    {
      lock_guard<mutex> guard(stateMutex);
      if (generation != myGeneration) {
        return;
      }
      outbound = queue;
      state = RelayState::REGISTERED;
      connected = true;
    }
    LOG(INFO) << "Registered with relay " << endpoint << " as "
              << config.deviceName;
    sink->emit(HostEvent::connectivityChanged(true));
  }

  thread writer(&RelayClient::runWriter, this, queue, socket);
  try {
    readLoop(socket);
  } catch (const std::runtime_error&) {
    queue->close();
    socket->close();
    writer.join();
    throw;
  }
  queue->close();
  socket->close();
  writer.join();
}

void RelayClient::readLoop(shared_ptr<RelaySocket> socket) {
  string text;
  while (socket->receive(&text)) {
    VLOG(2) << "Relay frame: " << text.size() << " bytes";
    RelayMessage message;
    try {
      message = RelayMessage::parse(text);
    } catch (const ProtocolDecodeError& pde) {
      LOG(WARNING) << "Ignoring undecodable relay frame: " << pde.what();
      continue;
    }

    shared_ptr<RelayMessageHandler> currentHandler;
    {
      lock_guard<mutex> guard(stateMutex);
      currentHandler = handler;
    }
    if (!currentHandler) {
      continue;
    }
    try {
      currentHandler->handleMessage(message);
    } catch (const std::runtime_error& re) {
      LOG(ERROR) << "Failed to handle relay message "
                 << relayMessageTypeName(message.type) << ": " << re.what();
    }
  }
  LOG(INFO) << "Relay closed the connection";
}

void RelayClient::runWriter(shared_ptr<OutboundQueue> queue,
                            shared_ptr<RelaySocket> socket) {
  el::Helpers::setThreadName("relay-writer");
  string message;
  while (queue->pop(&message)) {
    try {
      socket->send(message);
    } catch (const std::runtime_error& re) {
      LOG(WARNING) << "Relay write failed: " << re.what();
      // Unblocks the reader, which tears the connection down
      socket->close();
      return;
    }
  }
}

void RelayClient::markDisconnected(uint64_t myGeneration) {
  lock_guard<mutex> eventGuard(eventMutex);
  shared_ptr<OutboundQueue> queue;
  bool wasConnected;
  {
    lock_guard<mutex> guard(stateMutex);
    if (generation != myGeneration) {
      return;
    }
    activeSocket.reset();
    queue = outbound;
    outbound.reset();
    state = RelayState::DISCONNECTED;
    wasConnected = connected;
    connected = false;
  }
  if (queue) {
    queue->close();
  }
  if (wasConnected) {
    sink->emit(HostEvent::connectivityChanged(false));
  }
}
}  // namespace pt
