#include "RelayClient.hpp"

#include "FakeHostEventSink.hpp"
#include "FakeRelaySocket.hpp"
#include "TestHeaders.hpp"

using namespace pt;

namespace {
class RecordingHandler : public RelayMessageHandler {
 public:
  RecordingHandler() : failFirst(false) {}

  virtual void handleMessage(const RelayMessage& message) {
    lock_guard<mutex> guard(handlerMutex);
    received.push_back(message.body);
    if (failFirst && received.size() == 1) {
      throw std::runtime_error("handler failure");
    }
  }

  vector<json> getReceived() {
    lock_guard<mutex> guard(handlerMutex);
    return received;
  }

  bool failFirst;

 protected:
  mutex handlerMutex;
  vector<json> received;
};

// Restarts the connection from inside message dispatch
class RestartingHandler : public RelayMessageHandler {
 public:
  RestartingHandler(RelayClient* _client, const RelayConfig& _config)
      : restarts(0), client(_client), config(_config) {}

  virtual void handleMessage(const RelayMessage& message) {
    client->disable();
    client->enable(config);
    ++restarts;
  }

  atomic<int> restarts;

 protected:
  RelayClient* client;
  RelayConfig config;
};

RelayConfig testConfig() {
  RelayConfig config = RelayConfig::generateDefaults();
  config.enabled = true;
  config.relayUrl = "ws://relay.test/";
  config.deviceName = "test-desktop";
  return config;
}
}  // namespace

TEST_CASE("RelayClient registration", "[RelayClient]") {
  shared_ptr<FakeRelaySocketFactory> factory(new FakeRelaySocketFactory());
  shared_ptr<FakeHostEventSink> sink(new FakeHostEventSink());
  shared_ptr<RecordingHandler> handler(new RecordingHandler());
  RelayClient client(factory, sink, std::chrono::milliseconds(50));
  client.setHandler(handler);

  REQUIRE(client.getState() == RelayState::DISABLED);
  REQUIRE_FALSE(client.isRegistered());
  client.send(makeProjectChanged("early"));

  RelayConfig config = testConfig();
  client.enable(config);
  REQUIRE(client.isEnabled());
  REQUIRE(waitUntil([&] { return client.isConnected(); }));
  REQUIRE(client.getState() == RelayState::REGISTERED);
  REQUIRE(sink->connectivity() == vector<bool>{true});

  shared_ptr<FakeRelaySocket> socket = factory->lastSocket();
  REQUIRE(socket->url == "ws://relay.test/ws");
  vector<json> sent = socket->getSentJson();
  REQUIRE(sent.size() == 1);
  REQUIRE(sent[0]["type"] == "register_desktop");
  REQUIRE(sent[0]["deviceId"] == config.deviceId);
  REQUIRE(sent[0]["deviceName"] == "test-desktop");
  REQUIRE(sent[0]["pairingCode"] == config.pairingCode);
  REQUIRE(sent[0]["pairingPassphrase"] == config.pairingPassphrase);

  SECTION("Enabling again is a no-op") {
    client.enable(config);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE(factory->createdCount() == 1);
  }

  SECTION("Outbound messages are written in order") {
    client.send(makeProjectChanged("p1"));
    client.send(makeGitFilesChanged("/repo"));
    REQUIRE(waitUntil([&] { return socket->getSent().size() == 3; }));
    sent = socket->getSentJson();
    REQUIRE(sent[1]["type"] == "project_changed");
    REQUIRE(sent[1]["projectId"] == "p1");
    REQUIRE(sent[2]["type"] == "git_files_changed");
  }

  SECTION("Inbound messages are dispatched in order") {
    for (int i = 0; i < 20; ++i) {
      socket->deliver(json{{"type", "command"}, {"seq", i}});
    }
    REQUIRE(waitUntil([&] { return handler->getReceived().size() == 20; }));
    vector<json> received = handler->getReceived();
    for (int i = 0; i < 20; ++i) {
      REQUIRE(received[i]["seq"] == i);
    }
  }

  SECTION("Undecodable frames are skipped") {
    socket->deliver(string("this is not json"));
    socket->deliver(string("{\"no\":\"type\"}"));
    socket->deliver(json{{"type", "request_status"}});
    REQUIRE(waitUntil([&] { return handler->getReceived().size() == 1; }));
    REQUIRE(handler->getReceived()[0]["type"] == "request_status");
    REQUIRE(client.isConnected());
    REQUIRE(factory->createdCount() == 1);
  }

  SECTION("Disable takes effect immediately") {
    client.disable();
    REQUIRE_FALSE(client.isEnabled());
    REQUIRE_FALSE(client.isConnected());
    REQUIRE_FALSE(client.isRegistered());
    REQUIRE(client.getState() == RelayState::DISABLED);
    REQUIRE(sink->connectivity() == vector<bool>{true, false});
    REQUIRE(socket->isClosed());

    client.send(makeProjectChanged("late"));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    REQUIRE(socket->getSent().size() == 1);
    REQUIRE(factory->createdCount() == 1);
    REQUIRE(sink->connectivity() == vector<bool>{true, false});

    SECTION("And can be enabled again") {
      client.enable(config);
      REQUIRE(waitUntil([&] { return client.isConnected(); }));
      REQUIRE(factory->createdCount() == 2);
      REQUIRE(sink->connectivity() == vector<bool>{true, false, true});
    }
  }

  SECTION("Peer close leads to a reconnect") {
    socket->closeFromPeer();
    REQUIRE(waitUntil([&] {
      return factory->createdCount() == 2 && client.isConnected();
    }));
    REQUIRE(sink->connectivity() == vector<bool>{true, false, true});
    REQUIRE(factory->lastSocket()->getSentOfType("register_desktop").size() ==
            1);
  }

  client.shutdown();
}

TEST_CASE("RelayClient retries failed connections", "[RelayClient]") {
  shared_ptr<FakeRelaySocketFactory> factory(new FakeRelaySocketFactory());
  shared_ptr<FakeHostEventSink> sink(new FakeHostEventSink());
  RelayClient client(factory, sink, std::chrono::milliseconds(50));

  factory->failNext(2);
  client.enable(testConfig());
  REQUIRE(waitUntil([&] { return client.isConnected(); }));
  REQUIRE(factory->createdCount() == 3);
  REQUIRE_FALSE(factory->getSocket(0)->isConnected());
  REQUIRE(factory->getSocket(2)->isConnected());
  // Failed attempts were never connected, so nothing was reported for them
  REQUIRE(sink->connectivity() == vector<bool>{true});
}

TEST_CASE("RelayClient survives handler failures", "[RelayClient]") {
  shared_ptr<FakeRelaySocketFactory> factory(new FakeRelaySocketFactory());
  shared_ptr<FakeHostEventSink> sink(new FakeHostEventSink());
  shared_ptr<RecordingHandler> handler(new RecordingHandler());
  handler->failFirst = true;
  RelayClient client(factory, sink, std::chrono::milliseconds(50));
  client.setHandler(handler);

  client.enable(testConfig());
  REQUIRE(waitUntil([&] { return client.isConnected(); }));
  factory->lastSocket()->deliver(json{{"type", "command"}, {"n", 1}});
  factory->lastSocket()->deliver(json{{"type", "command"}, {"n", 2}});
  REQUIRE(waitUntil([&] { return handler->getReceived().size() == 2; }));
  REQUIRE(client.isConnected());
  REQUIRE(factory->createdCount() == 1);
}

TEST_CASE("RelayClient disable while retrying", "[RelayClient]") {
  shared_ptr<FakeRelaySocketFactory> factory(new FakeRelaySocketFactory());
  shared_ptr<FakeHostEventSink> sink(new FakeHostEventSink());
  RelayClient client(factory, sink, std::chrono::seconds(30));

  factory->failNext(1);
  client.enable(testConfig());
  REQUIRE(waitUntil([&] {
    return client.getState() == RelayState::DISCONNECTED;
  }));
  client.disable();
  REQUIRE(client.getState() == RelayState::DISABLED);
  // The 30s back-off is abandoned, not waited out
  auto start = std::chrono::steady_clock::now();
  client.shutdown();
  REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
  REQUIRE(factory->createdCount() == 1);
  REQUIRE(sink->connectivity().empty());
}

TEST_CASE("RelayClient disable during connect", "[RelayClient]") {
  shared_ptr<FakeRelaySocketFactory> factory(new FakeRelaySocketFactory());
  shared_ptr<FakeHostEventSink> sink(new FakeHostEventSink());
  shared_ptr<ConnectGate> gate(new ConnectGate());
  factory->holdConnects(gate);
  RelayClient client(factory, sink, std::chrono::milliseconds(50));

  client.enable(testConfig());
  REQUIRE(waitUntil([&] { return gate->getWaiting() == 1; }));
  client.disable();
  gate->release();
  client.shutdown();

  shared_ptr<FakeRelaySocket> socket = factory->getSocket(0);
  REQUIRE(socket->isConnected());
  // The late connection never registered or reported itself
  REQUIRE(socket->getSendAttempts() == 0);
  REQUIRE(factory->createdCount() == 1);
  REQUIRE(client.getState() == RelayState::DISABLED);
  REQUIRE(sink->connectivity().empty());
}

TEST_CASE("RelayClient restart from a message handler", "[RelayClient]") {
  shared_ptr<FakeRelaySocketFactory> factory(new FakeRelaySocketFactory());
  shared_ptr<FakeHostEventSink> sink(new FakeHostEventSink());
  RelayClient client(factory, sink, std::chrono::milliseconds(50));
  RelayConfig config = testConfig();
  shared_ptr<RestartingHandler> handler(new RestartingHandler(&client, config));
  client.setHandler(handler);

  client.enable(config);
  REQUIRE(waitUntil([&] { return client.isConnected(); }));
  factory->lastSocket()->deliver(json{{"type", "request_status"}});

  REQUIRE(waitUntil([&] {
    return handler->restarts == 1 && factory->createdCount() == 2 &&
           client.isConnected();
  }));
  REQUIRE(factory->getSocket(0)->isClosed());
  REQUIRE(factory->getSocket(1)->getSentOfType("register_desktop").size() ==
          1);
  REQUIRE(sink->connectivity() == vector<bool>{true, false, true});

  client.shutdown();
  REQUIRE_FALSE(client.isEnabled());
}
