#include "PortalContext.hpp"

#include "FakeHostEventSink.hpp"
#include "FakeRelaySocket.hpp"
#include "TestHeaders.hpp"

using namespace pt;

namespace {
PortalOptions fastOptions() {
  PortalOptions options;
  options.reconnectDelay = std::chrono::milliseconds(50);
  return options;
}

struct PortalFixture {
  PortalFixture()
      : kv(new MemoryKeyValueStore()),
        factory(new FakeRelaySocketFactory()),
        catalog(new StaticProjectCatalog()),
        sink(new FakeHostEventSink()) {}

  shared_ptr<PortalContext> create(
      const PortalOptions& options = fastOptions()) {
    return shared_ptr<PortalContext>(
        new PortalContext(kv, factory, catalog, sink, options));
  }

  RelayConfig stored() { return RelayConfigStore(kv).load(); }

  shared_ptr<MemoryKeyValueStore> kv;
  shared_ptr<FakeRelaySocketFactory> factory;
  shared_ptr<StaticProjectCatalog> catalog;
  shared_ptr<FakeHostEventSink> sink;
};
}  // namespace

TEST_CASE("PortalContext starts disabled with a fresh identity",
          "[PortalContext]") {
  PortalFixture f;
  shared_ptr<PortalContext> portal = f.create();

  PortalStatus status = portal->getStatus();
  REQUIRE_FALSE(status.isEnabled);
  REQUIRE_FALSE(status.isConnected);
  REQUIRE(status.deviceId.size() == 32);
  REQUIRE(status.pairingCode.size() == 6);
  REQUIRE(status.linkedDevices.empty());
  REQUIRE(f.stored().deviceId == status.deviceId);

  json j = status;
  REQUIRE(j["isEnabled"] == false);
  REQUIRE(j["pairingCode"] == status.pairingCode);

  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  REQUIRE(f.factory->createdCount() == 0);
}

TEST_CASE("PortalContext enable and disable", "[PortalContext]") {
  PortalFixture f;
  shared_ptr<PortalContext> portal = f.create();

  portal->enable();
  REQUIRE(f.stored().enabled);
  REQUIRE(waitUntil([&] { return portal->getStatus().isConnected; }));
  shared_ptr<FakeRelaySocket> socket = f.factory->lastSocket();
  REQUIRE(socket->url == DEFAULT_RELAY_URL + "/ws");
  json registration = socket->getSentOfType("register_desktop").at(0);
  REQUIRE(registration["deviceId"] == portal->getStatus().deviceId);

  portal->disable();
  PortalStatus status = portal->getStatus();
  REQUIRE_FALSE(status.isEnabled);
  REQUIRE_FALSE(status.isConnected);
  REQUIRE_FALSE(f.stored().enabled);
  REQUIRE(f.sink->connectivity() == vector<bool>{true, false});
}

TEST_CASE("PortalContext reconnects when it was enabled before",
          "[PortalContext]") {
  PortalFixture f;
  RelayConfigStore(f.kv).update([](RelayConfig& c) { c.enabled = true; });

  SECTION("Auto connect") {
    shared_ptr<PortalContext> portal = f.create();
    REQUIRE(portal->getStatus().isEnabled);
    REQUIRE(waitUntil([&] { return portal->getStatus().isConnected; }));
  }

  SECTION("Auto connect turned off") {
    PortalOptions options = fastOptions();
    options.autoConnect = false;
    shared_ptr<PortalContext> portal = f.create(options);
    REQUIRE_FALSE(portal->getStatus().isEnabled);
    REQUIRE(f.factory->createdCount() == 0);
  }
}

TEST_CASE("PortalContext pairing and config", "[PortalContext]") {
  PortalFixture f;
  shared_ptr<PortalContext> portal = f.create();
  RelayConfig before = portal->getConfig();
  RelayConfigStore(f.kv).update([](RelayConfig& c) {
    c.linkedDevices.push_back({"d1", "Phone", "ios", "1"});
  });
  REQUIRE(portal->getStatus().linkedDevices.size() == 1);

  SECTION("Regenerate while disabled") {
    RelayConfig after = portal->regeneratePairing();
    REQUIRE((after.pairingCode != before.pairingCode ||
             after.pairingPassphrase != before.pairingPassphrase));
    REQUIRE(after.deviceId == before.deviceId);
    REQUIRE(after.linkedDevices.empty());
    REQUIRE(portal->getStatus().pairingCode == after.pairingCode);
    REQUIRE(f.factory->createdCount() == 0);
  }

  SECTION("Regenerate while connected re-registers") {
    portal->enable();
    REQUIRE(waitUntil([&] { return portal->getStatus().isConnected; }));
    RelayConfig after = portal->regeneratePairing();
    REQUIRE(waitUntil([&] {
      return f.factory->createdCount() == 2 && portal->getStatus().isConnected;
    }));
    json registration =
        f.factory->lastSocket()->getSentOfType("register_desktop").at(0);
    REQUIRE(registration["pairingCode"] == after.pairingCode);
    REQUIRE(registration["pairingPassphrase"] == after.pairingPassphrase);
  }

  SECTION("setConfig with a new url restarts the connection") {
    portal->enable();
    REQUIRE(waitUntil([&] { return portal->getStatus().isConnected; }));
    RelayConfig config = portal->getConfig();
    config.relayUrl = "ws://other.relay:9000";
    portal->setConfig(config);
    REQUIRE(waitUntil([&] {
      return f.factory->createdCount() == 2 && portal->getStatus().isConnected;
    }));
    REQUIRE(f.factory->lastSocket()->url == "ws://other.relay:9000/ws");
    REQUIRE(f.stored().relayUrl == "ws://other.relay:9000");
  }

  SECTION("setConfig with enabled off disconnects") {
    portal->enable();
    REQUIRE(waitUntil([&] { return portal->getStatus().isConnected; }));
    RelayConfig config = portal->getConfig();
    config.enabled = false;
    portal->setConfig(config);
    REQUIRE_FALSE(portal->getStatus().isEnabled);
    REQUIRE_FALSE(f.stored().enabled);
  }
}

TEST_CASE("PortalContext outbound notifications", "[PortalContext]") {
  PortalFixture f;
  shared_ptr<PortalContext> portal = f.create();

  SECTION("Dropped while disabled") {
    portal->notifyProjectChanged("p1");
    portal->notifyGitFilesChanged("/repo");
    portal->sendCommandResponse("r1", true, nullopt, nullopt);
    portal->sendMessage(json{{"type", "custom"}});
    REQUIRE(f.factory->createdCount() == 0);
  }

  SECTION("Sent while connected") {
    portal->enable();
    REQUIRE(waitUntil([&] { return portal->getStatus().isConnected; }));
    shared_ptr<FakeRelaySocket> socket = f.factory->lastSocket();
    portal->notifyProjectChanged("p1");
    portal->notifyGitFilesChanged("/repo");
    portal->sendCommandResponse("r1", false, nullopt, string("no such file"));
    portal->sendMessage(json{{"type", "custom"}, {"id", "c1"}});
    REQUIRE(waitUntil([&] { return socket->getSent().size() == 5; }));

    REQUIRE(socket->getSentOfType("project_changed").at(0)["projectId"] ==
            "p1");
    REQUIRE(socket->getSentOfType("git_files_changed").at(0)["repoPath"] ==
            "/repo");
    json response = socket->getSentOfType("command_response").at(0);
    REQUIRE(response["requestId"] == "r1");
    REQUIRE(response["success"] == false);
    REQUIRE(response["error"] == "no such file");
    REQUIRE(socket->getSentOfType("custom").at(0)["id"] == "c1");
  }
}

TEST_CASE("PortalContext drives sessions from the relay", "[PortalContext]") {
  PortalFixture f;
  shared_ptr<PortalContext> portal = f.create();
  REQUIRE_FALSE(portal->registerRemoteTerminal("missing"));

  SpawnRequest request;
  request.shell = "/bin/cat";
  string id = portal->spawn(request);
  REQUIRE(portal->list().size() == 1);
  portal->write(id, "before\n");
  REQUIRE(waitUntil([&] {
    return portal->getBuffer(id).find("before\r\nbefore\r\n") != string::npos;
  }));

  portal->enable();
  REQUIRE(waitUntil([&] { return portal->getStatus().isConnected; }));
  shared_ptr<FakeRelaySocket> socket = f.factory->lastSocket();

  SECTION("Host-side attach replays the buffer") {
    REQUIRE(portal->registerRemoteTerminal(id));
    REQUIRE(waitUntil([&] {
      return socket->getSentOfType("terminal_output").size() == 1;
    }));
    REQUIRE(socket->getSentOfType("terminal_output")[0]["data"] ==
            portal->getBuffer(id));
  }

  SECTION("Remote status, attach, input and kill") {
    socket->deliver(json{{"type", "request_status"}});
    REQUIRE(waitUntil(
        [&] { return socket->getSentOfType("status_update").size() == 1; }));
    REQUIRE(socket->getSentOfType("status_update")[0]["terminals"][0]["id"] ==
            id);

    socket->deliver(json{{"type", "attach_terminal"}, {"terminalId", id}});
    REQUIRE(waitUntil([&] {
      return socket->getSentOfType("attach_terminal_response").size() == 1;
    }));
    REQUIRE(portal->getAttachments()->isAttached(id));

    socket->deliver(
        json{{"type", "terminal_input"}, {"terminalId", id}, {"data", "remote\n"}});
    REQUIRE(waitUntil([&] {
      for (const auto& message : socket->getSentOfType("terminal_output")) {
        if (message["data"].get<string>().find("remote") != string::npos) {
          return true;
        }
      }
      return false;
    }));

    socket->deliver(json{{"type", "kill_terminal"}, {"terminalId", id}});
    REQUIRE(waitUntil([&] { return portal->list().empty(); }));
    REQUIRE_FALSE(portal->getAttachments()->isAttached(id));
  }

  SECTION("Disabling forgets attachments") {
    REQUIRE(portal->registerRemoteTerminal(id));
    portal->disable();
    REQUIRE(portal->getAttachments()->getAttached().empty());
    REQUIRE(portal->list().size() == 1);
  }
}
