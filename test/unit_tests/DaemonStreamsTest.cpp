#include "DaemonStreams.hpp"

#include "JsonLinesEventSink.hpp"
#include "TestHeaders.hpp"

using namespace pt;

namespace {
PortalStatus testStatus() {
  PortalStatus status;
  status.isEnabled = true;
  status.isConnected = false;
  status.deviceId = "dev-1";
  status.deviceName = "desk";
  status.pairingCode = "123456";
  status.pairingPassphrase = "alpha-beta-gamma-delta";
  return status;
}

vector<string> lines(const string& text) {
  vector<string> result;
  std::istringstream in(text);
  string line;
  while (std::getline(in, line)) {
    result.push_back(line);
  }
  return result;
}
}  // namespace

TEST_CASE("DaemonStreams keeps events alone on their stream",
          "[DaemonStreams]") {
  std::ostringstream out;
  std::ostringstream err;

  SECTION("Events on stdout push text to stderr") {
    DaemonStreams streams("", out, err);
    REQUIRE(streams.eventsOnStdout());
    JsonLinesEventSink sink(streams.events());
    sink.emit(HostEvent::connectivityChanged(true));
    printPairing(streams.console(), testStatus());
    streams.console() << "Session s1: /bin/sh" << endl;
    sink.emit(HostEvent::sessionExited("s1"));

    vector<string> eventLines = lines(out.str());
    REQUIRE(eventLines.size() == 2);
    for (const auto& line : eventLines) {
      REQUIRE(json::parse(line).contains("event"));
    }
    REQUIRE(err.str().find("Pairing:    123456") != string::npos);
    REQUIRE(err.str().find("Session s1") != string::npos);
  }

  SECTION("An events file leaves stdout to people") {
    string scratch = (fs::temp_directory_path() / "pt_events_XXXXXX").string();
    REQUIRE(::mkdtemp(&scratch[0]) != NULL);
    string path = scratch + "/events.jsonl";
    {
      DaemonStreams streams(path, out, err);
      REQUIRE_FALSE(streams.eventsOnStdout());
      JsonLinesEventSink sink(streams.events());
      sink.emit(HostEvent::connectivityChanged(false));
      printPairing(streams.console(), testStatus());
    }
    REQUIRE(out.str().find("Passphrase: alpha-beta-gamma-delta") !=
            string::npos);
    REQUIRE(err.str().empty());

    std::ifstream in(path);
    string contents((std::istreambuf_iterator<char>(in)),
                    std::istreambuf_iterator<char>());
    vector<string> eventLines = lines(contents);
    REQUIRE(eventLines.size() == 1);
    REQUIRE(json::parse(eventLines[0])["connected"] == false);
    fs::remove_all(scratch);
  }

  SECTION("Unwritable events file is an error") {
    REQUIRE_THROWS_AS(DaemonStreams("/definitely/not/a/dir/events.jsonl"),
                      std::runtime_error);
  }
}
