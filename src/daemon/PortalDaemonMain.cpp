#include <cxxopts.hpp>

#include "DaemonStreams.hpp"
#include "JsonLinesEventSink.hpp"
#include "KeyValueStore.hpp"
#include "LogHandler.hpp"
#include "PortalContext.hpp"
#include "ProjectCatalog.hpp"
#include "SimpleIni.h"
#include "WebSocketRelaySocket.hpp"

using namespace pt;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  pt::HandleTerminate();

  cxxopts::Options options("portaltermd",
                           "Terminal sessions you can drive from a paired "
                           "device");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("relayurl", "Relay server url (ws:// or wss://)",
         cxxopts::value<std::string>())  //
        ("devicename", "Name shown on paired devices",
         cxxopts::value<std::string>())                        //
        ("enable", "Enable the relay connection")               //
        ("disable", "Disable the relay connection")             //
        ("regenerate", "Generate a new pairing code and passphrase")  //
        ("spawn", "Start a terminal session running this command line",
         cxxopts::value<std::vector<std::string>>())  //
        ("cwd", "Working directory for spawned sessions",
         cxxopts::value<std::string>()->default_value(""))  //
        ("capacity", "Bytes of output kept per session for replay",
         cxxopts::value<size_t>())  //
        ("events", "Append host events to this file instead of stdout",
         cxxopts::value<std::string>()->default_value(""))  //
        ("store", "Location of the persistent store",
         cxxopts::value<std::string>()->default_value(
             FileKeyValueStore::defaultPath()))  //
        ("logdir", "Directory for log files",
         cxxopts::value<std::string>()->default_value(
             LogHandler::defaultLogDirectory()))  //
        ("logtostdout", "log to stdout")          //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "portaltermd version " << PT_VERSION << endl;
      exit(0);
    }
    if (result.count("enable") && result.count("disable")) {
      CLOG(INFO, "stdout") << "--enable and --disable are exclusive" << endl;
      exit(1);
    }
    string eventsPath = result["events"].as<string>();
    if (result.count("logtostdout") && eventsPath.empty()) {
      // stdout carries the event stream unless it is sent elsewhere
      CLOG(INFO, "stdout") << "--logtostdout needs --events <file>" << endl;
      exit(1);
    }

    if (sodium_init() == -1) {
      STFATAL << "libsodium init failed";
    }

    // default max log file size is 20MB
    string maxlogsize = "20971520";
    string relayUrl;
    string deviceName;
    size_t capacity = DEFAULT_OUTPUT_BUFFER_BYTES;

    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty()) {
      // Load the config file
      CSimpleIniA ini(true, false, false);
      SI_Error rc = ini.LoadFile(cfgfilename.c_str());
      if (rc == 0) {
        const char *urlPtr = ini.GetValue("Relay", "url", NULL);
        if (urlPtr) {
          relayUrl = string(urlPtr);
        }
        const char *namePtr = ini.GetValue("Relay", "device_name", NULL);
        if (namePtr) {
          deviceName = string(namePtr);
        }
        const char *bufferBytes = ini.GetValue("Terminal", "buffer_bytes", NULL);
        if (bufferBytes && atoll(bufferBytes) > 0) {
          capacity = size_t(atoll(bufferBytes));
        }
        // read verbose level (prioritize command line option over cfgfile)
        const char *vlevel = ini.GetValue("Debug", "verbose", NULL);
        if (!result.count("verbose") && vlevel) {
          el::Loggers::setVerboseLevel(atoi(vlevel));
        }
        // read log file size limit
        const char *logsize = ini.GetValue("Debug", "logsize", NULL);
        if (logsize && atoi(logsize) != 0) {
          // make sure maxlogsize is a string of int value
          maxlogsize = string(logsize);
        }
      } else {
        STFATAL << "Invalid config file: " << cfgfilename;
      }
    }

    if (result.count("verbose")) {
      el::Loggers::setVerboseLevel(result["verbose"].as<int>());
    }
    if (result.count("relayurl")) {
      relayUrl = result["relayurl"].as<string>();
    }
    if (result.count("devicename")) {
      deviceName = result["devicename"].as<string>();
    }
    if (result.count("capacity")) {
      capacity = result["capacity"].as<size_t>();
    }

    bool logToStdout = result.count("logtostdout") > 0;
    LogHandler::setupLogFiles(&defaultConf, result["logdir"].as<string>(),
                              "portaltermd", logToStdout, !logToStdout,
                              maxlogsize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("portaltermd-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    // Every thread created from here on inherits the blocked set, so the
    // termination signals are only ever seen by sigwait below.
    sigset_t stopSignals;
    sigemptyset(&stopSignals);
    sigaddset(&stopSignals, SIGINT);
    sigaddset(&stopSignals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &stopSignals, NULL) != 0) {
      STFATAL << "Could not block termination signals";
    }
    // Writes to a dead relay socket must not kill the daemon
    ::signal(SIGPIPE, SIG_IGN);

    shared_ptr<KeyValueStore> store(
        new FileKeyValueStore(result["store"].as<string>()));
    DaemonStreams streams(eventsPath);
    shared_ptr<HostEventSink> sink(new JsonLinesEventSink(streams.events()));
    shared_ptr<ProjectCatalog> catalog(new StaticProjectCatalog());
    shared_ptr<RelaySocketFactory> socketFactory(
        new WebSocketRelaySocketFactory());

    PortalOptions portalOptions;
    portalOptions.bufferCapacity = capacity;
    portalOptions.autoConnect = !result.count("disable");

    LOG(INFO) << "Starting portaltermd " << PT_VERSION;
    PortalContext context(store, socketFactory, catalog, sink, portalOptions);

    if (!relayUrl.empty() || !deviceName.empty()) {
      RelayConfig config = context.getConfig();
      if (!relayUrl.empty()) config.relayUrl = relayUrl;
      if (!deviceName.empty()) config.deviceName = deviceName;
      context.setConfig(config);
    }
    if (result.count("regenerate")) {
      context.regeneratePairing();
    }
    if (result.count("disable")) {
      context.disable();
    } else if (result.count("enable")) {
      context.enable();
    }
    printPairing(streams.console(), context.getStatus());

    if (result.count("spawn")) {
      for (const auto &commandLine : result["spawn"].as<vector<string>>()) {
        SpawnRequest request;
        request.shell = commandLine;
        request.cwd = result["cwd"].as<string>();
        string id = context.spawn(request);
        streams.console() << "Session " << id << ": " << commandLine << endl;
      }
    }

    int signum = 0;
    if (sigwait(&stopSignals, &signum) != 0) {
      STFATAL << "sigwait failed";
    }
    LOG(INFO) << "Got signal " << signum << ", shutting down";
    context.killAll();
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const ConfigPersistenceError &cpe) {
    cerr << "Config error: " << cpe.what() << endl;
    exit(1);
  } catch (const SpawnFailure &sf) {
    cerr << "Could not start session: " << sf.what() << endl;
    exit(1);
  } catch (const std::runtime_error &re) {
    cerr << "Error: " << re.what() << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
