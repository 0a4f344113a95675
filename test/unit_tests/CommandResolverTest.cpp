#include "CommandResolver.hpp"

#include "TestHeaders.hpp"

using namespace pt;

namespace {
string envValue(const vector<string>& env, const string& key) {
  for (const auto& entry : env) {
    if (entry.rfind(key + "=", 0) == 0) {
      return entry.substr(key.size() + 1);
    }
  }
  return "";
}
}  // namespace

TEST_CASE("CommandResolver resolves programs", "[CommandResolver]") {
  CommandResolver resolver({"PATH=/usr/bin:/bin", "SHELL=/bin/sh", "FOO=bar"},
                           "/home/tester");

  SECTION("Empty command runs the login shell") {
    SpawnRequest request;
    ResolvedCommand resolved = resolver.resolve(request);
    REQUIRE(resolved.plan.program == "/bin/sh");
    REQUIRE(resolved.plan.argv == vector<string>{"-sh"});
    REQUIRE(resolved.title == "Shell");
    REQUIRE(resolved.kind == SessionKind::SHELL);
  }

  SECTION("Whitespace-only command is the same as empty") {
    SpawnRequest request;
    request.shell = "   ";
    REQUIRE(resolver.resolve(request).title == "Shell");
  }

  SECTION("Command line is split on whitespace and searched in PATH") {
    SpawnRequest request;
    request.shell = "sh -c  true";
    ResolvedCommand resolved = resolver.resolve(request);
    REQUIRE(resolved.plan.program.find("/sh") != string::npos);
    REQUIRE(resolved.plan.argv == vector<string>{"sh", "-c", "true"});
    REQUIRE(resolved.title == "sh");
    REQUIRE(resolved.kind == SessionKind::SHELL);
  }

  SECTION("Explicit args are passed verbatim") {
    SpawnRequest request;
    request.shell = "/bin/sh";
    request.args = vector<string>{"-c", "echo 'a b'"};
    ResolvedCommand resolved = resolver.resolve(request);
    REQUIRE(resolved.plan.program == "/bin/sh");
    REQUIRE(resolved.plan.argv ==
            vector<string>{"/bin/sh", "-c", "echo 'a b'"});
  }

  SECTION("Unknown programs go through the user's shell") {
    SpawnRequest request;
    request.shell = "no-such-program-xyz --flag it's";
    ResolvedCommand resolved = resolver.resolve(request);
    REQUIRE(resolved.plan.program == "/bin/sh");
    REQUIRE(resolved.plan.argv.size() == 5);
    REQUIRE(resolved.plan.argv[1] == "-i");
    REQUIRE(resolved.plan.argv[2] == "-l");
    REQUIRE(resolved.plan.argv[3] == "-c");
    REQUIRE(resolved.plan.argv[4] ==
            "exec no-such-program-xyz '--flag' 'it'\\''s'");
    REQUIRE(resolved.title == "no-such-program-xyz");
  }

  SECTION("Working directory is carried through") {
    SpawnRequest request;
    request.cwd = "/tmp";
    REQUIRE(resolver.resolve(request).plan.cwd == "/tmp");
  }
}

TEST_CASE("CommandResolver detects assistant programs", "[CommandResolver]") {
  REQUIRE(CommandResolver::isAssistantProgram("claude"));
  REQUIRE(CommandResolver::isAssistantProgram("/usr/local/bin/aider"));
  REQUIRE(CommandResolver::isAssistantProgram("opencode"));
  REQUIRE(CommandResolver::isAssistantProgram("pi"));
  REQUIRE_FALSE(CommandResolver::isAssistantProgram("bash"));
  REQUIRE_FALSE(CommandResolver::isAssistantProgram("claude-helper"));

  CommandResolver resolver({"PATH=/usr/bin:/bin", "SHELL=/bin/sh"}, "/home/t");
  SpawnRequest request;
  request.shell = "codex --model x";
  REQUIRE(resolver.resolve(request).kind == SessionKind::ASSISTANT);

  SECTION("Explicit kind wins") {
    request.kind = SessionKind::SHELL;
    REQUIRE(resolver.resolve(request).kind == SessionKind::SHELL);
  }
}

TEST_CASE("CommandResolver builds the child environment", "[CommandResolver]") {
  CommandResolver resolver(
      {"PATH=/usr/bin:/bin", "SHELL=/bin/sh", "TERM=dumb", "FOO=bar"},
      "/home/tester");
  SpawnRequest request;
  vector<string> env = resolver.resolve(request).plan.environment;

  REQUIRE(envValue(env, "TERM") == "xterm-256color");
  REQUIRE(envValue(env, "COLORTERM") == "truecolor");
  REQUIRE(envValue(env, "LANG") == "en_US.UTF-8");
  REQUIRE(envValue(env, "LC_ALL") == "en_US.UTF-8");
  REQUIRE(envValue(env, "FOO") == "bar");

  REQUIRE(envValue(env, "PATH") ==
          "/home/tester/bin:/home/tester/.local/bin:/home/tester/.cargo/bin:"
          "/home/tester/.pyenv/bin:/home/tester/.pyenv/shims:/usr/local/bin:"
          "/usr/bin:/bin");

  // TERM replaced rather than duplicated
  int termEntries = 0;
  for (const auto& entry : env) {
    if (entry.rfind("TERM=", 0) == 0) ++termEntries;
  }
  REQUIRE(termEntries == 1);
}

TEST_CASE("CommandResolver falls back to bash", "[CommandResolver]") {
  CommandResolver resolver({"PATH=/usr/bin:/bin"}, "/home/tester");
  REQUIRE(resolver.userShell() == "/bin/bash");
  REQUIRE(CommandResolver::shellQuote("plain") == "'plain'");
}

TEST_CASE("CommandResolver prefers user tool directories",
          "[CommandResolver]") {
  string scratch = (fs::temp_directory_path() / "pt_home_XXXXXX").string();
  REQUIRE(::mkdtemp(&scratch[0]) != NULL);
  string home = scratch + "/home";
  string systemDir = scratch + "/systemDir";
  fs::create_directories(home + "/.local/bin");
  fs::create_directories(systemDir);
  for (const auto& dir : {home + "/.local/bin", systemDir}) {
    std::ofstream(dir + "/pt-tool") << "#!/bin/sh\n";
    fs::permissions(dir + "/pt-tool", fs::perms::owner_all);
  }

  CommandResolver resolver({"PATH=" + systemDir + ":/usr/local/bin"}, home);
  REQUIRE(resolver.findInPath("pt-tool") ==
          optional<string>(home + "/.local/bin/pt-tool"));
  // Already present directories are not repeated
  string path = resolver.augmentedPath();
  REQUIRE(path.find("/usr/local/bin") == path.rfind("/usr/local/bin"));
  REQUIRE(path.find(systemDir) > path.find(home));

  fs::remove_all(scratch);
}
