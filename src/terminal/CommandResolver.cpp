#include "CommandResolver.hpp"

extern char** environ;

namespace pt {
namespace {
const char* ASSISTANT_PROGRAMS[] = {"claude", "aider",    "gemini",
                                    "codex",  "opencode", "pi"};

const char* EXTRA_PATH_DIRS[] = {"bin",         ".local/bin",   ".cargo/bin",
                                 ".pyenv/bin",  ".pyenv/shims"};

string envKey(const string& entry) { return entry.substr(0, entry.find('=')); }

void setEnv(vector<string>* env, const string& key, const string& value) {
  for (auto& entry : *env) {
    if (envKey(entry) == key) {
      entry = key + "=" + value;
      return;
    }
  }
  env->push_back(key + "=" + value);
}

string lookupHomeDir() {
  const char* home = ::getenv("HOME");
  if (home != NULL && *home) {
    return home;
  }
  passwd* pwd = ::getpwuid(::getuid());
  if (pwd != NULL && pwd->pw_dir != NULL) {
    return pwd->pw_dir;
  }
  return "";
}

vector<string> currentEnvironment() {
  vector<string> env;
  for (char** e = environ; e != NULL && *e != NULL; ++e) {
    env.push_back(*e);
  }
  return env;
}

string baseName(const string& program) {
  auto slash = program.find_last_of('/');
  return slash == string::npos ? program : program.substr(slash + 1);
}
}  // namespace

CommandResolver::CommandResolver()
    : environment(currentEnvironment()), homeDir(lookupHomeDir()) {}

CommandResolver::CommandResolver(const vector<string>& _environment,
                                 const string& _homeDir)
    : environment(_environment), homeDir(_homeDir) {}

optional<string> CommandResolver::getEnv(const string& key) const {
  for (const auto& entry : environment) {
    auto eq = entry.find('=');
    if (eq != string::npos && entry.compare(0, eq, key) == 0 &&
        eq == key.size()) {
      return entry.substr(eq + 1);
    }
  }
  return nullopt;
}

string CommandResolver::userShell() const {
  auto shell = getEnv("SHELL");
  if (!shell || shell->empty()) {
    return "/bin/bash";
  }
  return *shell;
}

bool CommandResolver::isAssistantProgram(const string& program) {
  string name = baseName(program);
  for (const char* assistant : ASSISTANT_PROGRAMS) {
    if (name == assistant) {
      return true;
    }
  }
  return false;
}

string CommandResolver::shellQuote(const string& arg) {
  string quoted = "'";
  for (char c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

string CommandResolver::augmentedPath() const {
  // User tool directories come first so they shadow system copies
  vector<string> dirs;
  if (!homeDir.empty()) {
    for (const char* extra : EXTRA_PATH_DIRS) {
      dirs.push_back(homeDir + "/" + extra);
    }
  }
  dirs.push_back("/usr/local/bin");
  auto path = getEnv("PATH");
  if (path) {
    for (const auto& dir : split(*path, ':')) {
      if (!dir.empty() && find(dirs.begin(), dirs.end(), dir) == dirs.end()) {
        dirs.push_back(dir);
      }
    }
  }

  string result;
  for (const auto& dir : dirs) {
    if (!result.empty()) result += ":";
    result += dir;
  }
  return result;
}

optional<string> CommandResolver::findInPath(const string& program) const {
  if (program.empty()) {
    return nullopt;
  }
  for (const auto& dir : split(augmentedPath(), ':')) {
    if (dir.empty()) continue;
    string candidate = dir + "/" + program;
    struct stat st;
    if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
        ::access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
  }
  return nullopt;
}

vector<string> CommandResolver::childEnvironment() const {
  vector<string> env = environment;
  setEnv(&env, "TERM", "xterm-256color");
  setEnv(&env, "COLORTERM", "truecolor");
  setEnv(&env, "LANG", "en_US.UTF-8");
  setEnv(&env, "LC_ALL", "en_US.UTF-8");
  setEnv(&env, "PATH", augmentedPath());
  return env;
}

ResolvedCommand CommandResolver::resolve(const SpawnRequest& request) const {
  ResolvedCommand resolved;
  resolved.plan.cwd = request.cwd;
  resolved.plan.environment = childEnvironment();

  string program;
  vector<string> args;
  if (request.args) {
    program = request.shell;
    args = *request.args;
  } else {
    vector<string> words = splitWhitespace(request.shell);
    if (!words.empty()) {
      program = words[0];
      args.assign(words.begin() + 1, words.end());
    }
  }

  if (program.empty()) {
    string shell = userShell();
    resolved.title = "Shell";
    resolved.plan.program = shell;
    // Leading dash asks the shell to behave as a login shell
    resolved.plan.argv = {"-" + baseName(shell)};
    resolved.kind = request.kind ? *request.kind : SessionKind::SHELL;
    return resolved;
  }

  vector<string> words = splitWhitespace(request.shell);
  resolved.title = words.empty() ? program : words[0];
  resolved.kind = request.kind ? *request.kind
                               : (isAssistantProgram(program)
                                      ? SessionKind::ASSISTANT
                                      : SessionKind::SHELL);

  optional<string> executable;
  if (program.find('/') != string::npos) {
    executable = program;
  } else {
    executable = findInPath(program);
  }

  if (executable) {
    resolved.plan.program = *executable;
    resolved.plan.argv.push_back(program);
    resolved.plan.argv.insert(resolved.plan.argv.end(), args.begin(),
                              args.end());
  } else {
    // Unknown to PATH: the user's shell may still know it
    string command = "exec " + program;
    for (const auto& arg : args) {
      command += " " + shellQuote(arg);
    }
    string shell = userShell();
    VLOG(1) << program << " not found in PATH, running through " << shell;
    resolved.plan.program = shell;
    resolved.plan.argv = {shell, "-i", "-l", "-c", command};
  }
  return resolved;
}
}  // namespace pt
