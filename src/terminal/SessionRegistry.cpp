#include "SessionRegistry.hpp"

namespace pt {
namespace {
const int DEFAULT_COLS = 80;
const int DEFAULT_ROWS = 24;
const int PUMP_BUFFER_SIZE = 16 * 1024;

string shortId(const string& id) { return id.substr(0, 8); }

string currentDirectory() {
  try {
    return fs::current_path().string();
  } catch (const fs::filesystem_error& fse) {
    throw SpawnFailure(string("Could not read the working directory: ") +
                       fse.what());
  }
}
}  // namespace

SessionRegistry::SessionRegistry(shared_ptr<HostEventSink> _sink,
                                 shared_ptr<RemoteAttachments> _attachments,
                                 size_t _bufferCapacity,
                                 shared_ptr<CommandResolver> _resolver)
    : sink(_sink),
      attachments(_attachments),
      resolver(_resolver),
      bufferCapacity(_bufferCapacity),
      nextSequence(0),
      shuttingDown(false) {
  if (resolver.get() == NULL) {
    resolver.reset(new CommandResolver());
  }
}

SessionRegistry::~SessionRegistry() { shutdown(); }

string SessionRegistry::spawn(const SpawnRequest& request) {
  {
    lock_guard<recursive_mutex> guard(registryMutex);
    if (shuttingDown) {
      throw SpawnFailure("Session registry is shutting down");
    }
  }
  pruneWorkers();

  ResolvedCommand resolved = resolver->resolve(request);
  int cols = request.cols > 0 ? request.cols : DEFAULT_COLS;
  int rows = request.rows > 0 ? request.rows : DEFAULT_ROWS;

  // Anything that can throw runs before the child exists
  shared_ptr<TerminalSession> session(new TerminalSession());
  session->id = sole::uuid4().str();
  session->title = resolved.title;
  session->cwd = request.cwd.empty() ? currentDirectory() : request.cwd;

  shared_ptr<PseudoTerminal> terminal(new PseudoTerminal());
  terminal->start(resolved.plan, cols, rows);
  session->kind = resolved.kind;
  session->terminal = terminal;
  session->output.reset(new RingBuffer(bufferCapacity));
  session->drained = session->pumpFinished.get_future().share();

  {
    lock_guard<recursive_mutex> guard(registryMutex);
    if (shuttingDown) {
      terminal->forceKill();
      terminal->waitForExit();
      throw SpawnFailure("Session registry is shutting down");
    }
    session->sequence = nextSequence++;
    sessions[session->id] = session;
  }

  startWorker(session, &SessionRegistry::runOutputPump);
  startWorker(session, &SessionRegistry::runLifecycleSupervisor);
  LOG(INFO) << "Spawned terminal session " << session->id << " ("
            << resolved.plan.program << ", pid " << terminal->getPid()
            << ", " << cols << "x" << rows << ")";
  return session->id;
}

void SessionRegistry::write(const string& id, const string& data) {
  shared_ptr<TerminalSession> session = find(id);
  if (session.get() == NULL) {
    throw SessionNotFound(id);
  }
  lock_guard<mutex> guard(session->writeMutex);
  session->terminal->writeInput(data.data(), data.size());
  VLOG(2) << "Wrote " << data.size() << " bytes to " << id;
}

void SessionRegistry::resize(const string& id, int cols, int rows) {
  shared_ptr<TerminalSession> session = find(id);
  if (session.get() == NULL || cols <= 0 || rows <= 0) {
    return;
  }
  try {
    session->terminal->setSize(cols, rows);
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Could not resize " << id << ": " << re.what();
  }
}

void SessionRegistry::kill(const string& id) {
  shared_ptr<TerminalSession> session;
  {
    lock_guard<recursive_mutex> guard(registryMutex);
    auto it = sessions.find(id);
    if (it == sessions.end()) {
      return;
    }
    session = it->second;
    sessions.erase(it);
  }
  attachments->detach(id);
  session->terminal->hangup();
  LOG(INFO) << "Killed terminal session " << id;
}

void SessionRegistry::killMany(const vector<string>& ids) {
  for (const auto& id : ids) {
    kill(id);
  }
}

void SessionRegistry::killAll() {
  vector<string> ids;
  {
    lock_guard<recursive_mutex> guard(registryMutex);
    for (const auto& it : sessions) {
      ids.push_back(it.first);
    }
  }
  killMany(ids);
}

vector<SessionInfo> SessionRegistry::list() {
  vector<shared_ptr<TerminalSession>> live;
  {
    lock_guard<recursive_mutex> guard(registryMutex);
    for (const auto& it : sessions) {
      live.push_back(it.second);
    }
  }
  sort(live.begin(), live.end(),
       [](const shared_ptr<TerminalSession>& a,
          const shared_ptr<TerminalSession>& b) {
         return a->sequence < b->sequence;
       });
  vector<SessionInfo> infos;
  for (const auto& session : live) {
    infos.push_back(session->info());
  }
  return infos;
}

string SessionRegistry::getBuffer(const string& id) {
  shared_ptr<TerminalSession> session = find(id);
  if (session.get() == NULL) {
    throw SessionNotFound(id);
  }
  return session->output->snapshot();
}

bool SessionRegistry::contains(const string& id) {
  return find(id).get() != NULL;
}

shared_ptr<TerminalSession> SessionRegistry::find(const string& id) {
  lock_guard<recursive_mutex> guard(registryMutex);
  auto it = sessions.find(id);
  if (it == sessions.end()) {
    return shared_ptr<TerminalSession>();
  }
  return it->second;
}

void SessionRegistry::shutdown() {
  vector<shared_ptr<TerminalSession>> victims;
  {
    lock_guard<recursive_mutex> guard(registryMutex);
    shuttingDown = true;
    for (const auto& it : sessions) {
      victims.push_back(it.second);
    }
    sessions.clear();
  }
  for (const auto& session : victims) {
    attachments->detach(session->id);
    session->terminal->hangup();
  }

  vector<Worker> toJoin;
  {
    lock_guard<mutex> guard(workerMutex);
    toJoin.swap(workers);
  }
  if (toJoin.empty()) {
    return;
  }
  LOG(INFO) << "Shutting down " << victims.size() << " terminal sessions";

  // Give hung-up processes a moment before escalating
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  for (const auto& worker : toJoin) {
    while (!*(worker.done) && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }
  for (const auto& worker : toJoin) {
    if (!*(worker.done)) {
      LOG(WARNING) << "Process " << worker.terminal->getPid()
                   << " ignored SIGHUP, sending SIGKILL";
      worker.terminal->forceKill();
    }
  }
  for (const auto& worker : toJoin) {
    worker.t->join();
  }
}

void SessionRegistry::runOutputPump(shared_ptr<TerminalSession> session) {
  el::Helpers::setThreadName("pump-" + shortId(session->id));
  vector<char> b(PUMP_BUFFER_SIZE);
  while (true) {
    ssize_t rc = session->terminal->readOutput(&b[0], b.size());
    if (rc <= 0) {
      break;
    }
    string chunk(&b[0], rc);
    attachments->recordOutput(session->id, session->output.get(), chunk);
    sink->emit(HostEvent::sessionOutput(session->id, chunk));
  }
  VLOG(1) << "Output of " << session->id << " ended";
  session->pumpFinished.set_value();
}

void SessionRegistry::runLifecycleSupervisor(
    shared_ptr<TerminalSession> session) {
  el::Helpers::setThreadName("supervisor-" + shortId(session->id));
  int status = session->terminal->waitForExit();
  if (WIFEXITED(status)) {
    LOG(INFO) << "Terminal session " << session->id << " exited with code "
              << WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    LOG(INFO) << "Terminal session " << session->id << " killed by signal "
              << WTERMSIG(status);
  }

  // Let the pump flush what the process printed last so that no output
  // event follows the exit event.
  session->drained.wait_for(std::chrono::seconds(1));

  if (removeIfCurrent(session)) {
    attachments->detach(session->id);
    sink->emit(HostEvent::sessionExited(session->id));
  }
}

bool SessionRegistry::removeIfCurrent(
    const shared_ptr<TerminalSession>& session) {
  lock_guard<recursive_mutex> guard(registryMutex);
  auto it = sessions.find(session->id);
  if (it == sessions.end() || it->second != session) {
    return false;
  }
  sessions.erase(it);
  return true;
}

void SessionRegistry::startWorker(
    shared_ptr<TerminalSession> session,
    void (SessionRegistry::*body)(shared_ptr<TerminalSession>)) {
  Worker worker;
  worker.done.reset(new atomic<bool>(false));
  worker.terminal = session->terminal;
  shared_ptr<atomic<bool>> done = worker.done;
  worker.t.reset(new thread([this, session, body, done]() {
    (this->*body)(session);
    *done = true;
  }));
  lock_guard<mutex> guard(workerMutex);
  workers.push_back(worker);
}

void SessionRegistry::pruneWorkers() {
  lock_guard<mutex> guard(workerMutex);
  auto it = workers.begin();
  while (it != workers.end()) {
    if (*(it->done)) {
      it->t->join();
      it = workers.erase(it);
    } else {
      ++it;
    }
  }
}
}  // namespace pt
