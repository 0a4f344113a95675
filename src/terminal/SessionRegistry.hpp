#ifndef __PT_SESSION_REGISTRY__
#define __PT_SESSION_REGISTRY__

#include "CommandResolver.hpp"
#include "Errors.hpp"
#include "Headers.hpp"
#include "HostEvents.hpp"
#include "RemoteAttachments.hpp"
#include "TerminalSession.hpp"

namespace pt {
/**
 * @brief Owns every live terminal session by id.
 *
 * Each spawned session gets two workers: an output pump that drains the pty
 * into the session's ring buffer (emitting `session-output` and forwarding to
 * attached remotes) and a lifecycle supervisor that reaps the child and
 * removes the session once it exits on its own.
 */
class SessionRegistry {
 public:
  SessionRegistry(shared_ptr<HostEventSink> _sink,
                  shared_ptr<RemoteAttachments> _attachments,
                  size_t _bufferCapacity = DEFAULT_OUTPUT_BUFFER_BYTES,
                  shared_ptr<CommandResolver> _resolver =
                      shared_ptr<CommandResolver>());
  virtual ~SessionRegistry();

  /**
   * @brief Starts a process on a new pty and registers it.
   * @return The new session id.
   * @throws SpawnFailure when nothing could be started.
   */
  string spawn(const SpawnRequest& request);

  /** @throws SessionNotFound when `id` is not registered. */
  void write(const string& id, const string& data);

  /** @brief No-op when `id` is not registered. */
  void resize(const string& id, int cols, int rows);

  /**
   * @brief Unregisters `id`, detaches it and hangs up its process group.
   * No-op when `id` is not registered.
   */
  void kill(const string& id);
  void killMany(const vector<string>& ids);
  void killAll();

  vector<SessionInfo> list();

  /** @throws SessionNotFound when `id` is not registered. */
  string getBuffer(const string& id);

  bool contains(const string& id);

  /** @brief The registered session, or null. */
  shared_ptr<TerminalSession> find(const string& id);

  /**
   * @brief Hangs up every session, force-kills whatever survives, and joins
   * all workers. Called by the destructor.
   */
  void shutdown();

  size_t getBufferCapacity() const { return bufferCapacity; }

 protected:
  struct Worker {
    shared_ptr<thread> t;
    shared_ptr<atomic<bool>> done;
    shared_ptr<PseudoTerminal> terminal;
  };

  void runOutputPump(shared_ptr<TerminalSession> session);
  void runLifecycleSupervisor(shared_ptr<TerminalSession> session);
  /** @brief Removes `session` only if it is still the registered object. */
  bool removeIfCurrent(const shared_ptr<TerminalSession>& session);
  void startWorker(shared_ptr<TerminalSession> session,
                   void (SessionRegistry::*body)(shared_ptr<TerminalSession>));
  void pruneWorkers();

  shared_ptr<HostEventSink> sink;
  shared_ptr<RemoteAttachments> attachments;
  shared_ptr<CommandResolver> resolver;
  size_t bufferCapacity;

  recursive_mutex registryMutex;
  map<string, shared_ptr<TerminalSession>> sessions;
  uint64_t nextSequence;
  bool shuttingDown;

  mutex workerMutex;
  vector<Worker> workers;
};
}  // namespace pt

#endif  // __PT_SESSION_REGISTRY__
