#ifndef __PT_RELAY_CLIENT__
#define __PT_RELAY_CLIENT__

#include "Headers.hpp"
#include "HostEvents.hpp"
#include "RelayConfig.hpp"
#include "RelayMessage.hpp"
#include "RelayOutbox.hpp"
#include "RelaySocket.hpp"

namespace pt {
enum class RelayState { DISABLED, CONNECTING, REGISTERED, DISCONNECTED };

string relayStateName(RelayState state);

/** @brief Receives inbound relay messages, one at a time, in arrival order. */
class RelayMessageHandler {
 public:
  virtual ~RelayMessageHandler() {}

  virtual void handleMessage(const RelayMessage& message) = 0;
};

/**
 * @brief Keeps one logical connection to the relay alive while enabled.
 *
 * A loop thread connects, registers the desktop and then reads and dispatches
 * inbound frames; a writer thread per connection drains the outbound queue.
 * Any failure drops back to DISCONNECTED and the loop retries after a fixed
 * delay until `disable()` is called.
 */
class RelayClient : public RelayOutbox {
 public:
  RelayClient(shared_ptr<RelaySocketFactory> _socketFactory,
              shared_ptr<HostEventSink> _sink,
              std::chrono::milliseconds _reconnectDelay =
                  std::chrono::seconds(RELAY_RECONNECT_DELAY_SECONDS));
  virtual ~RelayClient();

  void setHandler(shared_ptr<RelayMessageHandler> _handler);

  /**
   * @brief Starts the connect loop with the given identity. No-op when
   * already enabled. Safe to call from a message handler after `disable()`.
   */
  void enable(const RelayConfig& config);

  /**
   * @brief Stops everything now: in-flight connections are abandoned,
   * queued messages are dropped and a disconnected event is emitted if the
   * client was connected.
   */
  void disable();

  /** @brief `disable()` and wait for the loop thread to finish. */
  void shutdown();

  bool isEnabled();
  /** @brief True between registration and the next teardown. */
  bool isConnected();
  RelayState getState();

  virtual bool isRegistered();
  virtual void send(const json& message);

 protected:
  class OutboundQueue {
   public:
    OutboundQueue() : closed(false) {}

    void push(const string& message) {
      lock_guard<mutex> guard(queueMutex);
      if (closed) return;
      messages.push_back(message);
      queueCv.notify_one();
    }

    /** @return false once the queue is closed. */
    bool pop(string* message) {
      unique_lock<mutex> lock(queueMutex);
      queueCv.wait(lock, [this] { return closed || !messages.empty(); });
      if (closed) return false;
      *message = messages.front();
      messages.pop_front();
      return true;
    }

    void close() {
      lock_guard<mutex> guard(queueMutex);
      closed = true;
      messages.clear();
      queueCv.notify_all();
    }

   protected:
    mutex queueMutex;
    condition_variable queueCv;
    deque<string> messages;
    bool closed;
  };

  void run(uint64_t generation, RelayConfig config);
  void serve(uint64_t generation, const string& endpoint,
             const RelayConfig& config);
  void readLoop(shared_ptr<RelaySocket> socket);
  void runWriter(shared_ptr<OutboundQueue> queue,
                 shared_ptr<RelaySocket> socket);
  void markDisconnected(uint64_t generation);
  void retireLoopThread();

  shared_ptr<RelaySocketFactory> socketFactory;
  shared_ptr<HostEventSink> sink;
  std::chrono::milliseconds reconnectDelay;

  // Serializes enable/disable against each other
  mutex lifecycleMutex;

  // Held across a state flip and its connectivity event so events reach the
  // sink in the order the flips happened
  mutex eventMutex;

  mutex stateMutex;
  condition_variable stateCv;
  uint64_t generation;
  RelayState state;
  bool connected;
  shared_ptr<RelaySocket> activeSocket;
  shared_ptr<OutboundQueue> outbound;
  shared_ptr<RelayMessageHandler> handler;
  shared_ptr<thread> loopThread;
  // Loops replaced from inside their own handler, joined on shutdown
  vector<shared_ptr<thread>> retiredLoops;
};
}  // namespace pt

#endif  // __PT_RELAY_CLIENT__
