#ifndef __OT_SESSION_POOL__
#define __OT_SESSION_POOL__

#include "ChannelTracker.hpp"
#include "Errors.hpp"
#include "FlowController.hpp"
#include "Headers.hpp"
#include "HealthMonitor.hpp"
#include "OpsConfig.hpp"
#include "TerminalWorker.hpp"
#include "Transport.hpp"
#include "WorkerManager.hpp"

namespace ot {
/**
 * @brief Owns every transport to one remote target and routes work to them.
 *
 * Three kinds of transport are used:
 *  - the primary transport, blocking until the first terminal is opened and
 *    non-blocking for good afterwards;
 *  - the fast-path transport, always blocking, reserved for short polling
 *    queries;
 *  - disposable transports, created per command while the primary one is
 *    non-blocking.
 *
 * No pool lock is held across transport I/O.
 */
class SessionPool {
 public:
  SessionPool(shared_ptr<TransportFactory> _factory, const OpsConfig& _config);
  ~SessionPool();

  /**
   * @brief Opens the primary and fast-path transports and caches the
   * parameters for reconnection. Replaces any previous connection.
   * @throws ConnectionError or AuthenticationError.
   */
  void connect(const TransportEndpoint& endpoint, const string& password);

  /**
   * @brief Runs one command to completion.
   *
   * Uses the primary transport while it is still blocking, redialing it at
   * most once if it is dead. Once a terminal has been opened, every call
   * runs on a disposable transport.
   * @throws CommandRejected, ConnectionError or IoError.
   */
  CommandResult execute(const string& command);

  /** @brief Runs one command on the fast-path transport. */
  CommandResult executeFastPath(const string& command);

  /** @brief executeFastPath() as another user on the remote host. */
  CommandResult executeFastPathAsUser(const string& command,
                                      const string& user);

  /** @brief Lists a remote directory over the fast-path transport. */
  vector<RemoteFileInfo> listDirectory(const string& path);

  /**
   * @brief Opens a pty channel on the primary transport and starts a
   * TerminalWorker pumping it into `subscriber`. When the remote side ends
   * the terminal, it is unregistered as if closeTerminal() had been called.
   * @throws ChannelError if `id` is already open or the channel fails.
   */
  void openTerminal(const string& id, int cols, int rows,
                    TerminalSubscriber subscriber);

  /**
   * @throws ChannelError if the terminal is unknown or closed, or `data` is
   * empty.
   * @throws FlowControlError if its input queue is full.
   */
  void sendTerminalInput(const string& id, const string& data);

  void resizeTerminal(const string& id, int cols, int rows);

  /**
   * @brief Stops the worker and closes the channel. Closing a terminal that
   * was already closed is a no-op.
   * @throws ChannelError if `id` was never opened.
   */
  void closeTerminal(const string& id);

  /** @return Number of terminals closed. */
  int closeAllTerminals();

  /** @brief Closes every terminal and transport and forgets the credential. */
  void disconnect();

  bool isConnected();

  bool hasTerminal(const string& id);

  vector<string> activeTerminals();

  shared_ptr<HealthMonitor> health() { return monitor; }

  shared_ptr<ChannelTracker> channelTracker() { return tracker; }

  shared_ptr<WorkerManager> workerManager() { return workers; }

 protected:
  struct TerminalRecord {
    shared_ptr<Channel> channel;
    shared_ptr<FlowController> flowController;
    shared_ptr<TerminalWorker> worker;
  };

  ConnectionParams cachedParams();
  shared_ptr<BlockingTransport> dial(const ConnectionParams& params,
                                     const string& role);
  void hangUp(shared_ptr<Transport> transport, const string& reason);
  /** @brief isAlive() plus a keepalive health event. */
  bool checkAlive(const shared_ptr<Transport>& transport, const string& role);

  CommandResult executeOnPrimary(const string& command);
  CommandResult executeDisposable(const string& command);
  shared_ptr<BlockingTransport> redialPrimary(
      shared_ptr<BlockingTransport> dead);
  shared_ptr<BlockingTransport> fastPathTransport(bool forceRedial);
  shared_ptr<NonBlockingTransport> promotePrimary();

  /** @throws ChannelError if the terminal is unknown or has ended. */
  shared_ptr<TerminalWorker> findWorker(const string& id);
  /** @brief Unregisters a terminal whose worker exited on its own. */
  void onTerminalEnded(const string& id, shared_ptr<TerminalWorker> worker);
  void onWorkerReclaimed(const string& id);

  shared_ptr<TransportFactory> factory;
  OpsConfig config;
  shared_ptr<HealthMonitor> monitor;
  shared_ptr<ChannelTracker> tracker;
  shared_ptr<WorkerManager> workers;

  // Guards the transport handles and cached parameters
  recursive_mutex transportMutex;
  // Serialize redials, held across connect I/O
  mutex primaryDialMutex;
  mutex fastPathDialMutex;
  std::optional<ConnectionParams> params;
  shared_ptr<BlockingTransport> primaryBlocking;
  shared_ptr<NonBlockingTransport> primaryInteractive;
  shared_ptr<BlockingTransport> fastPath;

  std::shared_mutex terminalMutex;
  map<string, TerminalRecord> terminals;
  set<string> closedTerminals;
};
}  // namespace ot

#endif  // __OT_SESSION_POOL__
