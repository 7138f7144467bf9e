#include "SessionPool.hpp"

#include "ShellUtils.hpp"

namespace ot {
namespace {
string endpointToString(const TransportEndpoint& endpoint) {
  std::ostringstream ss;
  ss << endpoint;
  return ss.str();
}
}  // namespace

SessionPool::SessionPool(shared_ptr<TransportFactory> _factory,
                         const OpsConfig& _config)
    : factory(_factory),
      config(_config),
      monitor(make_shared<HealthMonitor>(_config.health)),
      tracker(make_shared<ChannelTracker>(_config.channels)),
      workers(make_shared<WorkerManager>(_config.workers)) {
  workers->setReclaimCallback(
      [this](const string& id) { onWorkerReclaimed(id); });
  tracker->startSweeper();
  workers->startSweeper();
}

SessionPool::~SessionPool() {
  // Joins the sweeper first, so the reclaim callback never sees a dead pool
  workers->stopAll();
  tracker->stopSweeper();
  try {
    disconnect();
  } catch (const std::exception& e) {
    LOG(WARNING) << "Error while tearing down session pool: " << e.what();
  }
}

void SessionPool::connect(const TransportEndpoint& endpoint,
                          const string& password) {
  if (isConnected()) {
    LOG(INFO) << "Replacing existing connection";
    disconnect();
  }
  lock_guard<mutex> primaryGuard(primaryDialMutex);
  lock_guard<mutex> fastPathGuard(fastPathDialMutex);

  ConnectionParams newParams;
  newParams.endpoint = endpoint;
  newParams.credential = make_shared<CredentialVault>(password);

  shared_ptr<BlockingTransport> newPrimary;
  shared_ptr<BlockingTransport> newFastPath;
  try {
    newPrimary = dial(newParams, "primary");
    newFastPath = dial(newParams, "fast path");
  } catch (const ConnectionError& ce) {
    if (newPrimary) {
      hangUp(newPrimary, "Connection setup failed");
    }
    newParams.credential->wipe();
    throw;
  }

  lock_guard<recursive_mutex> guard(transportMutex);
  params = newParams;
  primaryBlocking = newPrimary;
  primaryInteractive.reset();
  fastPath = newFastPath;
  LOG(INFO) << "Connected to " << endpoint;
}

CommandResult SessionPool::execute(const string& command) {
  if (!isCommandSafe(command)) {
    throw CommandRejected("Refusing to run unsafe command");
  }
  bool disposable;
  {
    lock_guard<recursive_mutex> guard(transportMutex);
    if (!params) {
      throw ConnectionError("Not connected");
    }
    // A transport that ever hosted a non-blocking channel hangs on blocking
    // reads
    disposable = primaryInteractive != nullptr || primaryBlocking == nullptr;
  }
  if (!disposable) {
    std::shared_lock<std::shared_mutex> guard(terminalMutex);
    disposable = !terminals.empty();
  }
  if (disposable) {
    return executeDisposable(command);
  }
  return executeOnPrimary(command);
}

CommandResult SessionPool::executeOnPrimary(const string& command) {
  shared_ptr<BlockingTransport> transport;
  {
    lock_guard<recursive_mutex> guard(transportMutex);
    transport = primaryBlocking;
  }
  bool redialed = false;
  if (!transport || !checkAlive(transport, "primary")) {
    transport = redialPrimary(transport);
    redialed = true;
    if (!transport) {
      return executeDisposable(command);
    }
  }
  try {
    return transport->execute(command);
  } catch (const IoError& ioe) {
    if (redialed) {
      throw;
    }
    LOG(WARNING) << "Primary transport failed (" << ioe.what()
                 << "), redialing once";
  }
  transport = redialPrimary(transport);
  if (!transport) {
    return executeDisposable(command);
  }
  return transport->execute(command);
}

CommandResult SessionPool::executeDisposable(const string& command) {
  auto transport = dial(cachedParams(), "disposable");
  CommandResult result;
  try {
    result = transport->execute(command);
  } catch (const std::exception& e) {
    hangUp(transport, "Command failed");
    throw;
  }
  hangUp(transport, "Command complete");
  return result;
}

CommandResult SessionPool::executeFastPath(const string& command) {
  if (!isCommandSafe(command)) {
    throw CommandRejected("Refusing to run unsafe command");
  }
  auto transport = fastPathTransport(false);
  try {
    return transport->execute(command);
  } catch (const IoError& ioe) {
    LOG(WARNING) << "Fast path failed (" << ioe.what() << "), redialing once";
  }
  return fastPathTransport(true)->execute(command);
}

CommandResult SessionPool::executeFastPathAsUser(const string& command,
                                                 const string& user) {
  return executeFastPath(wrapAsUser(command, user));
}

vector<RemoteFileInfo> SessionPool::listDirectory(const string& path) {
  auto transport = fastPathTransport(false);
  try {
    return transport->listDirectory(path);
  } catch (const IoError& ioe) {
    LOG(WARNING) << "Fast path failed (" << ioe.what() << "), redialing once";
  }
  return fastPathTransport(true)->listDirectory(path);
}

void SessionPool::openTerminal(const string& id, int cols, int rows,
                               TerminalSubscriber subscriber) {
  {
    std::shared_lock<std::shared_mutex> guard(terminalMutex);
    if (terminals.find(id) != terminals.end()) {
      throw ChannelError("Terminal already open: " + id);
    }
  }

  auto interactive = promotePrimary();
  auto channel = interactive->openTerminalChannel(cols, rows);
  auto flowController = make_shared<FlowController>(config.flowControl);
  auto worker =
      make_shared<TerminalWorker>(id, channel, flowController, tracker,
                                  monitor, subscriber, config.terminal);
  {
    std::unique_lock<std::shared_mutex> guard(terminalMutex);
    if (terminals.find(id) != terminals.end()) {
      channel->close();
      throw ChannelError("Terminal already open: " + id);
    }
    terminals[id] = TerminalRecord{channel, flowController, worker};
    closedTerminals.erase(id);
  }
  tracker->registerChannel(id, endpointToString(interactive->getEndpoint()));
  monitor->recordEvent(HealthEventType::CHANNEL_CREATED, id,
                       to_string(cols) + "x" + to_string(rows) + " terminal");

  try {
    workers->spawn(id, [this, id, worker](shared_ptr<WorkerContext> context) {
      worker->run(context);
      // A requested stop is cleaned up by whoever requested it
      if (!context->shouldStop()) {
        onTerminalEnded(id, worker);
      }
    });
  } catch (const std::runtime_error& e) {
    {
      std::unique_lock<std::shared_mutex> guard(terminalMutex);
      terminals.erase(id);
    }
    channel->close();
    tracker->closeChannel(id);
    throw ChannelError(string("Could not start terminal worker: ") + e.what());
  }
  LOG(INFO) << "Opened terminal " << id << " (" << cols << "x" << rows << ")";
}

void SessionPool::sendTerminalInput(const string& id, const string& data) {
  if (data.empty()) {
    throw ChannelError("Empty input for terminal " + id);
  }
  auto worker = findWorker(id);
  try {
    worker->sendInput(data);
  } catch (const FlowControlError& fce) {
    monitor->recordEvent(HealthEventType::BUFFER_OVERFLOW, id, fce.what());
    throw;
  }
}

void SessionPool::resizeTerminal(const string& id, int cols, int rows) {
  findWorker(id)->resize(cols, rows);
}

void SessionPool::closeTerminal(const string& id) {
  TerminalRecord record;
  {
    std::unique_lock<std::shared_mutex> guard(terminalMutex);
    auto it = terminals.find(id);
    if (it == terminals.end()) {
      if (closedTerminals.find(id) != closedTerminals.end()) {
        VLOG(1) << "Terminal " << id << " is already closed";
        return;
      }
      throw ChannelError("Terminal not found: " + id);
    }
    record = it->second;
    terminals.erase(it);
    closedTerminals.insert(id);
  }
  record.worker->closeInput();
  workers->stop(id);
  record.channel->close();
  tracker->closeChannel(id);
  monitor->recordEvent(HealthEventType::CHANNEL_CLOSED, id, "Terminal closed");
  LOG(INFO) << "Closed terminal " << id;
}

int SessionPool::closeAllTerminals() {
  vector<string> ids;
  {
    std::shared_lock<std::shared_mutex> guard(terminalMutex);
    for (const auto& it : terminals) {
      ids.push_back(it.first);
    }
  }
  int closed = 0;
  for (const auto& id : ids) {
    try {
      closeTerminal(id);
      closed++;
    } catch (const ChannelError& ce) {
      // Raced with another close
      VLOG(1) << ce.what();
    }
  }
  return closed;
}

void SessionPool::disconnect() {
  closeAllTerminals();

  std::optional<ConnectionParams> oldParams;
  vector<shared_ptr<Transport>> transports;
  {
    lock_guard<recursive_mutex> guard(transportMutex);
    if (primaryBlocking) transports.push_back(primaryBlocking);
    if (primaryInteractive) transports.push_back(primaryInteractive);
    if (fastPath) transports.push_back(fastPath);
    primaryBlocking.reset();
    primaryInteractive.reset();
    fastPath.reset();
    oldParams.swap(params);
  }
  for (auto& transport : transports) {
    hangUp(transport, "User requested disconnect");
  }
  if (oldParams) {
    oldParams->credential->wipe();
    LOG(INFO) << "Disconnected from " << oldParams->endpoint;
  }
  std::unique_lock<std::shared_mutex> guard(terminalMutex);
  closedTerminals.clear();
}

bool SessionPool::isConnected() {
  lock_guard<recursive_mutex> guard(transportMutex);
  return params.has_value() &&
         (primaryBlocking || primaryInteractive || fastPath);
}

bool SessionPool::hasTerminal(const string& id) {
  std::shared_lock<std::shared_mutex> guard(terminalMutex);
  return terminals.find(id) != terminals.end();
}

vector<string> SessionPool::activeTerminals() {
  vector<string> retval;
  std::shared_lock<std::shared_mutex> guard(terminalMutex);
  for (const auto& it : terminals) {
    if (!it.second.worker->isInputClosed()) {
      retval.push_back(it.first);
    }
  }
  return retval;
}

ConnectionParams SessionPool::cachedParams() {
  lock_guard<recursive_mutex> guard(transportMutex);
  if (!params) {
    throw ConnectionError("Not connected");
  }
  return *params;
}

shared_ptr<BlockingTransport> SessionPool::dial(
    const ConnectionParams& dialParams, const string& role) {
  string target = endpointToString(dialParams.endpoint);
  try {
    auto transport = factory->connect(dialParams);
    monitor->recordEvent(HealthEventType::CONNECTION_ESTABLISHED, "",
                         role + " " + target);
    return transport;
  } catch (const ConnectionError& ce) {
    LOG(WARNING) << "Could not open " << role << " transport to " << target
                 << ": " << ce.what();
    monitor->recordEvent(HealthEventType::CONNECTION_FAILED, "",
                         role + " " + target + ": " + ce.what());
    throw;
  }
}

bool SessionPool::checkAlive(const shared_ptr<Transport>& transport,
                             const string& role) {
  bool alive = transport->isAlive();
  monitor->recordEvent(alive ? HealthEventType::KEEPALIVE_SUCCESS
                             : HealthEventType::KEEPALIVE_FAILED,
                       "",
                       role + " " + endpointToString(transport->getEndpoint()));
  return alive;
}

void SessionPool::hangUp(shared_ptr<Transport> transport,
                         const string& reason) {
  transport->disconnect(reason);
  monitor->recordEvent(HealthEventType::CONNECTION_CLOSED, "",
                       endpointToString(transport->getEndpoint()) + ": " +
                           reason);
}

shared_ptr<BlockingTransport> SessionPool::redialPrimary(
    shared_ptr<BlockingTransport> dead) {
  lock_guard<mutex> dialGuard(primaryDialMutex);
  ConnectionParams dialParams;
  {
    lock_guard<recursive_mutex> guard(transportMutex);
    if (primaryInteractive) {
      // Promoted while we waited, the caller has to go disposable
      return nullptr;
    }
    if (primaryBlocking && primaryBlocking != dead) {
      // Someone else already redialed
      return primaryBlocking;
    }
    dialParams = cachedParams();
  }
  if (dead) {
    hangUp(dead, "Transport is dead");
  }
  LOG(INFO) << "Redialing primary transport to " << dialParams.endpoint;
  auto transport = dial(dialParams, "primary");
  lock_guard<recursive_mutex> guard(transportMutex);
  primaryBlocking = transport;
  return transport;
}

shared_ptr<BlockingTransport> SessionPool::fastPathTransport(
    bool forceRedial) {
  shared_ptr<BlockingTransport> current;
  {
    lock_guard<recursive_mutex> guard(transportMutex);
    if (!params) {
      throw ConnectionError("Not connected");
    }
    current = fastPath;
  }
  if (current && !forceRedial && checkAlive(current, "fast path")) {
    return current;
  }

  lock_guard<mutex> dialGuard(fastPathDialMutex);
  ConnectionParams dialParams;
  {
    lock_guard<recursive_mutex> guard(transportMutex);
    if (fastPath && fastPath != current) {
      return fastPath;
    }
    dialParams = cachedParams();
  }
  if (current) {
    hangUp(current, "Transport is dead");
  }
  LOG(INFO) << "Redialing fast path transport to " << dialParams.endpoint;
  auto transport = dial(dialParams, "fast path");
  lock_guard<recursive_mutex> guard(transportMutex);
  fastPath = transport;
  return transport;
}

shared_ptr<NonBlockingTransport> SessionPool::promotePrimary() {
  lock_guard<mutex> dialGuard(primaryDialMutex);
  shared_ptr<NonBlockingTransport> interactive;
  shared_ptr<BlockingTransport> blocking;
  {
    lock_guard<recursive_mutex> guard(transportMutex);
    if (!params) {
      throw ConnectionError("Not connected");
    }
    interactive = primaryInteractive;
    blocking = primaryBlocking;
  }
  if (interactive) {
    if (checkAlive(interactive, "interactive")) {
      return interactive;
    }
    LOG(WARNING) << "Interactive transport is dead, redialing";
    hangUp(interactive, "Transport is dead");
    blocking.reset();
  }
  if (!blocking || !checkAlive(blocking, "primary")) {
    if (blocking) {
      hangUp(blocking, "Transport is dead");
    }
    blocking = dial(cachedParams(), "primary");
  }
  interactive = factory->toNonBlocking(blocking);
  lock_guard<recursive_mutex> guard(transportMutex);
  primaryBlocking.reset();
  primaryInteractive = interactive;
  VLOG(1) << "Primary transport is now non-blocking";
  return interactive;
}

shared_ptr<TerminalWorker> SessionPool::findWorker(const string& id) {
  std::shared_lock<std::shared_mutex> guard(terminalMutex);
  auto it = terminals.find(id);
  if (it == terminals.end()) {
    throw ChannelError("Terminal not found: " + id);
  }
  if (it->second.worker->isInputClosed()) {
    throw ChannelError("Terminal closed: " + id);
  }
  return it->second.worker;
}

void SessionPool::onTerminalEnded(const string& id,
                                  shared_ptr<TerminalWorker> worker) {
  shared_ptr<HealthMonitor> healthMonitor = monitor;
  shared_ptr<Channel> channel;
  {
    std::unique_lock<std::shared_mutex> guard(terminalMutex);
    auto it = terminals.find(id);
    if (it == terminals.end() || it->second.worker != worker) {
      return;
    }
    channel = it->second.channel;
    terminals.erase(it);
    closedTerminals.insert(id);
    tracker->closeChannel(id);
    // Runs on the worker's own thread, so the record is detached, not joined
    workers->stop(id);
  }
  channel->close();
  healthMonitor->recordEvent(HealthEventType::CHANNEL_CLOSED, id,
                             "Terminal ended");
  LOG(INFO) << "Terminal " << id << " ended";
}

void SessionPool::onWorkerReclaimed(const string& id) {
  TerminalRecord record;
  {
    std::unique_lock<std::shared_mutex> guard(terminalMutex);
    auto it = terminals.find(id);
    if (it == terminals.end()) {
      return;
    }
    record = it->second;
    terminals.erase(it);
    closedTerminals.insert(id);
  }
  record.worker->closeInput();
  record.channel->close();
  tracker->setState(id, ChannelState::CLOSED, "Worker reclaimed");
  monitor->recordEvent(HealthEventType::CHANNEL_CLOSED, id,
                       "Reclaimed stale terminal worker");
  LOG(WARNING) << "Reclaimed stale terminal " << id;
}
}  // namespace ot
