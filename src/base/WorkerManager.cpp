#include "WorkerManager.hpp"

#include "LogHandler.hpp"

namespace ot {
WorkerContext::WorkerContext(const string& _id) : id(_id), shutdown(false) {
  heartbeat();
}

void WorkerContext::heartbeat() {
  lastActivityNanos =
      std::chrono::steady_clock::now().time_since_epoch().count();
}

std::chrono::steady_clock::time_point WorkerContext::getLastActivity() const {
  return std::chrono::steady_clock::time_point(
      std::chrono::steady_clock::duration(lastActivityNanos.load()));
}

WorkerManager::WorkerManager(const WorkerConfig& _config)
    : config(_config), shuttingDown(false) {}

WorkerManager::~WorkerManager() { stopAll(); }

void WorkerManager::spawn(const string& id, WorkerBody body) {
  if (shuttingDown) {
    throw std::runtime_error("Worker manager is shutting down");
  }
  auto record = make_shared<WorkerRecord>();
  record->context = make_shared<WorkerContext>(id);
  record->createdAt = std::chrono::steady_clock::now();
  record->state = WorkerState::STARTING;
  record->finished = false;

  std::unique_lock<std::shared_mutex> guard(workerMutex);
  if (workers.find(id) != workers.end()) {
    throw std::runtime_error("Worker already exists: " + id);
  }
  // The thread only holds the record, so it may outlive this manager
  record->workerThread.reset(new thread([record, body, id]() {
    LogHandler::nameThread(id);
    setState(record, WorkerState::RUNNING);
    try {
      body(record->context);
      setState(record, WorkerState::STOPPED);
    } catch (const std::exception& e) {
      LOG(WARNING) << "Worker " << id << " failed: " << e.what();
      setState(record, WorkerState::ERROR, e.what());
    }
    {
      lock_guard<mutex> stateGuard(record->stateMutex);
      record->finished = true;
    }
    record->finishedCv.notify_all();
  }));
  workers[id] = record;
  LOG(INFO) << "Spawned worker " << id;
}

bool WorkerManager::stop(const string& id) {
  shared_ptr<WorkerRecord> record;
  {
    std::unique_lock<std::shared_mutex> guard(workerMutex);
    auto it = workers.find(id);
    if (it == workers.end()) {
      return false;
    }
    record = it->second;
    workers.erase(it);
  }
  record->context->requestStop();
  {
    lock_guard<mutex> stateGuard(record->stateMutex);
    if (!record->finished) {
      record->state = WorkerState::STOPPING;
    }
  }
  retire(id, record);
  return true;
}

void WorkerManager::stopAll() {
  shuttingDown = true;
  unordered_map<string, shared_ptr<WorkerRecord>> toStop;
  {
    std::unique_lock<std::shared_mutex> guard(workerMutex);
    toStop.swap(workers);
  }
  // Signal everyone first so they wind down in parallel
  for (auto& it : toStop) {
    it.second->context->requestStop();
  }
  for (auto& it : toStop) {
    retire(it.first, it.second);
  }

  {
    lock_guard<mutex> guard(sweeperMutex);
  }
  sweeperCv.notify_all();
  if (sweeperThread && sweeperThread->joinable() &&
      sweeperThread->get_id() != std::this_thread::get_id()) {
    sweeperThread->join();
  }
  if (!toStop.empty()) {
    LOG(INFO) << "Stopped " << toStop.size() << " workers";
  }
}

vector<string> WorkerManager::sweepStale() {
  vector<pair<string, shared_ptr<WorkerRecord>>> stale;
  ReclaimCallback callback;
  {
    std::unique_lock<std::shared_mutex> guard(workerMutex);
    for (auto it = workers.begin(); it != workers.end();) {
      if (isStale(it->second)) {
        stale.push_back(*it);
        it = workers.erase(it);
      } else {
        ++it;
      }
    }
    callback = reclaimCallback;
  }

  vector<string> reclaimed;
  for (auto& it : stale) {
    LOG(INFO) << "Reclaiming stale worker " << it.first;
    it.second->context->requestStop();
    retire(it.first, it.second);
    {
      lock_guard<mutex> stateGuard(it.second->stateMutex);
      if (it.second->state != WorkerState::ERROR) {
        it.second->state = WorkerState::STOPPED;
      }
    }
    if (callback) {
      callback(it.first);
    }
    reclaimed.push_back(it.first);
  }
  return reclaimed;
}

void WorkerManager::setReclaimCallback(ReclaimCallback callback) {
  std::unique_lock<std::shared_mutex> guard(workerMutex);
  reclaimCallback = callback;
}

map<string, WorkerStats> WorkerManager::stats() {
  map<string, WorkerStats> retval;
  std::shared_lock<std::shared_mutex> guard(workerMutex);
  auto now = std::chrono::steady_clock::now();
  for (auto& it : workers) {
    lock_guard<mutex> stateGuard(it.second->stateMutex);
    retval[it.first] = WorkerStats{
        it.second->state, it.second->errorReason,
        std::chrono::duration_cast<std::chrono::seconds>(now -
                                                         it.second->createdAt),
        std::chrono::duration_cast<std::chrono::seconds>(
            now - it.second->context->getLastActivity())};
  }
  return retval;
}

bool WorkerManager::isHealthy(const string& id) {
  std::shared_lock<std::shared_mutex> guard(workerMutex);
  auto it = workers.find(id);
  if (it == workers.end()) {
    return false;
  }
  {
    lock_guard<mutex> stateGuard(it->second->stateMutex);
    if (it->second->state != WorkerState::RUNNING) {
      return false;
    }
  }
  return !isStale(it->second);
}

bool WorkerManager::contains(const string& id) {
  std::shared_lock<std::shared_mutex> guard(workerMutex);
  return workers.find(id) != workers.end();
}

size_t WorkerManager::size() {
  std::shared_lock<std::shared_mutex> guard(workerMutex);
  return workers.size();
}

void WorkerManager::startSweeper() {
  lock_guard<mutex> guard(sweeperMutex);
  if (sweeperThread || shuttingDown) {
    return;
  }
  sweeperThread.reset(new thread([this]() {
    LogHandler::nameThread("worker-sweeper");
    while (true) {
      {
        std::unique_lock<mutex> lock(sweeperMutex);
        sweeperCv.wait_for(lock, config.sweepInterval,
                           [this]() { return shuttingDown.load(); });
        if (shuttingDown) {
          return;
        }
      }
      auto reclaimed = sweepStale();
      if (!reclaimed.empty()) {
        LOG(INFO) << "Worker sweep reclaimed " << reclaimed.size()
                  << " workers";
      }
    }
  }));
}

void WorkerManager::setState(const shared_ptr<WorkerRecord>& record,
                             WorkerState state, const string& reason) {
  lock_guard<mutex> stateGuard(record->stateMutex);
  VLOG(1) << "Worker " << record->context->getId() << " "
          << workerStateToString(record->state) << " -> "
          << workerStateToString(state);
  record->state = state;
  record->errorReason = reason;
}

void WorkerManager::retire(const string& id,
                           const shared_ptr<WorkerRecord>& record) {
  if (!record->workerThread->joinable()) {
    return;
  }
  if (record->workerThread->get_id() == std::this_thread::get_id()) {
    // A worker stopping itself cannot join itself
    record->workerThread->detach();
    return;
  }
  bool finished;
  {
    std::unique_lock<mutex> stateLock(record->stateMutex);
    finished = record->finishedCv.wait_for(
        stateLock, config.stopTimeout,
        [&record]() { return record->finished; });
  }
  if (finished) {
    record->workerThread->join();
  } else {
    LOG(WARNING) << "Worker " << id << " did not stop within "
                 << config.stopTimeout.count() << "ms, detaching";
    record->workerThread->detach();
  }
}

bool WorkerManager::isStale(const shared_ptr<WorkerRecord>& record) const {
  return std::chrono::steady_clock::now() -
             record->context->getLastActivity() >
         config.staleTimeout;
}
}  // namespace ot
