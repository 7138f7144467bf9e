#ifndef __OT_WORKER_MANAGER__
#define __OT_WORKER_MANAGER__

#include "Headers.hpp"
#include "OpsConfig.hpp"

namespace ot {
enum class WorkerState {
  STARTING = 0,
  RUNNING = 1,
  STOPPING = 2,
  STOPPED = 3,
  ERROR = 4,
};

inline const char* workerStateToString(WorkerState state) {
  switch (state) {
    case WorkerState::STARTING:
      return "starting";
    case WorkerState::RUNNING:
      return "running";
    case WorkerState::STOPPING:
      return "stopping";
    case WorkerState::STOPPED:
      return "stopped";
    case WorkerState::ERROR:
      return "error";
  }
  return "unknown";
}

/**
 * @brief What a worker body sees of its own record. Cancellation is
 * cooperative: the body polls shouldStop() at every loop boundary.
 */
class WorkerContext {
 public:
  explicit WorkerContext(const string& _id);

  const string& getId() const { return id; }

  bool shouldStop() const { return shutdown; }

  void requestStop() { shutdown = true; }

  /** @brief Records that the worker is still making progress. */
  void heartbeat();

  std::chrono::steady_clock::time_point getLastActivity() const;

 protected:
  string id;
  std::atomic<bool> shutdown;
  std::atomic<int64_t> lastActivityNanos;
};

struct WorkerStats {
  WorkerState state;
  string errorReason;
  std::chrono::seconds age;
  std::chrono::seconds idle;
};

/**
 * @brief Owns every background worker thread: spawn, cooperative stop, join,
 * and reclamation of workers that stopped reporting activity.
 */
class WorkerManager {
 public:
  typedef std::function<void(shared_ptr<WorkerContext>)> WorkerBody;
  typedef std::function<void(const string&)> ReclaimCallback;

  explicit WorkerManager(const WorkerConfig& _config);
  ~WorkerManager();

  /**
   * @brief Starts `body` on a new thread.
   * @throws std::runtime_error if a worker with this id is already tracked
   * or the manager is shutting down.
   */
  void spawn(const string& id, WorkerBody body);

  /**
   * @brief Signals the worker, waits up to stopTimeout for it to exit and
   * forgets it.
   * @return false if no such worker is tracked.
   */
  bool stop(const string& id);

  /** @brief Stops every worker. Called on teardown. */
  void stopAll();

  /**
   * @brief Reclaims workers idle beyond staleTimeout.
   * @return Ids of the reclaimed workers.
   */
  vector<string> sweepStale();

  /** @brief Invoked with the id of every worker removed by sweepStale(). */
  void setReclaimCallback(ReclaimCallback callback);

  map<string, WorkerStats> stats();

  /** @brief RUNNING and not stale. */
  bool isHealthy(const string& id);

  bool contains(const string& id);

  size_t size();

  /** @brief Runs sweepStale() every sweepInterval until stopAll(). */
  void startSweeper();

 protected:
  struct WorkerRecord {
    shared_ptr<WorkerContext> context;
    shared_ptr<thread> workerThread;
    std::chrono::steady_clock::time_point createdAt;

    mutex stateMutex;
    std::condition_variable finishedCv;
    WorkerState state;
    string errorReason;
    bool finished;
  };

  static void setState(const shared_ptr<WorkerRecord>& record,
                       WorkerState state, const string& reason = "");
  void retire(const string& id, const shared_ptr<WorkerRecord>& record);
  bool isStale(const shared_ptr<WorkerRecord>& record) const;

  WorkerConfig config;
  std::shared_mutex workerMutex;
  unordered_map<string, shared_ptr<WorkerRecord>> workers;
  ReclaimCallback reclaimCallback;
  std::atomic<bool> shuttingDown;

  mutex sweeperMutex;
  std::condition_variable sweeperCv;
  unique_ptr<thread> sweeperThread;
};
}  // namespace ot

#endif  // __OT_WORKER_MANAGER__
