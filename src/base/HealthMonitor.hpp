#ifndef __OT_HEALTH_MONITOR__
#define __OT_HEALTH_MONITOR__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "OpsConfig.hpp"

namespace ot {
enum class HealthEventType {
  CONNECTION_ESTABLISHED = 0,
  CONNECTION_FAILED,
  CONNECTION_CLOSED,
  CHANNEL_CREATED,
  CHANNEL_CLOSED,
  INPUT_SENT,
  INPUT_FAILED,
  FLOW_CONTROL_ACTIVATED,
  FLOW_CONTROL_DEACTIVATED,
  WINDOW_ADJUSTED,
  KEEPALIVE_SUCCESS,
  KEEPALIVE_FAILED,
  THREAD_CREATED,
  THREAD_STOPPED,
  BUFFER_OVERFLOW,
  RETRY_EXHAUSTED,
};

const char* healthEventTypeToString(HealthEventType type);

struct HealthEvent {
  std::chrono::system_clock::time_point timestamp;
  HealthEventType type;
  string sessionId;
  string message;
};

struct HealthMetrics {
  uint64_t totalConnections = 0;
  int64_t activeConnections = 0;
  uint64_t failedConnections = 0;
  uint64_t totalInputBytes = 0;
  uint64_t failedInputBytes = 0;
  double averageLatencyMs = 0.0;
  uint64_t latencySamples = 0;
  uint64_t flowControlActivations = 0;
  uint64_t bufferOverflows = 0;
  uint64_t retryCount = 0;
  uint64_t keepaliveFailures = 0;
};

struct SessionHealth {
  std::chrono::steady_clock::time_point createdAt;
  std::chrono::steady_clock::time_point lastActivity;
  uint64_t inputBytes = 0;
  uint64_t errorCount = 0;
  uint64_t flowControlCount = 0;
  uint64_t retryCount = 0;
};

/**
 * @brief Passive observer of the engine. Records typed events into a bounded
 * log and derives counters and warnings. Never changes control flow.
 */
class HealthMonitor {
 public:
  explicit HealthMonitor(const HealthConfig& _config);

  /**
   * @brief Appends an event, evicting the oldest once maxEvents is reached.
   * @param bytes Payload size for INPUT_SENT and INPUT_FAILED.
   */
  void recordEvent(HealthEventType type, const string& sessionId,
                   const string& message, uint64_t bytes = 0);

  /** @brief Folds one input round trip into the average latency. */
  void recordLatency(std::chrono::milliseconds latency);

  /** @brief Advisory warnings derived from the counters. */
  vector<string> checkHealth();

  HealthMetrics getMetrics();

  map<string, SessionHealth> getSessions();

  /** @brief Up to `count` most recent events, oldest first. */
  vector<HealthEvent> recentEvents(size_t count);

  json report(size_t eventCount = 50);

  void clear();

  void setEnabled(bool _enabled);

  bool isEnabled();

 protected:
  SessionHealth& sessionLocked(const string& sessionId);

  HealthConfig config;
  recursive_mutex healthMutex;
  bool enabled;
  std::deque<HealthEvent> events;
  HealthMetrics metrics;
  map<string, SessionHealth> sessions;
};
}  // namespace ot

#endif  // __OT_HEALTH_MONITOR__
