#include "HealthMonitor.hpp"

namespace ot {
const char* healthEventTypeToString(HealthEventType type) {
  switch (type) {
    case HealthEventType::CONNECTION_ESTABLISHED:
      return "ConnectionEstablished";
    case HealthEventType::CONNECTION_FAILED:
      return "ConnectionFailed";
    case HealthEventType::CONNECTION_CLOSED:
      return "ConnectionClosed";
    case HealthEventType::CHANNEL_CREATED:
      return "ChannelCreated";
    case HealthEventType::CHANNEL_CLOSED:
      return "ChannelClosed";
    case HealthEventType::INPUT_SENT:
      return "InputSent";
    case HealthEventType::INPUT_FAILED:
      return "InputFailed";
    case HealthEventType::FLOW_CONTROL_ACTIVATED:
      return "FlowControlActivated";
    case HealthEventType::FLOW_CONTROL_DEACTIVATED:
      return "FlowControlDeactivated";
    case HealthEventType::WINDOW_ADJUSTED:
      return "WindowAdjusted";
    case HealthEventType::KEEPALIVE_SUCCESS:
      return "KeepAliveSuccess";
    case HealthEventType::KEEPALIVE_FAILED:
      return "KeepAliveFailed";
    case HealthEventType::THREAD_CREATED:
      return "ThreadCreated";
    case HealthEventType::THREAD_STOPPED:
      return "ThreadStopped";
    case HealthEventType::BUFFER_OVERFLOW:
      return "BufferOverflow";
    case HealthEventType::RETRY_EXHAUSTED:
      return "RetryExhausted";
  }
  return "Unknown";
}

HealthMonitor::HealthMonitor(const HealthConfig& _config)
    : config(_config), enabled(true) {}

void HealthMonitor::recordEvent(HealthEventType type, const string& sessionId,
                                const string& message, uint64_t bytes) {
  lock_guard<recursive_mutex> guard(healthMutex);
  if (!enabled) {
    return;
  }
  VLOG(3) << "Health event " << healthEventTypeToString(type) << " ["
          << sessionId << "] " << message;

  while (!events.empty() && events.size() >= config.maxEvents) {
    events.pop_front();
  }
  if (config.maxEvents > 0) {
    events.push_back(HealthEvent{std::chrono::system_clock::now(), type,
                                 sessionId, message});
  }

  SessionHealth* session = NULL;
  if (!sessionId.empty()) {
    session = &sessionLocked(sessionId);
    session->lastActivity = std::chrono::steady_clock::now();
  }

  switch (type) {
    case HealthEventType::CONNECTION_ESTABLISHED:
      metrics.totalConnections++;
      metrics.activeConnections++;
      break;
    case HealthEventType::CONNECTION_FAILED:
      metrics.totalConnections++;
      metrics.failedConnections++;
      if (session) session->errorCount++;
      break;
    case HealthEventType::CONNECTION_CLOSED:
      if (metrics.activeConnections > 0) {
        metrics.activeConnections--;
      }
      break;
    case HealthEventType::INPUT_SENT:
      metrics.totalInputBytes += bytes;
      if (session) session->inputBytes += bytes;
      break;
    case HealthEventType::INPUT_FAILED:
      metrics.failedInputBytes += bytes;
      if (session) session->errorCount++;
      break;
    case HealthEventType::FLOW_CONTROL_ACTIVATED:
      metrics.flowControlActivations++;
      if (session) session->flowControlCount++;
      break;
    case HealthEventType::BUFFER_OVERFLOW:
      metrics.bufferOverflows++;
      if (session) session->errorCount++;
      break;
    case HealthEventType::RETRY_EXHAUSTED:
      metrics.retryCount++;
      if (session) session->retryCount++;
      break;
    case HealthEventType::KEEPALIVE_FAILED:
      metrics.keepaliveFailures++;
      break;
    case HealthEventType::CHANNEL_CLOSED:
    case HealthEventType::THREAD_STOPPED:
      if (session) {
        // The session is gone, it should not show up as idle
        sessions.erase(sessionId);
      }
      break;
    default:
      break;
  }
}

void HealthMonitor::recordLatency(std::chrono::milliseconds latency) {
  lock_guard<recursive_mutex> guard(healthMutex);
  if (!enabled) {
    return;
  }
  metrics.latencySamples++;
  metrics.averageLatencyMs +=
      (double(latency.count()) - metrics.averageLatencyMs) /
      double(metrics.latencySamples);
}

vector<string> HealthMonitor::checkHealth() {
  lock_guard<recursive_mutex> guard(healthMutex);
  vector<string> warnings;
  if (metrics.totalConnections > 0) {
    double failureRate =
        double(metrics.failedConnections) / double(metrics.totalConnections);
    if (failureRate > 0.2) {
      warnings.push_back("High connection failure rate: " +
                         to_string(int(failureRate * 100)) + "%");
    }
  }
  if (metrics.flowControlActivations > 10) {
    warnings.push_back("Frequent flow control activations: " +
                       to_string(metrics.flowControlActivations));
  }
  if (metrics.bufferOverflows > 0) {
    warnings.push_back("Buffer overflows detected: " +
                       to_string(metrics.bufferOverflows));
  }
  auto now = std::chrono::steady_clock::now();
  for (const auto& it : sessions) {
    auto idle = now - it.second.lastActivity;
    if (idle > config.idleWarning) {
      warnings.push_back(
          "Session " + it.first + " idle for " +
          to_string(
              std::chrono::duration_cast<std::chrono::seconds>(idle).count()) +
          "s");
    }
  }
  return warnings;
}

HealthMetrics HealthMonitor::getMetrics() {
  lock_guard<recursive_mutex> guard(healthMutex);
  return metrics;
}

map<string, SessionHealth> HealthMonitor::getSessions() {
  lock_guard<recursive_mutex> guard(healthMutex);
  return sessions;
}

vector<HealthEvent> HealthMonitor::recentEvents(size_t count) {
  lock_guard<recursive_mutex> guard(healthMutex);
  size_t start = events.size() > count ? events.size() - count : 0;
  return vector<HealthEvent>(events.begin() + start, events.end());
}

json HealthMonitor::report(size_t eventCount) {
  lock_guard<recursive_mutex> guard(healthMutex);
  json retval;
  retval["enabled"] = enabled;
  json& m = retval["metrics"];
  m["total_connections"] = metrics.totalConnections;
  m["active_connections"] = metrics.activeConnections;
  m["failed_connections"] = metrics.failedConnections;
  m["total_input_bytes"] = metrics.totalInputBytes;
  m["failed_input_bytes"] = metrics.failedInputBytes;
  m["average_latency_ms"] = metrics.averageLatencyMs;
  m["flow_control_activations"] = metrics.flowControlActivations;
  m["buffer_overflows"] = metrics.bufferOverflows;
  m["retry_count"] = metrics.retryCount;
  m["keepalive_failures"] = metrics.keepaliveFailures;

  auto now = std::chrono::steady_clock::now();
  retval["sessions"] = json::object();
  for (const auto& it : sessions) {
    json session;
    session["age_seconds"] = std::chrono::duration_cast<std::chrono::seconds>(
                                 now - it.second.createdAt)
                                 .count();
    session["idle_seconds"] = std::chrono::duration_cast<std::chrono::seconds>(
                                  now - it.second.lastActivity)
                                  .count();
    session["input_bytes"] = it.second.inputBytes;
    session["errors"] = it.second.errorCount;
    session["flow_control"] = it.second.flowControlCount;
    session["retries"] = it.second.retryCount;
    retval["sessions"][it.first] = session;
  }

  retval["events"] = json::array();
  for (const auto& event : recentEvents(eventCount)) {
    json e;
    e["timestamp_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                            event.timestamp.time_since_epoch())
                            .count();
    e["type"] = healthEventTypeToString(event.type);
    e["session"] = event.sessionId;
    e["message"] = event.message;
    retval["events"].push_back(e);
  }
  retval["warnings"] = checkHealth();
  return retval;
}

void HealthMonitor::clear() {
  lock_guard<recursive_mutex> guard(healthMutex);
  events.clear();
  sessions.clear();
  metrics = HealthMetrics();
}

void HealthMonitor::setEnabled(bool _enabled) {
  lock_guard<recursive_mutex> guard(healthMutex);
  enabled = _enabled;
}

bool HealthMonitor::isEnabled() {
  lock_guard<recursive_mutex> guard(healthMutex);
  return enabled;
}

SessionHealth& HealthMonitor::sessionLocked(const string& sessionId) {
  auto it = sessions.find(sessionId);
  if (it == sessions.end()) {
    SessionHealth session;
    session.createdAt = std::chrono::steady_clock::now();
    session.lastActivity = session.createdAt;
    it = sessions.insert(make_pair(sessionId, session)).first;
  }
  return it->second;
}
}  // namespace ot
