#ifndef __OT_FLOW_CONTROLLER__
#define __OT_FLOW_CONTROLLER__

#include "Channel.hpp"
#include "Headers.hpp"
#include "InputBuffer.hpp"
#include "OpsConfig.hpp"

namespace ot {
enum class FlowControlState {
  NORMAL = 0,
  // Last write attempt found no room, retry soon
  THROTTLED = 1,
  // Window exhausted, nothing is written until the peer adjusts it
  BLOCKED = 2,
  // Peer is still draining, only urgent input is sent
  DRAINING = 3,
};

inline const char* flowControlStateToString(FlowControlState state) {
  switch (state) {
    case FlowControlState::NORMAL:
      return "normal";
    case FlowControlState::THROTTLED:
      return "throttled";
    case FlowControlState::BLOCKED:
      return "blocked";
    case FlowControlState::DRAINING:
      return "draining";
  }
  return "unknown";
}

struct BufferStats {
  size_t size;
  size_t highPriority;
  FlowControlState state;
};

/**
 * @brief Per-channel window accounting plus the prioritized input queue.
 *
 * UI threads call enqueue(), the owning worker calls processInput(). Both
 * take `flowMutex`; the lock is never held across a sleep.
 */
class FlowController {
 public:
  explicit FlowController(const FlowControlConfig& _config);

  /**
   * @brief Pure classification of a payload by urgency.
   */
  static InputPriority classify(const string& data, size_t bulkThreshold = 100);

  /**
   * @brief Queues input in priority order.
   * @throws FlowControlError(BUFFER_OVERFLOW)
   */
  void enqueue(const string& data, InputPriority priority);

  /** @brief Queues input using classify(). */
  void enqueue(const string& data);

  /**
   * @brief Writes as much queued input as the window allows.
   *
   * Entries of equal priority are coalesced up to maxWriteChunk, and at
   * most maxBatchEntries entries are consumed per call.
   * @return Bytes written.
   * @throws IoError when the channel is broken or closed. The queue is
   * cleared first.
   */
  size_t processInput(Channel& channel);

  /** @brief Peer advertised `bytes` more capacity. Ends DRAINING. */
  void adjustWindow(size_t bytes);

  /** @brief Peer consumed `bytes` of what we sent. */
  void acknowledge(size_t bytes);

  /**
   * @brief Aligns the accounting with the window the transport reports.
   * Outstanding bytes are treated as acknowledged.
   * @return Bytes the window grew by, 0 if it did not grow.
   */
  size_t syncWindow(size_t remoteWindow);

  /** @brief window - (sent - acknowledged) */
  size_t availableWindow();

  FlowControlState getState();

  BufferStats bufferStats();

  bool hasPendingInput();

  void clearBuffer();

  uint64_t getBytesSent();

  uint64_t getBytesAcknowledged();

  size_t getWindowSize();

  int getConsecutiveFailures();

  /** @brief Total retries recorded since construction. */
  uint64_t getRetryCount();

  /**
   * @brief Total entries dropped for staleness, exhausted retries or
   * while the peer was draining.
   */
  uint64_t getDroppedCount();

  /**
   * @brief Queue-to-wire delay of every entry fully written since the
   * last call.
   */
  vector<std::chrono::milliseconds> takeWriteLatencies();

 protected:
  size_t availableWindowLocked() const;
  void setState(FlowControlState newState);

  FlowControlConfig config;
  recursive_mutex flowMutex;
  InputBuffer buffer;
  FlowControlState state;
  size_t windowSize;
  uint64_t bytesSent;
  uint64_t bytesAcknowledged;
  int consecutiveFailures;
  uint64_t retryCount;
  uint64_t droppedCount;
  std::chrono::steady_clock::time_point lastSuccessfulWrite;
  // While DRAINING, nothing is written before this point
  std::chrono::steady_clock::time_point drainingUntil;
  vector<std::chrono::milliseconds> writeLatencies;

  static const size_t MAX_LATENCY_SAMPLES = 1024;
};
}  // namespace ot

#endif  // __OT_FLOW_CONTROLLER__
