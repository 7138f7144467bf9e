#ifndef __OT_CHANNEL_TRACKER__
#define __OT_CHANNEL_TRACKER__

#include "Channel.hpp"
#include "Errors.hpp"
#include "Headers.hpp"
#include "OpsConfig.hpp"

namespace ot {
enum class ChannelState {
  ACTIVE = 0,
  CLOSING = 1,
  CLOSED = 2,
  ERROR = 3,
};

inline const char* channelStateToString(ChannelState state) {
  switch (state) {
    case ChannelState::ACTIVE:
      return "active";
    case ChannelState::CLOSING:
      return "closing";
    case ChannelState::CLOSED:
      return "closed";
    case ChannelState::ERROR:
      return "error";
  }
  return "unknown";
}

struct TrackedChannel {
  ChannelState state;
  // Set when state is ERROR
  string errorReason;
  string sessionId;
  std::chrono::steady_clock::time_point createdAt;
  std::chrono::steady_clock::time_point lastActivity;
};

struct ChannelStats {
  ChannelState state;
  string errorReason;
  std::chrono::seconds age;
  std::chrono::seconds idle;
};

/**
 * @brief Liveness and health state of every open channel, independent of
 * byte-level flow control.
 */
class ChannelTracker {
 public:
  explicit ChannelTracker(const ChannelTrackerConfig& _config);
  ~ChannelTracker();

  /** @brief Starts tracking `id` as ACTIVE. Replaces an existing entry. */
  void registerChannel(const string& id, const string& sessionId);

  /** @brief Marks the channel as alive now. */
  void updateActivity(const string& id);

  void setState(const string& id, ChannelState state,
                const string& reason = "");

  /**
   * @brief Fails unless the channel can take a write right now.
   *
   * A stale channel moves to ERROR, a channel at end of stream moves to
   * CLOSED.
   * @throws ChannelError describing why the write is not allowed.
   */
  void validateForWrite(const string& id, Channel& channel);

  std::optional<ChannelState> getState(const string& id);

  /** @brief Moves the channel to CLOSED and forgets it. */
  void closeChannel(const string& id);

  /**
   * @brief Removes channels idle beyond the timeout.
   * @return Ids of the removed channels.
   */
  vector<string> sweepStale();

  map<string, ChannelStats> stats();

  /** @brief Runs sweepStale() every sweepInterval on a background thread. */
  void startSweeper();

  void stopSweeper();

 protected:
  bool isStaleLocked(const TrackedChannel& channel) const;

  ChannelTrackerConfig config;
  std::shared_mutex channelMutex;
  unordered_map<string, TrackedChannel> channels;

  mutex sweeperMutex;
  std::condition_variable sweeperCv;
  bool sweeperRunning;
  unique_ptr<thread> sweeperThread;
};
}  // namespace ot

#endif  // __OT_CHANNEL_TRACKER__
