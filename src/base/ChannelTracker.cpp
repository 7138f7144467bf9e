#include "ChannelTracker.hpp"

#include "LogHandler.hpp"

namespace ot {
ChannelTracker::ChannelTracker(const ChannelTrackerConfig& _config)
    : config(_config), sweeperRunning(false) {}

ChannelTracker::~ChannelTracker() { stopSweeper(); }

void ChannelTracker::registerChannel(const string& id,
                                     const string& sessionId) {
  std::unique_lock<std::shared_mutex> guard(channelMutex);
  auto now = std::chrono::steady_clock::now();
  channels[id] = TrackedChannel{ChannelState::ACTIVE, "", sessionId, now, now};
  VLOG(1) << "Tracking channel " << id << " on session " << sessionId;
}

void ChannelTracker::updateActivity(const string& id) {
  std::unique_lock<std::shared_mutex> guard(channelMutex);
  auto it = channels.find(id);
  if (it != channels.end()) {
    it->second.lastActivity = std::chrono::steady_clock::now();
  }
}

void ChannelTracker::setState(const string& id, ChannelState state,
                              const string& reason) {
  std::unique_lock<std::shared_mutex> guard(channelMutex);
  auto it = channels.find(id);
  if (it == channels.end()) {
    return;
  }
  if (it->second.state != state) {
    VLOG(1) << "Channel " << id << " " << channelStateToString(it->second.state)
            << " -> " << channelStateToString(state) << " " << reason;
  }
  it->second.state = state;
  it->second.errorReason = reason;
}

void ChannelTracker::validateForWrite(const string& id, Channel& channel) {
  std::unique_lock<std::shared_mutex> guard(channelMutex);
  auto it = channels.find(id);
  if (it == channels.end()) {
    throw ChannelError("Channel not found: " + id);
  }
  TrackedChannel& tracked = it->second;
  if (tracked.state != ChannelState::ACTIVE) {
    throw ChannelError("Channel " + id + " is not active (" +
                       channelStateToString(tracked.state) + ")");
  }
  if (isStaleLocked(tracked)) {
    tracked.state = ChannelState::ERROR;
    tracked.errorReason = "Channel timeout";
    throw ChannelError("Channel " + id + " timed out");
  }
  if (channel.eof()) {
    tracked.state = ChannelState::CLOSED;
    throw ChannelError("Channel " + id + " reached end of stream");
  }
}

std::optional<ChannelState> ChannelTracker::getState(const string& id) {
  std::shared_lock<std::shared_mutex> guard(channelMutex);
  auto it = channels.find(id);
  if (it == channels.end()) {
    return std::nullopt;
  }
  return it->second.state;
}

void ChannelTracker::closeChannel(const string& id) {
  std::unique_lock<std::shared_mutex> guard(channelMutex);
  auto it = channels.find(id);
  if (it == channels.end()) {
    return;
  }
  it->second.state = ChannelState::CLOSED;
  channels.erase(it);
  VLOG(1) << "Closed channel " << id;
}

vector<string> ChannelTracker::sweepStale() {
  vector<string> removed;
  std::unique_lock<std::shared_mutex> guard(channelMutex);
  for (auto it = channels.begin(); it != channels.end();) {
    if (isStaleLocked(it->second)) {
      it->second.state = ChannelState::ERROR;
      it->second.errorReason = "Stale channel cleanup";
      LOG(INFO) << "Reclaiming stale channel " << it->first << " (session "
                << it->second.sessionId << ")";
      removed.push_back(it->first);
      it = channels.erase(it);
    } else {
      ++it;
    }
  }
  return removed;
}

map<string, ChannelStats> ChannelTracker::stats() {
  map<string, ChannelStats> retval;
  std::shared_lock<std::shared_mutex> guard(channelMutex);
  auto now = std::chrono::steady_clock::now();
  for (const auto& it : channels) {
    retval[it.first] = ChannelStats{
        it.second.state, it.second.errorReason,
        std::chrono::duration_cast<std::chrono::seconds>(now -
                                                         it.second.createdAt),
        std::chrono::duration_cast<std::chrono::seconds>(
            now - it.second.lastActivity)};
  }
  return retval;
}

void ChannelTracker::startSweeper() {
  lock_guard<mutex> guard(sweeperMutex);
  if (sweeperRunning) {
    return;
  }
  sweeperRunning = true;
  sweeperThread.reset(new thread([this]() {
    LogHandler::nameThread("channel-sweeper");
    std::unique_lock<mutex> lock(sweeperMutex);
    while (sweeperRunning) {
      sweeperCv.wait_for(lock, config.sweepInterval);
      if (!sweeperRunning) {
        break;
      }
      lock.unlock();
      auto removed = sweepStale();
      if (!removed.empty()) {
        LOG(INFO) << "Channel sweep removed " << removed.size()
                  << " stale channels";
      }
      lock.lock();
    }
  }));
}

void ChannelTracker::stopSweeper() {
  {
    lock_guard<mutex> guard(sweeperMutex);
    if (!sweeperRunning) {
      return;
    }
    sweeperRunning = false;
  }
  sweeperCv.notify_all();
  if (sweeperThread && sweeperThread->joinable()) {
    sweeperThread->join();
  }
  sweeperThread.reset();
}

bool ChannelTracker::isStaleLocked(const TrackedChannel& channel) const {
  return std::chrono::steady_clock::now() - channel.lastActivity >
         config.timeout;
}
}  // namespace ot
