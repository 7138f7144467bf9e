#include "FlowController.hpp"

#include "RetryUtils.hpp"

namespace ot {
FlowController::FlowController(const FlowControlConfig& _config)
    : config(_config),
      buffer(_config.maxBufferEntries),
      state(FlowControlState::NORMAL),
      windowSize(_config.windowSize),
      bytesSent(0),
      bytesAcknowledged(0),
      consecutiveFailures(0),
      retryCount(0),
      droppedCount(0),
      lastSuccessfulWrite(std::chrono::steady_clock::now()),
      drainingUntil(std::chrono::steady_clock::now()) {}

InputPriority FlowController::classify(const string& data,
                                       size_t bulkThreshold) {
  if (data.size() == 1) {
    switch (data[0]) {
      case 0x03:  // ctrl-c
      case 0x04:  // ctrl-d
      case 0x1a:  // ctrl-z
      case '\r':
      case '\n':
      case 0x7f:  // delete
      case 0x08:  // backspace
      case '\t':
        return InputPriority::CONTROL;
      default:
        break;
    }
  }
  // Cursor and function keys
  if (data.size() >= 2 && data[0] == 0x1b &&
      (data[1] == '[' || data[1] == 'O')) {
    return InputPriority::CONTROL;
  }
  if (data.size() > bulkThreshold) {
    return InputPriority::BULK;
  }
  return InputPriority::NORMAL;
}

void FlowController::enqueue(const string& data, InputPriority priority) {
  lock_guard<recursive_mutex> guard(flowMutex);
  int evicted = buffer.enqueue(data, priority);
  if (evicted) {
    LOG(WARNING) << "Input buffer full, evicted " << evicted << " entries";
  }
}

void FlowController::enqueue(const string& data) {
  enqueue(data, classify(data, config.bulkThreshold));
}

size_t FlowController::processInput(Channel& channel) {
  lock_guard<recursive_mutex> guard(flowMutex);
  if (state == FlowControlState::BLOCKED) {
    return 0;
  }
  if (state == FlowControlState::DRAINING &&
      std::chrono::steady_clock::now() < drainingUntil) {
    // Still backing off
    return 0;
  }

  if (state == FlowControlState::DRAINING) {
    // Only urgent input goes out while the peer drains
    size_t dropped = 0;
    for (auto it = buffer.begin(); it != buffer.end();) {
      if (it->priority > InputPriority::NAVIGATION && !it->partiallySent) {
        it = buffer.erase(it);
        dropped++;
      } else {
        ++it;
      }
    }
    if (dropped) {
      droppedCount += dropped;
      LOG(WARNING) << "Peer is draining, dropped " << dropped
                   << " non-urgent inputs";
    }
  }

  size_t totalWritten = 0;
  size_t consumed = 0;
  while (!buffer.empty() && consumed < config.maxBatchEntries) {
    BufferedInput& head = buffer.front();
    if (head.isStale(config.staleTimeout) ||
        head.retryCount >= config.maxRetries) {
      LOG(WARNING) << "Dropping " << inputPriorityToString(head.priority)
                   << " input of " << head.data.size() << " bytes after "
                   << head.retryCount << " retries";
      buffer.popFront();
      droppedCount++;
      continue;
    }

    size_t available = availableWindowLocked();
    if (available == 0) {
      setState(FlowControlState::THROTTLED);
      break;
    }

    // Coalesce entries of the same priority into one write
    string chunk = head.data;
    size_t entriesInChunk = 1;
    for (auto it = buffer.begin() + 1; it != buffer.end(); ++it) {
      if (it->priority != head.priority ||
          consumed + entriesInChunk >= config.maxBatchEntries ||
          chunk.size() + it->data.size() > config.maxWriteChunk) {
        break;
      }
      chunk.append(it->data);
      entriesInChunk++;
    }

    size_t writeSize = std::min(chunk.size(), available);
    ssize_t rc = channel.write(chunk.data(), writeSize);
    if (rc > 0) {
      auto now = std::chrono::steady_clock::now();
      size_t remaining = size_t(rc);
      while (remaining > 0 && !buffer.empty()) {
        BufferedInput& entry = buffer.front();
        if (remaining >= entry.data.size()) {
          remaining -= entry.data.size();
          if (writeLatencies.size() < MAX_LATENCY_SAMPLES) {
            writeLatencies.push_back(
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    now - entry.enqueuedAt));
          }
          buffer.popFront();
          consumed++;
        } else {
          entry.data.erase(0, remaining);
          entry.partiallySent = true;
          remaining = 0;
        }
      }
      bytesSent += rc;
      totalWritten += rc;
      lastSuccessfulWrite = now;
      consecutiveFailures = 0;
      setState(FlowControlState::NORMAL);
      if (availableWindowLocked() == 0) {
        setState(FlowControlState::BLOCKED);
        break;
      }
      if (size_t(rc) < writeSize) {
        // The transport took less than offered, it is full for now
        break;
      }
      continue;
    }

    if (rc == CHANNEL_DRAINING) {
      head.retryCount++;
      retryCount++;
      drainingUntil =
          std::chrono::steady_clock::now() + drainBackoff(head.retryCount);
      setState(FlowControlState::DRAINING);
      break;
    }
    if (rc == 0 || rc == CHANNEL_WOULD_BLOCK) {
      head.retryCount++;
      retryCount++;
      setState(FlowControlState::THROTTLED);
      break;
    }
    if (isFatalChannelCode(rc)) {
      LOG(WARNING) << "Fatal channel error (" << channelCodeToString(rc)
                   << "), discarding " << buffer.size() << " queued inputs";
      buffer.clear();
      throw IoError(channelCodeToString(rc));
    }
    head.retryCount++;
    retryCount++;
    consecutiveFailures++;
    VLOG(1) << "Write failed (" << channelCodeToString(rc)
            << "), consecutive failures: " << consecutiveFailures;
    break;
  }
  return totalWritten;
}

void FlowController::adjustWindow(size_t bytes) {
  lock_guard<recursive_mutex> guard(flowMutex);
  windowSize += bytes;
  if (state == FlowControlState::BLOCKED && availableWindowLocked() > 0) {
    setState(FlowControlState::NORMAL);
  }
  if (state == FlowControlState::DRAINING && bytes > 0) {
    // Peer is consuming again
    setState(FlowControlState::NORMAL);
  }
}

void FlowController::acknowledge(size_t bytes) {
  lock_guard<recursive_mutex> guard(flowMutex);
  bytesAcknowledged = std::min(bytesSent, bytesAcknowledged + bytes);
  if (state == FlowControlState::BLOCKED && availableWindowLocked() > 0) {
    setState(FlowControlState::NORMAL);
  }
}

size_t FlowController::syncWindow(size_t remoteWindow) {
  lock_guard<recursive_mutex> guard(flowMutex);
  bytesAcknowledged = bytesSent;
  if (remoteWindow > windowSize) {
    size_t growth = remoteWindow - windowSize;
    adjustWindow(growth);
    return growth;
  }
  windowSize = remoteWindow;
  if (windowSize == 0 && state != FlowControlState::DRAINING) {
    setState(FlowControlState::BLOCKED);
  } else if (windowSize > 0 && state == FlowControlState::BLOCKED) {
    setState(FlowControlState::NORMAL);
  }
  return 0;
}

size_t FlowController::availableWindow() {
  lock_guard<recursive_mutex> guard(flowMutex);
  return availableWindowLocked();
}

size_t FlowController::availableWindowLocked() const {
  uint64_t pending = bytesSent - bytesAcknowledged;
  if (pending >= windowSize) {
    return 0;
  }
  return windowSize - size_t(pending);
}

void FlowController::setState(FlowControlState newState) {
  if (state != newState) {
    VLOG(2) << "Flow control " << flowControlStateToString(state) << " -> "
            << flowControlStateToString(newState);
    state = newState;
  }
}

FlowControlState FlowController::getState() {
  lock_guard<recursive_mutex> guard(flowMutex);
  return state;
}

BufferStats FlowController::bufferStats() {
  lock_guard<recursive_mutex> guard(flowMutex);
  return BufferStats{buffer.size(), buffer.highPriorityCount(), state};
}

bool FlowController::hasPendingInput() {
  lock_guard<recursive_mutex> guard(flowMutex);
  return !buffer.empty();
}

void FlowController::clearBuffer() {
  lock_guard<recursive_mutex> guard(flowMutex);
  buffer.clear();
}

uint64_t FlowController::getBytesSent() {
  lock_guard<recursive_mutex> guard(flowMutex);
  return bytesSent;
}

uint64_t FlowController::getBytesAcknowledged() {
  lock_guard<recursive_mutex> guard(flowMutex);
  return bytesAcknowledged;
}

size_t FlowController::getWindowSize() {
  lock_guard<recursive_mutex> guard(flowMutex);
  return windowSize;
}

int FlowController::getConsecutiveFailures() {
  lock_guard<recursive_mutex> guard(flowMutex);
  return consecutiveFailures;
}

uint64_t FlowController::getRetryCount() {
  lock_guard<recursive_mutex> guard(flowMutex);
  return retryCount;
}

vector<std::chrono::milliseconds> FlowController::takeWriteLatencies() {
  lock_guard<recursive_mutex> guard(flowMutex);
  vector<std::chrono::milliseconds> latencies;
  latencies.swap(writeLatencies);
  return latencies;
}

uint64_t FlowController::getDroppedCount() {
  lock_guard<recursive_mutex> guard(flowMutex);
  return droppedCount;
}
}  // namespace ot
