#include "TerminalWorker.hpp"

#include "Errors.hpp"

namespace ot {
TerminalWorker::TerminalWorker(const string& _id, shared_ptr<Channel> _channel,
                               shared_ptr<FlowController> _flowController,
                               shared_ptr<ChannelTracker> _tracker,
                               shared_ptr<HealthMonitor> _monitor,
                               TerminalSubscriber _subscriber,
                               const TerminalConfig& _config)
    : id(_id),
      channel(_channel),
      flowController(_flowController),
      tracker(_tracker),
      monitor(_monitor),
      subscriber(_subscriber),
      config(_config),
      inputClosed(false),
      readBuffer(_config.readBufferSize, '\0'),
      lastDroppedCount(0) {}

void TerminalWorker::sendInput(const string& data) {
  if (data.empty()) {
    throw ChannelError("Empty input for terminal " + id);
  }
  {
    lock_guard<mutex> guard(inputMutex);
    if (inputClosed) {
      throw ChannelError("Terminal " + id + " no longer accepts input");
    }
  }
  flowController->enqueue(data);
}

void TerminalWorker::closeInput() {
  lock_guard<mutex> guard(inputMutex);
  inputClosed = true;
}

bool TerminalWorker::isInputClosed() {
  lock_guard<mutex> guard(inputMutex);
  return inputClosed;
}

void TerminalWorker::resize(int cols, int rows) {
  VLOG(1) << "Resizing terminal " << id << " to " << cols << "x" << rows;
  channel->resize(cols, rows);
}

void TerminalWorker::run(shared_ptr<WorkerContext> context) {
  monitor->recordEvent(HealthEventType::THREAD_CREATED, id,
                       "Terminal worker started");
  string error;
  bool remoteClosed = false;
  while (!context->shouldStop() && !isInputClosed()) {
    context->heartbeat();

    // Never write while unread output is sitting in the channel
    if (!drainOutput()) {
      remoteClosed = true;
      break;
    }
    size_t growth = flowController->syncWindow(channel->writeWindow());
    if (growth > 0) {
      monitor->recordEvent(HealthEventType::WINDOW_ADJUSTED, id,
                           "Window grew by " + to_string(growth) + " bytes");
    }

    bool idle = true;
    if (flowController->hasPendingInput()) {
      try {
        tracker->validateForWrite(id, *channel);
        if (!drainOutput()) {
          remoteClosed = true;
          break;
        }
        FlowControlState before = flowController->getState();
        size_t written = flowController->processInput(*channel);
        recordFlowState(before, flowController->getState());
        for (auto latency : flowController->takeWriteLatencies()) {
          monitor->recordLatency(latency);
        }
        if (written > 0) {
          idle = false;
          tracker->updateActivity(id);
          monitor->recordEvent(HealthEventType::INPUT_SENT, id, "", written);
          // Pick up the echo right away
          if (!drainOutput()) {
            remoteClosed = true;
            break;
          }
        }
        uint64_t dropped = flowController->getDroppedCount();
        if (dropped > lastDroppedCount) {
          monitor->recordEvent(HealthEventType::RETRY_EXHAUSTED, id,
                               "Dropped " +
                                   to_string(dropped - lastDroppedCount) +
                                   " queued inputs");
          lastDroppedCount = dropped;
        }
      } catch (const IoError& ioe) {
        LOG(WARNING) << "Terminal " << id << " write failed: " << ioe.what();
        monitor->recordEvent(HealthEventType::INPUT_FAILED, id, ioe.what());
        error = ioe.what();
        break;
      } catch (const ChannelError& ce) {
        LOG(WARNING) << "Terminal " << id << " is not writable: " << ce.what();
        error = ce.what();
        break;
      }
    }

    if (idle) {
      std::this_thread::sleep_for(config.idleSleep);
    }
  }

  if (!error.empty()) {
    tracker->setState(id, ChannelState::ERROR, error);
  } else if (remoteClosed) {
    tracker->setState(id, ChannelState::CLOSED);
  } else {
    tracker->setState(id, ChannelState::CLOSING);
  }
  closeInput();
  flowController->clearBuffer();
  emitClosed(error);
  monitor->recordEvent(HealthEventType::THREAD_STOPPED, id,
                       remoteClosed ? "Remote closed the terminal"
                                    : "Terminal worker stopped");
  LOG(INFO) << "Terminal worker " << id << " exiting"
            << (error.empty() ? "" : ": " + error);
}

bool TerminalWorker::drainOutput() {
  while (true) {
    ssize_t rc = channel->read(&readBuffer[0], readBuffer.size());
    if (rc > 0) {
      tracker->updateActivity(id);
      emitData(string(readBuffer.data(), rc));
      continue;
    }
    if (rc == 0) {
      return true;
    }
    if (isFatalChannelCode(rc)) {
      VLOG(1) << "Terminal " << id << " read: " << channelCodeToString(rc);
      return false;
    }
    // Nothing readable right now
    return true;
  }
}

void TerminalWorker::emitData(const string& data) {
  TerminalEvent event;
  event.set_terminal_id(id);
  event.set_data(data);
  subscriber(event);
}

void TerminalWorker::emitClosed(const string& error) {
  TerminalEvent event;
  event.set_terminal_id(id);
  event.set_closed(true);
  if (!error.empty()) {
    event.set_error(error);
  }
  subscriber(event);
}

void TerminalWorker::recordFlowState(FlowControlState before,
                                     FlowControlState after) {
  bool wasLimited = before == FlowControlState::BLOCKED ||
                    before == FlowControlState::DRAINING;
  bool isLimited = after == FlowControlState::BLOCKED ||
                   after == FlowControlState::DRAINING;
  if (!wasLimited && isLimited) {
    monitor->recordEvent(HealthEventType::FLOW_CONTROL_ACTIVATED, id,
                         flowControlStateToString(after));
  } else if (wasLimited && !isLimited) {
    monitor->recordEvent(HealthEventType::FLOW_CONTROL_DEACTIVATED, id,
                         flowControlStateToString(after));
  }
}
}  // namespace ot
