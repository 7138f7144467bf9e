#ifndef __OT_TERMINAL_WORKER__
#define __OT_TERMINAL_WORKER__

#include "Channel.hpp"
#include "ChannelTracker.hpp"
#include "FlowController.hpp"
#include "Headers.hpp"
#include "HealthMonitor.hpp"
#include "OpsConfig.hpp"
#include "WorkerManager.hpp"

namespace ot {
typedef std::function<void(const TerminalEvent&)> TerminalSubscriber;

/**
 * @brief Pumps one interactive terminal channel in both directions.
 *
 * Remote output is always drained before input is written: a write issued
 * while the peer's output buffer is full stalls the whole link.
 */
class TerminalWorker {
 public:
  TerminalWorker(const string& _id, shared_ptr<Channel> _channel,
                 shared_ptr<FlowController> _flowController,
                 shared_ptr<ChannelTracker> _tracker,
                 shared_ptr<HealthMonitor> _monitor,
                 TerminalSubscriber _subscriber, const TerminalConfig& _config);

  const string& getId() const { return id; }

  /**
   * @brief Queues operator input for the next loop iteration.
   * @throws ChannelError for empty input, or once the input side is closed.
   * The input side closes when the loop exits for any reason.
   * @throws FlowControlError(BUFFER_OVERFLOW) if the queue is full.
   */
  void sendInput(const string& data);

  /** @brief Refuses further input. The loop exits on its next iteration. */
  void closeInput();

  bool isInputClosed();

  void resize(int cols, int rows);

  /** @brief Worker body, runs until the channel ends or a stop is requested. */
  void run(shared_ptr<WorkerContext> context);

 protected:
  /** @return false if the channel reported end of stream or a fatal error. */
  bool drainOutput();
  void emitData(const string& data);
  void emitClosed(const string& error);
  void recordFlowState(FlowControlState before, FlowControlState after);

  string id;
  shared_ptr<Channel> channel;
  shared_ptr<FlowController> flowController;
  shared_ptr<ChannelTracker> tracker;
  shared_ptr<HealthMonitor> monitor;
  TerminalSubscriber subscriber;
  TerminalConfig config;

  mutex inputMutex;
  bool inputClosed;
  string readBuffer;
  uint64_t lastDroppedCount;
};
}  // namespace ot

#endif  // __OT_TERMINAL_WORKER__
