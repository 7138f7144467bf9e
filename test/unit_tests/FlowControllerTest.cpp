#include "FakeTransport.hpp"
#include "FlowController.hpp"
#include "RetryUtils.hpp"
#include "TestHeaders.hpp"

using namespace ot;

namespace {
FlowControlConfig smallWindowConfig(size_t window) {
  FlowControlConfig config;
  config.windowSize = window;
  return config;
}
}  // namespace

TEST_CASE("Classify", "[FlowController]") {
  SECTION("Single control bytes") {
    for (char c : string("\x03\x04\x1a\r\n\x7f\x08\t")) {
      REQUIRE(FlowController::classify(string(1, c)) ==
              InputPriority::CONTROL);
    }
  }

  SECTION("Escape sequences") {
    REQUIRE(FlowController::classify("\x1b[A") == InputPriority::CONTROL);
    REQUIRE(FlowController::classify("\x1bOP") == InputPriority::CONTROL);
    REQUIRE(FlowController::classify("\x1b") == InputPriority::NORMAL);
  }

  SECTION("Typing and pastes") {
    REQUIRE(FlowController::classify("a") == InputPriority::NORMAL);
    REQUIRE(FlowController::classify("ls -la") == InputPriority::NORMAL);
    REQUIRE(FlowController::classify(string(100, 'x')) ==
            InputPriority::NORMAL);
    REQUIRE(FlowController::classify(string(101, 'x')) == InputPriority::BULK);
    REQUIRE(FlowController::classify(string(20, 'x'), 10) ==
            InputPriority::BULK);
  }
}

TEST_CASE("Writes never exceed the window", "[FlowController]") {
  FlowController flow(smallWindowConfig(100));
  FakeChannel channel;
  for (int a = 0; a < 10; a++) {
    flow.enqueue(string(30, 'a' + a), InputPriority::NORMAL);
  }

  size_t available = flow.availableWindow();
  REQUIRE(available == 100);
  size_t written = flow.processInput(channel);
  REQUIRE(written <= available);
  REQUIRE(written == 100);
  REQUIRE(flow.getBytesSent() - flow.getBytesAcknowledged() <= 100);
  REQUIRE(flow.getState() == FlowControlState::BLOCKED);

  // Blocked is a no-op
  REQUIRE(flow.processInput(channel) == 0);
  REQUIRE(channel.getWriteCalls() == 1);

  flow.acknowledge(50);
  REQUIRE(flow.getState() == FlowControlState::NORMAL);
  available = flow.availableWindow();
  REQUIRE(available == 50);
  written = flow.processInput(channel);
  REQUIRE(written == 50);
  REQUIRE(flow.getBytesSent() - flow.getBytesAcknowledged() <= 100);

  string expected;
  for (int a = 0; a < 10; a++) {
    expected += string(30, 'a' + a);
  }
  REQUIRE(channel.getWritten() == expected.substr(0, 150));
}

TEST_CASE("Window accounting holds for random workloads", "[FlowController]") {
  FlowController flow(smallWindowConfig(64));
  FakeChannel channel;
  channel.setMaxAcceptPerWrite(17);
  for (int round = 0; round < 200; round++) {
    flow.enqueue(string(rand() % 40 + 1, 'x'), InputPriority(rand() % 4));
    size_t available = flow.availableWindow();
    size_t written = flow.processInput(channel);
    REQUIRE(written <= available);
    REQUIRE(flow.getBytesSent() - flow.getBytesAcknowledged() <= 64);
    if (rand() % 3 == 0) {
      flow.acknowledge(rand() % 64);
    }
  }
}

TEST_CASE("adjustWindow unblocks", "[FlowController]") {
  FlowController flow(smallWindowConfig(10));
  FakeChannel channel;
  flow.enqueue(string(25, 'x'), InputPriority::NORMAL);
  REQUIRE(flow.processInput(channel) == 10);
  REQUIRE(flow.getState() == FlowControlState::BLOCKED);

  flow.adjustWindow(0);
  REQUIRE(flow.getState() == FlowControlState::BLOCKED);

  flow.adjustWindow(5);
  REQUIRE(flow.getState() == FlowControlState::NORMAL);
  REQUIRE(flow.availableWindow() == 5);
  REQUIRE(flow.processInput(channel) == 5);
}

TEST_CASE("syncWindow follows the transport", "[FlowController]") {
  FlowController flow(smallWindowConfig(100));
  FakeChannel channel;
  flow.enqueue(string(40, 'x'), InputPriority::NORMAL);
  REQUIRE(flow.processInput(channel) == 40);

  flow.syncWindow(0);
  REQUIRE(flow.getBytesAcknowledged() == flow.getBytesSent());
  REQUIRE(flow.getState() == FlowControlState::BLOCKED);

  REQUIRE(flow.syncWindow(200) == 200);
  REQUIRE(flow.getWindowSize() == 200);
  REQUIRE(flow.getState() == FlowControlState::NORMAL);

  REQUIRE(flow.syncWindow(50) == 0);
  REQUIRE(flow.getWindowSize() == 50);
  REQUIRE(flow.availableWindow() == 50);
}

TEST_CASE("Same priority entries are coalesced", "[FlowController]") {
  FlowControlConfig config;
  config.maxWriteChunk = 8;
  FlowController flow(config);
  FakeChannel channel;
  for (int a = 0; a < 5; a++) {
    flow.enqueue("ab", InputPriority::NORMAL);
  }
  flow.enqueue("\r", InputPriority::CONTROL);

  REQUIRE(flow.processInput(channel) == 11);
  REQUIRE(channel.getWritten() == "\rababababab");
  // Control alone, then 8 bytes, then the remaining 2
  REQUIRE(channel.getWriteSizes() == vector<size_t>{1, 8, 2});
}

TEST_CASE("One call consumes at most a batch of entries", "[FlowController]") {
  FlowController flow(smallWindowConfig(1024));
  FakeChannel channel;
  for (int a = 0; a < 15; a++) {
    flow.enqueue(string(1, 'a' + a), InputPriority::NORMAL);
  }
  REQUIRE(flow.processInput(channel) == 10);
  REQUIRE(flow.bufferStats().size == 5);
  REQUIRE(flow.processInput(channel) == 5);
  REQUIRE(channel.getWritten() == "abcdefghijklmno");
}

TEST_CASE("Partial writes keep the remainder in order", "[FlowController]") {
  FlowController flow(smallWindowConfig(1024));
  FakeChannel channel;
  channel.setMaxAcceptPerWrite(3);
  flow.enqueue("hello ", InputPriority::NORMAL);
  flow.enqueue("world", InputPriority::NORMAL);

  int calls = 0;
  while (flow.hasPendingInput() && calls++ < 10) {
    flow.processInput(channel);
  }
  REQUIRE(!flow.hasPendingInput());
  REQUIRE(channel.getWritten() == "hello world");
}

TEST_CASE("Would-block throttles and keeps the input", "[FlowController]") {
  FlowController flow(smallWindowConfig(1024));
  FakeChannel channel;
  channel.scriptWriteResult(CHANNEL_WOULD_BLOCK);
  flow.enqueue("x", InputPriority::NORMAL);

  REQUIRE(flow.processInput(channel) == 0);
  REQUIRE(flow.getState() == FlowControlState::THROTTLED);
  REQUIRE(flow.getRetryCount() == 1);
  REQUIRE(flow.hasPendingInput());

  REQUIRE(flow.processInput(channel) == 1);
  REQUIRE(flow.getState() == FlowControlState::NORMAL);
  REQUIRE(channel.getWritten() == "x");
}

TEST_CASE("Draining backs off", "[FlowController]") {
  FlowController flow(smallWindowConfig(1024));
  FakeChannel channel;
  channel.setForcedWriteCode(CHANNEL_DRAINING);
  flow.enqueue("\r", InputPriority::CONTROL);

  REQUIRE(flow.processInput(channel) == 0);
  REQUIRE(flow.getState() == FlowControlState::DRAINING);
  REQUIRE(channel.getWriteCalls() == 1);

  // Still inside the backoff window
  REQUIRE(flow.processInput(channel) == 0);
  REQUIRE(channel.getWriteCalls() == 1);

  channel.setForcedWriteCode(0);
  std::this_thread::sleep_for(drainBackoff(1) + std::chrono::milliseconds(50));
  REQUIRE(flow.processInput(channel) == 1);
  REQUIRE(flow.getState() == FlowControlState::NORMAL);
  REQUIRE(channel.getWritten() == "\r");
}

TEST_CASE("Only urgent input is written while draining", "[FlowController]") {
  FlowController flow(smallWindowConfig(4096));
  FakeChannel channel;
  channel.setForcedWriteCode(CHANNEL_DRAINING);
  flow.enqueue("\x03", InputPriority::CONTROL);
  REQUIRE(flow.processInput(channel) == 0);
  REQUIRE(flow.getState() == FlowControlState::DRAINING);

  channel.setForcedWriteCode(0);
  flow.enqueue(string(500, 'b'), InputPriority::BULK);
  flow.enqueue("ls", InputPriority::NORMAL);
  flow.enqueue("\x1b[A", InputPriority::NAVIGATION);
  std::this_thread::sleep_for(drainBackoff(1) + std::chrono::milliseconds(50));

  REQUIRE(flow.processInput(channel) == 4);
  REQUIRE(channel.getWritten() == "\x03\x1b[A");
  REQUIRE(flow.getDroppedCount() == 2);
  REQUIRE(!flow.hasPendingInput());
  REQUIRE(flow.getState() == FlowControlState::NORMAL);
}

TEST_CASE("A window update ends draining", "[FlowController]") {
  FlowController flow(smallWindowConfig(1024));
  FakeChannel channel;
  channel.setForcedWriteCode(CHANNEL_DRAINING);
  flow.enqueue("a", InputPriority::NORMAL);
  REQUIRE(flow.processInput(channel) == 0);
  REQUIRE(flow.getState() == FlowControlState::DRAINING);

  flow.adjustWindow(0);
  REQUIRE(flow.getState() == FlowControlState::DRAINING);

  flow.adjustWindow(16);
  REQUIRE(flow.getState() == FlowControlState::NORMAL);
  channel.setForcedWriteCode(0);
  REQUIRE(flow.processInput(channel) == 1);
  REQUIRE(channel.getWritten() == "a");
  REQUIRE(flow.getDroppedCount() == 0);
}

TEST_CASE("A partially written entry survives eviction", "[FlowController]") {
  FlowControlConfig config;
  config.maxBufferEntries = 2;
  FlowController flow(config);
  FakeChannel channel;
  channel.setMaxAcceptPerWrite(3);
  flow.enqueue("hello", InputPriority::NORMAL);
  REQUIRE(flow.processInput(channel) == 3);

  flow.enqueue("a", InputPriority::NORMAL);
  flow.enqueue("b", InputPriority::NORMAL);
  REQUIRE(flow.bufferStats().size == 2);

  channel.setMaxAcceptPerWrite(SIZE_MAX);
  REQUIRE(flow.processInput(channel) == 3);
  REQUIRE(channel.getWritten() == "hellob");
}

TEST_CASE("Written entries report their queueing delay", "[FlowController]") {
  FlowController flow(smallWindowConfig(1024));
  FakeChannel channel;
  channel.setMaxAcceptPerWrite(3);
  flow.enqueue("ab", InputPriority::NORMAL);
  flow.enqueue("cd", InputPriority::NORMAL);
  std::this_thread::sleep_for(std::chrono::milliseconds(20));

  // "cd" is only half written
  REQUIRE(flow.processInput(channel) == 3);
  auto latencies = flow.takeWriteLatencies();
  REQUIRE(latencies.size() == 1);
  REQUIRE(latencies[0] >= std::chrono::milliseconds(20));
  REQUIRE(flow.takeWriteLatencies().empty());

  REQUIRE(flow.processInput(channel) == 1);
  REQUIRE(flow.takeWriteLatencies().size() == 1);
}

TEST_CASE("drainBackoff doubles up to a second", "[FlowController]") {
  REQUIRE(drainBackoff(0) == std::chrono::milliseconds(50));
  REQUIRE(drainBackoff(1) == std::chrono::milliseconds(100));
  REQUIRE(drainBackoff(4) == std::chrono::milliseconds(800));
  REQUIRE(drainBackoff(5) == std::chrono::milliseconds(1000));
  REQUIRE(drainBackoff(40) == std::chrono::milliseconds(1000));
}

TEST_CASE("Fatal errors clear the queue", "[FlowController]") {
  FlowController flow(smallWindowConfig(1024));
  FakeChannel channel;
  channel.setForcedWriteCode(CHANNEL_BROKEN);
  flow.enqueue("a", InputPriority::NORMAL);
  flow.enqueue("b", InputPriority::BULK);

  REQUIRE_THROWS_AS(flow.processInput(channel), IoError);
  REQUIRE(!flow.hasPendingInput());
}

TEST_CASE("Non-fatal failures count and retry", "[FlowController]") {
  FlowController flow(smallWindowConfig(1024));
  FakeChannel channel;
  channel.scriptWriteResult(CHANNEL_FAILED);
  channel.scriptWriteResult(CHANNEL_FAILED);
  flow.enqueue("a", InputPriority::NORMAL);

  REQUIRE(flow.processInput(channel) == 0);
  REQUIRE(flow.processInput(channel) == 0);
  REQUIRE(flow.getConsecutiveFailures() == 2);
  REQUIRE(flow.processInput(channel) == 1);
  REQUIRE(flow.getConsecutiveFailures() == 0);
}

TEST_CASE("Entries past the retry limit are dropped", "[FlowController]") {
  FlowControlConfig config;
  config.maxRetries = 2;
  FlowController flow(config);
  FakeChannel channel;
  channel.setForcedWriteCode(CHANNEL_WOULD_BLOCK);
  flow.enqueue("lost", InputPriority::NORMAL);

  flow.processInput(channel);
  flow.processInput(channel);
  REQUIRE(flow.hasPendingInput());
  channel.setForcedWriteCode(0);
  flow.enqueue("kept", InputPriority::NORMAL);
  REQUIRE(flow.processInput(channel) == 4);
  REQUIRE(flow.getDroppedCount() == 1);
  REQUIRE(channel.getWritten() == "kept");
}

TEST_CASE("Buffer overflow surfaces from enqueue", "[FlowController]") {
  FlowControlConfig config;
  config.maxBufferEntries = 2;
  FlowController flow(config);
  flow.enqueue("\x03", InputPriority::CONTROL);
  flow.enqueue("\x1b[A", InputPriority::NAVIGATION);
  REQUIRE_THROWS_AS(flow.enqueue("a"), FlowControlError);

  BufferStats stats = flow.bufferStats();
  REQUIRE(stats.size == 2);
  REQUIRE(stats.highPriority == 2);
  REQUIRE(stats.state == FlowControlState::NORMAL);

  flow.clearBuffer();
  REQUIRE(!flow.hasPendingInput());
}

TEST_CASE("Homogeneous input is written byte for byte", "[FlowController]") {
  FlowController flow(smallWindowConfig(4096));
  FakeChannel channel;
  channel.setMaxAcceptPerWrite(7);
  string expected;
  for (int a = 0; a < 200; a++) {
    string chunk(rand() % 20 + 1, 'a' + (a % 26));
    expected += chunk;
    flow.enqueue(chunk, InputPriority::NORMAL);
  }
  int calls = 0;
  while (flow.hasPendingInput() && calls++ < 10000) {
    flow.processInput(channel);
    flow.acknowledge(flow.getBytesSent());
  }
  REQUIRE(channel.getWritten() == expected);
}
