#include "FakeTransport.hpp"
#include "SessionPool.hpp"
#include "ShellUtils.hpp"
#include "TestHeaders.hpp"

using namespace ot;

namespace {
TransportEndpoint testEndpoint() {
  TransportEndpoint endpoint;
  endpoint.set_name("build-01");
  endpoint.set_port(22);
  endpoint.set_principal("ops");
  return endpoint;
}

void ignoreEvents(const TerminalEvent&) {}

int countEvents(HealthMonitor& monitor, HealthEventType type) {
  int count = 0;
  for (const auto& event : monitor.recentEvents(1000)) {
    if (event.type == type) {
      count++;
    }
  }
  return count;
}

bool waitFor(const std::function<bool()>& condition) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return condition();
}

struct PoolFixture {
  explicit PoolFixture(const OpsConfig& config = OpsConfig())
      : factory(make_shared<FakeTransportFactory>()),
        pool(new SessionPool(factory, config)) {}

  void connect() { pool->connect(testEndpoint(), "hunter2"); }

  shared_ptr<FakeTransportFactory> factory;
  unique_ptr<SessionPool> pool;
};
}  // namespace

TEST_CASE("Connect opens the primary and fast path", "[SessionPool]") {
  PoolFixture f;
  REQUIRE(!f.pool->isConnected());
  REQUIRE_THROWS_AS(f.pool->execute("echo hi"), ConnectionError);

  f.connect();
  REQUIRE(f.pool->isConnected());
  REQUIRE(f.factory->dialCount() == 2);
  REQUIRE(f.factory->transport(0)->getEndpoint().name() == "build-01");
  REQUIRE(f.pool->health()->getMetrics().activeConnections == 2);

  SECTION("Connecting again replaces the transports") {
    f.connect();
    REQUIRE(f.factory->dialCount() == 4);
    REQUIRE(!f.factory->transport(0)->isAlive());
    REQUIRE(!f.factory->transport(1)->isAlive());
    REQUIRE(f.factory->transport(0)->getDisconnectReason() ==
            "User requested disconnect");
  }

  SECTION("Disconnect closes everything") {
    f.pool->openTerminal("t1", 80, 24, ignoreEvents);
    f.pool->disconnect();
    REQUIRE(!f.pool->isConnected());
    REQUIRE(!f.pool->hasTerminal("t1"));
    REQUIRE(f.factory->interactiveTransport(0)->channel(0)->isClosed());
    REQUIRE(!f.factory->transport(1)->isAlive());
    REQUIRE(f.pool->health()->getMetrics().activeConnections == 0);
    REQUIRE_THROWS_AS(f.pool->executeFastPath("echo hi"), ConnectionError);
  }
}

TEST_CASE("Connection failures", "[SessionPool]") {
  PoolFixture f;

  SECTION("Wrong password") {
    REQUIRE_THROWS_AS(f.pool->connect(testEndpoint(), "letmein"),
                      AuthenticationError);
    REQUIRE(!f.pool->isConnected());
  }

  SECTION("Host unreachable") {
    f.factory->failNextDials(1);
    REQUIRE_THROWS_AS(f.pool->connect(testEndpoint(), "hunter2"),
                      ConnectionError);
    REQUIRE(!f.pool->isConnected());
    REQUIRE(f.pool->health()->getMetrics().failedConnections == 1);
  }
}

TEST_CASE("Execute routes around the interactive primary", "[SessionPool]") {
  PoolFixture f;
  f.connect();
  auto primary = f.factory->transport(0);

  CommandResult before = f.pool->execute("echo hi");
  REQUIRE(before.output() == "hi\n");
  REQUIRE(before.exit_code() == 0);
  REQUIRE(primary->getExecuted() == vector<string>{"echo hi"});
  REQUIRE(f.factory->dialCount() == 2);

  f.pool->openTerminal("t1", 80, 24, ignoreEvents);
  REQUIRE(f.pool->hasTerminal("t1"));

  // Running on the promoted transport would throw std::logic_error
  CommandResult after = f.pool->execute("echo hi");
  REQUIRE(after.output() == "hi\n");
  REQUIRE(after.exit_code() == 0);
  REQUIRE(primary->getExecuted().size() == 1);
  REQUIRE(f.factory->dialCount() == 3);
  auto disposable = f.factory->transport(2);
  REQUIRE(disposable->getExecuted() == vector<string>{"echo hi"});
  REQUIRE(disposable->getDisconnectReason() == "Command complete");

  // The primary stays non-blocking once every terminal is closed
  f.pool->closeTerminal("t1");
  f.pool->execute("echo again");
  REQUIRE(primary->getExecuted().size() == 1);
  REQUIRE(f.factory->dialCount() == 4);
}

TEST_CASE("A dead primary is redialed once", "[SessionPool]") {
  PoolFixture f;
  f.connect();
  auto primary = f.factory->transport(0);

  SECTION("Dead before the call") {
    primary->kill();
    REQUIRE(f.pool->execute("echo hi").output() == "hi\n");
    REQUIRE(f.factory->dialCount() == 3);
    REQUIRE(f.factory->transport(2)->getExecuted() ==
            vector<string>{"echo hi"});
    REQUIRE(primary->getDisconnectReason() == "Transport is dead");

    // The replacement becomes the primary
    f.pool->execute("echo again");
    REQUIRE(f.factory->dialCount() == 3);
    REQUIRE(f.factory->transport(2)->getExecuted().size() == 2);
  }

  SECTION("Dies during the call") {
    primary->failNext();
    REQUIRE(f.pool->execute("echo hi").output() == "hi\n");
    REQUIRE(f.factory->dialCount() == 3);
    REQUIRE(primary->getExecuted() == vector<string>{"echo hi"});
  }

  SECTION("Redial fails") {
    primary->kill();
    f.factory->failNextDials(1);
    REQUIRE_THROWS_AS(f.pool->execute("echo hi"), ConnectionError);
  }
}

TEST_CASE("Scripted results pass through", "[SessionPool]") {
  PoolFixture f;
  f.connect();
  f.factory->transport(0)->setResponse("false", "", 1);
  f.factory->transport(0)->setResponse("kill -9 $$", "", std::nullopt);

  CommandResult failed = f.pool->execute("false");
  REQUIRE(failed.exit_code() == 1);
  CommandResult signalled = f.pool->execute("kill -9 $$");
  REQUIRE(!signalled.has_exit_code());
}

TEST_CASE("Unsafe commands are rejected", "[SessionPool]") {
  PoolFixture f;
  f.connect();
  REQUIRE_THROWS_AS(f.pool->execute(":(){ :|:& };:"), CommandRejected);
  REQUIRE_THROWS_AS(f.pool->executeFastPath(":(){ :|:& };:"),
                    CommandRejected);
  REQUIRE(f.factory->transport(0)->getExecuted().empty());
  REQUIRE(f.factory->transport(1)->getExecuted().empty());
}

TEST_CASE("Fast path", "[SessionPool]") {
  PoolFixture f;
  f.connect();
  auto fastPath = f.factory->transport(1);

  SECTION("Commands and listings use the fast path transport") {
    REQUIRE(f.pool->executeFastPath("echo fast").output() == "fast\n");
    REQUIRE(fastPath->getExecuted() == vector<string>{"echo fast"});

    auto files = f.pool->listDirectory("/var/log");
    REQUIRE(files.size() == 1);
    REQUIRE(files[0].path() == "/var/log/file.txt");
    REQUIRE(fastPath->getListed() == vector<string>{"/var/log"});
    REQUIRE_THROWS_AS(f.pool->listDirectory("/missing"), ChannelError);
    REQUIRE(f.factory->dialCount() == 2);
  }

  SECTION("Running as another user") {
    f.pool->executeFastPathAsUser("whoami", "deploy");
    auto executed = fastPath->getExecuted();
    REQUIRE(executed.size() == 1);
    REQUIRE(executed[0] == wrapAsUser("whoami", "deploy"));
  }

  SECTION("Keepalive results reach the health monitor") {
    f.pool->executeFastPath("echo fast");
    REQUIRE(countEvents(*f.pool->health(),
                        HealthEventType::KEEPALIVE_SUCCESS) == 1);
    REQUIRE(f.pool->health()->getMetrics().keepaliveFailures == 0);

    fastPath->kill();
    REQUIRE(f.pool->executeFastPath("echo fast").output() == "fast\n");
    REQUIRE(f.pool->health()->getMetrics().keepaliveFailures == 1);
    REQUIRE(f.factory->dialCount() == 3);
  }

  SECTION("A dead fast path is redialed") {
    fastPath->failNext();
    REQUIRE(f.pool->executeFastPath("echo fast").output() == "fast\n");
    REQUIRE(f.factory->dialCount() == 3);
    REQUIRE(f.factory->transport(2)->getExecuted() ==
            vector<string>{"echo fast"});
  }

  SECTION("Terminal congestion does not stall the fast path") {
    f.pool->openTerminal("t1", 80, 24, ignoreEvents);
    auto channel = f.factory->interactiveTransport(0)->channel(0);
    channel->setForcedWriteCode(CHANNEL_DRAINING);
    f.pool->sendTerminalInput("t1", string(4096, 'x'));
    REQUIRE(waitFor([&channel]() { return channel->getWriteCalls() > 0; }));

    auto start = std::chrono::steady_clock::now();
    REQUIRE(f.pool->executeFastPath("echo fast").output() == "fast\n");
    REQUIRE(millisSince(start) < 1000);
    REQUIRE(channel->getWritten().empty());
  }
}

TEST_CASE("Terminal lifecycle", "[SessionPool]") {
  PoolFixture f;
  f.connect();

  std::mutex outputMutex;
  string output;
  f.pool->openTerminal("t1", 100, 30,
                       [&outputMutex, &output](const TerminalEvent& event) {
                         lock_guard<mutex> guard(outputMutex);
                         output += event.data();
                       });
  REQUIRE_THROWS_AS(f.pool->openTerminal("t1", 80, 24, ignoreEvents),
                    ChannelError);
  REQUIRE(f.pool->activeTerminals() == vector<string>{"t1"});
  REQUIRE(*f.pool->channelTracker()->getState("t1") == ChannelState::ACTIVE);

  auto channel = f.factory->interactiveTransport(0)->channel(0);
  channel->setEcho("$ ");
  f.pool->sendTerminalInput("t1", "uptime\r");
  REQUIRE(channel->waitForWritten(7, std::chrono::seconds(5)));
  REQUIRE(channel->getWritten() == "uptime\r");
  REQUIRE(waitFor([&outputMutex, &output]() {
    lock_guard<mutex> guard(outputMutex);
    return output == "$ ";
  }));

  f.pool->resizeTerminal("t1", 120, 40);
  REQUIRE(channel->getResizes() == vector<pair<int, int>>{{120, 40}});

  f.pool->closeTerminal("t1");
  REQUIRE(channel->isClosed());
  REQUIRE(!f.pool->hasTerminal("t1"));
  REQUIRE(!f.pool->channelTracker()->getState("t1"));
  REQUIRE(!f.pool->workerManager()->contains("t1"));

  // Closing twice is fine, unknown ids are not
  f.pool->closeTerminal("t1");
  REQUIRE_THROWS_AS(f.pool->closeTerminal("nope"), ChannelError);
  REQUIRE_THROWS_AS(f.pool->sendTerminalInput("t1", "x"), ChannelError);

  // The id can be reused
  f.pool->openTerminal("t1", 80, 24, ignoreEvents);
  REQUIRE(f.pool->hasTerminal("t1"));
  REQUIRE(f.factory->interactiveTransport(0)->channelCount() == 2);
}

TEST_CASE("closeAllTerminals", "[SessionPool]") {
  PoolFixture f;
  f.connect();
  for (int a = 0; a < 3; a++) {
    f.pool->openTerminal("t" + to_string(a), 80, 24, ignoreEvents);
  }
  REQUIRE(f.pool->activeTerminals().size() == 3);
  REQUIRE(f.pool->closeAllTerminals() == 3);
  REQUIRE(f.pool->activeTerminals().empty());
  REQUIRE(f.pool->closeAllTerminals() == 0);
  for (int a = 0; a < 3; a++) {
    REQUIRE(f.factory->interactiveTransport(0)->channel(a)->isClosed());
  }
}

TEST_CASE("A failed channel open leaves no terminal", "[SessionPool]") {
  PoolFixture f;
  f.connect();
  f.pool->openTerminal("t1", 80, 24, ignoreEvents);
  f.factory->interactiveTransport(0)->setFailOpen(true);
  REQUIRE_THROWS_AS(f.pool->openTerminal("t2", 80, 24, ignoreEvents),
                    ChannelError);
  REQUIRE(!f.pool->hasTerminal("t2"));
  REQUIRE(f.pool->activeTerminals() == vector<string>{"t1"});
}

TEST_CASE("Stale terminal workers are reclaimed", "[SessionPool]") {
  OpsConfig config;
  config.workers.staleTimeout = std::chrono::seconds(0);
  PoolFixture f(config);
  f.connect();
  f.pool->openTerminal("t1", 80, 24, ignoreEvents);
  auto channel = f.factory->interactiveTransport(0)->channel(0);
  std::this_thread::sleep_for(std::chrono::milliseconds(20));

  auto reclaimed = f.pool->workerManager()->sweepStale();
  REQUIRE(reclaimed == vector<string>{"t1"});
  REQUIRE(channel->isClosed());
  REQUIRE(!f.pool->hasTerminal("t1"));
  REQUIRE(*f.pool->channelTracker()->getState("t1") == ChannelState::CLOSED);
  REQUIRE(f.pool->channelTracker()->stats()["t1"].errorReason ==
          "Worker reclaimed");

  // Already closed by the sweeper
  f.pool->closeTerminal("t1");
}

TEST_CASE("A terminal that ends on its own is unregistered",
          "[SessionPool]") {
  PoolFixture f;
  f.connect();
  f.pool->openTerminal("t1", 80, 24, ignoreEvents);
  auto channel = f.factory->interactiveTransport(0)->channel(0);

  SECTION("Remote end of stream") {
    channel->pushOutput("logout\r\n");
    channel->setRemoteEof();
  }

  SECTION("Broken channel") {
    channel->setForcedWriteCode(CHANNEL_BROKEN);
    f.pool->sendTerminalInput("t1", "ls\r");
  }

  REQUIRE(waitFor([&f]() { return !f.pool->hasTerminal("t1"); }));
  REQUIRE_THROWS_AS(f.pool->sendTerminalInput("t1", "ls\r"), ChannelError);
  REQUIRE(f.pool->activeTerminals().empty());
  REQUIRE(!f.pool->channelTracker()->getState("t1"));
  REQUIRE(!f.pool->workerManager()->contains("t1"));
  REQUIRE(waitFor([&channel]() { return channel->isClosed(); }));
  REQUIRE(waitFor([&f]() {
    return countEvents(*f.pool->health(), HealthEventType::CHANNEL_CLOSED) ==
           1;
  }));

  // Already closed
  f.pool->closeTerminal("t1");

  f.pool->openTerminal("t1", 80, 24, ignoreEvents);
  REQUIRE(f.pool->hasTerminal("t1"));
  REQUIRE(f.pool->activeTerminals() == vector<string>{"t1"});
  REQUIRE(f.factory->interactiveTransport(0)->channelCount() == 2);
}

TEST_CASE("Empty terminal input is rejected", "[SessionPool]") {
  PoolFixture f;
  f.connect();
  f.pool->openTerminal("t1", 80, 24, ignoreEvents);
  auto channel = f.factory->interactiveTransport(0)->channel(0);

  REQUIRE_THROWS_AS(f.pool->sendTerminalInput("t1", ""), ChannelError);
  f.pool->sendTerminalInput("t1", "\r");
  REQUIRE(channel->waitForWritten(1, std::chrono::seconds(5)));
  REQUIRE(channel->getWriteSizes() == vector<size_t>{1});
  REQUIRE(f.pool->activeTerminals() == vector<string>{"t1"});
}
