#include "TestHeaders.hpp"
#include "WorkerManager.hpp"

using namespace ot;

namespace {
WorkerConfig fastConfig() {
  WorkerConfig config;
  config.stopTimeout = std::chrono::milliseconds(2000);
  return config;
}

// Runs until asked to stop, heartbeating every millisecond
void politeBody(shared_ptr<WorkerContext> context) {
  while (!context->shouldStop()) {
    context->heartbeat();
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
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
}  // namespace

TEST_CASE("Spawn and stop", "[WorkerManager]") {
  WorkerManager manager(fastConfig());
  manager.spawn("w1", politeBody);

  REQUIRE(manager.contains("w1"));
  REQUIRE(waitFor([&manager]() {
    return manager.stats()["w1"].state == WorkerState::RUNNING;
  }));
  REQUIRE(manager.isHealthy("w1"));

  REQUIRE(manager.stop("w1"));
  REQUIRE(!manager.contains("w1"));
  REQUIRE(!manager.stop("w1"));
  REQUIRE(!manager.isHealthy("w1"));
}

TEST_CASE("Duplicate ids are rejected", "[WorkerManager]") {
  WorkerManager manager(fastConfig());
  manager.spawn("w1", politeBody);
  REQUIRE_THROWS_AS(manager.spawn("w1", politeBody), std::runtime_error);
  manager.stopAll();
  REQUIRE(manager.size() == 0);
  REQUIRE_THROWS(manager.spawn("w2", politeBody));
}

TEST_CASE("A failing body ends in ERROR", "[WorkerManager]") {
  WorkerManager manager(fastConfig());
  manager.spawn("w1", [](shared_ptr<WorkerContext>) {
    throw std::runtime_error("boom");
  });
  REQUIRE(waitFor([&manager]() {
    return manager.stats()["w1"].state == WorkerState::ERROR;
  }));
  REQUIRE(manager.stats()["w1"].errorReason == "boom");
  REQUIRE(manager.stop("w1"));
}

TEST_CASE("A finished body ends in STOPPED", "[WorkerManager]") {
  WorkerManager manager(fastConfig());
  manager.spawn("w1", [](shared_ptr<WorkerContext>) {});
  REQUIRE(waitFor([&manager]() {
    return manager.stats()["w1"].state == WorkerState::STOPPED;
  }));
}

TEST_CASE("stopAll stops every worker", "[WorkerManager]") {
  WorkerManager manager(fastConfig());
  std::atomic<int> exited(0);
  for (int a = 0; a < 5; a++) {
    manager.spawn("w" + to_string(a),
                  [&exited](shared_ptr<WorkerContext> context) {
                    politeBody(context);
                    exited++;
                  });
  }
  REQUIRE(manager.size() == 5);
  manager.stopAll();
  REQUIRE(manager.size() == 0);
  REQUIRE(exited == 5);
}

TEST_CASE("Silent workers are reclaimed", "[WorkerManager]") {
  WorkerConfig config = fastConfig();
  config.staleTimeout = std::chrono::seconds(1);
  WorkerManager manager(config);
  vector<string> reclaimedIds;
  manager.setReclaimCallback(
      [&reclaimedIds](const string& id) { reclaimedIds.push_back(id); });

  // Stops heartbeating but still honors the shutdown flag
  manager.spawn("quiet", [](shared_ptr<WorkerContext> context) {
    while (!context->shouldStop()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  });
  manager.spawn("chatty", politeBody);

  REQUIRE(manager.sweepStale().empty());
  std::this_thread::sleep_for(std::chrono::milliseconds(1200));
  REQUIRE(!manager.isHealthy("quiet"));
  REQUIRE(manager.isHealthy("chatty"));

  auto reclaimed = manager.sweepStale();
  REQUIRE(reclaimed == vector<string>{"quiet"});
  REQUIRE(reclaimedIds == vector<string>{"quiet"});
  REQUIRE(!manager.contains("quiet"));
  REQUIRE(manager.contains("chatty"));
}

TEST_CASE("A worker may stop itself", "[WorkerManager]") {
  WorkerManager manager(fastConfig());
  std::atomic<bool> stopped(false);
  manager.spawn("self", [&manager, &stopped](shared_ptr<WorkerContext>) {
    stopped = manager.stop("self");
  });
  REQUIRE(waitFor([&stopped]() { return stopped.load(); }));
  REQUIRE(!manager.contains("self"));
}
