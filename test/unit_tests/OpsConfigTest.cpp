#include "OpsConfig.hpp"
#include "TestHeaders.hpp"

using namespace ot;

namespace {
string makeTempDir() {
  string tmpPath = GetTempDirectory() + string("ot_config_XXXXXXXX");
  const char* dirPtr = ::mkdtemp(&tmpPath[0]);
  REQUIRE(dirPtr != NULL);
  return string(dirPtr);
}

void writeFile(const string& path, const string& contents) {
  std::ofstream out(path);
  out << contents;
}
}  // namespace

TEST_CASE("Missing file yields defaults", "[OpsConfig]") {
  OpsConfig config = OpsConfig::load("/nonexistent/opsterm.ini");
  REQUIRE(config.flowControl.windowSize == 1024 * 1024);
  REQUIRE(config.flowControl.maxBatchEntries == 10);
  REQUIRE(config.flowControl.maxWriteChunk == 1024);
  REQUIRE(config.terminal.ptyType == "xterm");
  REQUIRE(config.channels.timeout == std::chrono::seconds(300));
  REQUIRE(config.health.maxEvents == 1000);
}

TEST_CASE("Config files override defaults", "[OpsConfig]") {
  string dir = makeTempDir();
  string path = dir + "/opsterm.ini";

  SECTION("Partial file") {
    writeFile(path,
              "[flow_control]\nwindow_size = 4096\n"
              "[terminal]\npty_type = vt100\nidle_sleep_ms = 5\n");
    OpsConfig config = OpsConfig::load(path);
    REQUIRE(config.flowControl.windowSize == 4096);
    REQUIRE(config.flowControl.maxRetries == 100);
    REQUIRE(config.terminal.ptyType == "vt100");
    REQUIRE(config.terminal.idleSleep == std::chrono::milliseconds(5));
  }

  SECTION("Save then load") {
    OpsConfig config;
    config.flowControl.maxRetries = 7;
    config.workers.staleTimeout = std::chrono::seconds(42);
    config.connection.connectTimeout = std::chrono::seconds(3);
    string nested = dir + "/nested/opsterm.ini";
    config.save(nested);

    OpsConfig loaded = OpsConfig::load(nested);
    REQUIRE(loaded.flowControl.maxRetries == 7);
    REQUIRE(loaded.workers.staleTimeout == std::chrono::seconds(42));
    REQUIRE(loaded.connection.connectTimeout == std::chrono::seconds(3));
    REQUIRE(loaded.terminal.ptyType == "xterm");
  }

  SECTION("Invalid values") {
    writeFile(path, "[flow_control]\nmax_write_chunk = 0\n");
    REQUIRE_THROWS_AS(OpsConfig::load(path), std::runtime_error);
    writeFile(path, "[health]\nmax_events = -3\n");
    REQUIRE_THROWS_AS(OpsConfig::load(path), std::runtime_error);
  }

  fs::remove_all(dir);
}
