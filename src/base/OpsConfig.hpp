#ifndef __OT_OPS_CONFIG__
#define __OT_OPS_CONFIG__

#include "Headers.hpp"

namespace ot {
/** @brief Tunables of one flow controller. */
struct FlowControlConfig {
  size_t windowSize = 1024 * 1024;
  size_t maxBufferEntries = 1024 * 1024;
  int maxRetries = 100;
  std::chrono::seconds staleTimeout = std::chrono::seconds(3600);
  // Payloads longer than this are treated as pastes
  size_t bulkThreshold = 100;
  size_t maxBatchEntries = 10;
  size_t maxWriteChunk = 1024;
};

struct TerminalConfig {
  size_t readBufferSize = 8192;
  std::chrono::milliseconds idleSleep = std::chrono::milliseconds(1);
  string ptyType = "xterm";
};

struct ChannelTrackerConfig {
  std::chrono::seconds timeout = std::chrono::seconds(300);
  std::chrono::seconds sweepInterval = std::chrono::seconds(30);
};

struct WorkerConfig {
  std::chrono::seconds staleTimeout = std::chrono::seconds(300);
  std::chrono::seconds sweepInterval = std::chrono::seconds(30);
  std::chrono::milliseconds stopTimeout = std::chrono::milliseconds(5000);
};

struct HealthConfig {
  size_t maxEvents = 1000;
  std::chrono::seconds idleWarning = std::chrono::seconds(300);
};

struct ConnectionConfig {
  std::chrono::seconds connectTimeout = std::chrono::seconds(10);
};

/**
 * @brief Every tunable of the engine, loadable from an INI file.
 */
struct OpsConfig {
  FlowControlConfig flowControl;
  TerminalConfig terminal;
  ChannelTrackerConfig channels;
  WorkerConfig workers;
  HealthConfig health;
  ConnectionConfig connection;

  /** @brief `<config home>/opsterm/opsterm.ini` */
  static string defaultPath();

  /**
   * @brief Loads `path` over the defaults. A missing file yields defaults.
   * @throws std::runtime_error if the file exists but cannot be parsed.
   */
  static OpsConfig load(const string& path);

  /** @brief Writes every key, creating the parent directory if needed. */
  void save(const string& path) const;
};
}  // namespace ot

#endif  // __OT_OPS_CONFIG__
