#include "OpsConfig.hpp"

#include "SimpleIni.h"

namespace ot {
namespace {
template <typename Duration>
void readDuration(const CSimpleIniA& ini, const char* section, const char* key,
                  Duration* value) {
  *value = Duration(ini.GetLongValue(section, key, long(value->count())));
}

void readSize(const CSimpleIniA& ini, const char* section, const char* key,
              size_t* value) {
  long parsed = ini.GetLongValue(section, key, long(*value));
  if (parsed < 0) {
    throw std::runtime_error(string("Negative value for ") + section + "." +
                             key);
  }
  *value = size_t(parsed);
}
}  // namespace

string OpsConfig::defaultPath() {
  return sago::getConfigHome() + "/opsterm/opsterm.ini";
}

OpsConfig OpsConfig::load(const string& path) {
  OpsConfig config;
  if (!fs::exists(path)) {
    VLOG(1) << "No config file at " << path << ", using defaults";
    return config;
  }

  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }

  FlowControlConfig& fc = config.flowControl;
  readSize(ini, "flow_control", "window_size", &fc.windowSize);
  readSize(ini, "flow_control", "max_buffer_entries", &fc.maxBufferEntries);
  fc.maxRetries =
      int(ini.GetLongValue("flow_control", "max_retries", fc.maxRetries));
  readDuration(ini, "flow_control", "stale_timeout_seconds", &fc.staleTimeout);
  readSize(ini, "flow_control", "bulk_threshold", &fc.bulkThreshold);
  readSize(ini, "flow_control", "max_batch_entries", &fc.maxBatchEntries);
  readSize(ini, "flow_control", "max_write_chunk", &fc.maxWriteChunk);

  readSize(ini, "terminal", "read_buffer_size",
           &config.terminal.readBufferSize);
  readDuration(ini, "terminal", "idle_sleep_ms", &config.terminal.idleSleep);
  config.terminal.ptyType =
      ini.GetValue("terminal", "pty_type", config.terminal.ptyType.c_str());

  readDuration(ini, "channels", "timeout_seconds", &config.channels.timeout);
  readDuration(ini, "channels", "sweep_interval_seconds",
               &config.channels.sweepInterval);

  readDuration(ini, "workers", "stale_timeout_seconds",
               &config.workers.staleTimeout);
  readDuration(ini, "workers", "sweep_interval_seconds",
               &config.workers.sweepInterval);
  readDuration(ini, "workers", "stop_timeout_ms", &config.workers.stopTimeout);

  readSize(ini, "health", "max_events", &config.health.maxEvents);
  readDuration(ini, "health", "idle_warning_seconds",
               &config.health.idleWarning);

  readDuration(ini, "connection", "connect_timeout_seconds",
               &config.connection.connectTimeout);

  if (fc.maxWriteChunk == 0 || fc.maxBatchEntries == 0 ||
      config.terminal.readBufferSize == 0) {
    throw std::runtime_error("Chunk, batch and buffer sizes must be positive");
  }
  LOG(INFO) << "Loaded config from " << path;
  return config;
}

void OpsConfig::save(const string& path) const {
  fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent);
  }

  CSimpleIniA ini(true, false, false);
  ini.SetLongValue("flow_control", "window_size", long(flowControl.windowSize));
  ini.SetLongValue("flow_control", "max_buffer_entries",
                   long(flowControl.maxBufferEntries));
  ini.SetLongValue("flow_control", "max_retries", flowControl.maxRetries);
  ini.SetLongValue("flow_control", "stale_timeout_seconds",
                   long(flowControl.staleTimeout.count()));
  ini.SetLongValue("flow_control", "bulk_threshold",
                   long(flowControl.bulkThreshold));
  ini.SetLongValue("flow_control", "max_batch_entries",
                   long(flowControl.maxBatchEntries));
  ini.SetLongValue("flow_control", "max_write_chunk",
                   long(flowControl.maxWriteChunk));
  ini.SetLongValue("terminal", "read_buffer_size",
                   long(terminal.readBufferSize));
  ini.SetLongValue("terminal", "idle_sleep_ms",
                   long(terminal.idleSleep.count()));
  ini.SetValue("terminal", "pty_type", terminal.ptyType.c_str());
  ini.SetLongValue("channels", "timeout_seconds",
                   long(channels.timeout.count()));
  ini.SetLongValue("channels", "sweep_interval_seconds",
                   long(channels.sweepInterval.count()));
  ini.SetLongValue("workers", "stale_timeout_seconds",
                   long(workers.staleTimeout.count()));
  ini.SetLongValue("workers", "sweep_interval_seconds",
                   long(workers.sweepInterval.count()));
  ini.SetLongValue("workers", "stop_timeout_ms",
                   long(workers.stopTimeout.count()));
  ini.SetLongValue("health", "max_events", long(health.maxEvents));
  ini.SetLongValue("health", "idle_warning_seconds",
                   long(health.idleWarning.count()));
  ini.SetLongValue("connection", "connect_timeout_seconds",
                   long(connection.connectTimeout.count()));

  SI_Error rc = ini.SaveFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Could not write config file: " + path);
  }
}
}  // namespace ot
