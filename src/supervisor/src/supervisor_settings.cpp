#include "../include/supervisor_settings.hpp"

namespace {

std::chrono::milliseconds readMs(const nlohmann::json &timeouts,
                                 const char *key,
                                 std::chrono::milliseconds fallback) {
  if (!timeouts.contains(key)) return fallback;
  return std::chrono::milliseconds(timeouts[key].get<long long>());
}

}  // namespace

SupervisorSettings SupervisorSettings::fromJson(const nlohmann::json &merged) {
  SupervisorSettings s;

  s.pidFile = merged.value("pid_file", s.pidFile);
  s.portFile = merged.value("port_file", s.portFile);

  if (merged.contains("port_range")) {
    const auto &range = merged["port_range"];
    s.portRange = webctl::PortRange(range.value("start", s.portRange.start),
                                    range.value("end", s.portRange.end));
  }

  if (merged.contains("timeouts")) {
    const auto &t = merged["timeouts"];
    s.pollInterval = readMs(t, "poll_interval_ms", s.pollInterval);
    s.processExitTimeout = readMs(t, "process_exit_ms", s.processExitTimeout);
    s.portReleaseTimeout = readMs(t, "port_release_ms", s.portReleaseTimeout);
    s.restartDelay = readMs(t, "restart_delay_ms", s.restartDelay);
    s.startupGrace = readMs(t, "startup_grace_ms", s.startupGrace);
    s.lockTimeout = readMs(t, "lock_ms", s.lockTimeout);
  }

  if (merged.contains("server")) {
    const auto &server = merged["server"];
    if (server.contains("command")) {
      s.command = server["command"].get<std::vector<std::string>>();
    }
    s.workingDirectory = server.value("working_dir", s.workingDirectory);
    s.portEnv = server.value("port_env", s.portEnv);
  }

  if (merged.contains("logging")) {
    s.loggers.clear();
    for (const auto &entry : merged["logging"]) {
      LoggerSettings logger;
      logger.type = entry.value("type", logger.type);
      logger.level = entry.value("level", logger.level);
      logger.file = entry.value("file", logger.file);
      s.loggers.push_back(std::move(logger));
    }
  }

  return s;
}
