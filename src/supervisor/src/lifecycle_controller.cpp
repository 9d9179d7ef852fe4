#include "../include/lifecycle_controller.hpp"

#include <cerrno>
#include <system_error>
#include <utility>

#include "../include/polling.hpp"

using webctl::ProcessSignal;

namespace {

std::string replaceAll(std::string value, const std::string &token,
                       const std::string &replacement) {
  std::size_t pos = 0;
  while ((pos = value.find(token, pos)) != std::string::npos) {
    value.replace(pos, token.size(), replacement);
    pos += replacement.size();
  }
  return value;
}

}  // namespace

std::string lifecycleStateToString(LifecycleState state) {
  switch (state) {
    case LifecycleState::Stopped:
      return "stopped";
    case LifecycleState::Starting:
      return "starting";
    case LifecycleState::Running:
      return "running";
    case LifecycleState::Stopping:
      return "stopping";
  }
  return "unknown";
}

std::string outcomeToString(ActionOutcome outcome) {
  switch (outcome) {
    case ActionOutcome::Started:
      return "started";
    case ActionOutcome::AlreadyRunning:
      return "already running";
    case ActionOutcome::Stopped:
      return "stopped";
    case ActionOutcome::NotRunning:
      return "not running";
    case ActionOutcome::Interrupted:
      return "interrupted";
  }
  return "unknown";
}

LifecycleController::LifecycleController(
    SupervisorSettings settings, webctl::PidRegistry &pids,
    webctl::PortRegistry &ports, const webctl::PortAllocator &allocator,
    const webctl::IPortProber &prober, webctl::IProcessHost &host,
    webctl::ILogger &logger)
    : settings_(std::move(settings)),
      pids_(pids),
      ports_(ports),
      allocator_(allocator),
      prober_(prober),
      host_(host),
      logger_(logger) {
  state_ = inferState();
}

ActionReport LifecycleController::run(Action action) {
  switch (action) {
    case Action::Start:
      return start();
    case Action::Stop:
      return stop();
    case Action::Restart:
      return restart();
  }
  throw InvalidActionError("LifecycleController: run(): Unsupported action");
}

LifecycleState LifecycleController::inferState() const {
  return pids_.isAlive(pids_.read()) ? LifecycleState::Running
                                     : LifecycleState::Stopped;
}

void LifecycleController::requestTermination(int signum) noexcept {
  int expected = 0;
  terminationSignal_.compare_exchange_strong(expected, signum);
}

ActionReport LifecycleController::start() {
  ActionReport report;
  report.action = Action::Start;

  const auto existing = pids_.read();
  if (pids_.isAlive(existing)) {
    setState(LifecycleState::Running);
    logger_.info("Server is already running (pid " +
                 std::to_string(*existing) + ")");
    report.outcome = ActionOutcome::AlreadyRunning;
    report.pid = existing;
    report.port = ports_.read();
    return report;
  }

  if (pids_.exists()) {
    logger_.info("Removing stale pid file " + pids_.path().string());
    pids_.clear();
  }

  setState(LifecycleState::Starting);
  try {
    const int port = choosePort();
    report.port = port;
    ports_.write(port);

    if (terminationSignal_.load() != 0) {
      setState(LifecycleState::Stopped);
      return interrupted(report);
    }

    const pid_t pid = host_.spawn(buildRequest(port));
    report.pid = pid;

    try {
      pids_.write(pid);
    } catch (const std::exception &e) {
      logger_.error("Failed to record pid " + std::to_string(pid) + ": " +
                    e.what() + ", terminating the server");
      terminate(pid);
      throw;
    }

    logger_.info("Server started (pid " + std::to_string(pid) + ", port " +
                 std::to_string(port) + ")");
  } catch (const std::exception &) {
    setState(LifecycleState::Stopped);
    throw;
  }

  return watchStartup(report);
}

ActionReport LifecycleController::stop() {
  ActionReport report;
  report.action = Action::Stop;

  const auto pid = pids_.read();
  if (!pids_.isAlive(pid)) {
    if (pids_.exists()) {
      logger_.info("Removing stale pid file " + pids_.path().string());
      pids_.clear();
    }
    setState(LifecycleState::Stopped);
    logger_.info("Server is not running");
    report.outcome = ActionOutcome::NotRunning;
    return report;
  }

  setState(LifecycleState::Stopping);
  report.pid = pid;
  logger_.info("Stopping server (pid " + std::to_string(*pid) + ")");

  terminate(*pid);

  if (!waitForExit(*pid)) {
    report.exitTimedOut = true;
    logger_.warning("Process " + std::to_string(*pid) + " did not exit within " +
                    std::to_string(settings_.processExitTimeout.count()) +
                    " ms");
  }

  if (const auto port = ports_.read()) {
    report.port = port;
    if (!waitForPortRelease(*port)) {
      report.portReleaseTimedOut = true;
      logger_.warning("Port " + std::to_string(*port) +
                      " was not released within " +
                      std::to_string(settings_.portReleaseTimeout.count()) +
                      " ms");
    }
  }

  pids_.clear();
  setState(LifecycleState::Stopped);
  logger_.info("Server stopped");
  report.outcome = ActionOutcome::Stopped;
  return report;
}

ActionReport LifecycleController::restart() {
  const ActionReport stopped = stop();

  ActionReport report;
  report.action = Action::Restart;
  report.exitTimedOut = stopped.exitTimedOut;
  report.portReleaseTimedOut = stopped.portReleaseTimedOut;

  if (stopped.outcome == ActionOutcome::Stopped) {
    logger_.debug("Waiting " + std::to_string(settings_.restartDelay.count()) +
                  " ms before start");
    pollUntil([this] { return terminationSignal_.load() != 0; },
              settings_.restartDelay, settings_.pollInterval);
  }

  if (terminationSignal_.load() != 0) {
    return interrupted(report);
  }

  const ActionReport started = start();
  report.outcome = started.outcome;
  report.pid = started.pid;
  report.port = started.port;
  report.interruptSignal = started.interruptSignal;
  return report;
}

int LifecycleController::choosePort() {
  if (const auto persisted = ports_.read()) {
    if (waitForPortRelease(*persisted)) {
      logger_.debug("Reusing port " + std::to_string(*persisted));
      return *persisted;
    }
    logger_.warning("Port " + std::to_string(*persisted) +
                    " is still busy, allocating a new one");
  }

  const int port = allocator_.allocate();
  logger_.debug("Allocated port " + std::to_string(port) + " from " +
                allocator_.range().toString());
  return port;
}

webctl::SpawnRequest LifecycleController::buildRequest(int port) const {
  const std::string value = std::to_string(port);

  webctl::SpawnRequest request;
  request.argv.reserve(settings_.command.size());
  for (const auto &arg : settings_.command) {
    request.argv.push_back(replaceAll(arg, "{port}", value));
  }
  request.workingDirectory = settings_.workingDirectory;
  request.environment.emplace_back(settings_.portEnv, value);
  return request;
}

ActionReport LifecycleController::watchStartup(ActionReport report) {
  const pid_t pid = *report.pid;
  const int port = *report.port;
  bool exited = false;
  bool ready = false;

  pollUntil(
      [&] {
        if (terminationSignal_.load() != 0) return true;
        if (!pids_.isAlive(pid)) {
          exited = true;
          return true;
        }
        if (prober_.isListening(port)) {
          ready = true;
          return true;
        }
        return false;
      },
      settings_.startupGrace, settings_.pollInterval);

  if (terminationSignal_.load() != 0) {
    return interrupted(report);
  }

  if (exited) {
    pids_.clear();
    setState(LifecycleState::Stopped);
    throw webctl::SpawnError(
        ESRCH, "LifecycleController: start(): Server process " +
                   std::to_string(pid) + " exited during startup");
  }

  if (ready) {
    logger_.info("Server is listening on port " + std::to_string(port));
  } else {
    logger_.debug("Port " + std::to_string(port) + " not bound after " +
                  std::to_string(settings_.startupGrace.count()) +
                  " ms, assuming the server is still starting");
  }

  setState(LifecycleState::Running);
  report.outcome = ActionOutcome::Started;
  return report;
}

ActionReport LifecycleController::interrupted(ActionReport report) {
  const int signum = terminationSignal_.load();
  logger_.warning("Interrupted by signal " + std::to_string(signum));

  if (report.pid) {
    const pid_t pid = *report.pid;
    setState(LifecycleState::Stopping);
    logger_.info("Forwarding SIGTERM to server (pid " + std::to_string(pid) +
                 ")");
    if (terminate(pid) && !waitForExit(pid)) {
      report.exitTimedOut = true;
      logger_.warning("Process " + std::to_string(pid) +
                      " did not exit within " +
                      std::to_string(settings_.processExitTimeout.count()) +
                      " ms");
    }
    pids_.clear();
  }

  setState(LifecycleState::Stopped);
  report.outcome = ActionOutcome::Interrupted;
  report.interruptSignal = signum;
  return report;
}

bool LifecycleController::terminate(pid_t pid) {
  try {
    if (host_.signal(pid, ProcessSignal::Terminate)) return true;
    logger_.debug("Process " + std::to_string(pid) +
                  " exited before SIGTERM was delivered");
  } catch (const std::system_error &e) {
    logger_.warning("Failed to send SIGTERM to process " +
                    std::to_string(pid) + ": " + e.what());
  }
  return false;
}

bool LifecycleController::waitForExit(pid_t pid) {
  return pollUntil([this, pid] { return !pids_.isAlive(pid); },
                   settings_.processExitTimeout, settings_.pollInterval);
}

bool LifecycleController::waitForPortRelease(int port) {
  return pollUntil([this, port] { return prober_.isAvailable(port); },
                   settings_.portReleaseTimeout, settings_.pollInterval);
}

void LifecycleController::setState(LifecycleState state) {
  const LifecycleState previous = state_.exchange(state);
  if (previous != state) {
    logger_.debug("State " + lifecycleStateToString(previous) + " -> " +
                  lifecycleStateToString(state));
  }
}
