/**
 * @file service_controller.cpp
 * @brief Реализация методов ServiceController
 *
 * @details
 *  - run(): аргументы, конфигурация, логгеры
 *  - execute(): блокировка, компоненты, сигналы, действие
 *  - initLogger(): конфигурация логирования
 */

#include "../include/service_controller.hpp"

#include <signal.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>

#include "../include/action_lock.hpp"
#include "../include/configmanager.hpp"
#include "webctl/PidRegistry.hpp"
#include "webctl/PortAllocator.hpp"
#include "webctl/PortProber.hpp"
#include "webctl/PortRegistry.hpp"
#include "webctl/ProcessHost.hpp"
#include "webctl/SignalRouter.hpp"
#include "webctl/compositelogger.hpp"
#include "webctl/consolelogger.hpp"
#include "webctl/filelogger.hpp"

#ifndef WEBCTL_VERSION
#define WEBCTL_VERSION "1.0.0"
#endif

namespace fs = std::filesystem;

namespace {

// shared_ptr на синглтон без владения
template <typename T>
std::shared_ptr<webctl::ILogger> getSingletonPtr(T &singleton) {
  return std::shared_ptr<T>(&singleton, [](T *) {});
}

// Обработчики SIGINT/SIGTERM на время одного действия
class TerminationRouting {
 public:
  explicit TerminationRouting(LifecycleController &controller) {
    auto &router = webctl::SignalRouter::instance();
    auto &logger = webctl::CompositeLogger::instance();
    for (int signum : {SIGINT, SIGTERM}) {
      router.registerHandler(signum, [&controller, &logger](int sig_num) {
        logger.info("Signal " + std::to_string(sig_num) +
                    " received, interrupting");
        controller.requestTermination(sig_num);
      });
    }
    router.start();
  }

  ~TerminationRouting() {
    auto &router = webctl::SignalRouter::instance();
    router.stop();
    for (int signum : {SIGINT, SIGTERM}) {
      try {
        router.unregisterHandler(signum);
      } catch (const std::exception &e) {
        webctl::CompositeLogger::instance().error(e.what());
      }
    }
  }

  TerminationRouting(const TerminationRouting &) = delete;
  TerminationRouting &operator=(const TerminationRouting &) = delete;
};

std::string describe(const ActionReport &report) {
  std::string text =
      actionToString(report.action) + ": " + outcomeToString(report.outcome);
  if (report.pid) text += " (pid " + std::to_string(*report.pid);
  if (report.port) {
    text += report.pid ? ", " : " (";
    text += "port " + std::to_string(*report.port);
  }
  if (report.pid || report.port) text += ")";
  return text;
}

}  // namespace

int ServiceController::run(int argc, char **argv) {
  const std::string program =
      argc > 0 ? fs::path(argv[0]).filename().string() : "webctl";

  ParsedArgs args;
  try {
    ArgumentParser parser;
    args = parser.parse(argc, argv);
  } catch (const InvalidActionError &e) {
    std::cerr << e.what() << "\n\n" << ArgumentParser::usage(program);
    return EXIT_FAILURE;
  }

  if (args.help_message) {
    std::cout << ArgumentParser::usage(program);
    return EXIT_SUCCESS;
  }
  if (args.version_message) {
    printVersion();
    return EXIT_SUCCESS;
  }

  auto &logger = webctl::CompositeLogger::instance();
  logger.clearLoggers();
  logger.addLogger(getSingletonPtr(webctl::ConsoleLogger::instance()));

  try {
    ConfigManager config;
    if (args.config_path_explicit || fs::exists(args.config_path)) {
      config.initialize(args.config_path);
    } else {
      config.initializeDefaults();
    }
    if (!args.overrides.empty()) config.applyCliOverrides(args.overrides);

    const SupervisorSettings settings = SupervisorSettings::fromJson(
        config.getMergedConfig(args.environment));
    initLogger(args, settings);

    if (!config.getConfigFilePath().empty()) {
      logger.debug("Configuration loaded from " + config.getConfigFilePath());
    }

    return execute(*args.action, settings);
  } catch (const webctl::ExhaustedRangeError &e) {
    logger.critical(e.what());
  } catch (const webctl::SpawnError &e) {
    logger.critical(std::string("Failed to start server: ") + e.what());
  } catch (const std::exception &e) {
    logger.critical(e.what());
  }

  logger.flush();
  return EXIT_FAILURE;
}

int ServiceController::execute(Action action,
                               const SupervisorSettings &settings) {
  auto &logger = webctl::CompositeLogger::instance();

  ActionLock lock(settings.pidFile + ".lock", settings.lockTimeout,
                  settings.pollInterval);

  webctl::PosixProcessHost host;
  webctl::TcpPortProber prober;
  webctl::PidRegistry pids(settings.pidFile, host);
  webctl::PortRegistry ports(settings.portFile, settings.portRange);
  webctl::PortAllocator allocator(settings.portRange, prober);

  LifecycleController controller(settings, pids, ports, allocator, prober,
                                 host, logger);
  logger.debug("Current state: " +
               lifecycleStateToString(controller.state()));

  ActionReport report;
  {
    TerminationRouting routing(controller);
    report = controller.run(action);
  }

  logger.info(describe(report));
  logger.flush();
  return exitCodeFor(report);
}

int ServiceController::exitCodeFor(const ActionReport &report) {
  if (report.outcome == ActionOutcome::Interrupted) {
    return 128 + report.interruptSignal;
  }
  return EXIT_SUCCESS;
}

void ServiceController::initLogger(const ParsedArgs &args,
                                   const SupervisorSettings &settings) {
  auto &composite_logger = webctl::CompositeLogger::instance();
  composite_logger.clearLoggers();

  if (args.use_cli_logging && !args.logger_types.empty()) {
    for (const auto &type : args.logger_types) {
      if (type == "console") {
        composite_logger.addLogger(
            getSingletonPtr(webctl::ConsoleLogger::instance()));
      } else if (type == "file") {
        auto &logger = webctl::FileLogger::instance();
        logger.setMainLogPath("webctl.log");
        composite_logger.addLogger(getSingletonPtr(logger));
      }
    }
  } else {
    for (const auto &entry : settings.loggers) {
      const auto level = webctl::stringToLogLevel(entry.level);
      if (entry.type == "console") {
        auto &logger = webctl::ConsoleLogger::instance();
        logger.setLogLevel(level);
        composite_logger.addLogger(getSingletonPtr(logger));
      } else if (entry.type == "file") {
        auto &logger = webctl::FileLogger::instance();
        logger.setMainLogPath(entry.file);
        logger.setLogLevel(level);
        composite_logger.addLogger(getSingletonPtr(logger));
      }
    }
  }

  if (composite_logger.size() == 0) {
    composite_logger.addLogger(
        getSingletonPtr(webctl::ConsoleLogger::instance()));
  }

  if (args.log_level.has_value()) {
    composite_logger.setLogLevel(
        webctl::stringToLogLevel(args.log_level.value()));
  }
}

void ServiceController::printVersion() {
  std::cout << "webctl v" << WEBCTL_VERSION << "\n"
            << "(c) 2026 by Artem Ulyanov, STC LLC.\n";
}
