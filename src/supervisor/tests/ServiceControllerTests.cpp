#include <gtest/gtest.h>
#include <signal.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "../include/service_controller.hpp"

namespace fs = std::filesystem;

class ServiceControllerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("webctl_service_" +
            std::to_string(
                std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(dir_);
    pidFile_ = dir_ / "tmp" / "server.pid";
    portFile_ = dir_ / "tmp" / "server.port";
  }
  void TearDown() override {
    // Не оставлять серверы после упавшего теста
    runAction({"stop"});
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  void writeConfig(const std::vector<std::string> &command) {
    nlohmann::json config = {
        {"defaults",
         {{"pid_file", pidFile_.string()},
          {"port_file", portFile_.string()},
          {"port_range", {{"start", 42400}, {"end", 42420}}},
          {"timeouts",
           {{"poll_interval_ms", 10},
            {"process_exit_ms", 2000},
            {"port_release_ms", 200},
            {"restart_delay_ms", 20},
            {"startup_grace_ms", 150},
            {"lock_ms", 500}}},
          {"server", {{"command", command}, {"working_dir", dir_.string()}}},
          {"logging", {{{"type", "console"}, {"level", "error"}}}}}},
        {"environments", {{"production", nlohmann::json::object()}}}};
    std::ofstream(dir_ / "webctl.json") << config.dump(2);
  }

  int runAction(std::vector<std::string> args) {
    args.insert(args.begin(),
                {"webctl", "--config-file=" + (dir_ / "webctl.json").string()});
    std::vector<char *> argv;
    for (auto &arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    ServiceController controller;
    return controller.run(static_cast<int>(args.size()), argv.data());
  }

  int runRaw(std::vector<std::string> args) {
    args.insert(args.begin(), "webctl");
    std::vector<char *> argv;
    for (auto &arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    ServiceController controller;
    return controller.run(static_cast<int>(args.size()), argv.data());
  }

  fs::path dir_;
  fs::path pidFile_;
  fs::path portFile_;
};

TEST_F(ServiceControllerTest, InvalidActionExitsWithOne) {
  EXPECT_EQ(runRaw({"reload"}), 1);
  EXPECT_EQ(runRaw({}), 1);
  EXPECT_EQ(runRaw({"--bogus", "start"}), 1);
}

TEST_F(ServiceControllerTest, HelpAndVersionExitWithZero) {
  EXPECT_EQ(runRaw({"--help"}), 0);
  EXPECT_EQ(runRaw({"--version"}), 0);
}

TEST_F(ServiceControllerTest, MissingExplicitConfigExitsWithOne) {
  EXPECT_EQ(runAction({"stop"}), 1);
}

TEST_F(ServiceControllerTest, StopOnStoppedInstanceRemovesStalePid) {
  writeConfig({"sleep", "30"});
  fs::create_directories(pidFile_.parent_path());
  // Номер больше pid_max, такого процесса нет
  std::ofstream(pidFile_) << "999999999\n";

  EXPECT_EQ(runAction({"stop"}), 0);
  EXPECT_FALSE(fs::exists(pidFile_));
}

TEST_F(ServiceControllerTest, StartThenStopRealProcess) {
  writeConfig({"sleep", "30"});

  EXPECT_EQ(runAction({"START"}), 0);
  ASSERT_TRUE(fs::exists(pidFile_));
  ASSERT_TRUE(fs::exists(portFile_));

  pid_t pid = 0;
  std::ifstream(pidFile_) >> pid;
  ASSERT_GT(pid, 0);
  EXPECT_EQ(::kill(pid, 0), 0);

  // Повторный start ничего не меняет
  EXPECT_EQ(runAction({"start"}), 0);
  pid_t again = 0;
  std::ifstream(pidFile_) >> again;
  EXPECT_EQ(again, pid);

  EXPECT_EQ(runAction({"stop"}), 0);
  EXPECT_FALSE(fs::exists(pidFile_));
}

TEST_F(ServiceControllerTest, ChildExitingImmediatelyFailsStart) {
  writeConfig({"sh", "-c", "exit 3"});

  EXPECT_EQ(runAction({"start"}), 1);
  EXPECT_FALSE(fs::exists(pidFile_));
}

TEST_F(ServiceControllerTest, MissingExecutableFailsStart) {
  writeConfig({"/nonexistent/webctl-test-server"});

  EXPECT_EQ(runAction({"start"}), 1);
  EXPECT_FALSE(fs::exists(pidFile_));
}

TEST_F(ServiceControllerTest, OverrideReplacesConfiguredCommand) {
  writeConfig({"/nonexistent/webctl-test-server"});

  EXPECT_EQ(runAction({"--override=server.command:[\"sleep\",\"30\"]",
                       "restart"}),
            0);
  EXPECT_TRUE(fs::exists(pidFile_));

  EXPECT_EQ(runAction({"stop"}), 0);
}

TEST(ServiceControllerExitCodeTest, MapsOutcomes) {
  ActionReport report;
  report.outcome = ActionOutcome::Started;
  EXPECT_EQ(ServiceController::exitCodeFor(report), 0);

  report.outcome = ActionOutcome::NotRunning;
  EXPECT_EQ(ServiceController::exitCodeFor(report), 0);

  report.outcome = ActionOutcome::Interrupted;
  report.interruptSignal = SIGINT;
  EXPECT_EQ(ServiceController::exitCodeFor(report), 130);
  report.interruptSignal = SIGTERM;
  EXPECT_EQ(ServiceController::exitCodeFor(report), 143);
}
