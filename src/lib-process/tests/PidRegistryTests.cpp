#include <gtest/gtest.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <fstream>

#include "FakeProcessHost.hpp"
#include "webctl/PidRegistry.hpp"

namespace fs = std::filesystem;

class PidRegistryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("webctl_pid_" +
            std::to_string(
                std::chrono::steady_clock::now().time_since_epoch().count()));
    pidFile_ = dir_ / "tmp" / "server.pid";
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  fs::path dir_;
  fs::path pidFile_;
  FakeProcessHost host_;
};

TEST_F(PidRegistryTest, WriteThenReadReturnsSamePid) {
  webctl::PidRegistry registry(pidFile_, host_);
  registry.write(12345);
  ASSERT_TRUE(registry.exists());
  ASSERT_TRUE(registry.read().has_value());
  EXPECT_EQ(*registry.read(), 12345);
}

TEST_F(PidRegistryTest, UnparsableContentReadsAsAbsent) {
  fs::create_directories(pidFile_.parent_path());
  std::ofstream(pidFile_) << "garbage";
  webctl::PidRegistry registry(pidFile_, host_);
  EXPECT_FALSE(registry.read().has_value());
}

TEST_F(PidRegistryTest, MissingFileReadsAsAbsent) {
  webctl::PidRegistry registry(pidFile_, host_);
  EXPECT_FALSE(registry.read().has_value());
  EXPECT_FALSE(registry.exists());
}

TEST_F(PidRegistryTest, FilePermissionsAre0644) {
  webctl::PidRegistry registry(pidFile_, host_);
  registry.write(77);
  const auto perms = fs::status(pidFile_).permissions();
  EXPECT_EQ(perms, fs::perms::owner_read | fs::perms::owner_write |
                       fs::perms::group_read | fs::perms::others_read);
}

TEST_F(PidRegistryTest, ClearIsIdempotent) {
  webctl::PidRegistry registry(pidFile_, host_);
  registry.write(99);
  registry.clear();
  EXPECT_FALSE(fs::exists(pidFile_));
  EXPECT_NO_THROW(registry.clear());
  EXPECT_FALSE(fs::exists(pidFile_));
}

TEST_F(PidRegistryTest, IsAliveAsksProcessHost) {
  webctl::PidRegistry registry(pidFile_, host_);
  host_.addProcess(4242);
  EXPECT_TRUE(registry.isAlive(4242));
  host_.kill(4242);
  EXPECT_FALSE(registry.isAlive(4242));
}

TEST_F(PidRegistryTest, NonPositiveOrAbsentPidIsNeverAlive) {
  webctl::PidRegistry registry(pidFile_, host_);
  host_.addProcess(0);
  EXPECT_FALSE(registry.isAlive(std::nullopt));
  EXPECT_FALSE(registry.isAlive(0));
  EXPECT_FALSE(registry.isAlive(-1));
  EXPECT_EQ(host_.probes, 0);
}

TEST_F(PidRegistryTest, WriteFailsWhenParentIsAFile) {
  fs::create_directories(dir_);
  std::ofstream(dir_ / "tmp") << "not a directory";
  webctl::PidRegistry registry(pidFile_, host_);
  EXPECT_THROW(registry.write(1), std::system_error);
}
