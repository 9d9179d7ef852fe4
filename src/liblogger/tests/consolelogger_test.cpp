#include <gtest/gtest.h>

#include <iostream>
#include <sstream>

#include "webctl/consolelogger.hpp"

// Перехват stdout/stderr через подмену rdbuf
class CaptureStream {
 public:
  explicit CaptureStream(std::ostream& target)
      : target_(target), oldBuf_(target.rdbuf()) {
    target.rdbuf(buffer_.rdbuf());
  }
  ~CaptureStream() { target_.rdbuf(oldBuf_); }
  std::string getOutput() const { return buffer_.str(); }

 private:
  std::ostream& target_;
  std::streambuf* oldBuf_;
  std::ostringstream buffer_;
};

class ConsoleLoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    logger_ = &webctl::ConsoleLogger::instance();
    logger_->setColorEnabled(false);
    logger_->setLogLevel(webctl::LogLevel::LOG_DEBUG);
  }
  webctl::ConsoleLogger* logger_;
};

TEST_F(ConsoleLoggerTest, InfoGoesToStdout) {
  CaptureStream out(std::cout);
  CaptureStream err(std::cerr);
  logger_->info("Started server on PID 42");
  EXPECT_NE(out.getOutput().find("Started server on PID 42"),
            std::string::npos);
  EXPECT_TRUE(err.getOutput().empty());
}

TEST_F(ConsoleLoggerTest, WarningGoesToStderr) {
  CaptureStream out(std::cout);
  CaptureStream err(std::cerr);
  logger_->warning("port 4000 still busy");
  EXPECT_NE(err.getOutput().find("port 4000 still busy"), std::string::npos);
  EXPECT_TRUE(out.getOutput().empty());
}

TEST_F(ConsoleLoggerTest, SkipsLowerLevel) {
  logger_->setLogLevel(webctl::LogLevel::LOG_WARNING);
  CaptureStream out(std::cout);
  logger_->info("This should not appear");
  EXPECT_EQ(out.getOutput().find("This should not appear"), std::string::npos);
}

TEST_F(ConsoleLoggerTest, FormatsLevelAndMessageOnOneLine) {
  CaptureStream out(std::cout);
  logger_->info("Formatted message");
  const std::string output = out.getOutput();
  EXPECT_NE(output.find("[INFO] Formatted message"), std::string::npos);
  EXPECT_EQ(output.find('\n'), output.size() - 1);
}

TEST_F(ConsoleLoggerTest, NoColorCodesWhenDisabled) {
  CaptureStream out(std::cout);
  logger_->info("plain");
  EXPECT_EQ(out.getOutput().find("\033["), std::string::npos);
}

TEST(LogLevelTest, ParsesKnownNames) {
  EXPECT_EQ(webctl::stringToLogLevel("debug"), webctl::LogLevel::LOG_DEBUG);
  EXPECT_EQ(webctl::stringToLogLevel("critical"),
            webctl::LogLevel::LOG_CRITICAL);
  EXPECT_THROW(webctl::stringToLogLevel("verbose"), std::invalid_argument);
  EXPECT_EQ(webctl::leveltoString(webctl::LogLevel::LOG_WARNING), "WARNING");
}

TEST(TimeFormatterTest, DefaultFormatHasDateAndTime) {
  auto now = std::chrono::system_clock::now();
  std::string formatted = webctl::TimeFormatter::format(now);
  EXPECT_EQ(formatted.size(), 19u);
  EXPECT_FALSE(webctl::TimeFormatter::setGlobalFormat(""));
}
