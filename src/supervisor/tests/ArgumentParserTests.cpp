#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../include/argumentparser.hpp"

namespace {

// Владеет строками, пока парсер работает с argv
class Argv {
 public:
  Argv(std::initializer_list<std::string> args) : storage_(args) {
    storage_.insert(storage_.begin(), "webctl");
    for (auto &s : storage_) pointers_.push_back(s.data());
    pointers_.push_back(nullptr);
  }
  int argc() const { return static_cast<int>(storage_.size()); }
  char **argv() { return pointers_.data(); }

 private:
  std::vector<std::string> storage_;
  std::vector<char *> pointers_;
};

ParsedArgs parse(std::initializer_list<std::string> args) {
  Argv argv(args);
  ArgumentParser parser;
  return parser.parse(argv.argc(), argv.argv());
}

}  // namespace

TEST(ActionTest, ParsesCaseInsensitively) {
  EXPECT_EQ(parseAction("start"), Action::Start);
  EXPECT_EQ(parseAction("STOP"), Action::Stop);
  EXPECT_EQ(parseAction("ReStart"), Action::Restart);
  EXPECT_EQ(actionToString(Action::Restart), "restart");
}

TEST(ActionTest, RejectsUnknownAction) {
  EXPECT_THROW(parseAction("reload"), InvalidActionError);
  EXPECT_THROW(parseAction(""), InvalidActionError);
  EXPECT_THROW(parseAction("start "), InvalidActionError);
}

TEST(ArgumentParserTest, ActionOnly) {
  ParsedArgs args = parse({"start"});
  ASSERT_TRUE(args.action.has_value());
  EXPECT_EQ(*args.action, Action::Start);
  EXPECT_EQ(args.config_path, "webctl.json");
  EXPECT_FALSE(args.config_path_explicit);
  EXPECT_EQ(args.environment, "production");
  EXPECT_FALSE(args.use_cli_logging);
}

TEST(ArgumentParserTest, MissingActionIsAnError) {
  EXPECT_THROW(parse({}), InvalidActionError);
  EXPECT_THROW(parse({"--log-level=debug"}), InvalidActionError);
}

TEST(ArgumentParserTest, HelpAndVersionDoNotRequireAction) {
  EXPECT_TRUE(parse({"--help"}).help_message);
  EXPECT_TRUE(parse({"-h"}).help_message);
  EXPECT_TRUE(parse({"--version"}).version_message);
  EXPECT_TRUE(parse({"-v"}).version_message);
}

TEST(ArgumentParserTest, UnknownActionAndOptionsAreErrors) {
  EXPECT_THROW(parse({"status"}), InvalidActionError);
  EXPECT_THROW(parse({"--daemon", "start"}), InvalidActionError);
  EXPECT_THROW(parse({"start", "stop"}), InvalidActionError);
  EXPECT_THROW(parse({"--config-filex=a.json", "start"}), InvalidActionError);
}

TEST(ArgumentParserTest, OptionValuesInBothForms) {
  ParsedArgs eq = parse({"--config-file=/etc/webctl.json", "stop"});
  EXPECT_EQ(eq.config_path, "/etc/webctl.json");
  EXPECT_TRUE(eq.config_path_explicit);

  ParsedArgs sep = parse({"restart", "--environment", "development"});
  EXPECT_EQ(sep.environment, "development");
  EXPECT_EQ(*sep.action, Action::Restart);

  EXPECT_THROW(parse({"start", "--environment"}), InvalidActionError);
}

TEST(ArgumentParserTest, Overrides) {
  ParsedArgs args = parse({"--override=timeouts.lock_ms:250",
                           "--override=server.command:[\"node\",\"a.js\"]",
                           "start"});
  ASSERT_EQ(args.overrides.size(), 2u);
  EXPECT_EQ(args.overrides["timeouts.lock_ms"], "250");
  EXPECT_EQ(args.overrides["server.command"], "[\"node\",\"a.js\"]");

  EXPECT_THROW(parse({"--override=novalue", "start"}), InvalidActionError);
  EXPECT_THROW(parse({"--override=:x", "start"}), InvalidActionError);
  EXPECT_THROW(parse({"--override", "start"}), InvalidActionError);
}

TEST(ArgumentParserTest, LoggingOptions) {
  ParsedArgs args = parse({"--log-type=console,file", "--log-level=debug",
                           "start"});
  EXPECT_TRUE(args.use_cli_logging);
  EXPECT_EQ(args.logger_types,
            (std::vector<std::string>{"console", "file"}));
  ASSERT_TRUE(args.log_level.has_value());
  EXPECT_EQ(*args.log_level, "debug");

  EXPECT_THROW(parse({"--log-type=syslog", "start"}), InvalidActionError);
  EXPECT_THROW(parse({"--log-level=verbose", "start"}), InvalidActionError);
}

TEST(ArgumentParserTest, UsageListsActions) {
  const std::string usage = ArgumentParser::usage("webctl");
  EXPECT_NE(usage.find("<start|stop|restart>"), std::string::npos);
  EXPECT_NE(usage.find("--config-file"), std::string::npos);
}
