#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>
#include "config/options.hpp"

using namespace savestore::config;

class OptionsTest : public ::testing::Test {
protected:
  std::ostringstream err;

  ProgramOptions parse(std::vector<const char*> args) {
    args.insert(args.begin(), "savestore");
    return parse_command_line(static_cast<int>(args.size()), args.data(), err);
  }
};

TEST_F(OptionsTest, TitleOnly) {
  const ProgramOptions options = parse({"-t", "my-game"});
  ASSERT_TRUE(options.valid) << err.str();
  EXPECT_EQ(options.project_title, "my-game");
  EXPECT_TRUE(options.root_override.empty());
  EXPECT_EQ(options.platform, current_platform());
  EXPECT_EQ(options.log_file, "savestore.log");
  EXPECT_EQ(options.log_level, boost::log::trivial::info);
}

TEST_F(OptionsTest, AllFlags) {
  const ProgramOptions options = parse({
    "--title", "my-game",
    "--root", "/tmp/saves",
    "--platform", "windows",
    "--log-file", "store.log",
    "--log-level", "debug"
  });
  ASSERT_TRUE(options.valid) << err.str();
  EXPECT_EQ(options.root_override, "/tmp/saves");
  EXPECT_EQ(options.platform, Platform::Windows);
  EXPECT_EQ(options.log_file, "store.log");
  EXPECT_EQ(options.log_level, boost::log::trivial::debug);
}

TEST_F(OptionsTest, MissingTitle) {
  EXPECT_FALSE(parse({"-r", "/tmp/saves"}).valid);
  EXPECT_NE(err.str().find("project title is required"), std::string::npos);
  EXPECT_NE(err.str().find("Usage:"), std::string::npos);
}

TEST_F(OptionsTest, UnknownFlag) {
  EXPECT_FALSE(parse({"-t", "my-game", "--colour", "blue"}).valid);
  EXPECT_NE(err.str().find("Unknown argument: --colour"), std::string::npos);
}

TEST_F(OptionsTest, MissingValue) {
  EXPECT_FALSE(parse({"-t"}).valid);
  EXPECT_NE(err.str().find("Missing value for -t"), std::string::npos);
}

TEST_F(OptionsTest, BadValues) {
  EXPECT_FALSE(parse({"-t", "my-game", "-p", "amiga"}).valid);
  EXPECT_FALSE(parse({"-t", "my-game", "-v", "loud"}).valid);
}

TEST_F(OptionsTest, RootOverrideWins) {
  ProgramOptions options = parse({"-t", "my-game", "-r", "/srv/saves"});
  ASSERT_TRUE(options.valid);
  EXPECT_EQ(resolve_root(options, [](const char*) -> const char* { return nullptr; }), "/srv/saves");
}

TEST_F(OptionsTest, RootFromPlatform) {
  ProgramOptions options = parse({"-t", "my-game", "-p", "linux"});
  ASSERT_TRUE(options.valid);
  const auto env = [](const char* name) -> const char* {
    return std::string(name) == "HOME" ? "/home/ada" : nullptr;
  };
  EXPECT_EQ(resolve_root(options, env), "/home/ada/.local/share/my-game/");
}
