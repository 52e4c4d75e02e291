#include "bridge/Position.hh"
#include "main/Config.hh"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace std::string_literals;
using namespace std::string_view_literals;

using BidEngine::LogLevel;
using BidEngine::Main::Config;

namespace Positions = BidEngine::Positions;

class ConfigTest : public testing::Test {
protected:
    std::istringstream in;

    void assertThrows()
    {
        auto f = [this]() { static_cast<void>(Config {in}); };
        EXPECT_THROW(f(), std::runtime_error);
    }
};

TEST_F(ConfigTest, testBadStream)
{
    in.setstate(std::ios::failbit);
    assertThrows();
}

TEST_F(ConfigTest, testBadSyntax)
{
    in.str("this is invalid"s);
    assertThrows();
}

TEST_F(ConfigTest, testDefaults)
{
    const auto config = Config {in};
    EXPECT_FALSE(config.getSystemPath());
    EXPECT_EQ(Positions::NORTH, config.getDealer());
    EXPECT_FALSE(config.getLogLevel());
}

TEST_F(ConfigTest, testDefaultConstructedConfig)
{
    const auto config = Config {};
    EXPECT_FALSE(config.getSystemPath());
    EXPECT_EQ(Positions::NORTH, config.getDealer());
}

TEST_F(ConfigTest, testEmptyPathGivesDefaults)
{
    const auto config = BidEngine::Main::configFromPath(""sv);
    EXPECT_FALSE(config.getSystemPath());
}

TEST_F(ConfigTest, testSystemPath)
{
    in.str(R"EOF(
system = "/usr/share/bidengine/systems/kokish.json"
)EOF"s);
    const auto config = Config {in};
    EXPECT_EQ("/usr/share/bidengine/systems/kokish.json"sv, config.getSystemPath());
}

TEST_F(ConfigTest, testScriptIsEvaluated)
{
    in.str(R"EOF(
local dir = "systems"
system = dir .. "/kokish.json"
)EOF"s);
    const auto config = Config {in};
    EXPECT_EQ("systems/kokish.json"sv, config.getSystemPath());
}

TEST_F(ConfigTest, testSystemPathNotString)
{
    in.str("system = {}"s);
    assertThrows();
}

TEST_F(ConfigTest, testDealer)
{
    in.str(R"EOF(
dealer = "west"
)EOF"s);
    const auto config = Config {in};
    EXPECT_EQ(Positions::WEST, config.getDealer());
}

TEST_F(ConfigTest, testInvalidDealer)
{
    in.str(R"EOF(
dealer = "center"
)EOF"s);
    assertThrows();
}

TEST_F(ConfigTest, testLogLevel)
{
    in.str(R"EOF(
log_level = "debug"
)EOF"s);
    const auto config = Config {in};
    EXPECT_EQ(LogLevel::DEBUG, config.getLogLevel());
}

TEST_F(ConfigTest, testInvalidLogLevel)
{
    in.str(R"EOF(
log_level = "chatty"
)EOF"s);
    assertThrows();
}
