#include <frogworks/argument_handler.h>
#include <frogworks/cli_parser.h>
#include <frogworks/daemon_config.h>
#include <frogworks/error_types.h>

#include <gtest/gtest.h>

#include <cstdlib>

using namespace frogworks;

namespace {

struct Recorded {
    std::vector<std::string> events;
    std::vector<OpenTarget> opened;
};

ArgumentHandler make_handler(Recorded& rec) {
    ArgumentHandler::Actions actions;
    actions.open = [&rec](const OpenTarget& t) {
        rec.opened.push_back(t);
        rec.events.push_back("open");
    };
    actions.ping = [&rec]() { rec.events.push_back("ping"); };
    actions.quit = [&rec]() { rec.events.push_back("quit"); };
    return ArgumentHandler(actions);
}

} // namespace

TEST(OpenTargetTest, ParsesTypeAndId) {
    EXPECT_EQ(OpenTarget::parse("game:42"), (OpenTarget{"game", "42"}));
    EXPECT_EQ(OpenTarget::parse("Mod:frog-pack_2"), (OpenTarget{"mod", "frog-pack_2"}));
    // Only the first colon separates type from id
    EXPECT_EQ(OpenTarget::parse("save:slot:3"), (OpenTarget{"save", "slot:3"}));
}

TEST(OpenTargetTest, RejectsMalformedSpecs) {
    EXPECT_THROW(OpenTarget::parse("game42"), InvalidArgumentsException);
    EXPECT_THROW(OpenTarget::parse(":42"), InvalidArgumentsException);
    EXPECT_THROW(OpenTarget::parse("game:"), InvalidArgumentsException);
    EXPECT_THROW(OpenTarget::parse("ga me:42"), InvalidArgumentsException);
    EXPECT_THROW(OpenTarget::parse("game:4 2"), InvalidArgumentsException);
    EXPECT_THROW(OpenTarget::parse("game:4/2"), InvalidArgumentsException);
}

TEST(OpenTargetTest, ParsesLinks) {
    EXPECT_EQ(OpenTarget::from_uri("frogworks://game/42"), (OpenTarget{"game", "42"}));
    EXPECT_EQ(OpenTarget::from_uri("FROGWORKS://Game/42/"), (OpenTarget{"game", "42"}));
    EXPECT_EQ(OpenTarget::from_uri("frogworks:mod/abc"), (OpenTarget{"mod", "abc"}));
}

TEST(OpenTargetTest, RejectsMalformedLinks) {
    EXPECT_THROW(OpenTarget::from_uri("https://game/42"), InvalidArgumentsException);
    EXPECT_THROW(OpenTarget::from_uri("frogworks://game"), InvalidArgumentsException);
    EXPECT_THROW(OpenTarget::from_uri("frogworks://game/4/2"), InvalidArgumentsException);
    EXPECT_THROW(OpenTarget::from_uri("frogworks://"), InvalidArgumentsException);
}

TEST(ArgumentHandlerTest, EmptyInvocationDoesNothing) {
    Recorded rec;
    make_handler(rec).handle({});
    EXPECT_TRUE(rec.events.empty());
}

TEST(ArgumentHandlerTest, OpensTargetFromOption) {
    Recorded rec;
    make_handler(rec).handle({"--open", "game:42"});
    ASSERT_EQ(rec.opened.size(), 1u);
    EXPECT_EQ(rec.opened[0], (OpenTarget{"game", "42"}));
}

TEST(ArgumentHandlerTest, OpensTargetFromLink) {
    Recorded rec;
    make_handler(rec).handle({"frogworks://mod/7"});
    ASSERT_EQ(rec.opened.size(), 1u);
    EXPECT_EQ(rec.opened[0], (OpenTarget{"mod", "7"}));
}

TEST(ArgumentHandlerTest, QuitRunsAfterEverythingElse) {
    Recorded rec;
    make_handler(rec).handle({"--quit", "--ping", "--open", "game:1"});
    EXPECT_EQ(rec.events, (std::vector<std::string>{"open", "ping", "quit"}));
}

TEST(ArgumentHandlerTest, SettingsOnlyInvocationRequestsNoAction) {
    Recorded rec;
    make_handler(rec).handle({"--log-level", "debug", "--no-tray"});
    EXPECT_TRUE(rec.events.empty());
}

TEST(ArgumentHandlerTest, BadLinkDoesNotHalfApply) {
    Recorded rec;
    EXPECT_THROW(make_handler(rec).handle({"--open", "game:1", "--quit", "frogworks://broken"}),
                 InvalidArgumentsException);
    EXPECT_TRUE(rec.events.empty());
}

TEST(ArgumentHandlerTest, RejectsUnknownOptionsAndHelp) {
    Recorded rec;
    auto handler = make_handler(rec);
    EXPECT_THROW(handler.handle({"--bogus"}), InvalidArgumentsException);
    EXPECT_THROW(handler.handle({"--help"}), InvalidArgumentsException);
    EXPECT_THROW(handler.handle({"--log-level", "loud"}), InvalidArgumentsException);
    EXPECT_TRUE(rec.events.empty());
}

TEST(CLIParserTest, ParsesLocalInvocation) {
    CLIParser parser;
    EXPECT_EQ(parser.parse(std::vector<std::string>{"--open", "game:42", "--api-url", "http://127.0.0.1:9000"}), 0);
    EXPECT_TRUE(parser.should_continue());

    Invocation inv = parser.get_invocation();
    EXPECT_EQ(inv.open_target, "game:42");
    EXPECT_EQ(inv.api_url, "http://127.0.0.1:9000");
    EXPECT_TRUE(inv.has_action());
}

TEST(CLIParserTest, InvalidLogLevelStopsStartup) {
    CLIParser parser;
    EXPECT_NE(parser.parse(std::vector<std::string>{"--log-level", "verbose"}), 0);
    EXPECT_FALSE(parser.should_continue());
}

TEST(CLIParserTest, VersionFlagIsReported) {
    CLIParser parser;
    EXPECT_EQ(parser.parse(std::vector<std::string>{"--version"}), 0);
    EXPECT_TRUE(parser.should_show_version());
    EXPECT_FALSE(parser.get_invocation().has_action());
}

TEST(CLIParserTest, RelayedParsePreservesArgumentOrderSemantics) {
    Invocation inv = CLIParser::parse_relayed({"frogworks://game/9", "--ping"});
    EXPECT_EQ(inv.uri, "frogworks://game/9");
    EXPECT_TRUE(inv.ping);
    EXPECT_FALSE(inv.quit);
}

class DaemonConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        unsetenv("FROGWORKS_LOG_LEVEL");
        unsetenv("FROGWORKS_NO_TRAY");
        unsetenv("FROGWORKS_API_URL");
        unsetenv("FROGWORKS_RELAY_TIMEOUT_MS");
    }
};

TEST_F(DaemonConfigTest, DefaultsComeFromPlatformConstants) {
    DaemonConfig config;
    config.load_env_defaults();
    EXPECT_EQ(config.log_level, "info");
    EXPECT_FALSE(config.no_tray);
    EXPECT_EQ(config.api_url, PlatformConstants::DEFAULT_API_URL);
    EXPECT_EQ(config.read_timeout_ms, PlatformConstants::RELAY_READ_TIMEOUT_MS);
    EXPECT_EQ(config.relay_port, PlatformConstants::RELAY_PORT);
}

TEST_F(DaemonConfigTest, EnvironmentOverridesDefaults) {
    setenv("FROGWORKS_LOG_LEVEL", "debug", 1);
    setenv("FROGWORKS_NO_TRAY", "yes", 1);
    setenv("FROGWORKS_API_URL", "http://10.0.0.2:8000", 1);
    setenv("FROGWORKS_RELAY_TIMEOUT_MS", "750", 1);

    DaemonConfig config;
    config.load_env_defaults();
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_TRUE(config.no_tray);
    EXPECT_EQ(config.api_url, "http://10.0.0.2:8000");
    EXPECT_EQ(config.read_timeout_ms, 750);
}

TEST_F(DaemonConfigTest, InvalidEnvironmentValuesAreIgnored) {
    setenv("FROGWORKS_LOG_LEVEL", "chatty", 1);
    setenv("FROGWORKS_RELAY_TIMEOUT_MS", "soon", 1);

    DaemonConfig config;
    config.load_env_defaults();
    EXPECT_EQ(config.log_level, "info");
    EXPECT_EQ(config.read_timeout_ms, PlatformConstants::RELAY_READ_TIMEOUT_MS);

    setenv("FROGWORKS_RELAY_TIMEOUT_MS", "-5", 1);
    config.load_env_defaults();
    EXPECT_EQ(config.read_timeout_ms, PlatformConstants::RELAY_READ_TIMEOUT_MS);
}

TEST_F(DaemonConfigTest, CommandLineWinsOverEnvironment) {
    setenv("FROGWORKS_LOG_LEVEL", "debug", 1);
    setenv("FROGWORKS_API_URL", "http://env:1", 1);

    DaemonConfig config;
    config.load_env_defaults();

    Invocation inv;
    inv.log_level = "error";
    inv.api_url = "http://cli:2";
    config.apply(inv);

    EXPECT_EQ(config.log_level, "error");
    EXPECT_EQ(config.api_url, "http://cli:2");
    EXPECT_FALSE(config.no_tray);
}
