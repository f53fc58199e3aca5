#include "testing.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

namespace {

class ConfigTest : public ::testing::Test {
  protected:
    std::string Write(const std::string& body) {
        const std::string p = tmp.Path() + "/config.json";
        testutil::WriteFile(p, body);
        return p;
    }

    testutil::TemporaryDirectory tmp;
    seed::config::SeedConfigFromFile cfg;
    std::string err;
};

TEST_F(ConfigTest, LoadsAllKeys) {
    const auto p = Write(R"({
        "BaseDir": "/srv/projects",
        "LogLevel": "warn",
        "DefaultGroupId": "org.acme",
        "DefaultJavaVersion": "21"
    })");

    ASSERT_TRUE(cfg.LoadFile(p, err)) << err;
    EXPECT_EQ(cfg.base_dir, "/srv/projects");
    EXPECT_EQ(cfg.log_level, seed::LogLevel::Warn);
    EXPECT_EQ(cfg.default_group_id, "org.acme");
    EXPECT_EQ(cfg.default_java_version, "21");
}

TEST_F(ConfigTest, EmptyObjectLeavesEverythingUnset) {
    ASSERT_TRUE(cfg.LoadFile(Write("{}"), err)) << err;
    EXPECT_FALSE(cfg.base_dir.has_value());
    EXPECT_FALSE(cfg.log_level.has_value());
    EXPECT_FALSE(cfg.default_group_id.has_value());
}

TEST_F(ConfigTest, RejectsBadInput) {
    struct Case {
        const char* body;
        const char* expected_error_substr;
    };
    const Case cases[] = {
        {"[1, 2]", "root must be JSON object"},
        {"{not json", "invalid JSON"},
        {R"({"BaseDir": 5})", "BaseDir must be a string"},
        {R"({"BaseDir": ""})", "BaseDir must not be empty"},
        {R"({"LogLevel": "chatty"})", "unknown LogLevel 'chatty'"},
    };
    for (const auto& c : cases) {
        err.clear();
        EXPECT_FALSE(cfg.LoadFile(Write(c.body), err)) << c.body;
        EXPECT_NE(err.find(c.expected_error_substr), std::string::npos) << err;
        EXPECT_FALSE(cfg.base_dir.has_value());
    }
}

TEST_F(ConfigTest, MissingFileFails) {
    EXPECT_FALSE(cfg.LoadFile(tmp.Path() + "/absent.json", err));
    EXPECT_NE(err.find("cannot open"), std::string::npos);
}

TEST_F(ConfigTest, DefaultPathPrefersXdg) {
    const char* old_xdg = std::getenv("XDG_CONFIG_HOME");
    const std::string saved = old_xdg ? old_xdg : "";

    ::setenv("XDG_CONFIG_HOME", "/xdg", 1);
    EXPECT_EQ(seed::config::DefaultConfigPath(), "/xdg/springseed/config.json");

    ::unsetenv("XDG_CONFIG_HOME");
    const char* home = std::getenv("HOME");
    if (home && *home) {
        EXPECT_EQ(seed::config::DefaultConfigPath(),
                  std::string(home) + "/.config/springseed/config.json");
    }

    if (old_xdg) ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
}

TEST(LogLevelTest, ParsesNames) {
    seed::LogLevel lvl{};
    EXPECT_TRUE(seed::ParseLogLevel("DEBUG", lvl));
    EXPECT_EQ(lvl, seed::LogLevel::Debug);
    EXPECT_TRUE(seed::ParseLogLevel("warning", lvl));
    EXPECT_EQ(lvl, seed::LogLevel::Warn);
    EXPECT_TRUE(seed::ParseLogLevel("none", lvl));
    EXPECT_EQ(lvl, seed::LogLevel::None);
    EXPECT_FALSE(seed::ParseLogLevel("verbose", lvl));
}

} // namespace
