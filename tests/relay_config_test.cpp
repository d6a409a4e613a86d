#include <gtest/gtest.h>

#include "relay_config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <unistd.h>

namespace {

RelayConfig::Lookup lookup_from(const std::map<std::string, std::string>& vars)
{
    return [vars](const std::string& name, std::string& value) {
        auto it = vars.find(name);
        if (it == vars.end())
            return false;
        value = it->second;
        return true;
    };
}

std::map<std::string, std::string> required()
{
    return {{"ELEVENLABS_API_KEY", "xi-key"}, {"ELEVENLABS_AGENT_ID", "agent_123"}};
}

TEST(RelayConfigTest, DefaultsWhenOnlyCredentialsAreSet)
{
    const RelayConfig cfg = RelayConfig::from_lookup(lookup_from(required()));

    EXPECT_EQ(cfg.api_key, "xi-key");
    EXPECT_EQ(cfg.agent_id, "agent_123");
    EXPECT_EQ(cfg.listen_address, "0.0.0.0");
    EXPECT_EQ(cfg.port, 3001);
    EXPECT_EQ(cfg.voice_id, "Xb7hH8MSUJpSbSDYk0k2");
    EXPECT_EQ(cfg.tts_model_id, "eleven_flash_v2_5");
    EXPECT_EQ(cfg.upstream_host, "api.elevenlabs.io");
    EXPECT_EQ(cfg.upstream_port, "443");
    EXPECT_EQ(cfg.ping_interval.count(), 20);
    EXPECT_EQ(cfg.ping_timeout.count(), 20);
    EXPECT_EQ(cfg.mode, RelayMode::hybrid);
    EXPECT_FALSE(cfg.forward_raw_ai_events);
    EXPECT_EQ(cfg.log_level, LogLevel::info);
    EXPECT_EQ(cfg.tts_voice.chunk_length_schedule, (std::vector<int>{120, 160, 250, 290}));
}

TEST(RelayConfigTest, MissingCredentialsAreRejected)
{
    EXPECT_THROW(RelayConfig::from_lookup(lookup_from({{"ELEVENLABS_AGENT_ID", "a"}})), std::runtime_error);
    EXPECT_THROW(RelayConfig::from_lookup(lookup_from({{"ELEVENLABS_API_KEY", "k"}})), std::runtime_error);
    EXPECT_THROW(RelayConfig::from_lookup(lookup_from({{"ELEVENLABS_API_KEY", ""}, {"ELEVENLABS_AGENT_ID", "a"}})),
                 std::runtime_error);
}

TEST(RelayConfigTest, OverridesAreApplied)
{
    auto vars = required();
    vars["PORT"] = "8080";
    vars["LISTEN_ADDRESS"] = "127.0.0.1";
    vars["ELEVENLABS_VOICE_ID"] = "voice_9";
    vars["ELEVENLABS_HOST"] = "eu.elevenlabs.io";
    vars["RELAY_MODE"] = "Conversational";
    vars["RELAY_FORWARD_RAW_AI_EVENTS"] = "yes";
    vars["PING_INTERVAL"] = "15";
    vars["LOG_LEVEL"] = "DEBUG";

    const RelayConfig cfg = RelayConfig::from_lookup(lookup_from(vars));
    EXPECT_EQ(cfg.port, 8080);
    EXPECT_EQ(cfg.listen_address, "127.0.0.1");
    EXPECT_EQ(cfg.voice_id, "voice_9");
    EXPECT_EQ(cfg.upstream_host, "eu.elevenlabs.io");
    EXPECT_EQ(cfg.mode, RelayMode::conversational);
    EXPECT_TRUE(cfg.forward_raw_ai_events);
    EXPECT_EQ(cfg.ping_interval.count(), 15);
    EXPECT_EQ(cfg.log_level, LogLevel::debug);
}

TEST(RelayConfigTest, MalformedValuesAreRejected)
{
    const std::vector<std::pair<std::string, std::string>> bad_values{
        {"PORT", "30o1"},
        {"PORT", "70000"},
        {"ELEVENLABS_PORT", "0"},
        {"PING_TIMEOUT", "0"},
        {"RELAY_MODE", "triple"},
        {"RELAY_FORWARD_RAW_AI_EVENTS", "maybe"},
        {"LOG_LEVEL", "chatty"}};

    for (const auto& bad : bad_values) {
        auto vars = required();
        vars[bad.first] = bad.second;
        EXPECT_THROW(RelayConfig::from_lookup(lookup_from(vars)), std::runtime_error) << bad.first;
    }
}

TEST(DotenvTest, ParsesCommonLineShapes)
{
    std::pair<std::string, std::string> entry;

    ASSERT_TRUE(parse_dotenv_line("PORT=3001", entry));
    EXPECT_EQ(entry.first, "PORT");
    EXPECT_EQ(entry.second, "3001");

    ASSERT_TRUE(parse_dotenv_line("export ELEVENLABS_AGENT_ID = \"agent # 1\"", entry));
    EXPECT_EQ(entry.first, "ELEVENLABS_AGENT_ID");
    EXPECT_EQ(entry.second, "agent # 1");

    ASSERT_TRUE(parse_dotenv_line("ELEVENLABS_VOICE_ID=abc # default voice", entry));
    EXPECT_EQ(entry.second, "abc");

    ASSERT_TRUE(parse_dotenv_line("EMPTY=", entry));
    EXPECT_EQ(entry.second, "");

    EXPECT_FALSE(parse_dotenv_line("", entry));
    EXPECT_FALSE(parse_dotenv_line("   # comment", entry));
    EXPECT_FALSE(parse_dotenv_line("no equals sign", entry));
    EXPECT_FALSE(parse_dotenv_line("=value", entry));
}

TEST(DotenvTest, LoadDoesNotOverrideTheEnvironment)
{
    char path[] = "/tmp/relay_dotenv_XXXXXX";
    const int fd = ::mkstemp(path);
    ASSERT_NE(fd, -1);
    ::close(fd);
    {
        std::ofstream out(path);
        out << "# relay settings\n"
            << "RELAY_TEST_FROM_FILE=file\n"
            << "RELAY_TEST_ALREADY_SET=file\n";
    }

    ::setenv("RELAY_TEST_ALREADY_SET", "process", 1);
    ::unsetenv("RELAY_TEST_FROM_FILE");

    EXPECT_EQ(load_dotenv(path), 1);
    EXPECT_STREQ(std::getenv("RELAY_TEST_FROM_FILE"), "file");
    EXPECT_STREQ(std::getenv("RELAY_TEST_ALREADY_SET"), "process");

    EXPECT_EQ(load_dotenv("/nonexistent/relay/.env"), 0);
    std::remove(path);
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively)
{
    EXPECT_EQ(parse_log_level("Warning"), LogLevel::warning);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::warning);
    EXPECT_EQ(parse_log_level("ERROR"), LogLevel::error);
    EXPECT_THROW(parse_log_level("verbose"), std::invalid_argument);
}

} // namespace
