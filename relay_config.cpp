#include "relay_config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace {

std::string trim(const std::string& s)
{
    const auto first = std::find_if_not(s.begin(), s.end(),
                                        [](unsigned char c) { return std::isspace(c); });
    const auto last = std::find_if_not(s.rbegin(), s.rend(),
                                       [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string();
}

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

long parse_number(const std::string& name, const std::string& text, long min, long max)
{
    std::size_t used = 0;
    long value = 0;
    try {
        value = std::stol(text, &used);
    } catch (const std::exception&) {
        throw std::runtime_error(name + " must be a number, got '" + text + "'");
    }
    if (used != text.size())
        throw std::runtime_error(name + " must be a number, got '" + text + "'");
    if (value < min || value > max) {
        throw std::runtime_error(name + " must be between " + std::to_string(min) + " and " +
                                 std::to_string(max) + ", got " + text);
    }
    return value;
}

bool parse_flag(const std::string& name, const std::string& text)
{
    const std::string v = lower(text);
    if (v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off" || v.empty())
        return false;
    throw std::runtime_error(name + " must be a boolean, got '" + text + "'");
}

} // namespace

const char* relay_mode_name(RelayMode mode)
{
    return mode == RelayMode::hybrid ? "hybrid" : "conversational";
}

RelayConfig RelayConfig::from_lookup(const Lookup& lookup)
{
    RelayConfig cfg;
    std::string value;

    if (!lookup("ELEVENLABS_API_KEY", value) || value.empty())
        throw std::runtime_error("ELEVENLABS_API_KEY must be set in .env file");
    cfg.api_key = value;

    if (!lookup("ELEVENLABS_AGENT_ID", value) || value.empty())
        throw std::runtime_error("ELEVENLABS_AGENT_ID must be set in .env file");
    cfg.agent_id = value;

    if (lookup("ELEVENLABS_VOICE_ID", value) && !value.empty())
        cfg.voice_id = value;
    if (lookup("ELEVENLABS_TTS_MODEL", value) && !value.empty())
        cfg.tts_model_id = value;
    if (lookup("ELEVENLABS_HOST", value) && !value.empty())
        cfg.upstream_host = value;
    if (lookup("ELEVENLABS_PORT", value) && !value.empty())
        cfg.upstream_port = std::to_string(parse_number("ELEVENLABS_PORT", value, 1, 65535));

    if (lookup("LISTEN_ADDRESS", value) && !value.empty())
        cfg.listen_address = value;
    if (lookup("PORT", value) && !value.empty())
        cfg.port = static_cast<unsigned short>(parse_number("PORT", value, 0, 65535));

    if (lookup("PING_INTERVAL", value) && !value.empty())
        cfg.ping_interval = std::chrono::seconds(parse_number("PING_INTERVAL", value, 1, 3600));
    if (lookup("PING_TIMEOUT", value) && !value.empty())
        cfg.ping_timeout = std::chrono::seconds(parse_number("PING_TIMEOUT", value, 1, 3600));
    if (lookup("UPSTREAM_TIMEOUT", value) && !value.empty())
        cfg.upstream_timeout = std::chrono::seconds(parse_number("UPSTREAM_TIMEOUT", value, 1, 3600));

    if (lookup("RELAY_MODE", value) && !value.empty()) {
        const std::string mode = lower(value);
        if (mode == "hybrid")
            cfg.mode = RelayMode::hybrid;
        else if (mode == "conversational")
            cfg.mode = RelayMode::conversational;
        else
            throw std::runtime_error("RELAY_MODE must be 'hybrid' or 'conversational', got '" + value + "'");
    }
    if (lookup("RELAY_FORWARD_RAW_AI_EVENTS", value))
        cfg.forward_raw_ai_events = parse_flag("RELAY_FORWARD_RAW_AI_EVENTS", value);

    if (lookup("LOG_LEVEL", value) && !value.empty()) {
        try {
            cfg.log_level = parse_log_level(value);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(std::string("LOG_LEVEL: ") + e.what());
        }
    }

    return cfg;
}

RelayConfig RelayConfig::from_environment()
{
    return from_lookup([](const std::string& name, std::string& value) {
        const char* v = std::getenv(name.c_str());
        if (!v)
            return false;
        value = v;
        return true;
    });
}

bool parse_dotenv_line(const std::string& line, std::pair<std::string, std::string>& entry)
{
    std::string text = trim(line);
    if (text.empty() || text[0] == '#')
        return false;
    if (text.compare(0, 7, "export ") == 0)
        text = trim(text.substr(7));

    const auto eq = text.find('=');
    if (eq == std::string::npos || eq == 0)
        return false;

    std::string key = trim(text.substr(0, eq));
    std::string value = trim(text.substr(eq + 1));
    if (key.empty())
        return false;

    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'')) {
        const char quote = value.front();
        const auto close = value.find(quote, 1);
        if (close != std::string::npos)
            value = value.substr(1, close - 1);
    } else {
        // unquoted values may carry a trailing comment
        const auto hash = value.find(" #");
        if (hash != std::string::npos)
            value = trim(value.substr(0, hash));
    }

    entry.first = std::move(key);
    entry.second = std::move(value);
    return true;
}

int load_dotenv(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        return 0;

    int count = 0;
    std::string line;
    std::pair<std::string, std::string> entry;
    while (std::getline(in, line)) {
        if (!parse_dotenv_line(line, entry))
            continue;
        if (std::getenv(entry.first.c_str()))
            continue;
        if (::setenv(entry.first.c_str(), entry.second.c_str(), 0) == 0)
            ++count;
    }
    return count;
}
