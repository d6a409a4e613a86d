#ifndef RELAY_CONFIG_H
#define RELAY_CONFIG_H

#include "relay_log.h"

#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include <vector>

// --- TTS stream init parameters ---
struct TtsVoiceSettings {
    double stability = 0.5;
    double similarity_boost = 0.8;
    bool use_speaker_boost = false;
    std::vector<int> chunk_length_schedule{120, 160, 250, 290};
};

enum class RelayMode {
    conversational, // browser <-> AI, AI supplies the audio
    hybrid          // browser <-> AI + TTS, agent text is voiced by the TTS stream
};

const char* relay_mode_name(RelayMode mode);

struct RelayConfig {
    // Downstream listener
    std::string listen_address = "0.0.0.0";
    unsigned short port = 3001;
    std::chrono::seconds ping_interval{20};
    std::chrono::seconds ping_timeout{20};

    // Upstream (ElevenLabs)
    std::string api_key;
    std::string agent_id;
    std::string voice_id = "Xb7hH8MSUJpSbSDYk0k2";
    std::string tts_model_id = "eleven_flash_v2_5";
    std::string upstream_host = "api.elevenlabs.io";
    std::string upstream_port = "443";
    std::chrono::seconds upstream_timeout{30};
    TtsVoiceSettings tts_voice;

    RelayMode mode = RelayMode::hybrid;
    bool forward_raw_ai_events = false;
    LogLevel log_level = LogLevel::info;

    using Lookup = std::function<bool(const std::string& name, std::string& value)>;

    // Throws std::runtime_error on a missing credential or a malformed value
    static RelayConfig from_lookup(const Lookup& lookup);
    static RelayConfig from_environment();
};

// KEY=VALUE, optional "export ", quotes stripped, '#' comments. False for blank/comment lines.
bool parse_dotenv_line(const std::string& line, std::pair<std::string, std::string>& entry);

// Loads a .env file into the process environment without overriding existing
// variables. Returns the number of variables set; a missing file is not an error.
int load_dotenv(const std::string& path);

#endif // RELAY_CONFIG_H
