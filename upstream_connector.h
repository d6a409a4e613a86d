#ifndef UPSTREAM_CONNECTOR_H
#define UPSTREAM_CONNECTOR_H

#include "message_channel.h"
#include "relay_config.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

struct UpstreamLinks {
    std::shared_ptr<MessageChannel> ai;
    std::shared_ptr<MessageChannel> tts; // null without a TTS leg
};

// Opens the upstream sockets of one session
class UpstreamConnector {
public:
    using ConnectHandler = std::function<void(beast::error_code, std::shared_ptr<MessageChannel>)>;
    using LinksHandler = std::function<void(beast::error_code, UpstreamLinks)>;

    virtual ~UpstreamConnector() = default;

    virtual void connect_ai(const std::string& agent_id, const std::string& api_key,
                            ConnectHandler handler) = 0;

    // Completes only after the stream init message has been written
    virtual void connect_tts(const std::string& voice_id, const std::string& api_key,
                             ConnectHandler handler) = 0;

    // AI first, then TTS when requested. If TTS fails the AI socket is
    // closed before the error is reported.
    void connect_all(const std::string& agent_id, const std::string& voice_id,
                     const std::string& api_key, bool with_tts, LinksHandler handler);
};

// --- ElevenLabs ---
std::string ai_conversation_target(const std::string& agent_id);
std::string tts_stream_target(const std::string& voice_id, const std::string& model_id);
json tts_init_message(const TtsVoiceSettings& settings, const std::string& api_key);

struct ElevenLabsEndpoint {
    std::string host = "api.elevenlabs.io";
    std::string port = "443";
    std::string tts_model_id = "eleven_flash_v2_5";
    TtsVoiceSettings voice_settings;
    std::chrono::seconds timeout{30};
};

ElevenLabsEndpoint endpoint_from_config(const RelayConfig& config);

class ElevenLabsConnector : public UpstreamConnector {
public:
    ElevenLabsConnector(net::io_context& ioc, ElevenLabsEndpoint endpoint);

    void connect_ai(const std::string& agent_id, const std::string& api_key,
                    ConnectHandler handler) override;
    void connect_tts(const std::string& voice_id, const std::string& api_key,
                     ConnectHandler handler) override;

private:
    net::io_context& ioc_;
    ssl::context ssl_ctx_;
    ElevenLabsEndpoint endpoint_;
};

#endif // UPSTREAM_CONNECTOR_H
