#ifndef REALTIME_EVENTS_H
#define REALTIME_EVENTS_H

#include "relay_common.h"
#include "relay_log.h"

#include <initializer_list>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// --- Browser (OpenAI Realtime) -> relay ---
struct ClientSessionUpdate {};
struct ClientAudioAppend { std::string audio; };
struct ClientAudioCommit {};
struct ClientResponseCreate {};
struct ClientUnrecognized { std::string type; };

using ClientEvent = std::variant<ClientSessionUpdate, ClientAudioAppend, ClientAudioCommit,
                                 ClientResponseCreate, ClientUnrecognized>;

// --- ElevenLabs conversational AI -> relay ---
struct AiAgentResponse { std::string text; };
struct AiAgentResponseCorrection {};
struct AiUserTranscript { std::string text; };
struct AiInterruption {};
struct AiPing {};
struct AiAudio { std::string audio_base_64; };
struct AiMessage { std::string role; std::string content; };
struct AiUnrecognized { std::string type; };

using AiEvent = std::variant<AiAgentResponse, AiAgentResponseCorrection, AiUserTranscript,
                             AiInterruption, AiPing, AiAudio, AiMessage, AiUnrecognized>;

// --- ElevenLabs stream-input TTS -> relay ---
struct TtsAudioChunk { std::string audio; };
struct TtsFinal {};
struct TtsUnrecognized {};

using TtsEvent = std::variant<TtsAudioChunk, TtsFinal, TtsUnrecognized>;

// Empty optional when the frame is not a JSON object
std::optional<ClientEvent> decode_client_event(const std::string& text);
std::optional<AiEvent> decode_ai_event(const std::string& text);
std::optional<TtsEvent> decode_tts_event(const std::string& text);

// Value of a string member reached through `path`, or "" when any step is
// missing or has the wrong type.
std::string string_at(const json& doc, std::initializer_list<const char*> path);

struct OutboundMessage {
    Leg target;
    json body;
};

// What one inbound event turns into. `summary` is logged by the caller at `level`.
struct Translation {
    std::vector<OutboundMessage> messages;
    LogLevel level = LogLevel::debug;
    std::string summary;
};

// Canonical session block advertised in session.created / session.updated
json make_session_descriptor(const std::string& session_id, bool with_tts);

class EventTranslator {
public:
    EventTranslator(json descriptor, bool with_tts);

    const json& descriptor() const { return descriptor_; }
    bool with_tts() const { return with_tts_; }

    json session_created() const;
    json session_updated() const;

    Translation from_client(const ClientEvent& event) const;
    Translation from_ai(const AiEvent& event) const;
    Translation from_tts(const TtsEvent& event) const;

private:
    const json descriptor_;
    const bool with_tts_;
};

// Outbound event builders
json text_delta_event(const std::string& text);
json audio_delta_event(const std::string& response_id, const std::string& item_id,
                       const std::string& audio);
json audio_done_event();
json interrupted_event();
json user_audio_chunk_message(const std::string& audio);
json tts_utterance_message(const std::string& text);

#endif // REALTIME_EVENTS_H
