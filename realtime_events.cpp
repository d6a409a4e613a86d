#include "realtime_events.h"

#include <utility>

namespace {

const char* const kTextResponseId = "elevenlabs_response";
const char* const kTextItemId = "elevenlabs_text";
const char* const kAgentAudioResponseId = "elevenlabs_response";
const char* const kAgentAudioItemId = "elevenlabs_audio";
const char* const kTtsResponseId = "elevenlabs_tts_response";
const char* const kTtsItemId = "elevenlabs_tts_audio";

std::optional<json> parse_object(const std::string& text)
{
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object())
        return std::nullopt;
    return doc;
}

Translation make_translation(LogLevel level, std::string summary)
{
    Translation t;
    t.level = level;
    t.summary = std::move(summary);
    return t;
}

struct ClientTranslation {
    const EventTranslator& translator;

    Translation operator()(const ClientSessionUpdate&) const
    {
        Translation t = make_translation(LogLevel::info, "Received session.update, acknowledging");
        t.messages.push_back({Leg::downstream, translator.session_updated()});
        return t;
    }

    Translation operator()(const ClientAudioAppend& e) const
    {
        Translation t = make_translation(LogLevel::debug, "Forwarding audio input to ElevenLabs AI");
        t.messages.push_back({Leg::ai, user_audio_chunk_message(e.audio)});
        return t;
    }

    // Turn taking is driven by the upstream VAD
    Translation operator()(const ClientAudioCommit&) const
    {
        return make_translation(LogLevel::info, "Committing audio buffer");
    }

    Translation operator()(const ClientResponseCreate&) const
    {
        return make_translation(LogLevel::info, "Creating response");
    }

    Translation operator()(const ClientUnrecognized& e) const
    {
        return make_translation(LogLevel::info, "Received event \"" + e.type + "\" from browser");
    }
};

struct AiTranslation {
    const EventTranslator& translator;

    Translation operator()(const AiAgentResponse& e) const
    {
        if (e.text.empty())
            return make_translation(LogLevel::debug, "Empty agent response skipped");

        Translation t;
        t.level = LogLevel::info;
        if (translator.with_tts()) {
            t.summary = "Converting to speech: " + e.text;
            t.messages.push_back({Leg::tts, tts_utterance_message(e.text)});
        } else {
            t.summary = "Relayed agent response: " + e.text;
        }
        t.messages.push_back({Leg::downstream, text_delta_event(e.text)});
        return t;
    }

    Translation operator()(const AiAgentResponseCorrection&) const
    {
        Translation t = make_translation(LogLevel::info, "Relayed agent response correction as interruption");
        t.messages.push_back({Leg::downstream, interrupted_event()});
        return t;
    }

    Translation operator()(const AiUserTranscript& e) const
    {
        return make_translation(LogLevel::info, "User transcript received: " + e.text);
    }

    Translation operator()(const AiInterruption&) const
    {
        Translation t = make_translation(LogLevel::info, "Relayed interruption from ElevenLabs AI");
        t.messages.push_back({Leg::downstream, interrupted_event()});
        return t;
    }

    Translation operator()(const AiPing&) const
    {
        return make_translation(LogLevel::debug, "Ping from ElevenLabs AI");
    }

    Translation operator()(const AiAudio& e) const
    {
        if (translator.with_tts())
            return make_translation(LogLevel::debug, "Agent audio ignored, speech comes from the TTS stream");
        if (e.audio_base_64.empty())
            return make_translation(LogLevel::debug, "Empty agent audio skipped");

        Translation t = make_translation(LogLevel::debug, "Relayed audio from ElevenLabs AI");
        t.messages.push_back(
            {Leg::downstream, audio_delta_event(kAgentAudioResponseId, kAgentAudioItemId, e.audio_base_64)});
        return t;
    }

    Translation operator()(const AiMessage& e) const
    {
        if (translator.with_tts() || e.role != "assistant")
            return make_translation(LogLevel::info, "Unhandled AI message with role \"" + e.role + "\"");

        Translation t = make_translation(LogLevel::info, "Relayed text from ElevenLabs AI");
        t.messages.push_back({Leg::downstream, text_delta_event(e.content)});
        return t;
    }

    Translation operator()(const AiUnrecognized& e) const
    {
        return make_translation(LogLevel::info, "Unhandled AI event \"" + e.type + "\"");
    }
};

struct TtsTranslation {
    Translation operator()(const TtsAudioChunk& e) const
    {
        Translation t = make_translation(LogLevel::debug, "Relayed TTS audio to browser");
        t.messages.push_back({Leg::downstream, audio_delta_event(kTtsResponseId, kTtsItemId, e.audio)});
        return t;
    }

    Translation operator()(const TtsFinal&) const
    {
        Translation t = make_translation(LogLevel::info, "TTS audio generation completed");
        t.messages.push_back({Leg::downstream, audio_done_event()});
        return t;
    }

    Translation operator()(const TtsUnrecognized&) const
    {
        return make_translation(LogLevel::debug, "TTS message without audio ignored");
    }
};

} // namespace

std::string string_at(const json& doc, std::initializer_list<const char*> path)
{
    const json* node = &doc;
    for (const char* key : path) {
        if (!node->is_object())
            return std::string();
        auto it = node->find(key);
        if (it == node->end())
            return std::string();
        node = &*it;
    }
    return node->is_string() ? node->get<std::string>() : std::string();
}

std::optional<ClientEvent> decode_client_event(const std::string& text)
{
    auto doc = parse_object(text);
    if (!doc)
        return std::nullopt;

    const std::string type = string_at(*doc, {"type"});
    if (type == "session.update")
        return ClientEvent{ClientSessionUpdate{}};
    if (type == "input_audio_buffer.append")
        return ClientEvent{ClientAudioAppend{string_at(*doc, {"audio"})}};
    if (type == "input_audio_buffer.commit")
        return ClientEvent{ClientAudioCommit{}};
    if (type == "response.create")
        return ClientEvent{ClientResponseCreate{}};
    return ClientEvent{ClientUnrecognized{type}};
}

std::optional<AiEvent> decode_ai_event(const std::string& text)
{
    auto doc = parse_object(text);
    if (!doc)
        return std::nullopt;

    const std::string type = string_at(*doc, {"type"});
    if (type == "agent_response")
        return AiEvent{AiAgentResponse{string_at(*doc, {"agent_response_event", "agent_response"})}};
    if (type == "agent_response_correction")
        return AiEvent{AiAgentResponseCorrection{}};
    if (type == "user_transcript")
        return AiEvent{AiUserTranscript{string_at(*doc, {"user_transcription_event", "user_transcript"})}};
    if (type == "interruption")
        return AiEvent{AiInterruption{}};
    if (type == "ping")
        return AiEvent{AiPing{}};
    if (type == "audio")
        return AiEvent{AiAudio{string_at(*doc, {"audio_event", "audio_base_64"})}};
    if (type == "message")
        return AiEvent{AiMessage{string_at(*doc, {"message", "role"}), string_at(*doc, {"message", "content"})}};
    return AiEvent{AiUnrecognized{type}};
}

std::optional<TtsEvent> decode_tts_event(const std::string& text)
{
    auto doc = parse_object(text);
    if (!doc)
        return std::nullopt;

    std::string audio = string_at(*doc, {"audio"});
    if (!audio.empty())
        return TtsEvent{TtsAudioChunk{std::move(audio)}};

    auto final_flag = doc->find("isFinal");
    if (final_flag != doc->end() && final_flag->is_boolean() && final_flag->get<bool>())
        return TtsEvent{TtsFinal{}};
    return TtsEvent{TtsUnrecognized{}};
}

json make_session_descriptor(const std::string& session_id, bool with_tts)
{
    return json{
        {"id", session_id},
        {"object", "realtime.session"},
        {"model", with_tts ? "elevenlabs-hybrid" : "elevenlabs-conversational-ai"},
        {"modalities", {"text", "audio"}},
        {"instructions", with_tts ? "ElevenLabs Hybrid Agent" : "ElevenLabs Conversational AI Agent"},
        {"voice", with_tts ? "elevenlabs-tts-voice" : "elevenlabs-agent-voice"},
        {"input_audio_format", "pcm16"},
        {"output_audio_format", "pcm16"},
        {"input_audio_transcription", nullptr},
        {"turn_detection", {
            {"type", "server_vad"},
            {"threshold", 0.5},
            {"prefix_padding_ms", 300},
            {"silence_duration_ms", 200}
        }},
        {"tools", json::array()},
        {"tool_choice", "auto"},
        {"temperature", 0.8},
        {"max_response_output_tokens", "inf"}
    };
}

EventTranslator::EventTranslator(json descriptor, bool with_tts)
    : descriptor_(std::move(descriptor)), with_tts_(with_tts)
{
}

json EventTranslator::session_created() const
{
    return json{{"type", "session.created"}, {"session", descriptor_}};
}

json EventTranslator::session_updated() const
{
    return json{{"type", "session.updated"}, {"session", descriptor_}};
}

Translation EventTranslator::from_client(const ClientEvent& event) const
{
    return std::visit(ClientTranslation{*this}, event);
}

Translation EventTranslator::from_ai(const AiEvent& event) const
{
    return std::visit(AiTranslation{*this}, event);
}

Translation EventTranslator::from_tts(const TtsEvent& event) const
{
    return std::visit(TtsTranslation{}, event);
}

json text_delta_event(const std::string& text)
{
    return json{
        {"type", "response.text.delta"},
        {"response_id", kTextResponseId},
        {"item_id", kTextItemId},
        {"output_index", 0},
        {"content_index", 0},
        {"delta", text}
    };
}

json audio_delta_event(const std::string& response_id, const std::string& item_id,
                       const std::string& audio)
{
    return json{
        {"type", "response.audio.delta"},
        {"response_id", response_id},
        {"item_id", item_id},
        {"output_index", 0},
        {"content_index", 0},
        {"delta", audio}
    };
}

json audio_done_event()
{
    return json{{"type", "response.audio.done"}};
}

json interrupted_event()
{
    return json{{"type", "conversation.interrupted"}};
}

json user_audio_chunk_message(const std::string& audio)
{
    return json{{"user_audio_chunk", audio}};
}

json tts_utterance_message(const std::string& text)
{
    return json{{"text", text}, {"flush", true}};
}
