#include "relay_common.h"

const char* leg_name(Leg leg)
{
    switch (leg) {
    case Leg::downstream:
        return "browser";
    case Leg::ai:
        return "ElevenLabs AI";
    case Leg::tts:
        return "ElevenLabs TTS";
    }
    return "unknown";
}

websocket::close_reason make_close_reason(websocket::close_code code, const std::string& reason)
{
    const std::size_t limit = websocket::reason_string::max_size_n;
    std::size_t len = reason.size();
    if (len > limit) {
        len = limit;
        // don't cut a UTF-8 sequence in half
        while (len > 0 && (static_cast<unsigned char>(reason[len]) & 0xC0) == 0x80)
            --len;
    }
    return websocket::close_reason(code, beast::string_view(reason.data(), len));
}

std::string dump_event(const json& event)
{
    return event.dump(-1, ' ', false, json::error_handler_t::replace);
}
