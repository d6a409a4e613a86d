#ifndef RELAY_SESSION_H
#define RELAY_SESSION_H

#include "message_channel.h"
#include "realtime_events.h"
#include "upstream_connector.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

enum class SessionState { connecting, active, closing, closed };

const char* session_state_name(SessionState state);

struct SessionOptions {
    std::string agent_id;
    std::string voice_id;
    std::string api_key;
    bool with_tts = true;
    bool forward_raw_ai_events = false; // conversational mode only
};

// One browser connection and the upstream socket(s) it drives. Created in
// `connecting`, moves forward only. The pump runs one read loop per owned
// socket; the first connection-level error on any of them tears the whole
// group down.
class RelaySession : public std::enable_shared_from_this<RelaySession> {
public:
    using ClosedCallback = std::function<void(std::uint64_t)>;

    RelaySession(std::uint64_t id, std::shared_ptr<MessageChannel> downstream,
                 std::shared_ptr<UpstreamConnector> connector, SessionOptions options,
                 ClosedCallback on_closed);

    void start();

    // Server shutdown: tear down from whatever state the session is in
    void stop();

    std::uint64_t id() const { return id_; }
    SessionState state() const { return state_; }
    const json& descriptor() const { return translator_.descriptor(); }

private:
    bool advance(SessionState next);

    void on_upstreams(beast::error_code ec, UpstreamLinks links);
    void activate();

    void read_next(Leg leg);
    void on_read(Leg leg, beast::error_code ec, const std::string& text);
    void handle_frame(Leg leg, const std::string& text);
    void dispatch(const Translation& translation);
    void send(Leg leg, std::string text);

    void terminate(Leg failed, beast::error_code ec);
    void teardown(const Leg* failed, websocket::close_reason failed_reason);
    void close_channel(const std::shared_ptr<MessageChannel>& channel, websocket::close_reason reason);
    void finish_if_idle();

    std::shared_ptr<MessageChannel>& channel(Leg leg);
    std::string tag() const;

    const std::uint64_t id_;
    SessionState state_ = SessionState::connecting;
    std::shared_ptr<MessageChannel> downstream_;
    std::shared_ptr<MessageChannel> ai_;
    std::shared_ptr<MessageChannel> tts_;
    std::shared_ptr<UpstreamConnector> connector_;
    SessionOptions options_;
    EventTranslator translator_;
    ClosedCallback on_closed_;
    int pending_closes_ = 0;
};

#endif // RELAY_SESSION_H
