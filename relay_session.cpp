#include "relay_session.h"
#include "relay_log.h"

#include <utility>

namespace {

const char* const kNormalClosure = "Normal closure";

void log_at(LogLevel level, const std::string& message)
{
    if (log_enabled(level))
        write_log_line(level, message);
}

} // namespace

const char* session_state_name(SessionState state)
{
    switch (state) {
    case SessionState::connecting:
        return "CONNECTING";
    case SessionState::active:
        return "ACTIVE";
    case SessionState::closing:
        return "CLOSING";
    case SessionState::closed:
        return "CLOSED";
    }
    return "UNKNOWN";
}

RelaySession::RelaySession(std::uint64_t id, std::shared_ptr<MessageChannel> downstream,
                           std::shared_ptr<UpstreamConnector> connector, SessionOptions options,
                           ClosedCallback on_closed)
    : id_(id),
      downstream_(std::move(downstream)),
      connector_(std::move(connector)),
      options_(std::move(options)),
      translator_(make_session_descriptor("sess_relay_" + std::to_string(id), options_.with_tts),
                  options_.with_tts),
      on_closed_(std::move(on_closed))
{
}

void RelaySession::start()
{
    RELAY_LOG_INFO << tag() << "Connecting upstream"
                   << (options_.with_tts ? " (ElevenLabs AI + TTS)" : " (ElevenLabs AI)");

    auto self = shared_from_this();
    connector_->connect_all(options_.agent_id, options_.voice_id, options_.api_key, options_.with_tts,
        [self](beast::error_code ec, UpstreamLinks links) { self->on_upstreams(ec, std::move(links)); });
}

void RelaySession::stop()
{
    if (state_ == SessionState::connecting) {
        advance(SessionState::closing);
        RELAY_LOG_INFO << tag() << "Stopped while connecting upstream";
        if (downstream_->is_open())
            close_channel(downstream_, make_close_reason(websocket::close_code::normal, kNormalClosure));
        finish_if_idle();
    } else if (state_ == SessionState::active) {
        RELAY_LOG_INFO << tag() << "Stopping session";
        teardown(nullptr, websocket::close_reason());
    }
}

bool RelaySession::advance(SessionState next)
{
    if (static_cast<int>(next) <= static_cast<int>(state_))
        return false;
    RELAY_LOG_DEBUG << tag() << session_state_name(state_) << " -> " << session_state_name(next);
    state_ = next;
    return true;
}

void RelaySession::on_upstreams(beast::error_code ec, UpstreamLinks links)
{
    if (state_ != SessionState::connecting) {
        // stopped meanwhile, don't leave the fresh upstream sockets behind
        if (links.ai && links.ai->is_open())
            close_channel(links.ai, make_close_reason(websocket::close_code::normal, kNormalClosure));
        if (links.tts && links.tts->is_open())
            close_channel(links.tts, make_close_reason(websocket::close_code::normal, kNormalClosure));
        return;
    }

    if (ec) {
        RELAY_LOG_ERROR << tag() << "Error handling connection: " << ec.message();
        advance(SessionState::closing);
        if (downstream_->is_open())
            close_channel(downstream_, make_close_reason(websocket::close_code::internal_error, ec.message()));
        finish_if_idle();
        return;
    }

    ai_ = std::move(links.ai);
    tts_ = std::move(links.tts);
    activate();
}

void RelaySession::activate()
{
    advance(SessionState::active);
    RELAY_LOG_INFO << tag()
                   << (tts_ ? "Connected to both ElevenLabs AI and TTS successfully!"
                            : "Connected to ElevenLabs successfully!");

    send(Leg::downstream, dump_event(translator_.session_created()));
    RELAY_LOG_INFO << tag() << "Sent session.created to browser";

    read_next(Leg::downstream);
    read_next(Leg::ai);
    if (tts_)
        read_next(Leg::tts);
}

void RelaySession::read_next(Leg leg)
{
    auto self = shared_from_this();
    channel(leg)->async_read([self, leg](beast::error_code ec, std::string text) {
        self->on_read(leg, ec, text);
    });
}

void RelaySession::on_read(Leg leg, beast::error_code ec, const std::string& text)
{
    if (state_ != SessionState::active)
        return;
    if (ec) {
        terminate(leg, ec);
        return;
    }

    handle_frame(leg, text);

    if (state_ == SessionState::active)
        read_next(leg);
}

void RelaySession::handle_frame(Leg leg, const std::string& text)
{
    try {
        switch (leg) {
        case Leg::downstream: {
            auto event = decode_client_event(text);
            if (!event) {
                RELAY_LOG_ERROR << tag() << "Invalid JSON from browser: " << text;
                return;
            }
            dispatch(translator_.from_client(*event));
            break;
        }
        case Leg::ai: {
            auto event = decode_ai_event(text);
            if (!event) {
                RELAY_LOG_ERROR << tag() << "Invalid JSON from ElevenLabs AI: " << text;
                return;
            }
            if (std::holds_alternative<AiUnrecognized>(*event)) {
                RELAY_LOG_DEBUG << tag() << "Unhandled AI frame: " << text;
            }
            dispatch(translator_.from_ai(*event));
            if (options_.forward_raw_ai_events && !tts_)
                send(Leg::downstream, text);
            break;
        }
        case Leg::tts: {
            auto event = decode_tts_event(text);
            if (!event) {
                RELAY_LOG_ERROR << tag() << "Invalid JSON from ElevenLabs TTS: " << text;
                return;
            }
            dispatch(translator_.from_tts(*event));
            break;
        }
        }
    } catch (const std::exception& e) {
        RELAY_LOG_ERROR << tag() << "Error processing " << leg_name(leg) << " message: " << e.what();
    }
}

void RelaySession::dispatch(const Translation& translation)
{
    if (!translation.summary.empty())
        log_at(translation.level, tag() + translation.summary);

    for (const auto& message : translation.messages) {
        if (!channel(message.target)) {
            RELAY_LOG_WARNING << tag() << "No " << leg_name(message.target) << " socket, dropping "
                              << message.body.value("type", std::string("message"));
            continue;
        }
        send(message.target, dump_event(message.body));
    }
}

void RelaySession::send(Leg leg, std::string text)
{
    auto self = shared_from_this();
    channel(leg)->async_send(std::move(text), [self, leg](beast::error_code ec) {
        if (ec)
            self->terminate(leg, ec);
    });
}

void RelaySession::terminate(Leg failed, beast::error_code ec)
{
    if (state_ != SessionState::active)
        return;

    const websocket::close_reason reason = channel(failed)->peer_close_reason();
    if (ec == websocket::error::closed) {
        RELAY_LOG_INFO << tag() << leg_name(failed) << " connection closed: code=" << reason.code
                       << ", reason=" << std::string(reason.reason.data(), reason.reason.size());
    } else {
        RELAY_LOG_INFO << tag() << leg_name(failed) << " connection lost: " << ec.message();
    }
    teardown(&failed, reason);
}

void RelaySession::teardown(const Leg* failed, websocket::close_reason failed_reason)
{
    advance(SessionState::closing);
    RELAY_LOG_INFO << tag() << "Connection closed, cleaning up";

    for (Leg leg : {Leg::ai, Leg::tts, Leg::downstream}) {
        const auto& ch = channel(leg);
        if (!ch || !ch->is_open())
            continue;
        if (failed && *failed == leg && failed_reason.code != websocket::close_code::none)
            close_channel(ch, failed_reason);
        else
            close_channel(ch, make_close_reason(websocket::close_code::normal, kNormalClosure));
    }
    finish_if_idle();
}

void RelaySession::close_channel(const std::shared_ptr<MessageChannel>& channel,
                                 websocket::close_reason reason)
{
    ++pending_closes_;
    auto self = shared_from_this();
    channel->async_close(reason, [self](beast::error_code ec) {
        if (ec && ec != websocket::error::closed && ec != net::error::operation_aborted) {
            RELAY_LOG_DEBUG << self->tag() << "Close did not complete cleanly: " << ec.message();
        }
        --self->pending_closes_;
        self->finish_if_idle();
    });
}

void RelaySession::finish_if_idle()
{
    if (pending_closes_ > 0 || state_ != SessionState::closing)
        return;
    advance(SessionState::closed);
    RELAY_LOG_INFO << tag() << "Session closed";
    if (on_closed_)
        on_closed_(id_);
}

std::shared_ptr<MessageChannel>& RelaySession::channel(Leg leg)
{
    switch (leg) {
    case Leg::ai:
        return ai_;
    case Leg::tts:
        return tts_;
    case Leg::downstream:
        break;
    }
    return downstream_;
}

std::string RelaySession::tag() const
{
    return "[session " + std::to_string(id_) + "] ";
}
