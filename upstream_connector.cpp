#include "upstream_connector.h"
#include "relay_log.h"
#include "websocket_channel.h"

#include <boost/asio/ssl/host_name_verification.hpp>
#include <openssl/err.h>

#include <utility>

namespace {

using UpstreamChannel = WebSocketChannel<UpstreamStream>;

// resolve -> tcp connect -> TLS handshake -> websocket upgrade [-> init message]
class UpstreamHandshake : public std::enable_shared_from_this<UpstreamHandshake> {
public:
    UpstreamHandshake(net::io_context& ioc, ssl::context& ctx, const ElevenLabsEndpoint& endpoint,
                      std::string label, std::string target,
                      UpstreamConnector::ConnectHandler handler)
        : resolver_(ioc),
          channel_(std::make_shared<UpstreamChannel>(ioc, ctx)),
          host_(endpoint.host),
          port_(endpoint.port),
          timeout_(endpoint.timeout),
          label_(std::move(label)),
          target_(std::move(target)),
          handler_(std::move(handler))
    {
    }

    void set_api_key_header(std::string api_key) { api_key_header_ = std::move(api_key); }
    void set_init_message(std::string message) { init_message_ = std::move(message); }

    void run()
    {
        RELAY_LOG_DEBUG << "Connecting to " << label_ << " at " << host_ << ":" << port_;
        resolver_.async_resolve(host_, port_,
            [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type results) {
                self->on_resolve(ec, results);
            });
    }

private:
    UpstreamStream& ws() { return channel_->stream(); }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results)
    {
        if (ec)
            return fail(ec, "resolve");

        beast::get_lowest_layer(ws()).expires_after(timeout_);
        beast::get_lowest_layer(ws()).async_connect(results,
            [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
                self->on_connect(ec);
            });
    }

    void on_connect(beast::error_code ec)
    {
        if (ec)
            return fail(ec, "connect");

        // SNI, most hosts behind a CDN refuse the handshake without it
        if (!SSL_set_tlsext_host_name(ws().next_layer().native_handle(), host_.c_str())) {
            ec = beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
            return fail(ec, "SSL_set_tlsext_host_name");
        }
        ws().next_layer().set_verify_callback(ssl::host_name_verification(host_));

        beast::get_lowest_layer(ws()).expires_after(timeout_);
        ws().next_layer().async_handshake(ssl::stream_base::client,
            [self = shared_from_this()](beast::error_code ec) { self->on_ssl_handshake(ec); });
    }

    void on_ssl_handshake(beast::error_code ec)
    {
        if (ec)
            return fail(ec, "ssl handshake");

        // the websocket stream keeps its own timers from here on
        beast::get_lowest_layer(ws()).expires_never();

        websocket::stream_base::timeout opt = websocket::stream_base::timeout::suggested(beast::role_type::client);
        opt.handshake_timeout = timeout_;
        ws().set_option(opt);

        const std::string api_key = api_key_header_;
        ws().set_option(websocket::stream_base::decorator(
            [api_key](websocket::request_type& req) {
                req.set(http::field::user_agent, "realtime-relay/1.0");
                if (!api_key.empty())
                    req.set("xi-api-key", api_key);
            }));

        const std::string host_header = port_ == "443" ? host_ : host_ + ":" + port_;
        ws().async_handshake(host_header, target_,
            [self = shared_from_this()](beast::error_code ec) { self->on_handshake(ec); });
    }

    void on_handshake(beast::error_code ec)
    {
        if (ec)
            return fail(ec, "websocket handshake");

        if (init_message_.empty())
            return succeed();

        channel_->async_send(init_message_,
            [self = shared_from_this()](beast::error_code ec) {
                if (ec)
                    return self->fail(ec, "init message");
                RELAY_LOG_INFO << "Initialized " << self->label_ << " session";
                self->succeed();
            });
    }

    void succeed()
    {
        RELAY_LOG_INFO << "Successfully connected to " << label_;
        handler_(beast::error_code(), channel_);
    }

    void fail(beast::error_code ec, const char* what)
    {
        RELAY_LOG_ERROR << "Failed to connect to " << label_ << ": " << what << ": " << ec.message();
        handler_(ec, nullptr);
    }

    tcp::resolver resolver_;
    std::shared_ptr<UpstreamChannel> channel_;
    std::string host_;
    std::string port_;
    std::chrono::seconds timeout_;
    std::string label_;
    std::string target_;
    std::string api_key_header_;
    std::string init_message_;
    UpstreamConnector::ConnectHandler handler_;
};

} // namespace

void UpstreamConnector::connect_all(const std::string& agent_id, const std::string& voice_id,
                                    const std::string& api_key, bool with_tts, LinksHandler handler)
{
    connect_ai(agent_id, api_key,
        [this, voice_id, api_key, with_tts, handler](beast::error_code ec, std::shared_ptr<MessageChannel> ai) {
            if (ec) {
                handler(ec, UpstreamLinks());
                return;
            }
            if (!with_tts) {
                handler(ec, UpstreamLinks{ai, nullptr});
                return;
            }

            connect_tts(voice_id, api_key,
                [ai, handler](beast::error_code ec, std::shared_ptr<MessageChannel> tts) {
                    if (!ec) {
                        handler(ec, UpstreamLinks{ai, tts});
                        return;
                    }
                    // no orphaned AI conversation when the TTS leg is missing
                    RELAY_LOG_INFO << "Closing ElevenLabs AI connection, TTS is unavailable";
                    ai->async_close(make_close_reason(websocket::close_code::normal, "Normal closure"),
                        [ai, ec, handler](beast::error_code) { handler(ec, UpstreamLinks()); });
                });
        });
}

std::string ai_conversation_target(const std::string& agent_id)
{
    return "/v1/convai/conversation?agent_id=" + agent_id;
}

std::string tts_stream_target(const std::string& voice_id, const std::string& model_id)
{
    return "/v1/text-to-speech/" + voice_id + "/stream-input?model_id=" + model_id;
}

json tts_init_message(const TtsVoiceSettings& settings, const std::string& api_key)
{
    return json{
        {"text", " "},
        {"voice_settings", {
            {"stability", settings.stability},
            {"similarity_boost", settings.similarity_boost},
            {"use_speaker_boost", settings.use_speaker_boost}
        }},
        {"generation_config", {
            {"chunk_length_schedule", settings.chunk_length_schedule}
        }},
        {"xi_api_key", api_key}
    };
}

ElevenLabsEndpoint endpoint_from_config(const RelayConfig& config)
{
    ElevenLabsEndpoint endpoint;
    endpoint.host = config.upstream_host;
    endpoint.port = config.upstream_port;
    endpoint.tts_model_id = config.tts_model_id;
    endpoint.voice_settings = config.tts_voice;
    endpoint.timeout = config.upstream_timeout;
    return endpoint;
}

ElevenLabsConnector::ElevenLabsConnector(net::io_context& ioc, ElevenLabsEndpoint endpoint)
    : ioc_(ioc), ssl_ctx_(ssl::context::tlsv12_client), endpoint_(std::move(endpoint))
{
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

void ElevenLabsConnector::connect_ai(const std::string& agent_id, const std::string& api_key,
                                     ConnectHandler handler)
{
    auto op = std::make_shared<UpstreamHandshake>(ioc_, ssl_ctx_, endpoint_, "ElevenLabs Conversational AI",
                                                  ai_conversation_target(agent_id), std::move(handler));
    op->set_api_key_header(api_key);
    op->run();
}

void ElevenLabsConnector::connect_tts(const std::string& voice_id, const std::string& api_key,
                                      ConnectHandler handler)
{
    auto op = std::make_shared<UpstreamHandshake>(ioc_, ssl_ctx_, endpoint_, "ElevenLabs TTS",
                                                  tts_stream_target(voice_id, endpoint_.tts_model_id),
                                                  std::move(handler));
    op->set_init_message(dump_event(tts_init_message(endpoint_.voice_settings, api_key)));
    op->run();
}
