#include "relay_server.h"
#include "relay_log.h"
#include "websocket_channel.h"

#include <utility>

namespace {

using DownstreamChannel = WebSocketChannel<DownstreamStream>;

const char* const kSubprotocol = "realtime";
const char* const kServerName = "realtime-relay/1.0";

beast::string_view trim_view(beast::string_view s)
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
        s.remove_suffix(1);
    return s;
}

} // namespace

// Reads the HTTP upgrade of one browser connection, applies the path rule and
// hands accepted sockets to the server.
class DownstreamHandshake : public std::enable_shared_from_this<DownstreamHandshake> {
public:
    DownstreamHandshake(std::shared_ptr<RelayServer> server, tcp::socket socket, std::string remote)
        : server_(std::move(server)),
          channel_(std::make_shared<DownstreamChannel>(std::move(socket))),
          remote_(std::move(remote))
    {
    }

    void run()
    {
        beast::get_lowest_layer(ws()).expires_after(server_->options_.handshake_timeout);
        http::async_read(beast::get_lowest_layer(ws()), buffer_, req_,
            [self = shared_from_this()](beast::error_code ec, std::size_t) { self->on_request(ec); });
    }

private:
    DownstreamStream& ws() { return channel_->stream(); }

    void on_request(beast::error_code ec)
    {
        if (ec) {
            RELAY_LOG_DEBUG << "Handshake read from " << remote_ << " failed: " << ec.message();
            return;
        }

        if (!websocket::is_upgrade(req_)) {
            RELAY_LOG_INFO << "Rejected plain HTTP request from " << remote_ << " for " << req_.target();
            reject_plain_http();
            return;
        }

        beast::get_lowest_layer(ws()).expires_never();

        // ping after ping_interval of silence, give up ping_timeout later
        websocket::stream_base::timeout opt;
        opt.handshake_timeout = server_->options_.handshake_timeout;
        opt.idle_timeout = server_->options_.ping_interval + server_->options_.ping_timeout;
        opt.keep_alive_pings = true;
        ws().set_option(opt);

        const bool realtime = offers_subprotocol(req_[http::field::sec_websocket_protocol], kSubprotocol);
        ws().set_option(websocket::stream_base::decorator(
            [realtime](websocket::response_type& res) {
                res.set(http::field::server, kServerName);
                if (realtime)
                    res.set(http::field::sec_websocket_protocol, kSubprotocol);
            }));

        path_ok_ = is_relay_path(req_.target());
        ws().async_accept(req_, [self = shared_from_this()](beast::error_code ec) { self->on_accept(ec); });
    }

    void on_accept(beast::error_code ec)
    {
        if (ec) {
            RELAY_LOG_INFO << "WebSocket accept from " << remote_ << " failed: " << ec.message();
            return;
        }

        if (!path_ok_) {
            RELAY_LOG_ERROR << "Invalid path: " << req_.target();
            channel_->async_close(make_close_reason(websocket::close_code::policy_error, "Invalid path"),
                [](beast::error_code) {});
            return;
        }

        server_->start_session(channel_, remote_);
    }

    void reject_plain_http()
    {
        res_.result(http::status::upgrade_required);
        res_.version(req_.version());
        res_.set(http::field::server, kServerName);
        res_.set(http::field::content_type, "text/plain");
        res_.set(http::field::upgrade, "websocket");
        res_.keep_alive(false);
        res_.body() = "Upgrade Required\n";
        res_.prepare_payload();

        http::async_write(beast::get_lowest_layer(ws()), res_,
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                beast::get_lowest_layer(self->ws()).socket().shutdown(tcp::socket::shutdown_send, ec);
            });
    }

    std::shared_ptr<RelayServer> server_;
    std::shared_ptr<DownstreamChannel> channel_;
    std::string remote_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    http::response<http::string_body> res_;
    bool path_ok_ = false;
};

bool SessionRegistry::insert(std::shared_ptr<RelaySession> session)
{
    const std::uint64_t id = session->id();
    return sessions_.emplace(id, std::move(session)).second;
}

bool SessionRegistry::remove(std::uint64_t id)
{
    return sessions_.erase(id) > 0;
}

std::shared_ptr<RelaySession> SessionRegistry::find(std::uint64_t id) const
{
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<RelaySession>> SessionRegistry::snapshot() const
{
    std::vector<std::shared_ptr<RelaySession>> out;
    out.reserve(sessions_.size());
    for (const auto& entry : sessions_)
        out.push_back(entry.second);
    return out;
}

bool is_relay_path(beast::string_view target)
{
    const auto query = target.find('?');
    if (query != beast::string_view::npos)
        target = target.substr(0, query);
    return target == "/";
}

bool offers_subprotocol(beast::string_view offer, beast::string_view wanted)
{
    while (!offer.empty()) {
        const auto comma = offer.find(',');
        const beast::string_view token = trim_view(offer.substr(0, comma));
        if (token == wanted)
            return true;
        if (comma == beast::string_view::npos)
            break;
        offer.remove_prefix(comma + 1);
    }
    return false;
}

ServerOptions server_options_from_config(const RelayConfig& config)
{
    ServerOptions options;
    options.listen_address = config.listen_address;
    options.port = config.port;
    options.ping_interval = config.ping_interval;
    options.ping_timeout = config.ping_timeout;
    options.session.agent_id = config.agent_id;
    options.session.voice_id = config.voice_id;
    options.session.api_key = config.api_key;
    options.session.with_tts = config.mode == RelayMode::hybrid;
    options.session.forward_raw_ai_events = config.forward_raw_ai_events;
    return options;
}

RelayServer::RelayServer(net::io_context& ioc, ServerOptions options,
                         std::shared_ptr<UpstreamConnector> connector)
    : acceptor_(ioc), options_(std::move(options)), connector_(std::move(connector))
{
}

void RelayServer::run()
{
    const tcp::endpoint endpoint{net::ip::make_address(options_.listen_address), options_.port};
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);

    const tcp::endpoint bound = acceptor_.local_endpoint();
    RELAY_LOG_INFO << "ElevenLabs relay server started on ws://" << bound.address().to_string() << ":"
                   << bound.port() << (options_.session.with_tts ? " (AI + TTS)" : " (AI only)");
    do_accept();
}

void RelayServer::stop()
{
    if (stopped_)
        return;
    stopped_ = true;

    beast::error_code ec;
    acceptor_.close(ec);

    const auto sessions = registry_.snapshot();
    RELAY_LOG_INFO << "Closing " << sessions.size() << " active session(s)";
    for (const auto& session : sessions)
        session->stop();
}

void RelayServer::do_accept()
{
    acceptor_.async_accept([self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
        self->on_accept(ec, std::move(socket));
    });
}

void RelayServer::on_accept(beast::error_code ec, tcp::socket socket)
{
    if (stopped_)
        return;

    if (ec) {
        RELAY_LOG_ERROR << "Accept failed: " << ec.message();
    } else {
        beast::error_code ep_ec;
        const tcp::endpoint remote = socket.remote_endpoint(ep_ec);
        const std::string label = ep_ec ? std::string("unknown peer")
                                        : remote.address().to_string() + ":" + std::to_string(remote.port());
        std::make_shared<DownstreamHandshake>(shared_from_this(), std::move(socket), label)->run();
    }

    do_accept();
}

void RelayServer::start_session(std::shared_ptr<MessageChannel> downstream, const std::string& remote)
{
    if (stopped_) {
        downstream->async_close(make_close_reason(websocket::close_code::normal, "Server shutting down"),
            [downstream](beast::error_code) {});
        return;
    }

    const std::uint64_t id = next_session_id_++;
    RELAY_LOG_INFO << "[session " << id << "] Browser connected from " << remote;

    std::weak_ptr<RelayServer> weak = shared_from_this();
    auto session = std::make_shared<RelaySession>(id, std::move(downstream), connector_, options_.session,
        [weak](std::uint64_t closed_id) {
            if (auto server = weak.lock())
                server->on_session_closed(closed_id);
        });
    registry_.insert(session);
    session->start();
}

void RelayServer::on_session_closed(std::uint64_t id)
{
    if (!registry_.remove(id)) {
        RELAY_LOG_WARNING << "[session " << id << "] Not in registry";
        return;
    }
    RELAY_LOG_DEBUG << "[session " << id << "] Removed, " << registry_.size() << " active";
}
