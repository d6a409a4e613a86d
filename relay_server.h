#ifndef RELAY_SERVER_H
#define RELAY_SERVER_H

#include "relay_config.h"
#include "relay_session.h"
#include "upstream_connector.h"

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

// Active sessions keyed by the id handed to their downstream socket. Only the
// accept path inserts and only a session's own teardown removes its entry.
class SessionRegistry {
public:
    bool insert(std::shared_ptr<RelaySession> session);
    bool remove(std::uint64_t id);
    std::shared_ptr<RelaySession> find(std::uint64_t id) const;
    std::vector<std::shared_ptr<RelaySession>> snapshot() const;
    std::size_t size() const { return sessions_.size(); }

private:
    std::unordered_map<std::uint64_t, std::shared_ptr<RelaySession>> sessions_;
};

// Path part of a request target must be "/"; the query string is ignored
bool is_relay_path(beast::string_view target);

// True when the comma separated Sec-WebSocket-Protocol offer contains `wanted`
bool offers_subprotocol(beast::string_view offer, beast::string_view wanted);

struct ServerOptions {
    std::string listen_address = "0.0.0.0";
    unsigned short port = 3001;
    std::chrono::seconds ping_interval{20};
    std::chrono::seconds ping_timeout{20};
    std::chrono::seconds handshake_timeout{30};
    SessionOptions session;
};

ServerOptions server_options_from_config(const RelayConfig& config);

class RelayServer : public std::enable_shared_from_this<RelayServer> {
public:
    RelayServer(net::io_context& ioc, ServerOptions options, std::shared_ptr<UpstreamConnector> connector);

    // Binds and starts accepting. Throws boost::system::system_error.
    void run();

    // Stops accepting and tears down every registered session
    void stop();

    tcp::endpoint local_endpoint() const { return acceptor_.local_endpoint(); }
    const SessionRegistry& registry() const { return registry_; }

private:
    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);

    friend class DownstreamHandshake;
    void start_session(std::shared_ptr<MessageChannel> downstream, const std::string& remote);
    void on_session_closed(std::uint64_t id);

    tcp::acceptor acceptor_;
    ServerOptions options_;
    std::shared_ptr<UpstreamConnector> connector_;
    SessionRegistry registry_;
    std::uint64_t next_session_id_ = 1;
    bool stopped_ = false;
};

#endif // RELAY_SERVER_H
