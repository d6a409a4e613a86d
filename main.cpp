#include "relay_config.h"
#include "relay_log.h"
#include "relay_server.h"
#include "upstream_connector.h"

#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>

int main()
{
    const char* env_file = std::getenv("RELAY_ENV_FILE");
    const int loaded = load_dotenv(env_file ? env_file : ".env");

    RelayConfig config;
    try {
        config = RelayConfig::from_environment();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    set_log_level(config.log_level);
    if (loaded > 0)
        RELAY_LOG_DEBUG << "Loaded " << loaded << " variable(s) from .env";

    try {
        net::io_context ioc{1};

        auto connector = std::make_shared<ElevenLabsConnector>(ioc, endpoint_from_config(config));
        auto server = std::make_shared<RelayServer>(ioc, server_options_from_config(config), connector);
        server->run();

        RELAY_LOG_INFO << "Mode: " << relay_mode_name(config.mode) << ", voice " << config.voice_id
                       << ", press Ctrl-C to exit";

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([server](beast::error_code ec, int signo) {
            if (ec)
                return;
            RELAY_LOG_INFO << "Server shutdown requested (signal " << signo << ")";
            server->stop();
        });

        // returns once the acceptor is closed and every session has torn down
        ioc.run();
    } catch (const std::exception& e) {
        RELAY_LOG_ERROR << "Error: " << e.what();
        RELAY_LOG_INFO << "Server shutdown complete";
        return 1;
    }

    RELAY_LOG_INFO << "Server shutdown complete";
    return 0;
}
