#ifndef RELAY_COMMON_H
#define RELAY_COMMON_H

/*
realtime_relay: presents the ElevenLabs conversational AI (and optionally the
ElevenLabs streaming TTS) to a browser as a single OpenAI Realtime compatible
WebSocket endpoint.

Build deps:
$sudo apt-get install libboost-all-dev libssl-dev nlohmann-json3-dev libgtest-dev

How to run the application:
$export ELEVENLABS_API_KEY="..."
$export ELEVENLABS_AGENT_ID="..."
$./realtime_relay
Then press Ctrl-C to exit the program.
*/

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace beast = boost::beast;         // from <boost/beast.hpp>
namespace http = beast::http;           // from <boost/beast/http.hpp>
namespace websocket = beast::websocket; // from <boost/beast/websocket.hpp>
namespace net = boost::asio;            // from <boost/asio.hpp>
namespace ssl = boost::asio::ssl;       // from <boost/asio/ssl.hpp>
using tcp = net::ip::tcp;               // from <boost/asio/ip/tcp.hpp>
using json = nlohmann::ordered_json;    // keeps wire field order

// Streams used by the relay
using DownstreamStream = websocket::stream<beast::tcp_stream>;
using UpstreamStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

// The three sockets a session can own
enum class Leg { downstream, ai, tts };

const char* leg_name(Leg leg);

// A close frame payload may carry at most 123 bytes of reason text
websocket::close_reason make_close_reason(websocket::close_code code, const std::string& reason);

// Serialize for the wire; invalid UTF-8 is replaced instead of throwing
std::string dump_event(const json& event);

#endif // RELAY_COMMON_H
