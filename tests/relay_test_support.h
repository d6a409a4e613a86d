#ifndef RELAY_TEST_SUPPORT_H
#define RELAY_TEST_SUPPORT_H

#include "message_channel.h"
#include "upstream_connector.h"

#include <boost/asio/post.hpp>

#include <atomic>
#include <deque>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// In-memory MessageChannel. Completions are posted to the io_context so the
// session sees the same asynchrony as with a real socket.
class FakeChannel : public MessageChannel, public std::enable_shared_from_this<FakeChannel> {
public:
    explicit FakeChannel(net::io_context& ioc) : ioc_(ioc) {}

    void async_read(ReadHandler handler) override
    {
        pending_read_ = std::move(handler);
        ++reads_issued;
        pump();
    }

    void async_send(std::string text, WriteHandler handler) override
    {
        beast::error_code ec;
        if (!open_)
            ec = websocket::error::closed;
        else if (fail_writes)
            ec = net::error::broken_pipe;
        else
            sent.push_back(std::move(text));
        complete(std::move(handler), ec);
    }

    void async_close(websocket::close_reason reason, WriteHandler handler) override
    {
        close_calls.push_back(reason);
        open_ = false;
        complete(std::move(handler), beast::error_code());
        pump();
    }

    bool is_open() const override { return open_; }

    websocket::close_reason peer_close_reason() const override { return peer_reason_; }

    // --- test side ---
    void deliver(std::string text)
    {
        inbox_.push_back(std::move(text));
        pump();
    }

    void peer_close(websocket::close_code code, const std::string& reason)
    {
        peer_reason_ = websocket::close_reason(code, reason);
        open_ = false;
        pump();
    }

    void drop(beast::error_code ec)
    {
        drop_error_ = ec;
        open_ = false;
        pump();
    }

    json sent_json(std::size_t i) const { return json::parse(sent.at(i)); }
    json last_sent_json() const { return json::parse(sent.back()); }

    std::vector<std::string> sent;
    std::vector<websocket::close_reason> close_calls;
    int reads_issued = 0;
    bool fail_writes = false;

private:
    void complete(WriteHandler handler, beast::error_code ec)
    {
        if (handler)
            net::post(ioc_, [handler, ec]() { handler(ec); });
    }

    void pump()
    {
        if (!pending_read_)
            return;

        ReadHandler handler = std::move(pending_read_);
        pending_read_ = nullptr;

        if (!inbox_.empty()) {
            std::string text = std::move(inbox_.front());
            inbox_.pop_front();
            net::post(ioc_, [handler, text]() { handler(beast::error_code(), text); });
        } else if (!open_) {
            const beast::error_code ec = drop_error_ ? drop_error_ : beast::error_code(websocket::error::closed);
            net::post(ioc_, [handler, ec]() { handler(ec, std::string()); });
        } else {
            pending_read_ = std::move(handler);
        }
    }

    net::io_context& ioc_;
    bool open_ = true;
    websocket::close_reason peer_reason_;
    beast::error_code drop_error_;
    std::deque<std::string> inbox_;
    ReadHandler pending_read_;
};

// Hands out FakeChannels (or errors) instead of dialing ElevenLabs
class ScriptedConnector : public UpstreamConnector {
public:
    explicit ScriptedConnector(net::io_context& ioc)
        : ai(std::make_shared<FakeChannel>(ioc)), tts(std::make_shared<FakeChannel>(ioc)), ioc_(ioc)
    {
    }

    void connect_ai(const std::string& agent_id, const std::string& api_key, ConnectHandler handler) override
    {
        ++ai_calls;
        last_agent_id = agent_id;
        last_api_key = api_key;
        if (hold_ai) {
            held_ai_ = std::move(handler);
            return;
        }
        finish(std::move(handler), ai_error, ai);
    }

    void connect_tts(const std::string& voice_id, const std::string& api_key, ConnectHandler handler) override
    {
        ++tts_calls;
        last_voice_id = voice_id;
        last_api_key = api_key;
        finish(std::move(handler), tts_error, tts);
    }

    void release_ai() { finish(std::move(held_ai_), ai_error, ai); }

    std::shared_ptr<FakeChannel> ai;
    std::shared_ptr<FakeChannel> tts;
    beast::error_code ai_error;
    beast::error_code tts_error;
    bool hold_ai = false;

    std::atomic<int> ai_calls{0};
    std::atomic<int> tts_calls{0};
    std::string last_agent_id;
    std::string last_voice_id;
    std::string last_api_key;

private:
    void finish(ConnectHandler handler, beast::error_code ec, std::shared_ptr<FakeChannel> channel)
    {
        net::post(ioc_, [handler, ec, channel]() {
            if (ec)
                handler(ec, nullptr);
            else
                handler(ec, channel);
        });
    }

    net::io_context& ioc_;
    ConnectHandler held_ai_;
};

#endif // RELAY_TEST_SUPPORT_H
