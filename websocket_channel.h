#ifndef WEBSOCKET_CHANNEL_H
#define WEBSOCKET_CHANNEL_H

#include "message_channel.h"

#include <deque>
#include <memory>
#include <utility>

// MessageChannel over a Beast websocket::stream. Beast allows a single
// outstanding write (close included), so sends and closes go through a queue.
template <class Stream>
class WebSocketChannel : public MessageChannel,
                         public std::enable_shared_from_this<WebSocketChannel<Stream>> {
public:
    template <class... Args>
    explicit WebSocketChannel(Args&&... args) : ws_(std::forward<Args>(args)...)
    {
    }

    Stream& stream() { return ws_; }

    void async_read(ReadHandler handler) override
    {
        auto self = this->shared_from_this();
        ws_.async_read(read_buffer_, [self, handler](beast::error_code ec, std::size_t) {
            if (ec) {
                handler(ec, std::string());
                return;
            }
            std::string text = beast::buffers_to_string(self->read_buffer_.data());
            self->read_buffer_.consume(self->read_buffer_.size());
            handler(ec, std::move(text));
        });
    }

    void async_send(std::string text, WriteHandler handler) override
    {
        PendingWrite w;
        w.text = std::move(text);
        w.handler = std::move(handler);
        enqueue(std::move(w));
    }

    void async_close(websocket::close_reason reason, WriteHandler handler) override
    {
        PendingWrite w;
        w.close = true;
        w.reason = reason;
        w.handler = std::move(handler);
        enqueue(std::move(w));
    }

    bool is_open() const override { return ws_.is_open(); }

    websocket::close_reason peer_close_reason() const override { return ws_.reason(); }

private:
    struct PendingWrite {
        bool close = false;
        std::string text;
        websocket::close_reason reason;
        WriteHandler handler;
    };

    void enqueue(PendingWrite w)
    {
        queue_.push_back(std::move(w));
        if (queue_.size() == 1)
            write_next();
    }

    void write_next()
    {
        auto self = this->shared_from_this();
        PendingWrite& front = queue_.front();
        if (front.close) {
            ws_.async_close(front.reason, [self](beast::error_code ec) { self->on_write(ec); });
        } else {
            ws_.text(true);
            ws_.async_write(net::buffer(front.text),
                            [self](beast::error_code ec, std::size_t) { self->on_write(ec); });
        }
    }

    void on_write(beast::error_code ec)
    {
        WriteHandler handler = std::move(queue_.front().handler);
        queue_.pop_front();

        if (ec) {
            // the stream is unusable, fail whatever is still waiting
            std::deque<PendingWrite> abandoned;
            abandoned.swap(queue_);
            if (handler)
                handler(ec);
            for (auto& w : abandoned) {
                if (w.handler)
                    w.handler(ec);
            }
            return;
        }

        if (!queue_.empty())
            write_next();
        if (handler)
            handler(ec);
    }

    Stream ws_;
    beast::flat_buffer read_buffer_;
    std::deque<PendingWrite> queue_;
};

#endif // WEBSOCKET_CHANNEL_H
