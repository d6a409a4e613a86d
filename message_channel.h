#ifndef MESSAGE_CHANNEL_H
#define MESSAGE_CHANNEL_H

#include "relay_common.h"

#include <functional>
#include <string>

// One end of a WebSocket as the relay sees it: text frames in, text frames out.
// All operations complete on the owning io_context. At most one read may be
// outstanding; sends and closes are queued and performed in call order.
class MessageChannel {
public:
    using ReadHandler = std::function<void(beast::error_code, std::string)>;
    using WriteHandler = std::function<void(beast::error_code)>;

    virtual ~MessageChannel() = default;

    virtual void async_read(ReadHandler handler) = 0;
    virtual void async_send(std::string text, WriteHandler handler) = 0;
    virtual void async_close(websocket::close_reason reason, WriteHandler handler) = 0;

    virtual bool is_open() const = 0;

    // Close frame received from the peer, if any
    virtual websocket::close_reason peer_close_reason() const = 0;
};

#endif // MESSAGE_CHANNEL_H
