#pragma once
#include <functional>
#include <memory>
#include <string>

// Duplex text-frame socket to the streaming endpoint.
// Handlers run on the transport's I/O thread and must not block.
class IStreamSocket {
public:
    using OpenHandler    = std::function<void(IStreamSocket&)>;
    using MessageHandler = std::function<void(const std::string&)>;

    virtual ~IStreamSocket() = default;

    // Throws TransportError if the socket cannot take the frame yet.
    virtual void send(const std::string& text) = 0;
    // Graceful close after queued frames are written. Idempotent.
    virtual void close() = 0;
    // Empty handler detaches the current one.
    virtual void set_on_message(MessageHandler handler) = 0;
    virtual bool is_open() const = 0;
};

struct StreamHandlers {
    IStreamSocket::OpenHandler    on_open;
    IStreamSocket::MessageHandler on_message;
};

class IStreamConnector {
public:
    virtual ~IStreamConnector() = default;

    // Returns immediately with a socket that is connecting;
    // handlers.on_open fires once the socket can send.
    virtual std::unique_ptr<IStreamSocket> open(const std::string& url,
                                                StreamHandlers handlers) = 0;
};
