#pragma once
#include "IStreamSocket.hpp"
#include "StreamUrl.hpp"
#include <memory>

// WSS client socket: Boost.Beast over TLS, one I/O thread per socket.
// Boost headers stay in the .cpp (PIMPL).
class BeastStreamSocket : public IStreamSocket {
public:
    BeastStreamSocket(StreamUrl url, StreamHandlers handlers);
    ~BeastStreamSocket() override;

    BeastStreamSocket(const BeastStreamSocket&) = delete;
    BeastStreamSocket& operator=(const BeastStreamSocket&) = delete;

    // Kicks off resolve -> connect -> TLS -> WS handshake; returns immediately
    void start();

    void send(const std::string& text) override;
    void close() override;
    void set_on_message(MessageHandler handler) override;
    bool is_open() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

class BeastStreamConnector : public IStreamConnector {
public:
    std::unique_ptr<IStreamSocket> open(const std::string& url,
                                        StreamHandlers handlers) override;
};
