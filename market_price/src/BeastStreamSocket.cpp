#include "BeastStreamSocket.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace beast     = boost::beast;
namespace http      = beast::http;
namespace websocket = beast::websocket;
namespace net       = boost::asio;
namespace ssl       = net::ssl;
using tcp           = net::ip::tcp;
using ws_stream     = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

namespace {

enum class SocketState {
    Connecting,
    Open,
    Closing,
    Closed
};

const char* kTag = "BeastStreamSocket";
constexpr auto kConnectTimeout = std::chrono::seconds(30);
constexpr auto kCloseWait      = std::chrono::seconds(3);

// Set on the I/O thread while the open handler runs
thread_local const void* t_opening = nullptr;

} // namespace

struct BeastStreamSocket::Impl {
    StreamUrl url;
    IStreamSocket& owner;
    OpenHandler on_open;

    std::mutex handler_mtx;
    MessageHandler on_message;

    net::io_context ioc{1};
    ssl::context ctx{ssl::context::tlsv12_client};
    tcp::resolver resolver{ioc};
    std::unique_ptr<ws_stream> ws;
    beast::flat_buffer buffer;

    // touched on the I/O thread only
    std::deque<std::string> outbox;
    bool close_requested = false;

    mutable std::mutex state_mtx;
    std::condition_variable state_cv;
    SocketState state = SocketState::Connecting;

    std::thread io_thread;

    Impl(StreamUrl u, StreamHandlers handlers, IStreamSocket& self)
        : url(std::move(u)),
          owner(self),
          on_open(std::move(handlers.on_open)),
          on_message(std::move(handlers.on_message))
    {
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);
        ws = std::make_unique<ws_stream>(ioc, ctx);
    }

    SocketState get_state() const {
        std::lock_guard<std::mutex> lk(state_mtx);
        return state;
    }

    void set_closed() {
        {
            std::lock_guard<std::mutex> lk(state_mtx);
            state = SocketState::Closed;
        }
        state_cv.notify_all();
    }

    void fail(const std::string& where, const beast::error_code& ec) {
        // operation_aborted: torn down by close()
        if (ec != net::error::operation_aborted) {
            log_error(kTag, where + " failed (" + url.host + "): " + ec.message());
        }
        set_closed();
    }

    // ------------------------------------------------------------
    // Handshake chain: resolve -> tcp connect -> TLS -> websocket
    // ------------------------------------------------------------
    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail("resolve", ec);

        beast::get_lowest_layer(*ws).expires_after(kConnectTimeout);
        beast::get_lowest_layer(*ws).async_connect(
            results,
            [this](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
                on_connect(ec);
            });
    }

    void on_connect(beast::error_code ec) {
        if (ec) return fail("connect", ec);

        // SNI (Server Name Indication) for TLS
        if (!SSL_set_tlsext_host_name(ws->next_layer().native_handle(), url.host.c_str())) {
            ec = beast::error_code(static_cast<int>(::ERR_get_error()),
                                   net::error::get_ssl_category());
            return fail("SNI", ec);
        }
        ws->next_layer().set_verify_callback(ssl::host_name_verification(url.host));

        ws->next_layer().async_handshake(
            ssl::stream_base::client,
            [this](beast::error_code ec) { on_tls_handshake(ec); });
    }

    void on_tls_handshake(beast::error_code ec) {
        if (ec) return fail("tls handshake", ec);

        // websocket has its own timeouts from here on
        beast::get_lowest_layer(*ws).expires_never();
        ws->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws->set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(http::field::user_agent, std::string("market-price/1.0"));
        }));
        ws->text(true);

        const std::string host_header = url.port == "443" ? url.host : url.host + ":" + url.port;
        ws->async_handshake(host_header, url.target,
                            [this](beast::error_code ec) { on_ws_handshake(ec); });
    }

    void on_ws_handshake(beast::error_code ec) {
        if (ec) return fail("websocket handshake", ec);

        // close() arrived while we were still handshaking; abort_connect is
        // already queued behind us
        if (get_state() != SocketState::Connecting) return;

        // frames sent from on_open go straight to the outbox, ahead of
        // anything another thread sends once we report Open
        if (on_open) {
            t_opening = this;
            try {
                on_open(owner);
            } catch (const std::exception& e) {
                log_error(kTag, std::string("open handler error: ") + e.what());
            }
            t_opening = nullptr;
        }

        {
            std::lock_guard<std::mutex> lk(state_mtx);
            if (state != SocketState::Connecting) return;
            state = SocketState::Open;
        }
        state_cv.notify_all();

        do_read();
    }

    // ------------------------------------------------------------
    // Read loop
    // ------------------------------------------------------------
    void do_read() {
        ws->async_read(buffer, [this](beast::error_code ec, std::size_t) { on_read(ec); });
    }

    void on_read(beast::error_code ec) {
        if (ec) {
            // Expected during close() or orderly remote shutdown
            if (ec == websocket::error::closed || ec == net::error::operation_aborted) {
                set_closed();
                return;
            }
            return fail("read", ec);
        }

        std::string text = beast::buffers_to_string(buffer.data());
        buffer.consume(buffer.size());

        MessageHandler handler;
        {
            std::lock_guard<std::mutex> lk(handler_mtx);
            handler = on_message;
        }
        if (handler) {
            try {
                handler(text);
            } catch (const std::exception& e) {
                log_error(kTag, std::string("message handler error: ") + e.what());
            }
        }

        do_read();
    }

    // ------------------------------------------------------------
    // Write queue (one async_write in flight at a time)
    // ------------------------------------------------------------
    void enqueue(std::string text) {
        outbox.push_back(std::move(text));
        if (outbox.size() == 1) do_write();
    }

    void do_write() {
        ws->async_write(net::buffer(outbox.front()),
                        [this](beast::error_code ec, std::size_t) { on_write(ec); });
    }

    void on_write(beast::error_code ec) {
        if (ec) {
            outbox.clear();
            return fail("write", ec);
        }
        outbox.pop_front();
        if (!outbox.empty()) {
            do_write();
        } else if (close_requested) {
            do_close();
        }
    }

    // ------------------------------------------------------------
    // Close
    // ------------------------------------------------------------
    void request_close() {
        close_requested = true;
        if (outbox.empty()) do_close();
    }

    void do_close() {
        ws->async_close(websocket::close_code::normal, [this](beast::error_code ec) {
            if (ec && ec != net::error::operation_aborted) {
                log_error(kTag, "close: " + ec.message());
            }
            set_closed();
        });
    }

    void abort_connect() {
        resolver.cancel();
        beast::get_lowest_layer(*ws).close();
        set_closed();
    }
};

BeastStreamSocket::BeastStreamSocket(StreamUrl url, StreamHandlers handlers)
    : impl_(std::make_unique<Impl>(std::move(url), std::move(handlers), *this))
{}

BeastStreamSocket::~BeastStreamSocket() {
    if (impl_->io_thread.joinable()) {
        close();
        std::unique_lock<std::mutex> lk(impl_->state_mtx);
        impl_->state_cv.wait_for(lk, kCloseWait, [this] {
            return impl_->state == SocketState::Closed;
        });
    }
    impl_->ioc.stop();
    if (impl_->io_thread.joinable()) impl_->io_thread.join();
}

void BeastStreamSocket::start() {
    Impl* impl = impl_.get();
    impl->resolver.async_resolve(
        impl->url.host, impl->url.port,
        [impl](beast::error_code ec, tcp::resolver::results_type results) {
            impl->on_resolve(ec, std::move(results));
        });

    impl->io_thread = std::thread([impl] {
        try {
            impl->ioc.run();
        } catch (const std::exception& e) {
            log_error(kTag, std::string("io loop error: ") + e.what());
            impl->set_closed();
        }
    });
}

void BeastStreamSocket::send(const std::string& text) {
    const SocketState st = impl_->get_state();
    if (st == SocketState::Connecting) {
        if (t_opening == impl_.get()) {
            impl_->enqueue(text);
            return;
        }
        throw TransportError("socket is still connecting to " + impl_->url.host);
    }
    if (st != SocketState::Open) {
        log_error(kTag, "socket closed, dropping frame");
        return;
    }

    Impl* impl = impl_.get();
    net::post(impl->ioc, [impl, text] { impl->enqueue(text); });
}

void BeastStreamSocket::close() {
    SocketState prev;
    {
        std::lock_guard<std::mutex> lk(impl_->state_mtx);
        prev = impl_->state;
        if (prev == SocketState::Closing || prev == SocketState::Closed) return;
        impl_->state = SocketState::Closing;
    }

    Impl* impl = impl_.get();
    if (prev == SocketState::Connecting) {
        net::post(impl->ioc, [impl] { impl->abort_connect(); });
    } else {
        net::post(impl->ioc, [impl] { impl->request_close(); });
    }
}

void BeastStreamSocket::set_on_message(MessageHandler handler) {
    std::lock_guard<std::mutex> lk(impl_->handler_mtx);
    impl_->on_message = std::move(handler);
}

bool BeastStreamSocket::is_open() const {
    return impl_->get_state() == SocketState::Open;
}

std::unique_ptr<IStreamSocket> BeastStreamConnector::open(const std::string& url,
                                                          StreamHandlers handlers) {
    auto socket = std::make_unique<BeastStreamSocket>(parse_stream_url(url), std::move(handlers));
    socket->start();
    return socket;
}
