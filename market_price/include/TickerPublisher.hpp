#pragma once
#include "Ticker.hpp"
#include <zmq.hpp>
#include <mutex>
#include <string>

// Republishes tickers on a ZMQ PUB socket: [ticker.<INSTID>][ticker json]
class TickerPublisher {
public:
    explicit TickerPublisher(const std::string& bind_addr)
        : ctx_(1), pub_(ctx_, zmq::socket_type::pub)
    {
        // High-water mark: drop if subscriber is slow
        pub_.set(zmq::sockopt::sndhwm, 10000);
        pub_.set(zmq::sockopt::linger, 0);
        pub_.bind(bind_addr);
    }

    // Called from the stream I/O thread
    void publish(const Ticker& t) {
        const std::string topic   = topic_for(t);
        const std::string payload = nlohmann::json(t).dump();

        std::lock_guard<std::mutex> lk(mtx_);
        zmq::message_t tm(topic.data(), topic.size());
        zmq::message_t pm(payload.data(), payload.size());

        pub_.send(tm, zmq::send_flags::sndmore);
        pub_.send(pm, zmq::send_flags::dontwait);
    }

    static std::string topic_for(const Ticker& t) { return "ticker." + t.inst_id; }

private:
    zmq::context_t ctx_;
    zmq::socket_t  pub_;
    std::mutex mtx_;
};
