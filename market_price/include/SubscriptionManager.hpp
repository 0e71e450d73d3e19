#pragma once
#include "IStreamSocket.hpp"
#include "RetryPolicy.hpp"
#include "SubscriptionMessage.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

/* ================= SubscriptionManager =================
 *
 * Owns at most one live ticker channel (socket + its subscription message).
 *
 *   Idle   --start()-->  Active
 *   Active --stop()--->  Idle     (unsubscribe frame, close, detach handler)
 *
 * A failed teardown is retried after RetryPolicy::backoff; with the default
 * policy it retries until it succeeds. Not thread-safe: callers serialise
 * start/stop.
 */
class SubscriptionManager {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    SubscriptionManager(std::shared_ptr<IStreamConnector> connector,
                        std::string stream_url,
                        RetryPolicy retry = {},
                        bool verbose = true,
                        Sleeper sleeper = {});
    ~SubscriptionManager();

    SubscriptionManager(const SubscriptionManager&) = delete;
    SubscriptionManager& operator=(const SubscriptionManager&) = delete;

    // Requires Idle (throws InvalidStateError otherwise). Opens the socket and
    // returns; the subscribe frame goes out once the socket reports open.
    void start(const std::vector<std::string>& instruments,
               IStreamSocket::MessageHandler on_frame);

    // true once Idle. false only when a bounded retry policy gave up; the
    // channel then stays Active.
    bool stop();

    bool is_active() const { return active_ != nullptr; }

    // nullptr when Idle
    const SubscriptionMessage* active_message() const;

private:
    struct ActiveChannel {
        std::unique_ptr<IStreamSocket> socket;
        SubscriptionMessage message;
    };

    void log(const std::string& msg) const;

    std::shared_ptr<IStreamConnector> connector_;
    std::string stream_url_;
    RetryPolicy retry_;
    bool verbose_;
    Sleeper sleeper_;

    std::unique_ptr<ActiveChannel> active_;
};
