#include "SubscriptionManager.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include <thread>

static const char* kTag = "SubscriptionManager";

SubscriptionManager::SubscriptionManager(std::shared_ptr<IStreamConnector> connector,
                                         std::string stream_url,
                                         RetryPolicy retry,
                                         bool verbose,
                                         Sleeper sleeper)
    : connector_(std::move(connector)),
      stream_url_(std::move(stream_url)),
      retry_(retry),
      verbose_(verbose),
      sleeper_(std::move(sleeper))
{
    if (!connector_) throw std::invalid_argument("stream connector is required");
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

SubscriptionManager::~SubscriptionManager() = default;

void SubscriptionManager::start(const std::vector<std::string>& instruments,
                                IStreamSocket::MessageHandler on_frame) {
    if (active_) {
        throw InvalidStateError("subscription already active, stop() it first");
    }

    auto channel = std::make_unique<ActiveChannel>();
    channel->message = make_ticker_subscription(instruments);

    // snapshot of the subscribe frame; the held message is flipped to
    // unsubscribe on teardown
    const std::string subscribe_frame = channel->message.dump();

    log("creating new subscription (" + std::to_string(instruments.size()) + " instruments)...");

    StreamHandlers handlers;
    handlers.on_open = [subscribe_frame](IStreamSocket& socket) {
        socket.send(subscribe_frame);
    };
    handlers.on_message = std::move(on_frame);

    channel->socket = connector_->open(stream_url_, std::move(handlers));
    active_ = std::move(channel);
}

bool SubscriptionManager::stop() {
    if (!active_) return true;

    active_->message.op = SubscriptionOp::Unsubscribe;
    const std::string unsubscribe_frame = active_->message.dump();

    for (int attempt = 1; ; ++attempt) {
        try {
            log("closing subscription...");
            active_->socket->send(unsubscribe_frame);
            active_->socket->close();
            active_->socket->set_on_message(nullptr);
            active_.reset();
            log("subscription closed.");
            return true;
        } catch (const std::exception& e) {
            log_error(kTag, std::string("cannot close subscription due to error \"")
                                + e.what() + "\" (attempt " + std::to_string(attempt) + ")");
        }

        if (!retry_.unlimited() && attempt >= retry_.max_attempts) {
            log_error(kTag, "giving up closing subscription after "
                                + std::to_string(attempt) + " attempts");
            return false;
        }

        log("retrying in " + std::to_string(retry_.backoff.count()) + "ms...");
        sleeper_(retry_.backoff);
    }
}

const SubscriptionMessage* SubscriptionManager::active_message() const {
    return active_ ? &active_->message : nullptr;
}

void SubscriptionManager::log(const std::string& msg) const {
    if (!verbose_) return;
    log_info(kTag, msg);
}
