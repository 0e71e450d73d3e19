#pragma once
#include <chrono>

// Teardown retry for a failed unsubscribe/close.
struct RetryPolicy {
    std::chrono::milliseconds backoff{300};
    int max_attempts = 0;   // 0 = retry forever

    bool unlimited() const { return max_attempts <= 0; }
};
