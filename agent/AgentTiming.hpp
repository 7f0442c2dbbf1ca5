// Retry bounds and the blocking sleep used between attempts and cycles.
#pragma once
#include <chrono>
#include <functional>
#include <thread>

struct RetryPolicy {
    int maxConnectionRetries = 5;
    std::chrono::seconds connectionBackoff{10};
    int maxFileAttempts = 3;
    std::chrono::seconds fileRetryDelay{10};
    // Wait after a download before re-checking the remote entry
    std::chrono::seconds gracePeriod{2};
};

// Every suspension point goes through a Sleeper so tests can run the loop
// without waiting.
using Sleeper = std::function<void(std::chrono::seconds)>;

inline void blockingSleep(std::chrono::seconds s) {
    std::this_thread::sleep_for(s);
}
