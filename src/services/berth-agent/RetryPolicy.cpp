#include "RetryPolicy.hpp"

#include <algorithm>
#include <thread>
#include <utility>

RetryPolicy::RetryPolicy(
    int maxAttempts,
    std::chrono::milliseconds baseDelay,
    std::chrono::milliseconds maxDelay,
    Sleeper sleeper)
    : maxAttempts_(std::max(1, maxAttempts)),
      baseDelay_(baseDelay),
      maxDelay_(maxDelay),
      sleeper_(std::move(sleeper)) {}

std::chrono::milliseconds RetryPolicy::Delay(int attempt) const {
    const int shift = std::min(std::max(attempt, 0), 20);
    const auto delay = baseDelay_ * (1LL << shift);
    return std::min(std::chrono::duration_cast<std::chrono::milliseconds>(delay), maxDelay_);
}

void RetryPolicy::Sleep(std::chrono::milliseconds delay) const {
    if (sleeper_) {
        sleeper_(delay);
        return;
    }
    std::this_thread::sleep_for(delay);
}
