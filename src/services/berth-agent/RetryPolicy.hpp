#pragma once

#include "MigrationErrors.hpp"

#include <chrono>
#include <functional>
#include <iostream>
#include <string>

// Bounded exponential backoff. Only transient TransferErrors are retried;
// every other exception propagates on first occurrence.
class RetryPolicy {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using CancelCheck = std::function<bool()>;

    RetryPolicy(
        int maxAttempts,
        std::chrono::milliseconds baseDelay,
        std::chrono::milliseconds maxDelay = std::chrono::milliseconds(60000),
        Sleeper sleeper = Sleeper());

    int MaxAttempts() const { return maxAttempts_; }
    std::chrono::milliseconds Delay(int attempt) const;

    template <typename Fn>
    auto Run(const std::string& label, Fn&& fn, const CancelCheck& cancelled = CancelCheck()) const -> decltype(fn()) {
        for (int attempt = 0;; ++attempt) {
            try {
                return fn();
            } catch (const TransferError& ex) {
                if (!ex.IsTransient() || attempt + 1 >= maxAttempts_ || (cancelled && cancelled())) {
                    throw;
                }

                const auto wait = Delay(attempt);
                std::cerr << "[Transfer] " << label << " failed (Attempt " << (attempt + 1) << "/" << maxAttempts_
                          << "). Retrying in " << wait.count() << "ms: " << ex.what() << std::endl;
                Sleep(wait);
            }
        }
    }

private:
    void Sleep(std::chrono::milliseconds delay) const;

    int maxAttempts_;
    std::chrono::milliseconds baseDelay_;
    std::chrono::milliseconds maxDelay_;
    Sleeper sleeper_;
};
