#include "RetryPolicy.hpp"
#include "TestSupport.hpp"

#include <string>
#include <vector>

int main() {
    std::vector<long long> slept;
    const RetryPolicy policy(4, std::chrono::milliseconds(100), std::chrono::milliseconds(250),
        [&](std::chrono::milliseconds delay) { slept.push_back(delay.count()); });

    if (policy.Delay(0).count() != 100 || policy.Delay(1).count() != 200 || policy.Delay(2).count() != 250
        || policy.Delay(40).count() != 250) {
        return Fail("Backoff should double and stop at the cap.");
    }
    if (RetryPolicy(0, std::chrono::milliseconds(1)).MaxAttempts() != 1) {
        return Fail("At least one attempt is always made.");
    }

    int calls = 0;
    const int value = policy.Run("flaky", [&]() {
        if (++calls < 3) {
            throw TransferError(TransferError::Cause::TRANSIENT_NETWORK, "Connection reset");
        }
        return 42;
    });
    if (value != 42 || calls != 3 || slept != std::vector<long long>{100, 200}) {
        return Fail("Transient failures should be retried with backoff.");
    }

    calls = 0;
    try {
        policy.Run("full", [&]() {
            ++calls;
            throw TransferError(TransferError::Cause::DESTINATION_FULL, "No space left on device");
        });
        return Fail("Fatal error should propagate.");
    } catch (const TransferError& ex) {
        if (calls != 1 || ex.GetCause() != TransferError::Cause::DESTINATION_FULL) {
            return Fail("Fatal transfer error must not be retried.");
        }
    }

    calls = 0;
    try {
        policy.Run("integrity", [&]() {
            ++calls;
            throw IntegrityError("checksum mismatch");
        });
        return Fail("Non-transfer error should propagate.");
    } catch (const IntegrityError&) {
        if (calls != 1) {
            return Fail("Non-transfer errors are never retried.");
        }
    }

    calls = 0;
    try {
        policy.Run("down", [&]() {
            ++calls;
            throw TransferError(TransferError::Cause::TRANSIENT_NETWORK, "No route to host");
        });
        return Fail("Exhausted retries should rethrow.");
    } catch (const TransferError& ex) {
        if (calls != 4 || !ex.IsTransient()) {
            return Fail("Every attempt should be used before giving up.");
        }
    }

    calls = 0;
    try {
        policy.Run(
            "cancelled",
            [&]() {
                ++calls;
                throw TransferError(TransferError::Cause::TRANSIENT_NETWORK, "Broken pipe");
            },
            [] { return true; });
        return Fail("Cancelled retry should rethrow.");
    } catch (const TransferError&) {
        if (calls != 1) {
            return Fail("Cancellation should stop further attempts.");
        }
    }

    return 0;
}
