#pragma once
#include "vaultbridge/core/failures.hpp"
#include "vaultbridge/core/result.hpp"
#include "vaultbridge/protocol/constants.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace vaultbridge::protocol::rpc {

struct RetryPolicy {
    uint32_t max_attempts = kDefaultRetryAttempts;
    std::chrono::milliseconds initial_delay = kDefaultRetryInitialDelay;
    double backoff_multiplier = kDefaultRetryBackoffMultiplier;
    std::chrono::milliseconds request_timeout = kDefaultRetryRequestTimeout;
    std::chrono::milliseconds initial_wait{0};

    [[nodiscard]] Result<Unit, ProtocolFailure> Validate() const;

    // Delay after the given failed attempt (1-based), rounded to whole milliseconds.
    [[nodiscard]] std::chrono::milliseconds DelayAfterAttempt(uint32_t attempt) const;
};

/**
 * Re-runs an asynchronous attempt with exponential backoff.
 *
 * Each attempt is started from scratch by the supplied function, so the
 * caller decides what is fresh per attempt. Completion receives the first
 * success or the failure of the last attempt.
 */
class RetryScheduler : public std::enable_shared_from_this<RetryScheduler> {
public:
    using Completion = std::function<void(Result<nlohmann::json, ProtocolFailure>)>;
    using Attempt = std::function<void(uint32_t attempt, Completion done)>;

    static void Run(
        boost::asio::io_context& io,
        const RetryPolicy& policy,
        Attempt attempt,
        Completion done);

    RetryScheduler(const RetryScheduler&) = delete;
    RetryScheduler& operator=(const RetryScheduler&) = delete;

private:
    RetryScheduler(boost::asio::io_context& io, RetryPolicy policy, Attempt attempt, Completion done);

    void Schedule(std::chrono::milliseconds delay);
    void StartAttempt();
    void OnAttemptFinished(Result<nlohmann::json, ProtocolFailure> result);

    boost::asio::steady_timer timer_;
    RetryPolicy policy_;
    Attempt attempt_;
    Completion done_;
    uint32_t current_attempt_ = 0;
};

}
