#include "vaultbridge/rpc/retry.hpp"
#include "vaultbridge/core/format.hpp"
#include "vaultbridge/core/logging.hpp"

#include <boost/asio/post.hpp>

#include <cmath>

namespace vaultbridge::protocol::rpc {

Result<Unit, ProtocolFailure> RetryPolicy::Validate() const {
    if (max_attempts == 0) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Retry policy needs at least one attempt"));
    }
    if (backoff_multiplier < 1.0) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
            compat::format("Backoff multiplier must be >= 1, got {}", backoff_multiplier)));
    }
    if (initial_delay.count() < 0 || initial_wait.count() < 0) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Retry delays must not be negative"));
    }
    if (request_timeout.count() <= 0) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Request timeout must be positive"));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

std::chrono::milliseconds RetryPolicy::DelayAfterAttempt(const uint32_t attempt) const {
    double delay = static_cast<double>(initial_delay.count());
    for (uint32_t i = 1; i < attempt; ++i) {
        delay = std::round(delay * backoff_multiplier);
    }
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

RetryScheduler::RetryScheduler(boost::asio::io_context& io, RetryPolicy policy, Attempt attempt, Completion done)
    : timer_(io)
    , policy_(policy)
    , attempt_(std::move(attempt))
    , done_(std::move(done)) {}

void RetryScheduler::Run(
    boost::asio::io_context& io,
    const RetryPolicy& policy,
    Attempt attempt,
    Completion done) {
    if (auto valid = policy.Validate(); valid.IsErr()) {
        boost::asio::post(io, [done = std::move(done), failure = std::move(valid).UnwrapErr()]() {
            done(Result<nlohmann::json, ProtocolFailure>::Err(failure));
        });
        return;
    }
    std::shared_ptr<RetryScheduler> scheduler(
        new RetryScheduler(io, policy, std::move(attempt), std::move(done)));
    scheduler->Schedule(policy.initial_wait);
}

void RetryScheduler::Schedule(const std::chrono::milliseconds delay) {
    timer_.expires_after(delay);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        if (ec) {
            self->done_(Result<nlohmann::json, ProtocolFailure>::Err(
                ProtocolFailure::Generic(compat::format("Retry timer failed: {}", ec.message()))));
            return;
        }
        self->StartAttempt();
    });
}

void RetryScheduler::StartAttempt() {
    ++current_attempt_;
    attempt_(current_attempt_, [self = shared_from_this()](Result<nlohmann::json, ProtocolFailure> result) {
        self->OnAttemptFinished(std::move(result));
    });
}

void RetryScheduler::OnAttemptFinished(Result<nlohmann::json, ProtocolFailure> result) {
    if (result.IsOk()) {
        done_(std::move(result));
        return;
    }
    logging::Get()->info("Request attempt {}/{} failed: {}",
        current_attempt_, policy_.max_attempts, result.UnwrapErr().message);
    if (current_attempt_ >= policy_.max_attempts) {
        done_(std::move(result));
        return;
    }
    const auto delay = policy_.DelayAfterAttempt(current_attempt_);
    logging::Get()->info("Retrying in {}ms", delay.count());
    Schedule(delay);
}

}
