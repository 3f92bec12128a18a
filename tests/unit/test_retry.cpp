#include <catch2/catch.hpp>
#include "vaultbridge/rpc/retry.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

using namespace vaultbridge::protocol;
using namespace vaultbridge::protocol::rpc;
using namespace std::chrono_literals;
using nlohmann::json;

TEST_CASE("RetryPolicy - Defaults and backoff", "[rpc][retry]") {
    const RetryPolicy policy;
    REQUIRE(policy.max_attempts == 3);
    REQUIRE(policy.initial_delay == 2000ms);
    REQUIRE(policy.backoff_multiplier == 1.5);
    REQUIRE(policy.request_timeout == 30000ms);
    REQUIRE(policy.initial_wait == 0ms);
    REQUIRE(policy.Validate().IsOk());

    REQUIRE(policy.DelayAfterAttempt(1) == 2000ms);
    REQUIRE(policy.DelayAfterAttempt(2) == 3000ms);
    REQUIRE(policy.DelayAfterAttempt(3) == 4500ms);

    RetryPolicy odd;
    odd.initial_delay = 333ms;
    odd.backoff_multiplier = 1.5;
    REQUIRE(odd.DelayAfterAttempt(2) == 500ms);
    REQUIRE(odd.DelayAfterAttempt(3) == 750ms);
}

TEST_CASE("RetryPolicy - Validation", "[rpc][retry]") {
    RetryPolicy policy;
    policy.max_attempts = 0;
    REQUIRE(policy.Validate().IsErr());
    policy = RetryPolicy{};
    policy.backoff_multiplier = 0.5;
    REQUIRE(policy.Validate().IsErr());
    policy = RetryPolicy{};
    policy.request_timeout = 0ms;
    REQUIRE(policy.Validate().IsErr());
}

TEST_CASE("RetryScheduler - Stops at the first success", "[rpc][retry]") {
    boost::asio::io_context io;
    RetryPolicy policy;
    policy.initial_delay = 5ms;
    std::vector<uint32_t> attempts;
    std::optional<Result<json, ProtocolFailure>> outcome;

    RetryScheduler::Run(io, policy,
        [&](uint32_t attempt, RetryScheduler::Completion done) {
            attempts.push_back(attempt);
            boost::asio::post(io, [attempt, done = std::move(done)]() {
                if (attempt < 2) {
                    done(Result<json, ProtocolFailure>::Err(ProtocolFailure::RequestTimeout("Request timeout")));
                } else {
                    done(Result<json, ProtocolFailure>::Ok(json{{"ok", true}}));
                }
            });
        },
        [&](Result<json, ProtocolFailure> result) { outcome.emplace(std::move(result)); });
    io.run();

    REQUIRE(attempts == std::vector<uint32_t>{1, 2});
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->IsOk());
}

TEST_CASE("RetryScheduler - Returns the last failure after the final attempt", "[rpc][retry]") {
    boost::asio::io_context io;
    RetryPolicy policy;
    policy.max_attempts = 3;
    policy.initial_delay = 10ms;
    policy.backoff_multiplier = 2.0;
    const auto started = std::chrono::steady_clock::now();
    uint32_t attempts = 0;
    std::optional<Result<json, ProtocolFailure>> outcome;

    RetryScheduler::Run(io, policy,
        [&](uint32_t attempt, RetryScheduler::Completion done) {
            ++attempts;
            done(Result<json, ProtocolFailure>::Err(
                ProtocolFailure::ServerError("attempt " + std::to_string(attempt))));
        },
        [&](Result<json, ProtocolFailure> result) { outcome.emplace(std::move(result)); });
    io.run();

    REQUIRE(attempts == 3);
    REQUIRE(outcome->UnwrapErr().message == "attempt 3");
    REQUIRE(std::chrono::steady_clock::now() - started >= 30ms);
}

TEST_CASE("RetryScheduler - Invalid policy fails without attempting", "[rpc][retry]") {
    boost::asio::io_context io;
    RetryPolicy policy;
    policy.max_attempts = 0;
    bool attempted = false;
    std::optional<Result<json, ProtocolFailure>> outcome;
    RetryScheduler::Run(io, policy,
        [&](uint32_t, RetryScheduler::Completion) { attempted = true; },
        [&](Result<json, ProtocolFailure> result) { outcome.emplace(std::move(result)); });
    io.run();
    REQUIRE_FALSE(attempted);
    REQUIRE(outcome->UnwrapErr().type == ProtocolFailureType::InvalidInput);
}
