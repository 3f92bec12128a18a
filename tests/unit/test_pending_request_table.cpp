#include <catch2/catch.hpp>
#include "vaultbridge/rpc/pending_request_table.hpp"

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

using namespace vaultbridge::protocol;
using namespace vaultbridge::protocol::rpc;
using namespace std::chrono_literals;
using nlohmann::json;

namespace {
struct Outcome {
    int calls = 0;
    std::optional<Result<json, ProtocolFailure>> result;

    PendingRequestTable::CompletionHandler Handler() {
        return [this](Result<json, ProtocolFailure> value) {
            ++calls;
            result.emplace(std::move(value));
        };
    }
};
}

TEST_CASE("PendingRequestTable - Resolve completes the matching entry once", "[rpc][correlation]") {
    boost::asio::io_context io;
    auto table = PendingRequestTable::Create(io);
    Outcome first;
    Outcome second;
    REQUIRE(table->Register("a", 5s, first.Handler()).IsOk());
    REQUIRE(table->Register("b", 5s, second.Handler()).IsOk());
    REQUIRE(table->Size() == 2);

    REQUIRE(table->Resolve("b", json{{"requestId", "b"}, {"entries", json::array()}}));
    REQUIRE(second.calls == 1);
    REQUIRE(second.result->Unwrap()["requestId"] == "b");
    REQUIRE(first.calls == 0);
    REQUIRE_FALSE(table->Contains("b"));

    SECTION("Late duplicate is reported as stray") {
        REQUIRE_FALSE(table->Resolve("b", json::object()));
        REQUIRE(second.calls == 1);
    }
    SECTION("Unknown ids are stray") {
        REQUIRE_FALSE(table->Resolve("zzz", json::object()));
    }
}

TEST_CASE("PendingRequestTable - Duplicate ids are refused", "[rpc][correlation]") {
    boost::asio::io_context io;
    auto table = PendingRequestTable::Create(io);
    Outcome outcome;
    REQUIRE(table->Register("dup", 5s, outcome.Handler()).IsOk());
    auto again = table->Register("dup", 5s, outcome.Handler());
    REQUIRE(again.IsErr());
    REQUIRE(again.UnwrapErr().type == ProtocolFailureType::InvalidState);
    REQUIRE(table->Size() == 1);
}

TEST_CASE("PendingRequestTable - Entries expire with RequestTimeout", "[rpc][timeout]") {
    boost::asio::io_context io;
    auto table = PendingRequestTable::Create(io);
    Outcome fast;
    Outcome slow;
    REQUIRE(table->Register("fast", 20ms, fast.Handler()).IsOk());
    REQUIRE(table->Register("slow", 10s, slow.Handler()).IsOk());

    io.run_for(200ms);

    REQUIRE(fast.calls == 1);
    REQUIRE(fast.result->IsErr());
    REQUIRE(fast.result->UnwrapErr().type == ProtocolFailureType::RequestTimeout);
    REQUIRE(fast.result->UnwrapErr().message == "Request timeout");
    REQUIRE(slow.calls == 0);
    REQUIRE(table->Contains("slow"));

    SECTION("A response after the timeout is dropped") {
        REQUIRE_FALSE(table->Resolve("fast", json::object()));
        REQUIRE(fast.calls == 1);
    }
}

TEST_CASE("PendingRequestTable - Resolved entries never time out", "[rpc][timeout]") {
    boost::asio::io_context io;
    auto table = PendingRequestTable::Create(io);
    Outcome outcome;
    REQUIRE(table->Register("r", 20ms, outcome.Handler()).IsOk());
    REQUIRE(table->Resolve("r", json::object()));
    io.run_for(100ms);
    REQUIRE(outcome.calls == 1);
    REQUIRE(outcome.result->IsOk());
}

TEST_CASE("PendingRequestTable - Reject and RejectAll", "[rpc][correlation]") {
    boost::asio::io_context io;
    auto table = PendingRequestTable::Create(io);
    std::vector<Outcome> outcomes(3);
    for (size_t i = 0; i < outcomes.size(); ++i) {
        REQUIRE(table->Register("id-" + std::to_string(i), 50ms, outcomes[i].Handler()).IsOk());
    }

    REQUIRE(table->Reject("id-0", ProtocolFailure::Transport("write failed")));
    REQUIRE(outcomes[0].result->UnwrapErr().type == ProtocolFailureType::Transport);

    REQUIRE(table->RejectAll(ProtocolFailure::Disconnected("Disconnected by client")) == 2);
    REQUIRE(table->Size() == 0);
    io.run_for(150ms);
    for (const auto& outcome : outcomes) {
        REQUIRE(outcome.calls == 1);
    }
    REQUIRE(outcomes[2].result->UnwrapErr().type == ProtocolFailureType::Disconnected);
}

TEST_CASE("PendingRequestTable - Discard drops an entry silently", "[rpc][correlation]") {
    boost::asio::io_context io;
    auto table = PendingRequestTable::Create(io);
    Outcome outcome;
    REQUIRE(table->Register("a", 20ms, outcome.Handler()).IsOk());

    REQUIRE(table->Discard("a"));
    REQUIRE_FALSE(table->Discard("a"));
    REQUIRE_FALSE(table->Contains("a"));

    io.run_for(60ms);
    REQUIRE(outcome.calls == 0);
    REQUIRE_FALSE(table->Resolve("a", json::object()));
}
