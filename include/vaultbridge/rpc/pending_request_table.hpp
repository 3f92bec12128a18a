#pragma once
#include "vaultbridge/core/failures.hpp"
#include "vaultbridge/core/result.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace vaultbridge::protocol::rpc {

/**
 * @brief requestId -> completion handler with a per-entry deadline.
 *
 * Every registered handler runs exactly once: with the decrypted body on
 * Resolve, with RequestTimeout when its timer fires, or with the supplied
 * failure on Reject/RejectAll. Handlers are invoked outside the lock.
 */
class PendingRequestTable : public std::enable_shared_from_this<PendingRequestTable> {
public:
    using CompletionHandler = std::function<void(Result<nlohmann::json, ProtocolFailure>)>;

    [[nodiscard]] static std::shared_ptr<PendingRequestTable> Create(boost::asio::io_context& io);

    // Fails with InvalidState if request_id is already pending.
    Result<Unit, ProtocolFailure> Register(
        const std::string& request_id,
        std::chrono::milliseconds timeout,
        CompletionHandler handler);

    // Returns false for stray or late responses.
    bool Resolve(const std::string& request_id, nlohmann::json body);

    bool Reject(const std::string& request_id, const ProtocolFailure& failure);

    // Removes the entry without running its handler; the caller completes it.
    bool Discard(const std::string& request_id);

    size_t RejectAll(const ProtocolFailure& failure);

    [[nodiscard]] size_t Size() const;
    [[nodiscard]] bool Contains(const std::string& request_id) const;

    PendingRequestTable(const PendingRequestTable&) = delete;
    PendingRequestTable& operator=(const PendingRequestTable&) = delete;

private:
    struct Entry {
        CompletionHandler handler;
        std::unique_ptr<boost::asio::steady_timer> timer;
    };

    explicit PendingRequestTable(boost::asio::io_context& io);

    std::optional<Entry> Take(const std::string& request_id);
    void Expire(const std::string& request_id);

    boost::asio::io_context& io_;
    mutable std::unique_ptr<std::mutex> lock_;
    std::unordered_map<std::string, Entry> entries_;
};

}
