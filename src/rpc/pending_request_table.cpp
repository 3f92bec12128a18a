#include "vaultbridge/rpc/pending_request_table.hpp"
#include "vaultbridge/core/constants.hpp"
#include "vaultbridge/core/format.hpp"
#include "vaultbridge/core/logging.hpp"

#include <vector>

namespace vaultbridge::protocol::rpc {

std::shared_ptr<PendingRequestTable> PendingRequestTable::Create(boost::asio::io_context& io) {
    return std::shared_ptr<PendingRequestTable>(new PendingRequestTable(io));
}

PendingRequestTable::PendingRequestTable(boost::asio::io_context& io)
    : io_(io)
    , lock_(std::make_unique<std::mutex>()) {}

Result<Unit, ProtocolFailure> PendingRequestTable::Register(
    const std::string& request_id,
    const std::chrono::milliseconds timeout,
    CompletionHandler handler) {
    auto timer = std::make_unique<boost::asio::steady_timer>(io_, timeout);
    {
        std::lock_guard guard(*lock_);
        if (entries_.contains(request_id)) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidState(
                compat::format("Request {} is already pending", request_id)));
        }
        timer->async_wait([weak = weak_from_this(), request_id](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) {
                return;
            }
            if (auto self = weak.lock()) {
                self->Expire(request_id);
            }
        });
        entries_.emplace(request_id, Entry{std::move(handler), std::move(timer)});
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

std::optional<PendingRequestTable::Entry> PendingRequestTable::Take(const std::string& request_id) {
    std::lock_guard guard(*lock_);
    auto it = entries_.find(request_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    Entry entry = std::move(it->second);
    entries_.erase(it);
    entry.timer->cancel();
    return entry;
}

bool PendingRequestTable::Resolve(const std::string& request_id, nlohmann::json body) {
    auto entry = Take(request_id);
    if (!entry.has_value()) {
        return false;
    }
    entry->handler(Result<nlohmann::json, ProtocolFailure>::Ok(std::move(body)));
    return true;
}

bool PendingRequestTable::Reject(const std::string& request_id, const ProtocolFailure& failure) {
    auto entry = Take(request_id);
    if (!entry.has_value()) {
        return false;
    }
    entry->handler(Result<nlohmann::json, ProtocolFailure>::Err(failure));
    return true;
}

bool PendingRequestTable::Discard(const std::string& request_id) {
    return Take(request_id).has_value();
}

void PendingRequestTable::Expire(const std::string& request_id) {
    auto entry = Take(request_id);
    if (!entry.has_value()) {
        return;
    }
    logging::Get()->warn("Request {} timed out", request_id);
    entry->handler(Result<nlohmann::json, ProtocolFailure>::Err(
        ProtocolFailure::RequestTimeout(std::string(ErrorMessages::REQUEST_TIMEOUT))));
}

size_t PendingRequestTable::RejectAll(const ProtocolFailure& failure) {
    std::vector<Entry> drained;
    {
        std::lock_guard guard(*lock_);
        drained.reserve(entries_.size());
        for (auto& [id, entry] : entries_) {
            entry.timer->cancel();
            drained.push_back(std::move(entry));
        }
        entries_.clear();
    }
    for (auto& entry : drained) {
        entry.handler(Result<nlohmann::json, ProtocolFailure>::Err(failure));
    }
    return drained.size();
}

size_t PendingRequestTable::Size() const {
    std::lock_guard guard(*lock_);
    return entries_.size();
}

bool PendingRequestTable::Contains(const std::string& request_id) const {
    std::lock_guard guard(*lock_);
    return entries_.contains(request_id);
}

}
