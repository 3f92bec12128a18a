#pragma once
#include "vaultbridge/core/failures.hpp"
#include "vaultbridge/core/result.hpp"
#include <functional>
#include <string>
#include <string_view>
namespace vaultbridge::protocol {

/**
 * Message-oriented duplex connection to the vault bridge.
 *
 * Handlers run on the transport's executor. A failed open is reported only
 * through the open handler. After a successful open, exactly one of the close
 * or error handlers fires when the connection ends, unless Close() was called
 * locally, in which case neither fires.
 */
class ITransport {
public:
    using OpenHandler = std::function<void(Result<Unit, ProtocolFailure>)>;
    using MessageHandler = std::function<void(std::string_view)>;
    using CloseHandler = std::function<void()>;
    using ErrorHandler = std::function<void(const ProtocolFailure&)>;

    virtual ~ITransport() = default;

    virtual void Connect(const std::string& url, OpenHandler on_open) = 0;
    virtual Result<Unit, ProtocolFailure> Send(std::string message) = 0;
    virtual void OnMessage(MessageHandler handler) = 0;
    virtual void OnClose(CloseHandler handler) = 0;
    virtual void OnError(ErrorHandler handler) = 0;
    virtual void Close() = 0;
    [[nodiscard]] virtual bool IsOpen() const = 0;
};

}
