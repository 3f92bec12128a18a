#pragma once
#include "vaultbridge/interfaces/i_transport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>

namespace vaultbridge::protocol::transport {

struct WebSocketEndpoint {
    std::string host;
    std::string port;
    std::string target;
};

// Accepts ws://host[:port][/path]; port defaults to 80 and path to "/".
[[nodiscard]] Result<WebSocketEndpoint, ProtocolFailure> ParseWebSocketUrl(std::string_view url);

/**
 * ITransport over a Boost.Beast WebSocket client.
 *
 * All socket work runs on a strand of the supplied io_context; Send may be
 * called from any thread and queues text frames, written one at a time.
 * Closing while an open is in flight fails that open with Transport.
 */
class WebSocketTransport final
    : public ITransport
    , public std::enable_shared_from_this<WebSocketTransport> {
public:
    [[nodiscard]] static std::shared_ptr<WebSocketTransport> Create(boost::asio::io_context& io);

    void Connect(const std::string& url, OpenHandler on_open) override;
    Result<Unit, ProtocolFailure> Send(std::string message) override;
    void OnMessage(MessageHandler handler) override;
    void OnClose(CloseHandler handler) override;
    void OnError(ErrorHandler handler) override;
    void Close() override;
    [[nodiscard]] bool IsOpen() const override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

private:
    using Stream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    explicit WebSocketTransport(boost::asio::io_context& io);

    void StartConnect(WebSocketEndpoint endpoint, uint64_t generation);
    // Runs the in-flight open handler, if any, exactly once.
    void CompleteOpen(Result<Unit, ProtocolFailure> result);
    void ReadLoop(uint64_t generation);
    void WriteNext(uint64_t generation);
    void Fail(const std::string& what, uint64_t generation);

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::ip::tcp::resolver resolver_;
    std::shared_ptr<Stream> stream_;
    boost::beast::flat_buffer read_buffer_;
    std::deque<std::string> write_queue_;
    OpenHandler pending_open_;
    std::atomic<bool> open_{false};
    // Bumped on every Connect/Close so callbacks from a torn-down stream are ignored.
    uint64_t generation_ = 0;

    MessageHandler on_message_;
    CloseHandler on_close_;
    ErrorHandler on_error_;
};

}
