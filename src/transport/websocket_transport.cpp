#include "vaultbridge/transport/websocket_transport.hpp"
#include "vaultbridge/core/constants.hpp"
#include "vaultbridge/core/format.hpp"
#include "vaultbridge/core/logging.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket/error.hpp>
#include <boost/beast/websocket/rfc6455.hpp>

#include <chrono>
#include <utility>

namespace vaultbridge::protocol::transport {
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

namespace {
    constexpr std::string_view kScheme = "ws://";
    constexpr std::string_view kDefaultPort = "80";
    constexpr auto kConnectTimeout = std::chrono::seconds(30);
}

Result<WebSocketEndpoint, ProtocolFailure> ParseWebSocketUrl(std::string_view url) {
    using EndpointResult = Result<WebSocketEndpoint, ProtocolFailure>;
    if (url.substr(0, kScheme.size()) != kScheme) {
        return EndpointResult::Err(ProtocolFailure::InvalidInput(
            compat::format("Unsupported bridge URL '{}': expected ws://host[:port][/path]", url)));
    }
    std::string_view rest = url.substr(kScheme.size());
    WebSocketEndpoint endpoint;
    const auto slash = rest.find('/');
    std::string_view authority = rest.substr(0, slash);
    endpoint.target = slash == std::string_view::npos ? "/" : std::string(rest.substr(slash));
    const auto colon = authority.rfind(':');
    if (colon == std::string_view::npos) {
        endpoint.host = std::string(authority);
        endpoint.port = std::string(kDefaultPort);
    } else {
        endpoint.host = std::string(authority.substr(0, colon));
        endpoint.port = std::string(authority.substr(colon + 1));
        if (endpoint.port.empty() ||
            endpoint.port.find_first_not_of("0123456789") != std::string::npos) {
            return EndpointResult::Err(ProtocolFailure::InvalidInput(
                compat::format("Invalid port in bridge URL '{}'", url)));
        }
    }
    if (endpoint.host.empty()) {
        return EndpointResult::Err(ProtocolFailure::InvalidInput(
            compat::format("Missing host in bridge URL '{}'", url)));
    }
    return EndpointResult::Ok(std::move(endpoint));
}

std::shared_ptr<WebSocketTransport> WebSocketTransport::Create(boost::asio::io_context& io) {
    return std::shared_ptr<WebSocketTransport>(new WebSocketTransport(io));
}

WebSocketTransport::WebSocketTransport(boost::asio::io_context& io)
    : strand_(boost::asio::make_strand(io))
    , resolver_(strand_) {}

void WebSocketTransport::OnMessage(MessageHandler handler) {
    on_message_ = std::move(handler);
}

void WebSocketTransport::OnClose(CloseHandler handler) {
    on_close_ = std::move(handler);
}

void WebSocketTransport::OnError(ErrorHandler handler) {
    on_error_ = std::move(handler);
}

bool WebSocketTransport::IsOpen() const {
    return open_.load(std::memory_order_acquire);
}

void WebSocketTransport::Connect(const std::string& url, OpenHandler on_open) {
    auto endpoint = ParseWebSocketUrl(url);
    if (endpoint.IsErr()) {
        boost::asio::post(strand_, [on_open = std::move(on_open), failure = std::move(endpoint).UnwrapErr()]() {
            on_open(Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Transport(failure.message)));
        });
        return;
    }
    boost::asio::post(strand_, [self = shared_from_this(), endpoint = std::move(endpoint).Unwrap(),
                                on_open = std::move(on_open)]() mutable {
        if (self->IsOpen()) {
            on_open(Result<Unit, ProtocolFailure>::Ok(unit));
            return;
        }
        const uint64_t generation = ++self->generation_;
        self->CompleteOpen(Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Transport("Superseded by a new connection attempt")));
        self->pending_open_ = std::move(on_open);
        self->StartConnect(std::move(endpoint), generation);
    });
}

void WebSocketTransport::CompleteOpen(Result<Unit, ProtocolFailure> result) {
    auto handler = std::exchange(pending_open_, nullptr);
    if (handler) {
        handler(std::move(result));
    }
}

void WebSocketTransport::StartConnect(WebSocketEndpoint endpoint, const uint64_t generation) {
    stream_ = std::make_shared<Stream>(strand_);
    read_buffer_.clear();
    write_queue_.clear();
    auto fail_open = [](const std::shared_ptr<WebSocketTransport>& self,
                        const std::string& stage, const beast::error_code& ec) {
        self->CompleteOpen(Result<Unit, ProtocolFailure>::Err(ProtocolFailure::Transport(
            compat::format("{} failed: {}", stage, ec.message()))));
    };

    const std::string host = endpoint.host;
    const std::string port = endpoint.port;
    resolver_.async_resolve(host, port,
        [self = shared_from_this(), endpoint = std::move(endpoint), fail_open, generation](
            const beast::error_code& ec, tcp::resolver::results_type results) {
            if (generation != self->generation_) {
                return;
            }
            if (ec) {
                fail_open(self, "Resolve", ec);
                return;
            }
            auto stream = self->stream_;
            beast::get_lowest_layer(*stream).expires_after(kConnectTimeout);
            beast::get_lowest_layer(*stream).async_connect(results,
                [self, stream, endpoint, fail_open, generation](
                    const beast::error_code& connect_ec, const tcp::endpoint& remote) {
                    if (generation != self->generation_) {
                        return;
                    }
                    if (connect_ec) {
                        fail_open(self, "Connect", connect_ec);
                        return;
                    }
                    beast::get_lowest_layer(*stream).expires_never();
                    stream->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
                    stream->text(true);
                    const std::string host_header = endpoint.host + ":" + std::to_string(remote.port());
                    stream->async_handshake(host_header, endpoint.target,
                        [self, fail_open, generation](const beast::error_code& handshake_ec) {
                            if (generation != self->generation_) {
                                return;
                            }
                            if (handshake_ec) {
                                fail_open(self, "WebSocket handshake", handshake_ec);
                                return;
                            }
                            self->open_.store(true, std::memory_order_release);
                            logging::Get()->debug("WebSocket transport open");
                            self->CompleteOpen(Result<Unit, ProtocolFailure>::Ok(unit));
                            self->ReadLoop(generation);
                        });
                });
        });
}

void WebSocketTransport::ReadLoop(const uint64_t generation) {
    auto stream = stream_;
    stream->async_read(read_buffer_,
        [self = shared_from_this(), stream, generation](const beast::error_code& ec, std::size_t) {
            if (generation != self->generation_) {
                return;
            }
            if (ec == websocket::error::closed) {
                self->open_.store(false, std::memory_order_release);
                ++self->generation_;
                self->write_queue_.clear();
                logging::Get()->info("WebSocket closed by peer");
                if (self->on_close_) {
                    self->on_close_();
                }
                return;
            }
            if (ec) {
                self->Fail(compat::format("Read failed: {}", ec.message()), generation);
                return;
            }
            std::string frame = beast::buffers_to_string(self->read_buffer_.data());
            self->read_buffer_.consume(self->read_buffer_.size());
            if (self->on_message_) {
                self->on_message_(frame);
            }
            if (generation == self->generation_) {
                self->ReadLoop(generation);
            }
        });
}

Result<Unit, ProtocolFailure> WebSocketTransport::Send(std::string message) {
    if (!IsOpen()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Transport(std::string(ErrorMessages::NOT_CONNECTED)));
    }
    boost::asio::post(strand_, [self = shared_from_this(), message = std::move(message)]() mutable {
        if (!self->IsOpen()) {
            logging::Get()->warn("Dropping outbound frame: transport closed before write");
            return;
        }
        self->write_queue_.push_back(std::move(message));
        if (self->write_queue_.size() == 1) {
            self->WriteNext(self->generation_);
        }
    });
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

void WebSocketTransport::WriteNext(const uint64_t generation) {
    if (write_queue_.empty()) {
        return;
    }
    auto stream = stream_;
    stream->async_write(boost::asio::buffer(write_queue_.front()),
        [self = shared_from_this(), stream, generation](const beast::error_code& ec, std::size_t) {
            if (generation != self->generation_) {
                return;
            }
            if (ec) {
                self->Fail(compat::format("Write failed: {}", ec.message()), generation);
                return;
            }
            self->write_queue_.pop_front();
            self->WriteNext(generation);
        });
}

void WebSocketTransport::Fail(const std::string& what, const uint64_t generation) {
    if (generation != generation_) {
        return;
    }
    ++generation_;
    const bool was_open = open_.exchange(false, std::memory_order_acq_rel);
    write_queue_.clear();
    if (stream_) {
        beast::error_code ignored;
        beast::get_lowest_layer(*stream_).socket().close(ignored);
    }
    logging::Get()->error("WebSocket transport error: {}", what);
    if (was_open && on_error_) {
        on_error_(ProtocolFailure::Transport(what));
    }
}

void WebSocketTransport::Close() {
    open_.store(false, std::memory_order_release);
    boost::asio::post(strand_, [self = shared_from_this()]() {
        ++self->generation_;
        self->resolver_.cancel();
        self->write_queue_.clear();
        self->CompleteOpen(Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Transport(std::string(ErrorMessages::CONNECTION_CLOSED))));
        auto stream = self->stream_;
        if (!stream) {
            return;
        }
        if (!stream->is_open()) {
            beast::error_code ignored;
            beast::get_lowest_layer(*stream).socket().close(ignored);
            return;
        }
        stream->async_close(websocket::close_code::normal, [stream](const beast::error_code& ec) {
            if (ec) {
                logging::Get()->debug("WebSocket close handshake ended with: {}", ec.message());
            }
        });
    });
}

}
