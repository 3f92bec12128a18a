#pragma once
#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/websocket/error.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <boost/beast/websocket/stream.hpp>

#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace vaultbridge::protocol::test_helpers {

/**
 * Single-session Beast WebSocket server on 127.0.0.1 with an ephemeral port.
 * Runs on the test's io_context; the test thread pumps it.
 */
class LoopbackWebSocketServer {
public:
    using tcp = boost::asio::ip::tcp;
    using Stream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    explicit LoopbackWebSocketServer(boost::asio::io_context& io)
        : acceptor_(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)) {
        Accept();
    }

    [[nodiscard]] std::string Url(const std::string& path = "/bridge") const {
        return "ws://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port()) + path;
    }

    void SetEcho(const bool echo) { echo_ = echo; }

    void Send(std::string frame) {
        outbox_.push_back(std::move(frame));
        if (outbox_.size() == 1) {
            WriteNext();
        }
    }

    // Completes the WebSocket closing handshake from the server side.
    void CloseGracefully() {
        ws_->async_close(boost::beast::websocket::close_code::normal, [](const boost::beast::error_code&) {});
    }

    // Tears down TCP without a close frame.
    void DropConnection() {
        boost::beast::error_code ignored;
        boost::beast::get_lowest_layer(*ws_).socket().shutdown(tcp::socket::shutdown_both, ignored);
        boost::beast::get_lowest_layer(*ws_).socket().close(ignored);
    }

    [[nodiscard]] bool Accepted() const { return accepted_; }
    [[nodiscard]] bool PeerClosed() const { return peer_closed_; }
    [[nodiscard]] const std::string& Target() const { return target_; }
    [[nodiscard]] const std::vector<std::string>& Received() const { return received_; }

private:
    void Accept() {
        acceptor_.async_accept([this](const boost::beast::error_code& ec, tcp::socket socket) {
            if (ec) {
                return;
            }
            ws_ = std::make_unique<Stream>(std::move(socket));
            boost::beast::http::async_read(ws_->next_layer(), http_buffer_, request_,
                [this](const boost::beast::error_code& read_ec, std::size_t) {
                    if (read_ec) {
                        return;
                    }
                    target_ = std::string(request_.target());
                    ws_->async_accept(request_, [this](const boost::beast::error_code& accept_ec) {
                        if (accept_ec) {
                            return;
                        }
                        ws_->text(true);
                        accepted_ = true;
                        Read();
                    });
                });
        });
    }

    void Read() {
        ws_->async_read(read_buffer_, [this](const boost::beast::error_code& ec, std::size_t) {
            if (ec == boost::beast::websocket::error::closed) {
                peer_closed_ = true;
                return;
            }
            if (ec) {
                return;
            }
            received_.push_back(boost::beast::buffers_to_string(read_buffer_.data()));
            read_buffer_.consume(read_buffer_.size());
            if (echo_) {
                Send(received_.back());
            }
            Read();
        });
    }

    void WriteNext() {
        ws_->async_write(boost::asio::buffer(outbox_.front()),
            [this](const boost::beast::error_code& ec, std::size_t) {
                if (ec) {
                    return;
                }
                outbox_.pop_front();
                if (!outbox_.empty()) {
                    WriteNext();
                }
            });
    }

    tcp::acceptor acceptor_;
    std::unique_ptr<Stream> ws_;
    boost::beast::flat_buffer http_buffer_;
    boost::beast::http::request<boost::beast::http::string_body> request_;
    boost::beast::flat_buffer read_buffer_;
    std::deque<std::string> outbox_;
    std::vector<std::string> received_;
    std::string target_;
    bool echo_ = false;
    bool accepted_ = false;
    bool peer_closed_ = false;
};

}
