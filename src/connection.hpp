#pragma once
#include <asio.hpp>
#include <asio/ssl.hpp>

#include <array>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"
#include "protocol.hpp"

// One TLS stream carrying length-prefixed frames. All completion handlers run
// on the socket's executor, which callers construct as a strand; every method
// must be called from that strand.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using Stream = asio::ssl::stream<asio::ip::tcp::socket>;
    using FrameHandler = std::function<void(Frame&& frame)>;
    using ErrorHandler = std::function<void(const std::error_code& ec)>;

    Connection(asio::ip::tcp::socket socket, asio::ssl::context& context, Logger* logger);
    ~Connection();

    asio::any_io_executor executor() { return stream_.get_executor(); }
    Stream& stream() { return stream_; }
    std::string remote_address() const;

    // Connect then run the client side of the TLS handshake.
    void async_connect(const asio::ip::tcp::endpoint& endpoint, std::function<void(const std::error_code&)> handler);
    // Server side of the TLS handshake on an accepted socket.
    void async_accept(std::function<void(const std::error_code&)> handler);
    std::optional<std::vector<uint8_t>> peer_certificate_der();

    void set_max_body(std::size_t bytes) { max_body_ = bytes; }
    // Reads frames until close() or an error. A frame with an unknown type or
    // an oversize body is reported as asio::error::invalid_argument.
    void start_reading(FrameHandler on_frame, ErrorHandler on_error);

    void send(std::vector<uint8_t> frame);
    // Closes once every queued frame has been written.
    void close_after_flush();
    void close();
    bool is_open() const { return open_; }

private:
    void do_read_header();
    void do_read_body(FrameType type, uint32_t length);
    void do_write();
    void fail(const std::error_code& ec);

    Stream stream_;
    Logger* logger_ = nullptr;
    std::size_t max_body_ = 4096;
    std::array<uint8_t, kFrameHeaderBytes> header_{};
    std::vector<uint8_t> body_;
    std::deque<std::vector<uint8_t>> write_queue_;
    FrameHandler on_frame_;
    ErrorHandler on_error_;
    bool open_ = true;
    bool close_when_idle_ = false;
};
