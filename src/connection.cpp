#include "connection.hpp"
#include "certificate_manager.hpp"

Connection::Connection(asio::ip::tcp::socket socket, asio::ssl::context& context, Logger* logger)
: stream_(std::move(socket), context), logger_(logger)
{
}

Connection::~Connection(){
    std::error_code ec;
    stream_.lowest_layer().close(ec);
}

std::string Connection::remote_address() const {
    std::error_code ec;
    auto endpoint = stream_.lowest_layer().remote_endpoint(ec);
    if(ec) return "<unknown>";
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

void Connection::async_connect(const asio::ip::tcp::endpoint& endpoint,
                               std::function<void(const std::error_code&)> handler){
    auto self = shared_from_this();
    stream_.lowest_layer().async_connect(endpoint,
        [this, self, handler = std::move(handler)](const std::error_code& ec) mutable {
            if(ec){
                handler(ec);
                return;
            }
            std::error_code nodelay_ec;
            stream_.lowest_layer().set_option(asio::ip::tcp::no_delay(true), nodelay_ec);
            stream_.async_handshake(asio::ssl::stream_base::client,
                [self, handler = std::move(handler)](const std::error_code& hec){
                    handler(hec);
                });
        });
}

void Connection::async_accept(std::function<void(const std::error_code&)> handler){
    auto self = shared_from_this();
    std::error_code nodelay_ec;
    stream_.lowest_layer().set_option(asio::ip::tcp::no_delay(true), nodelay_ec);
    stream_.async_handshake(asio::ssl::stream_base::server,
        [self, handler = std::move(handler)](const std::error_code& ec){
            handler(ec);
        });
}

std::optional<std::vector<uint8_t>> Connection::peer_certificate_der(){
    return CertificateManager::peer_certificate_der(stream_.native_handle());
}

void Connection::start_reading(FrameHandler on_frame, ErrorHandler on_error){
    on_frame_ = std::move(on_frame);
    on_error_ = std::move(on_error);
    do_read_header();
}

void Connection::do_read_header(){
    if(!open_) return;
    auto self = shared_from_this();
    asio::async_read(stream_, asio::buffer(header_),
        [this, self](const std::error_code& ec, std::size_t){
            if(ec){
                fail(ec);
                return;
            }
            FrameType type{};
            uint32_t length = 0;
            if(!decode_frame_header(header_.data(), max_body_, type, length)){
                log_warn(logger_, "rejecting frame header from {} (type {}, limit {})",
                         remote_address(), header_[0], max_body_);
                fail(asio::error::invalid_argument);
                return;
            }
            do_read_body(type, length);
        });
}

void Connection::do_read_body(FrameType type, uint32_t length){
    body_.resize(length);
    auto self = shared_from_this();
    asio::async_read(stream_, asio::buffer(body_),
        [this, self, type](const std::error_code& ec, std::size_t){
            if(ec){
                fail(ec);
                return;
            }
            Frame frame;
            frame.type = type;
            frame.body.swap(body_);
            // The handler may close this connection; keep it alive for the call.
            auto handler = on_frame_;
            if(handler) handler(std::move(frame));
            do_read_header();
        });
}

void Connection::send(std::vector<uint8_t> frame){
    if(!open_) return;
    bool start_write = write_queue_.empty();
    write_queue_.push_back(std::move(frame));
    if(start_write){
        do_write();
    }
}

void Connection::do_write(){
    if(write_queue_.empty()) return;
    auto self = shared_from_this();
    asio::async_write(stream_, asio::buffer(write_queue_.front()),
        [this, self](const std::error_code& ec, std::size_t){
            if(ec){
                fail(ec);
                return;
            }
            write_queue_.pop_front();
            if(!write_queue_.empty()){
                do_write();
            } else if(close_when_idle_){
                close();
            }
        });
}

void Connection::close_after_flush(){
    if(write_queue_.empty()){
        close();
    } else {
        close_when_idle_ = true;
    }
}

void Connection::close(){
    if(!open_) return;
    open_ = false;
    std::error_code ec;
    stream_.lowest_layer().shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    stream_.lowest_layer().close(ec);
    on_frame_ = nullptr;
    on_error_ = nullptr;
}

void Connection::fail(const std::error_code& ec){
    if(!open_) return;
    auto handler = std::move(on_error_);
    close();
    if(handler) handler(ec);
}
