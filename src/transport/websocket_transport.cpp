#include "websocket_transport.hpp"
#include <utility>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include "../core/errors/errors.hpp"
#include "../core/logger/logger.hpp"
#include "../core/types/constants.hpp"
#include "../utils/url/url.hpp"

namespace Tether {
namespace Transport {

namespace beast     = boost::beast;
namespace websocket = beast::websocket;
namespace net       = boost::asio;
using tcp           = net::ip::tcp;

using namespace Tether::Core;

constexpr auto kConnectTimeout = std::chrono::seconds(10);

WebSocketTransport::WebSocketTransport(const net::any_io_executor& ex, std::size_t max_message_size)
    : strand_(net::make_strand(ex)), ws_(strand_) {
    ws_.read_message_max(max_message_size);
}

net::awaitable<std::shared_ptr<WebSocketTransport>>
WebSocketTransport::connect(const net::any_io_executor& ex,
                            const std::string&          url,
                            std::size_t                 max_message_size) {
    auto transport = std::make_shared<WebSocketTransport>(ex, max_message_size);
    co_await transport->handshake(url);
    co_return transport;
}

net::awaitable<void> WebSocketTransport::handshake(const std::string& url) {
    auto parsed = Utils::Url::parse(url);
    if (parsed.scheme != "ws" || parsed.host.empty())
        throw TransportFault("Unsupported endpoint: " + url, CloseReason::TransportError);

    try {
        tcp::resolver resolver(strand_);
        auto results = co_await resolver.async_resolve(parsed.host, parsed.port, net::use_awaitable);

        beast::get_lowest_layer(ws_).expires_after(kConnectTimeout);
        co_await beast::get_lowest_layer(ws_).async_connect(results, net::use_awaitable);
        beast::get_lowest_layer(ws_).expires_never();

        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, Constants::USER_AGENT);
        }));

        co_await ws_.async_handshake(parsed.host + ":" + parsed.port, parsed.target(),
                                     net::use_awaitable);
    } catch (const boost::system::system_error& e) {
        throw TransportFault("WebSocket connect to " + url + " failed: " + e.code().message(),
                             CloseReason::TransportError);
    }

    ws_.text(true);
    open_ = true;
    Logger::info("Transport: connected to " + url);
}

net::any_io_executor WebSocketTransport::get_executor() {
    return strand_;
}

void WebSocketTransport::write_frame(std::string frame) {
    if (!open_)
        throw TransportFault("WebSocket is not open", fault_.load());

    net::post(strand_, [self = shared_from_this(), frame = std::move(frame)]() mutable {
        if (self->closing_ || self->write_failed_)
            return;
        self->queue_.push_back(std::move(frame));
        if (self->queue_.size() == 1)
            self->do_write();
    });
}

void WebSocketTransport::do_write() {
    ws_.async_write(
        net::buffer(queue_.front()),
        net::bind_executor(strand_,
                           [self = shared_from_this()](beast::error_code ec, std::size_t) {
                               if (ec) {
                                   Logger::warn("Transport: write failed: " + ec.message());
                                   self->write_failed_ = true;
                                   self->fault_        = CloseReason::TransportError;
                                   self->open_         = false;
                                   self->queue_.clear();
                                   beast::error_code ignored;
                                   beast::get_lowest_layer(self->ws_).socket().close(ignored);
                                   return;
                               }
                               self->queue_.pop_front();
                               if (!self->queue_.empty())
                                   self->do_write();
                               else if (self->closing_)
                                   self->do_close();
                           }));
}

net::awaitable<std::string> WebSocketTransport::read_frame() {
    try {
        co_await ws_.async_read(buffer_, net::use_awaitable);
    } catch (const boost::system::system_error& e) {
        const auto code = e.code();
        bool clean = !write_failed_
                     && (code == websocket::error::closed || code == net::error::eof
                         || code == net::error::operation_aborted);
        if (!clean)
            fault_ = CloseReason::TransportError;
        open_ = false;
        throw TransportFault("WebSocket read ended: " + code.message(), fault_.load());
    }

    std::string frame = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    co_return frame;
}

void WebSocketTransport::close() {
    net::post(strand_, [self = shared_from_this()]() {
        if (self->closing_)
            return;
        self->closing_ = true;
        self->open_    = false;
        if (self->queue_.empty())
            self->do_close();
    });
}

void WebSocketTransport::do_close() {
    if (!ws_.is_open()) {
        beast::error_code ignored;
        beast::get_lowest_layer(ws_).socket().close(ignored);
        return;
    }
    ws_.async_close(websocket::close_code::normal,
                    net::bind_executor(strand_, [self = shared_from_this()](beast::error_code ec) {
                        if (ec)
                            Logger::debug("Transport: close handshake: " + ec.message());
                    }));
}

bool WebSocketTransport::is_open() const {
    return open_;
}

}  // namespace Transport
}  // namespace Tether
