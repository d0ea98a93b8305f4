#pragma once
#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <deque>
#include <memory>
#include <string>
#include "../core/errors/errors.hpp"
#include "transport.hpp"

namespace Tether {
namespace Transport {

/// CDP transport over a plain (ws://) WebSocket using Boost.Beast.
class WebSocketTransport : public Transport,
                           public std::enable_shared_from_this<WebSocketTransport> {
public:
    WebSocketTransport(const boost::asio::any_io_executor& ex, std::size_t max_message_size);

    // Resolves, connects and performs the upgrade handshake.
    static boost::asio::awaitable<std::shared_ptr<WebSocketTransport>>
    connect(const boost::asio::any_io_executor& ex,
            const std::string&                  url,
            std::size_t                         max_message_size);

    boost::asio::any_io_executor        get_executor() override;
    void                                write_frame(std::string frame) override;
    boost::asio::awaitable<std::string> read_frame() override;
    void                                close() override;
    bool                                is_open() const override;

private:
    boost::asio::awaitable<void> handshake(const std::string& url);
    void                         do_write();
    void                         do_close();

    boost::asio::any_io_executor                              strand_;
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::beast::flat_buffer                                 buffer_;
    std::deque<std::string>                                   queue_;
    std::atomic<bool>                                         open_{false};
    bool                                                      closing_      = false;
    bool                                                      write_failed_ = false;
    // Why the socket went away; reported by later writes.
    std::atomic<Core::CloseReason> fault_{Core::CloseReason::TransportClosed};
};

}  // namespace Transport
}  // namespace Tether
