#pragma once
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <string>

namespace Tether {
namespace Transport {

/// Bidirectional text-frame channel to the remote debugging endpoint.
///
/// get_executor() must return a strand: the connection runs its receive
/// loop on it and the transport serializes its own I/O there.
class Transport {
public:
    virtual ~Transport() = default;

    virtual boost::asio::any_io_executor get_executor() = 0;

    // Queues one frame for sending. Throws Core::TransportFault when the
    // channel is no longer usable.
    virtual void write_frame(std::string frame) = 0;

    // Completes with the next inbound frame. Throws Core::TransportFault
    // tagged TransportClosed on a clean shutdown, TransportError otherwise.
    virtual boost::asio::awaitable<std::string> read_frame() = 0;

    virtual void close()         = 0;
    virtual bool is_open() const = 0;
};

}  // namespace Transport
}  // namespace Tether
