#pragma once
#include <boost/asio/any_io_executor.hpp>
#include <memory>
#include <utility>
#include "transport.hpp"

namespace Tether {
namespace Transport {

/// In-process transport: two endpoints sharing one channel, each reading
/// what the other writes. Used to embed a protocol peer in the same
/// process and by the test suite.
class MemoryTransport : public Transport {
public:
    using Endpoint = std::shared_ptr<MemoryTransport>;

    static std::pair<Endpoint, Endpoint> pair(const boost::asio::any_io_executor& ex);

    boost::asio::any_io_executor        get_executor() override;
    void                                write_frame(std::string frame) override;
    boost::asio::awaitable<std::string> read_frame() override;
    void                                close() override;
    bool                                is_open() const override;

    // Breaks the channel for both endpoints as a transport error would.
    void fail(const std::string& why);

    std::size_t frames_written() const;

    struct Channel;

    MemoryTransport(std::shared_ptr<Channel> channel, int side, boost::asio::any_io_executor ex);

private:
    std::shared_ptr<Channel>     channel_;
    int                          side_;
    boost::asio::any_io_executor strand_;
};

}  // namespace Transport
}  // namespace Tether
