#include "memory_transport.hpp"
#include <utility>
#include <boost/asio/strand.hpp>
#include <deque>
#include <mutex>
#include "../cdp/waiter.hpp"
#include "../core/errors/errors.hpp"

namespace Tether {
namespace Transport {

using Core::CloseReason;
using Core::TransportFault;

struct MemoryTransport::Channel {
    std::mutex                                mutex;
    std::deque<std::string>                   inbox[2];
    std::shared_ptr<CDP::Waiter<std::string>> reader[2];
    std::size_t                               written[2] = {0, 0};
    bool                                      closed     = false;
    CloseReason                               reason     = CloseReason::TransportClosed;
    std::string                               why;
};

std::pair<MemoryTransport::Endpoint, MemoryTransport::Endpoint>
MemoryTransport::pair(const boost::asio::any_io_executor& ex) {
    auto channel = std::make_shared<Channel>();
    return {std::make_shared<MemoryTransport>(channel, 0, boost::asio::make_strand(ex)),
            std::make_shared<MemoryTransport>(channel, 1, boost::asio::make_strand(ex))};
}

MemoryTransport::MemoryTransport(std::shared_ptr<Channel>     channel,
                                 int                          side,
                                 boost::asio::any_io_executor ex)
    : channel_(std::move(channel)), side_(side), strand_(std::move(ex)) {
}

boost::asio::any_io_executor MemoryTransport::get_executor() {
    return strand_;
}

void MemoryTransport::write_frame(std::string frame) {
    std::shared_ptr<CDP::Waiter<std::string>> reader;
    {
        std::lock_guard<std::mutex> lock(channel_->mutex);
        if (channel_->closed)
            throw TransportFault("Memory channel is closed", channel_->reason);
        ++channel_->written[side_];
        const int peer = 1 - side_;
        if (channel_->reader[peer]) {
            reader.swap(channel_->reader[peer]);
        }
        else {
            channel_->inbox[peer].push_back(std::move(frame));
            return;
        }
    }
    reader->resolve(std::move(frame));
}

boost::asio::awaitable<std::string> MemoryTransport::read_frame() {
    std::shared_ptr<CDP::Waiter<std::string>> reader;
    {
        std::unique_lock<std::mutex> lock(channel_->mutex);
        auto&                        inbox = channel_->inbox[side_];
        if (!inbox.empty()) {
            std::string frame = std::move(inbox.front());
            inbox.pop_front();
            lock.unlock();
            co_return frame;
        }
        if (channel_->closed)
            throw TransportFault("Memory channel closed: " + channel_->why, channel_->reason);
        reader                   = std::make_shared<CDP::Waiter<std::string>>();
        channel_->reader[side_] = reader;
    }
    co_return co_await reader->wait();
}

void MemoryTransport::close() {
    std::shared_ptr<CDP::Waiter<std::string>> readers[2];
    {
        std::lock_guard<std::mutex> lock(channel_->mutex);
        channel_->inbox[side_].clear();
        if (channel_->closed)
            return;
        channel_->closed = true;
        channel_->reason = CloseReason::TransportClosed;
        channel_->why    = "closed by peer";
        readers[0].swap(channel_->reader[0]);
        readers[1].swap(channel_->reader[1]);
    }
    for (auto& reader : readers) {
        if (reader)
            reader->fail(TransportFault("Memory channel closed", CloseReason::TransportClosed));
    }
}

void MemoryTransport::fail(const std::string& why) {
    std::shared_ptr<CDP::Waiter<std::string>> readers[2];
    {
        std::lock_guard<std::mutex> lock(channel_->mutex);
        if (channel_->closed)
            return;
        channel_->closed = true;
        channel_->reason = CloseReason::TransportError;
        channel_->why    = why;
        channel_->inbox[0].clear();
        channel_->inbox[1].clear();
        readers[0].swap(channel_->reader[0]);
        readers[1].swap(channel_->reader[1]);
    }
    for (auto& reader : readers) {
        if (reader)
            reader->fail(TransportFault("Memory channel broken: " + why, CloseReason::TransportError));
    }
}

bool MemoryTransport::is_open() const {
    std::lock_guard<std::mutex> lock(channel_->mutex);
    return !channel_->closed;
}

std::size_t MemoryTransport::frames_written() const {
    std::lock_guard<std::mutex> lock(channel_->mutex);
    return channel_->written[side_];
}

}  // namespace Transport
}  // namespace Tether
