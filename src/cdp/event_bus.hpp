#pragma once
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "../core/errors/errors.hpp"
#include "../protocol/message.hpp"

namespace Tether {
namespace CDP {

using SubscriptionId = std::uint64_t;

/// Ordered publish/subscribe for protocol events and the close notification.
///
/// Subscribers are called in subscription order, outside the internal lock,
/// at most once per published event. The close notification fires exactly
/// once; subscribing to it afterwards calls the handler immediately.
class EventBus {
public:
    using EventHandler = std::function<void(const Protocol::Event&)>;
    using CloseHandler = std::function<void(Core::CloseReason)>;

    // An empty method receives every event.
    SubscriptionId subscribe(const std::string& method, EventHandler handler);
    SubscriptionId on_close(CloseHandler handler);
    void           unsubscribe(SubscriptionId id);

    void publish(const Protocol::Event& event);
    bool publish_close(Core::CloseReason reason);

    std::size_t subscriber_count() const;

private:
    struct EventSubscriber {
        SubscriptionId id;
        std::string    method;
        EventHandler   handler;
    };
    struct CloseSubscriber {
        SubscriptionId id;
        CloseHandler   handler;
    };

    mutable std::mutex               mutex_;
    SubscriptionId                   next_id_ = 0;
    std::vector<EventSubscriber>     event_subscribers_;
    std::vector<CloseSubscriber>     close_subscribers_;
    std::optional<Core::CloseReason> closed_;
};

}  // namespace CDP
}  // namespace Tether
