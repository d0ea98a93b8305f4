#include "event_bus.hpp"
#include <algorithm>
#include "../core/logger/logger.hpp"

namespace Tether {
namespace CDP {

using namespace Tether::Core;

SubscriptionId EventBus::subscribe(const std::string& method, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  id = ++next_id_;
    event_subscribers_.push_back({id, method, std::move(handler)});
    return id;
}

SubscriptionId EventBus::on_close(CloseHandler handler) {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto                   id = ++next_id_;
    if (closed_) {
        auto reason = *closed_;
        lock.unlock();
        handler(reason);
        return id;
    }
    close_subscribers_.push_back({id, std::move(handler)});
    return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    event_subscribers_.erase(
        std::remove_if(event_subscribers_.begin(),
                       event_subscribers_.end(),
                       [id](const EventSubscriber& s) { return s.id == id; }),
        event_subscribers_.end());
    close_subscribers_.erase(
        std::remove_if(close_subscribers_.begin(),
                       close_subscribers_.end(),
                       [id](const CloseSubscriber& s) { return s.id == id; }),
        close_subscribers_.end());
}

void EventBus::publish(const Protocol::Event& event) {
    std::vector<EventSubscriber> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            return;
        for (const auto& s : event_subscribers_) {
            if (s.method.empty() || s.method == event.method)
                targets.push_back(s);
        }
    }

    for (const auto& s : targets) {
        try {
            s.handler(event);
        } catch (const std::exception& e) {
            Logger::error("Listener for " + event.method + " threw: " + e.what());
        }
    }
}

bool EventBus::publish_close(CloseReason reason) {
    std::vector<CloseSubscriber> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            return false;
        closed_ = reason;
        targets.swap(close_subscribers_);
        event_subscribers_.clear();
    }

    for (const auto& s : targets) {
        try {
            s.handler(reason);
        } catch (const std::exception& e) {
            Logger::error(std::string("Close listener threw: ") + e.what());
        }
    }
    return true;
}

std::size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return event_subscribers_.size() + close_subscribers_.size();
}

}  // namespace CDP
}  // namespace Tether
