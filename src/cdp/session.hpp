#pragma once
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "../core/errors/errors.hpp"
#include "event_bus.hpp"
#include "waiter.hpp"
#include "waiter_registry.hpp"

namespace Tether {
namespace CDP {

class Connection;

/// Logical channel to one attached target, multiplexed over a Connection.
///
/// The Connection owns its sessions; a Session only keeps a weak
/// back-reference for routing. Commands sent through a Session are tracked
/// in the Session's own registry so closing the Session rejects exactly
/// those commands.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(std::weak_ptr<Connection>    connection,
            boost::asio::any_io_executor strand,
            std::string                  session_id,
            std::string                  target_id,
            std::string                  target_type);

    const std::string& id() const {
        return id_;
    }
    const std::string& target_id() const {
        return target_id_;
    }
    const std::string& target_type() const {
        return target_type_;
    }

    PendingResult send(const std::string& method, nlohmann::json params = nlohmann::json::object());
    boost::asio::awaitable<nlohmann::json> call(const std::string& method,
                                                nlohmann::json     params = nlohmann::json::object());

    // A zero timeout waits until a match or until the session closes.
    PendingEvent wait_for_event(EventPredicate predicate, std::chrono::milliseconds timeout);
    PendingEvent wait_for_event(const std::string&        method,
                                EventPredicate            predicate,
                                std::chrono::milliseconds timeout);

    // Idempotent; only the first reason is kept.
    void close(Core::CloseReason reason);

    // Asks the browser to detach; the detach event then closes the session.
    PendingResult detach();

    bool                             is_closed() const;
    std::optional<Core::CloseReason> close_reason() const;

    std::shared_ptr<Waiter<Core::CloseReason>> closed() const {
        return closed_;
    }
    boost::asio::awaitable<Core::CloseReason> wait_closed();

    EventBus& events() {
        return events_;
    }
    const WaiterRegistry& registry() const {
        return *registry_;
    }

private:
    friend class Connection;

    // Called from the connection's receive loop.
    void on_response(const Protocol::Message& response);
    void on_event(const Protocol::Event& event);

    std::weak_ptr<Connection>                  connection_;
    std::string                                id_;
    std::string                                target_id_;
    std::string                                target_type_;
    std::shared_ptr<WaiterRegistry>            registry_;
    EventBus                                   events_;
    std::shared_ptr<Waiter<Core::CloseReason>> closed_;
};

}  // namespace CDP
}  // namespace Tether
