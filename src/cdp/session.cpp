#include "session.hpp"
#include "../core/logger/logger.hpp"
#include "connection.hpp"

namespace Tether {
namespace CDP {

using namespace Tether::Core;

Session::Session(std::weak_ptr<Connection>    connection,
                 boost::asio::any_io_executor strand,
                 std::string                  session_id,
                 std::string                  target_id,
                 std::string                  target_type)
    : connection_(std::move(connection)),
      id_(std::move(session_id)),
      target_id_(std::move(target_id)),
      target_type_(std::move(target_type)),
      registry_(std::make_shared<WaiterRegistry>(std::move(strand), "Session " + id_)),
      closed_(std::make_shared<Waiter<CloseReason>>()) {
}

PendingResult Session::send(const std::string& method, nlohmann::json params) {
    auto waiter = std::make_shared<Waiter<nlohmann::json>>();
    if (auto reason = registry_->close_reason()) {
        waiter->fail(TargetClosedError::for_command(method, *reason));
        return waiter;
    }
    auto connection = connection_.lock();
    if (!connection) {
        waiter->fail(TargetClosedError::for_command(method, CloseReason::TransportClosed));
        return waiter;
    }
    connection->issue(*registry_, id_, method, std::move(params), waiter);
    return waiter;
}

boost::asio::awaitable<nlohmann::json> Session::call(const std::string& method,
                                                     nlohmann::json     params) {
    auto pending = send(method, std::move(params));
    co_return co_await pending->wait();
}

PendingEvent Session::wait_for_event(EventPredicate predicate, std::chrono::milliseconds timeout) {
    return registry_->add_predicate("", std::move(predicate), timeout, "Waiting for event");
}

PendingEvent Session::wait_for_event(const std::string&        method,
                                     EventPredicate            predicate,
                                     std::chrono::milliseconds timeout) {
    return registry_->add_predicate(method, std::move(predicate), timeout, "Waiting for " + method);
}

void Session::close(CloseReason reason) {
    if (!registry_->close(reason))
        return;

    Logger::debug("Session " + id_ + " closed (" + to_string(reason) + ")");
    if (auto connection = connection_.lock())
        connection->forget_session(id_);
    events_.publish_close(reason);
    closed_->resolve(reason);
}

PendingResult Session::detach() {
    auto connection = connection_.lock();
    if (!connection) {
        auto waiter = std::make_shared<Waiter<nlohmann::json>>();
        waiter->fail(
            TargetClosedError::for_command("Target.detachFromTarget", CloseReason::TransportClosed));
        return waiter;
    }
    return connection->send("", "Target.detachFromTarget", {{"sessionId", id_}});
}

bool Session::is_closed() const {
    return registry_->is_closed();
}

std::optional<CloseReason> Session::close_reason() const {
    return registry_->close_reason();
}

boost::asio::awaitable<CloseReason> Session::wait_closed() {
    auto closed = closed_;
    co_return co_await closed->wait();
}

void Session::on_response(const Protocol::Message& response) {
    if (!registry_->settle(response))
        Logger::debug("Session " + id_ + ": no waiter for response " + std::to_string(response.id));
}

void Session::on_event(const Protocol::Event& event) {
    registry_->dispatch(event);
    events_.publish(event);
}

}  // namespace CDP
}  // namespace Tether
