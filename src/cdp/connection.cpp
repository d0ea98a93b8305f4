#include "connection.hpp"
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/dispatch.hpp>
#include "../core/logger/logger.hpp"
#include "../protocol/message.hpp"
#include "../sync/sync_bridge.hpp"
#include "../transport/websocket_transport.hpp"

namespace Tether {
namespace CDP {

using namespace Tether::Core;

Connection::Connection(std::shared_ptr<Transport::Transport> transport,
                       std::string                           url,
                       const Config&                         config)
    : transport_(std::move(transport)),
      strand_(transport_->get_executor()),
      url_(std::move(url)),
      config_(config),
      root_(std::make_shared<WaiterRegistry>(strand_, "Connection")),
      closed_(std::make_shared<Waiter<CloseReason>>()) {
}

std::shared_ptr<Connection> Connection::create(std::shared_ptr<Transport::Transport> transport,
                                               std::string                           url,
                                               const Config&                         config) {
    auto connection =
        std::shared_ptr<Connection>(new Connection(std::move(transport), std::move(url), config));
    connection->start();
    return connection;
}

boost::asio::awaitable<std::shared_ptr<Connection>>
Connection::connect(const boost::asio::any_io_executor& ex, const Config& config) {
    auto transport =
        co_await Transport::WebSocketTransport::connect(ex, config.endpoint, config.max_message_size);
    co_return create(transport, config.endpoint, config);
}

Connection::~Connection() {
    finish_close(close_reason().value_or(CloseReason::ExplicitClose));
}

void Connection::start() {
    boost::asio::co_spawn(
        strand_,
        [self = shared_from_this()]() { return self->receive_loop(); },
        [](std::exception_ptr error) {
            if (!error)
                return;
            try {
                std::rethrow_exception(error);
            } catch (const std::exception& e) {
                Logger::error("Connection receive loop failed: " + std::string(e.what()));
            }
        });
}

PendingResult Connection::send(const std::string& session_id,
                               const std::string& method,
                               nlohmann::json     params) {
    auto waiter = std::make_shared<Waiter<nlohmann::json>>();
    if (session_id.empty()) {
        issue(*root_, session_id, method, std::move(params), waiter);
        return waiter;
    }

    auto target = session(session_id);
    if (!target) {
        waiter->fail(TargetClosedError::for_command(
            method, close_reason().value_or(CloseReason::TargetDetached)));
        return waiter;
    }
    issue(*target->registry_, session_id, method, std::move(params), waiter);
    return waiter;
}

boost::asio::awaitable<nlohmann::json> Connection::call(const std::string& method,
                                                        nlohmann::json     params) {
    auto pending = send("", method, std::move(params));
    co_return co_await pending->wait();
}

PendingEvent Connection::wait_for_event(const std::string&        method,
                                        EventPredicate            predicate,
                                        std::chrono::milliseconds timeout) {
    return root_->add_predicate(method, std::move(predicate), timeout, "Waiting for " + method);
}

void Connection::issue(WaiterRegistry&      registry,
                       const std::string&   session_id,
                       const std::string&   method,
                       nlohmann::json       params,
                       const PendingResult& waiter) {
    if (auto reason = close_reason()) {
        waiter->fail(TargetClosedError::for_command(method, *reason));
        return;
    }

    Protocol::Command command;
    command.id         = ++last_id_;
    command.method     = method;
    command.params     = std::move(params);
    command.session_id = session_id;

    if (!registry.track(command.id, method, waiter))
        return;

    try {
        transport_->write_frame(Protocol::serialize(command));
    } catch (const TransportFault& e) {
        Logger::warn("Connection: write failed: " + std::string(e.what()));
        close(e.reason());
        return;
    }
    Logger::debug("SEND ► " + std::to_string(command.id) + " " + method
                  + (session_id.empty() ? "" : " [" + session_id + "]"));
}

std::shared_ptr<Session> Connection::attach_session(const std::string& session_id,
                                                    const std::string& target_id,
                                                    const std::string& target_type) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto                         it = sessions_.find(session_id);
    if (it != sessions_.end())
        return it->second;

    auto created =
        std::make_shared<Session>(weak_from_this(), strand_, session_id, target_id, target_type);
    if (close_reason_) {
        // Nothing will ever be routed to it; hand back a closed session.
        auto reason = *close_reason_;
        lock.unlock();
        created->close(reason);
        return created;
    }
    sessions_.emplace(session_id, created);
    lock.unlock();
    Logger::debug("Session " + session_id + " attached to " + target_type + " " + target_id);
    return created;
}

std::shared_ptr<Session> Connection::session(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<Session>> Connection::sessions() const {
    std::lock_guard<std::mutex>           lock(mutex_);
    std::vector<std::shared_ptr<Session>> result;
    result.reserve(sessions_.size());
    for (const auto& [id, s] : sessions_)
        result.push_back(s);
    return result;
}

void Connection::forget_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(session_id);
}

std::shared_ptr<Waiter<CloseReason>> Connection::close(CloseReason reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (close_reason_)
            return closed_;
        close_reason_ = reason;
    }
    Logger::debug("Connection closing (" + std::string(to_string(reason)) + ")");

    std::weak_ptr<Connection> weak = weak_from_this();
    boost::asio::dispatch(strand_, [weak, reason]() {
        if (auto self = weak.lock())
            self->finish_close(reason);
    });
    return closed_;
}

void Connection::dispose() {
    auto done = close(CloseReason::ExplicitClose);
    if (done->is_settled())
        return;
    if (!Sync::SyncBridge::can_block()) {
        Logger::warn("Connection::dispose() on an I/O thread; not waiting for the drain");
        return;
    }
    Sync::SyncBridge::wait(done, std::chrono::milliseconds(config_.close_timeout_ms));
}

bool Connection::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_reason_.has_value();
}

std::optional<CloseReason> Connection::close_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_reason_;
}

boost::asio::awaitable<CloseReason> Connection::wait_closed() {
    auto closed = closed_;
    co_return co_await closed->wait();
}

boost::asio::awaitable<void> Connection::receive_loop() {
    for (;;) {
        // Reads may complete without suspending; drain here so a busy
        // stream cannot hold off a close posted to the strand.
        if (auto reason = close_reason()) {
            finish_close(*reason);
            co_return;
        }

        std::string frame;
        try {
            frame = co_await transport_->read_frame();
        } catch (const TransportFault& e) {
            if (!is_closed())
                Logger::warn("Connection lost: " + std::string(e.what()));
            close(e.reason());
            co_return;
        }
        // A frame that lands after close() must not settle waiters the
        // drain is about to reject.
        if (auto reason = close_reason()) {
            finish_close(*reason);
            co_return;
        }
        on_frame(frame);
    }
}

void Connection::on_frame(const std::string& frame) {
    Protocol::Message message;
    try {
        message = Protocol::parse(frame);
    } catch (const MalformedFrame& e) {
        Logger::warn("Dropping malformed frame: " + std::string(e.what()));
        return;
    } catch (const nlohmann::json::exception& e) {
        Logger::warn("Dropping malformed frame: " + std::string(e.what()));
        return;
    }
    Logger::debug("◀ RECV " + frame);

    if (message.is_response()) {
        if (message.session_id.empty()) {
            if (!root_->settle(message))
                Logger::debug("No waiter for response " + std::to_string(message.id));
            return;
        }
        auto target = session(message.session_id);
        if (!target || target->is_closed()) {
            Logger::debug("Discarding response for closed session " + message.session_id);
            return;
        }
        target->on_response(message);
        return;
    }

    auto event = message.to_event();
    try {
        on_target_event(event);
    } catch (const nlohmann::json::exception& e) {
        Logger::warn("Malformed " + event.method + " params: " + e.what());
    }

    if (event.session_id.empty()) {
        root_->dispatch(event);
        events_.publish(event);
        return;
    }
    auto target = session(event.session_id);
    if (!target || target->is_closed()) {
        Logger::debug("Discarding " + event.method + " for closed session " + event.session_id);
        return;
    }
    target->on_event(event);
}

void Connection::on_target_event(const Protocol::Event& event) {
    if (event.method == "Target.attachedToTarget") {
        const auto& info = event.params.at("targetInfo");
        attach_session(event.params.at("sessionId").get<std::string>(),
                       info.value("targetId", ""),
                       info.value("type", ""));
    }
    else if (event.method == "Target.detachedFromTarget") {
        if (auto target = session(event.params.at("sessionId").get<std::string>()))
            target->close(CloseReason::TargetDetached);
    }
}

void Connection::finish_close(CloseReason reason) {
    std::map<std::string, std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (drained_)
            return;
        drained_ = true;
        if (!close_reason_)
            close_reason_ = reason;
        sessions.swap(sessions_);
    }

    root_->close(reason);
    for (auto& [id, s] : sessions)
        s->close(reason);
    transport_->close();
    events_.publish_close(reason);
    closed_->resolve(reason);
    Logger::debug("Connection closed (" + std::string(to_string(reason)) + ")");
}

}  // namespace CDP
}  // namespace Tether
