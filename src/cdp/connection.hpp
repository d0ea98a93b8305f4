#pragma once
#include <atomic>
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "../core/config/config.hpp"
#include "../core/errors/errors.hpp"
#include "../transport/transport.hpp"
#include "event_bus.hpp"
#include "session.hpp"
#include "waiter.hpp"
#include "waiter_registry.hpp"

namespace Tether {
namespace CDP {

/// One control channel to the browser, multiplexing every attached session.
///
/// The connection owns the transport and the sessions. Its receive loop,
/// the close drain and all event deadlines run on the transport's strand;
/// send() may be called from any thread.
///
/// close() flips the state synchronously, so a send() issued after close()
/// returns is always rejected without touching the transport. The drain
/// that rejects outstanding waiters then runs on the strand.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    static std::shared_ptr<Connection> create(std::shared_ptr<Transport::Transport> transport,
                                              std::string                           url,
                                              const Core::Config& config = Core::Config());

    // Opens a WebSocket to config.endpoint and starts the receive loop.
    static boost::asio::awaitable<std::shared_ptr<Connection>>
    connect(const boost::asio::any_io_executor& ex, const Core::Config& config);

    ~Connection();

    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    // Root-session command when session_id is empty.
    PendingResult send(const std::string& session_id,
                       const std::string& method,
                       nlohmann::json     params = nlohmann::json::object());
    boost::asio::awaitable<nlohmann::json> call(const std::string& method,
                                                nlohmann::json     params = nlohmann::json::object());

    PendingEvent wait_for_event(const std::string&        method,
                                EventPredicate            predicate,
                                std::chrono::milliseconds timeout);

    // Registers a session for a target attached out of band. Idempotent.
    std::shared_ptr<Session> attach_session(const std::string& session_id,
                                            const std::string& target_id,
                                            const std::string& target_type);

    std::shared_ptr<Session>              session(const std::string& session_id) const;
    std::vector<std::shared_ptr<Session>> sessions() const;

    std::shared_ptr<Waiter<Core::CloseReason>> close(
        Core::CloseReason reason = Core::CloseReason::ExplicitClose);

    // close() and block until the drain finished.
    void dispose();

    bool                             is_closed() const;
    std::optional<Core::CloseReason> close_reason() const;

    std::shared_ptr<Waiter<Core::CloseReason>> closed() const {
        return closed_;
    }
    boost::asio::awaitable<Core::CloseReason> wait_closed();

    EventBus& events() {
        return events_;
    }
    const std::string& url() const {
        return url_;
    }
    boost::asio::any_io_executor get_executor() const {
        return strand_;
    }
    std::uint64_t last_command_id() const {
        return last_id_.load();
    }
    const Core::Config& config() const {
        return config_;
    }

private:
    friend class Session;

    Connection(std::shared_ptr<Transport::Transport> transport,
               std::string                           url,
               const Core::Config&                   config);

    void start();

    void issue(WaiterRegistry&    registry,
               const std::string& session_id,
               const std::string& method,
               nlohmann::json     params,
               const PendingResult& waiter);
    void forget_session(const std::string& session_id);

    boost::asio::awaitable<void> receive_loop();
    void                         on_frame(const std::string& frame);
    void                         on_target_event(const Protocol::Event& event);
    void                         finish_close(Core::CloseReason reason);

    std::shared_ptr<Transport::Transport> transport_;
    boost::asio::any_io_executor          strand_;
    std::string                           url_;
    Core::Config                          config_;

    std::atomic<std::uint64_t>      last_id_{0};
    std::shared_ptr<WaiterRegistry> root_;
    EventBus                        events_;

    mutable std::mutex                               mutex_;
    std::optional<Core::CloseReason>                 close_reason_;
    bool                                             drained_ = false;
    std::map<std::string, std::shared_ptr<Session>> sessions_;

    std::shared_ptr<Waiter<Core::CloseReason>> closed_;
};

}  // namespace CDP
}  // namespace Tether
