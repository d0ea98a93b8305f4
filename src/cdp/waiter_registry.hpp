#pragma once
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "../core/errors/errors.hpp"
#include "../protocol/message.hpp"
#include "waiter.hpp"

namespace Tether {
namespace CDP {

using PendingResult  = std::shared_ptr<Waiter<nlohmann::json>>;
using PendingEvent   = std::shared_ptr<Waiter<Protocol::Event>>;
using EventPredicate = std::function<bool(const Protocol::Event&)>;

/// Outstanding command and predicate waiters of one Connection or Session.
///
/// Every insertion is insert-if-open and every completion is
/// remove-then-resolve under one lock, so a waiter is settled by whichever
/// path removes it first: response, predicate match, deadline or close.
/// The close sweep moves both maps out before resolving anything.
///
/// dispatch() and deadlines run on the owning connection's strand;
/// track() and add_predicate() may be called from any thread.
class WaiterRegistry : public std::enable_shared_from_this<WaiterRegistry> {
public:
    WaiterRegistry(boost::asio::any_io_executor strand, std::string owner);

    // False when already closed; the waiter has then been rejected.
    bool track(std::uint64_t id, const std::string& method, const PendingResult& waiter);

    // Resolves the command a response belongs to. False for unknown ids.
    bool settle(const Protocol::Message& response);

    PendingEvent add_predicate(const std::string&        method,
                               EventPredicate            predicate,
                               std::chrono::milliseconds timeout,
                               const std::string&        description);

    // Runs one event through the predicate waiters; returns the number matched.
    std::size_t dispatch(const Protocol::Event& event);

    // One-shot sweep. False if the registry was already closed.
    bool close(Core::CloseReason reason);

    bool                             is_closed() const;
    std::optional<Core::CloseReason> close_reason() const;
    std::size_t                      pending_commands() const;
    std::size_t                      pending_predicates() const;

private:
    struct PendingCommand {
        std::string   method;
        PendingResult waiter;
    };

    struct PredicateWaiter {
        std::string                                method;
        EventPredicate                             predicate;
        PendingEvent                               waiter;
        std::shared_ptr<boost::asio::steady_timer> deadline;
        std::chrono::milliseconds                  timeout;
        std::string                                description;
    };

    void expire(std::uint64_t predicate_id);
    void cancel_deadline(const std::shared_ptr<boost::asio::steady_timer>& deadline);

    boost::asio::any_io_executor strand_;
    std::string                  owner_;

    mutable std::mutex                        mutex_;
    std::optional<Core::CloseReason>          closed_;
    std::map<std::uint64_t, PendingCommand>   commands_;
    std::map<std::uint64_t, PredicateWaiter>  predicates_;
    std::uint64_t                             next_predicate_id_ = 0;
};

}  // namespace CDP
}  // namespace Tether
