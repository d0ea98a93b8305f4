#include "waiter_registry.hpp"
#include <utility>
#include <boost/asio/post.hpp>
#include <vector>
#include "../core/logger/logger.hpp"

namespace Tether {
namespace CDP {

using namespace Tether::Core;

WaiterRegistry::WaiterRegistry(boost::asio::any_io_executor strand, std::string owner)
    : strand_(std::move(strand)), owner_(std::move(owner)) {
}

bool WaiterRegistry::track(std::uint64_t id, const std::string& method, const PendingResult& waiter) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_) {
        auto reason = *closed_;
        lock.unlock();
        waiter->fail(TargetClosedError::for_command(method, reason));
        return false;
    }
    commands_.emplace(id, PendingCommand{method, waiter});
    return true;
}

bool WaiterRegistry::settle(const Protocol::Message& response) {
    PendingCommand pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = commands_.find(response.id);
        if (it == commands_.end())
            return false;
        pending = std::move(it->second);
        commands_.erase(it);
    }

    if (response.error) {
        pending.waiter->fail(ProtocolError(
            pending.method, response.error->code, response.error->message, response.error->data));
    }
    else {
        pending.waiter->resolve(response.result);
    }
    return true;
}

PendingEvent WaiterRegistry::add_predicate(const std::string&        method,
                                           EventPredicate            predicate,
                                           std::chrono::milliseconds timeout,
                                           const std::string&        description) {
    auto waiter = std::make_shared<Waiter<Protocol::Event>>();

    std::shared_ptr<boost::asio::steady_timer> deadline;
    std::uint64_t                              predicate_id = 0;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_) {
            auto reason = *closed_;
            lock.unlock();
            waiter->fail(TargetClosedError::for_wait(description, reason));
            return waiter;
        }
        predicate_id = ++next_predicate_id_;
        if (timeout.count() > 0)
            deadline = std::make_shared<boost::asio::steady_timer>(strand_);
        predicates_.emplace(
            predicate_id,
            PredicateWaiter{method, std::move(predicate), waiter, deadline, timeout, description});
    }

    // Timer operations only ever run on the strand.
    if (deadline) {
        boost::asio::post(
            strand_, [deadline, timeout, predicate_id, weak = weak_from_this()]() {
                deadline->expires_after(timeout);
                deadline->async_wait([predicate_id, weak](const boost::system::error_code& ec) {
                    if (ec)
                        return;
                    if (auto self = weak.lock())
                        self->expire(predicate_id);
                });
            });
    }
    return waiter;
}

std::size_t WaiterRegistry::dispatch(const Protocol::Event& event) {
    std::vector<std::pair<std::uint64_t, EventPredicate>> candidates;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            return 0;
        for (const auto& [id, w] : predicates_) {
            if (w.method.empty() || w.method == event.method)
                candidates.emplace_back(id, w.predicate);
        }
    }

    std::size_t matched = 0;
    for (const auto& [id, predicate] : candidates) {
        std::exception_ptr failure;
        bool               hit = false;
        try {
            hit = predicate(event);
        } catch (const std::exception& e) {
            Logger::warn(owner_ + ": event predicate threw: " + e.what());
            failure = std::current_exception();
        }
        if (!hit && !failure)
            continue;

        PredicateWaiter taken;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto                        it = predicates_.find(id);
            if (it == predicates_.end())
                continue;
            taken = std::move(it->second);
            predicates_.erase(it);
        }
        cancel_deadline(taken.deadline);

        if (failure) {
            taken.waiter->reject(failure);
        }
        else {
            taken.waiter->resolve(event);
            ++matched;
        }
    }
    return matched;
}

void WaiterRegistry::expire(std::uint64_t predicate_id) {
    PredicateWaiter taken;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = predicates_.find(predicate_id);
        if (it == predicates_.end())
            return;
        taken = std::move(it->second);
        predicates_.erase(it);
    }
    Logger::debug(owner_ + ": " + taken.description + " timed out");
    taken.waiter->fail(TimeoutError(taken.description, taken.timeout));
}

bool WaiterRegistry::close(CloseReason reason) {
    std::map<std::uint64_t, PendingCommand>  commands;
    std::map<std::uint64_t, PredicateWaiter> predicates;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            return false;
        closed_ = reason;
        commands.swap(commands_);
        predicates.swap(predicates_);
    }

    if (!commands.empty() || !predicates.empty()) {
        Logger::debug(owner_ + ": rejecting " + std::to_string(commands.size()) + " commands and "
                      + std::to_string(predicates.size()) + " event waiters ("
                      + to_string(reason) + ")");
    }

    for (auto& [id, pending] : commands)
        pending.waiter->fail(TargetClosedError::for_command(pending.method, reason));

    for (auto& [id, w] : predicates) {
        cancel_deadline(w.deadline);
        w.waiter->fail(TargetClosedError::for_wait(w.description, reason));
    }
    return true;
}

void WaiterRegistry::cancel_deadline(const std::shared_ptr<boost::asio::steady_timer>& deadline) {
    if (!deadline)
        return;
    boost::asio::post(strand_, [deadline]() { deadline->cancel(); });
}

bool WaiterRegistry::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_.has_value();
}

std::optional<CloseReason> WaiterRegistry::close_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t WaiterRegistry::pending_commands() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commands_.size();
}

std::size_t WaiterRegistry::pending_predicates() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return predicates_.size();
}

}  // namespace CDP
}  // namespace Tether
