#pragma once
#include <utility>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace Tether {
namespace CDP {

/// Single-resolution completion handle.
///
/// Exactly one of resolve() / reject() takes effect; every later call
/// returns false and changes nothing. Settlement may happen on any thread.
///
/// Coroutines observe the outcome through wait(): the continuation is
/// always posted to the awaiting coroutine's executor, never run inline
/// on the settling thread. Plain threads observe it through wait_for().
template <typename T>
class Waiter {
public:
    Waiter() = default;

    Waiter(const Waiter&)            = delete;
    Waiter& operator=(const Waiter&) = delete;

    bool resolve(T value) {
        return settle(std::optional<T>(std::move(value)), nullptr);
    }

    bool reject(std::exception_ptr error) {
        return settle(std::nullopt, std::move(error));
    }

    template <typename Error>
    bool fail(Error error) {
        return reject(std::make_exception_ptr(std::move(error)));
    }

    bool is_settled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return settled_;
    }

    bool is_rejected() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return settled_ && error_ != nullptr;
    }

    boost::asio::awaitable<T> wait() {
        co_return co_await boost::asio::async_initiate<const boost::asio::use_awaitable_t<>,
                                                       void(std::exception_ptr, T)>(
            [this](auto handler) { attach(std::move(handler)); }, boost::asio::use_awaitable);
    }

    // Blocks the calling thread. Returns nullopt when the timeout elapses first;
    // rethrows the rejection error.
    std::optional<T> wait_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return settled_; }))
            return std::nullopt;
        if (error_)
            std::rethrow_exception(error_);
        return value_;
    }

private:
    using Continuation = std::function<void(std::exception_ptr, T)>;

    template <typename Handler>
    void attach(Handler handler) {
        auto shared  = std::make_shared<Handler>(std::move(handler));
        auto deliver = [shared](std::exception_ptr error, T value) {
            auto ex = boost::asio::get_associated_executor(*shared);
            boost::asio::post(ex, [shared, error, value = std::move(value)]() mutable {
                (*shared)(error, std::move(value));
            });
        };

        std::unique_lock<std::mutex> lock(mutex_);
        if (!settled_) {
            continuations_.push_back(std::move(deliver));
            return;
        }
        auto error = error_;
        T    value = value_ ? *value_ : T{};
        lock.unlock();
        deliver(error, std::move(value));
    }

    bool settle(std::optional<T> value, std::exception_ptr error) {
        std::vector<Continuation> continuations;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (settled_)
                return false;
            settled_ = true;
            value_   = std::move(value);
            error_   = std::move(error);
            continuations.swap(continuations_);
        }
        cv_.notify_all();

        for (auto& continuation : continuations)
            continuation(error_, value_ ? *value_ : T{});
        return true;
    }

    mutable std::mutex        mutex_;
    std::condition_variable   cv_;
    bool                      settled_ = false;
    std::optional<T>          value_;
    std::exception_ptr        error_;
    std::vector<Continuation> continuations_;
};

}  // namespace CDP
}  // namespace Tether
