#pragma once
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/co_spawn.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <type_traits>
#include "../cdp/waiter.hpp"
#include "../core/errors/errors.hpp"

namespace Tether {
namespace Sync {

/// Blocking adapters for callers that live outside the I/O threads.
///
/// The awaited work always runs on its own executor; the calling thread
/// only parks on a condition variable. Blocking on an I/O thread could
/// starve the loop that has to finish the work, so both entry points throw
/// std::logic_error there instead.
class SyncBridge {
public:
    static bool can_block();

    // Returns the resolved value, rethrows a rejection, throws TimeoutError.
    template <typename T>
    static T wait(const std::shared_ptr<CDP::Waiter<T>>& waiter, std::chrono::milliseconds timeout) {
        ensure_can_block("SyncBridge::wait");
        auto value = waiter->wait_for(timeout);
        if (!value)
            throw Core::TimeoutError("Synchronous wait", timeout);
        return std::move(*value);
    }

    // Spawns factory() on ex and blocks until the coroutine finishes.
    template <typename Factory>
    static auto run(const boost::asio::any_io_executor& ex,
                    Factory                             factory,
                    std::chrono::milliseconds           timeout) {
        using Result = typename decltype(factory())::value_type;
        ensure_can_block("SyncBridge::run");

        if constexpr (std::is_void_v<Result>) {
            auto done = std::make_shared<CDP::Waiter<bool>>();
            boost::asio::co_spawn(ex, std::move(factory), [done](std::exception_ptr error) {
                if (error)
                    done->reject(error);
                else
                    done->resolve(true);
            });
            wait(done, timeout);
        }
        else {
            auto done = std::make_shared<CDP::Waiter<Result>>();
            boost::asio::co_spawn(
                ex, std::move(factory), [done](std::exception_ptr error, Result value) {
                    if (error)
                        done->reject(error);
                    else
                        done->resolve(std::move(value));
                });
            return wait(done, timeout);
        }
    }

private:
    static void ensure_can_block(const std::string& where);
};

}  // namespace Sync
}  // namespace Tether
