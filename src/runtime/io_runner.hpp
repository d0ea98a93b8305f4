#pragma once
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>
#include "../core/config/config.hpp"

namespace Tether {
namespace Runtime {

/// Owns the io_context and the threads that drive connection strands.
class IoRunner {
public:
    explicit IoRunner(int threads);
    // Sized by config.io_threads.
    explicit IoRunner(const Core::Config& config);
    // Must not run on one of the runner's own threads.
    ~IoRunner();

    IoRunner(const IoRunner&)            = delete;
    IoRunner& operator=(const IoRunner&) = delete;

    boost::asio::any_io_executor get_executor();
    boost::asio::io_context&     io_context() {
        return ioc_;
    }

    // Joins the threads. Throws std::logic_error when called from one of
    // them, since that thread would have to join itself.
    void        stop();
    bool        stopped() const;
    std::size_t thread_count() const {
        return threads_.size();
    }

    // True when the calling thread belongs to any IoRunner. Blocking on
    // such a thread could starve the loop that must complete the wait.
    static bool on_io_thread();

private:
    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
                             work_guard_;
    std::vector<std::thread> threads_;
    bool                     stopped_ = false;
};

}  // namespace Runtime
}  // namespace Tether
