#include "io_runner.hpp"
#include <stdexcept>
#include "../core/logger/logger.hpp"

namespace Tether {
namespace Runtime {

using namespace Tether::Core;

namespace {
thread_local bool t_io_thread = false;
}

IoRunner::IoRunner(int threads) {
    if (threads < 1)
        threads = 1;
    work_guard_ =
        std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
            ioc_.get_executor());
    for (int i = 0; i < threads; ++i) {
        threads_.emplace_back([this]() {
            t_io_thread = true;
            try {
                ioc_.run();
            } catch (const std::exception& e) {
                Logger::error("IO Thread Exception: " + std::string(e.what()));
            }
        });
    }
    Logger::debug("Started " + std::to_string(threads) + " IO threads.");
}

IoRunner::IoRunner(const Config& config) : IoRunner(config.io_threads) {
}

IoRunner::~IoRunner() {
    stop();
}

boost::asio::any_io_executor IoRunner::get_executor() {
    return ioc_.get_executor();
}

void IoRunner::stop() {
    if (stopped_)
        return;
    for (const auto& t : threads_) {
        if (t.get_id() == std::this_thread::get_id()) {
            Logger::error("IoRunner::stop() called from one of its own threads");
            throw std::logic_error("IoRunner cannot be stopped from its own I/O thread");
        }
    }
    stopped_ = true;

    work_guard_.reset();
    ioc_.stop();

    for (auto& t : threads_) {
        if (t.joinable())
            t.join();
    }
}

bool IoRunner::stopped() const {
    return stopped_;
}

bool IoRunner::on_io_thread() {
    return t_io_thread;
}

}  // namespace Runtime
}  // namespace Tether
