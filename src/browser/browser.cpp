#include "browser.hpp"
#include "../core/logger/logger.hpp"
#include "../sync/sync_bridge.hpp"

namespace Tether {
namespace Browser {

using namespace Tether::Core;

Browser::Browser(std::shared_ptr<CDP::Connection> connection) : connection_(std::move(connection)) {
}

boost::asio::awaitable<std::shared_ptr<Browser>>
Browser::connect(const boost::asio::any_io_executor& ex, const Config& config) {
    auto connection = co_await CDP::Connection::connect(ex, config);
    co_return create(connection);
}

std::shared_ptr<Browser> Browser::create(std::shared_ptr<CDP::Connection> connection) {
    auto browser              = std::shared_ptr<Browser>(new Browser(std::move(connection)));
    browser->default_context_ = std::make_shared<BrowserContext>(browser->connection_, browser, "");

    std::weak_ptr<Browser> weak = browser;
    browser->connection_->events().on_close([weak](CloseReason reason) {
        if (auto self = weak.lock())
            self->on_connection_closed(reason);
    });
    return browser;
}

boost::asio::awaitable<std::shared_ptr<Page>> Browser::new_page() {
    auto context = default_context_;
    co_return co_await context->new_page();
}

boost::asio::awaitable<std::shared_ptr<BrowserContext>> Browser::create_browser_context() {
    auto self   = shared_from_this();
    auto result = co_await connection_->call("Target.createBrowserContext");
    auto id     = result.at("browserContextId").get<std::string>();

    auto context = std::make_shared<BrowserContext>(connection_, weak_from_this(), id);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        contexts_.emplace(id, context);
    }
    if (connection_->is_closed())
        context->mark_closed();
    co_return context;
}

std::shared_ptr<BrowserContext> Browser::default_context() const {
    return default_context_;
}

std::vector<std::shared_ptr<BrowserContext>> Browser::contexts() const {
    std::lock_guard<std::mutex>                  lock(mutex_);
    std::vector<std::shared_ptr<BrowserContext>> result{default_context_};
    for (const auto& [id, context] : contexts_)
        result.push_back(context);
    return result;
}

std::vector<std::shared_ptr<Page>> Browser::pages() const {
    std::vector<std::shared_ptr<Page>> result;
    for (const auto& context : contexts()) {
        auto pages = context->pages();
        result.insert(result.end(), pages.begin(), pages.end());
    }
    return result;
}

boost::asio::awaitable<void> Browser::close() {
    auto self       = shared_from_this();
    auto connection = connection_;
    if (!connection->is_closed()) {
        // No reply is expected: the browser exits and drops the socket.
        connection->send("", "Browser.close");
        connection->close(CloseReason::ExplicitClose);
    }
    co_await connection->wait_closed();
}

void Browser::disconnect() {
    connection_->close(CloseReason::ExplicitClose);
}

void Browser::dispose() {
    if (connection_->closed()->is_settled())
        return;
    if (!Sync::SyncBridge::can_block()) {
        Logger::warn("Browser::dispose() on an I/O thread; closing without waiting");
        connection_->send("", "Browser.close");
        connection_->close(CloseReason::ExplicitClose);
        return;
    }
    auto self = shared_from_this();
    Sync::SyncBridge::run(connection_->get_executor(),
                          [self]() { return self->close(); },
                          std::chrono::milliseconds(connection_->config().close_timeout_ms));
}

bool Browser::is_closed() const {
    return connection_->is_closed();
}

CDP::SubscriptionId Browser::on_disconnected(CDP::EventBus::CloseHandler handler) {
    return connection_->events().on_close(std::move(handler));
}

void Browser::forget_context(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    contexts_.erase(id);
}

void Browser::on_connection_closed(CloseReason reason) {
    Logger::debug("Browser disconnected (" + std::string(to_string(reason)) + ")");
    std::map<std::string, std::shared_ptr<BrowserContext>> contexts;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        contexts.swap(contexts_);
    }
    default_context_->mark_closed();
    for (auto& [id, context] : contexts)
        context->mark_closed();
}

}  // namespace Browser
}  // namespace Tether
