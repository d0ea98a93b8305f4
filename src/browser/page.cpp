#include "page.hpp"
#include "../core/logger/logger.hpp"
#include "../core/types/constants.hpp"
#include "../sync/sync_bridge.hpp"
#include "browser_context.hpp"

namespace Tether {
namespace Browser {

using namespace Tether::Core;

namespace {

CDP::EventPredicate url_matches(const std::string& field, const std::string& url) {
    return [field, url](const Protocol::Event& event) {
        auto it = event.params.find(field);
        if (it == event.params.end() || !it->is_object())
            return false;
        return it->value("url", "") == url;
    };
}

}  // namespace

Page::Page(std::shared_ptr<CDP::Session>  session,
           std::weak_ptr<CDP::Connection> connection,
           std::weak_ptr<BrowserContext>  context)
    : session_(std::move(session)), connection_(std::move(connection)), context_(std::move(context)) {
}

std::shared_ptr<Page> Page::create(std::shared_ptr<CDP::Session>  session,
                                   std::weak_ptr<CDP::Connection> connection,
                                   std::weak_ptr<BrowserContext>  context) {
    auto page = std::shared_ptr<Page>(new Page(std::move(session), std::move(connection), std::move(context)));
    std::weak_ptr<Page> weak = page;
    page->session_->events().on_close([weak](CloseReason reason) {
        if (auto self = weak.lock())
            self->on_session_closed(reason);
    });
    return page;
}

CDP::PendingResult Page::send(const std::string& method, nlohmann::json params) {
    return session_->send(method, std::move(params));
}

boost::asio::awaitable<nlohmann::json> Page::call(const std::string& method, nlohmann::json params) {
    return session_->call(method, std::move(params));
}

CDP::PendingEvent Page::wait_for_event(const std::string&        method,
                                       CDP::EventPredicate       predicate,
                                       std::chrono::milliseconds timeout) {
    return session_->wait_for_event(method, std::move(predicate), timeout);
}

CDP::PendingEvent Page::wait_for_request(const std::string& url) {
    return wait_for_request(url, default_timeout());
}

CDP::PendingEvent Page::wait_for_request(const std::string& url, std::chrono::milliseconds timeout) {
    return session_->wait_for_event("Network.requestWillBeSent", url_matches("request", url), timeout);
}

CDP::PendingEvent Page::wait_for_response(const std::string& url) {
    return wait_for_response(url, default_timeout());
}

CDP::PendingEvent Page::wait_for_response(const std::string& url, std::chrono::milliseconds timeout) {
    return session_->wait_for_event("Network.responseReceived", url_matches("response", url), timeout);
}

boost::asio::awaitable<void> Page::close(PageCloseOptions options) {
    auto self    = shared_from_this();
    auto session = session_;
    if (session->is_closed())
        co_return;

    if (options.run_before_unload) {
        session->send("Page.close");
        co_return;
    }

    auto connection = connection_.lock();
    if (!connection) {
        session->close(CloseReason::TransportClosed);
        co_return;
    }

    auto pending = connection->send("", "Target.closeTarget", {{"targetId", session->target_id()}});
    try {
        co_await pending->wait();
    } catch (const TargetClosedError& e) {
        Logger::debug("Page " + session->target_id() + ": " + e.what());
    }
    co_await session->wait_closed();
}

void Page::dispose() {
    if (session_->is_closed())
        return;
    auto connection = connection_.lock();
    if (!connection) {
        session_->close(CloseReason::TransportClosed);
        return;
    }

    if (!Sync::SyncBridge::can_block()) {
        // Cannot wait for the detach here; close locally and let the
        // browser catch up.
        Logger::warn("Page::dispose() on an I/O thread; closing without waiting for the target");
        connection->send("", "Target.closeTarget", {{"targetId", target_id()}});
        session_->close(CloseReason::ExplicitClose);
        return;
    }
    auto self = shared_from_this();
    Sync::SyncBridge::run(connection->get_executor(), [self]() { return self->close(); }, close_timeout());
}

bool Page::is_closed() const {
    return session_->is_closed();
}

std::optional<CloseReason> Page::close_reason() const {
    return session_->close_reason();
}

CDP::SubscriptionId Page::on_close(CDP::EventBus::CloseHandler handler) {
    return session_->events().on_close(std::move(handler));
}

void Page::on_session_closed(CloseReason reason) {
    Logger::debug("Page " + target_id() + " closed (" + to_string(reason) + ")");
    if (auto context = context_.lock())
        context->forget_page(target_id());
}

std::chrono::milliseconds Page::default_timeout() const {
    if (auto connection = connection_.lock())
        return std::chrono::milliseconds(connection->config().default_timeout_ms);
    return std::chrono::milliseconds(Constants::DEFAULT_TIMEOUT_MS);
}

std::chrono::milliseconds Page::close_timeout() const {
    if (auto connection = connection_.lock())
        return std::chrono::milliseconds(connection->config().close_timeout_ms);
    return std::chrono::milliseconds(Constants::DEFAULT_CLOSE_TIMEOUT_MS);
}

}  // namespace Browser
}  // namespace Tether
