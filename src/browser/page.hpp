#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "../cdp/connection.hpp"
#include "../cdp/session.hpp"

namespace Tether {
namespace Browser {

class BrowserContext;

struct PageCloseOptions {
    // Let the page run its beforeunload handlers; close() then returns
    // without waiting for the target to go away.
    bool run_before_unload = false;
};

/// A page target and the session attached to it.
///
/// The page is closed exactly when its session is; closing removes it from
/// its browser context before any on_close() handler runs.
class Page : public std::enable_shared_from_this<Page> {
public:
    static std::shared_ptr<Page> create(std::shared_ptr<CDP::Session> session,
                                        std::weak_ptr<CDP::Connection> connection,
                                        std::weak_ptr<BrowserContext>  context);

    const std::string& target_id() const {
        return session_->target_id();
    }
    std::shared_ptr<CDP::Session> session() const {
        return session_;
    }

    CDP::PendingResult send(const std::string& method,
                            nlohmann::json     params = nlohmann::json::object());
    boost::asio::awaitable<nlohmann::json> call(const std::string& method,
                                                nlohmann::json     params = nlohmann::json::object());

    CDP::PendingEvent wait_for_event(const std::string&        method,
                                     CDP::EventPredicate       predicate,
                                     std::chrono::milliseconds timeout);
    CDP::PendingEvent wait_for_request(const std::string& url);
    CDP::PendingEvent wait_for_request(const std::string& url, std::chrono::milliseconds timeout);
    CDP::PendingEvent wait_for_response(const std::string& url);
    CDP::PendingEvent wait_for_response(const std::string& url, std::chrono::milliseconds timeout);

    boost::asio::awaitable<void> close(PageCloseOptions options = PageCloseOptions());
    void                         dispose();

    bool                             is_closed() const;
    std::optional<Core::CloseReason> close_reason() const;
    CDP::SubscriptionId              on_close(CDP::EventBus::CloseHandler handler);

private:
    Page(std::shared_ptr<CDP::Session>  session,
         std::weak_ptr<CDP::Connection> connection,
         std::weak_ptr<BrowserContext>  context);

    void                      on_session_closed(Core::CloseReason reason);
    std::chrono::milliseconds default_timeout() const;
    std::chrono::milliseconds close_timeout() const;

    std::shared_ptr<CDP::Session>  session_;
    std::weak_ptr<CDP::Connection> connection_;
    std::weak_ptr<BrowserContext>  context_;
};

}  // namespace Browser
}  // namespace Tether
