#pragma once
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "../cdp/connection.hpp"
#include "../core/config/config.hpp"
#include "browser_context.hpp"
#include "page.hpp"

namespace Tether {
namespace Browser {

/// Root of the close cascade: owns the connection and every context.
///
/// Whatever closes the connection (close(), disconnect(), the transport
/// dropping) rejects the pending work of every page first and then fires
/// on_disconnected() once.
class Browser : public std::enable_shared_from_this<Browser> {
public:
    static boost::asio::awaitable<std::shared_ptr<Browser>>
    connect(const boost::asio::any_io_executor& ex, const Core::Config& config);

    static std::shared_ptr<Browser> create(std::shared_ptr<CDP::Connection> connection);

    boost::asio::awaitable<std::shared_ptr<Page>>           new_page();
    boost::asio::awaitable<std::shared_ptr<BrowserContext>> create_browser_context();

    std::shared_ptr<BrowserContext>              default_context() const;
    std::vector<std::shared_ptr<BrowserContext>> contexts() const;
    std::vector<std::shared_ptr<Page>>           pages() const;

    // Asks the browser to exit, then closes the connection.
    boost::asio::awaitable<void> close();
    // Drops the connection and leaves the browser running.
    void disconnect();
    void dispose();

    bool                is_closed() const;
    CDP::SubscriptionId on_disconnected(CDP::EventBus::CloseHandler handler);

    std::shared_ptr<CDP::Connection> connection() const {
        return connection_;
    }

    void forget_context(const std::string& id);

private:
    explicit Browser(std::shared_ptr<CDP::Connection> connection);

    void on_connection_closed(Core::CloseReason reason);

    std::shared_ptr<CDP::Connection> connection_;
    std::shared_ptr<BrowserContext>  default_context_;

    mutable std::mutex                                     mutex_;
    std::map<std::string, std::shared_ptr<BrowserContext>> contexts_;
};

}  // namespace Browser
}  // namespace Tether
