#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "../cdp/connection.hpp"
#include "page.hpp"

namespace Tether {
namespace Browser {

class Browser;

/// Group of pages sharing one browser profile. The default context has an
/// empty id and cannot be closed.
class BrowserContext : public std::enable_shared_from_this<BrowserContext> {
public:
    BrowserContext(std::shared_ptr<CDP::Connection> connection,
                   std::weak_ptr<Browser>           browser,
                   std::string                      id);

    const std::string& id() const {
        return id_;
    }
    bool is_default() const {
        return id_.empty();
    }

    boost::asio::awaitable<std::shared_ptr<Page>> new_page();
    std::vector<std::shared_ptr<Page>>            pages() const;

    // Disposes the context in the browser, then closes its pages locally.
    boost::asio::awaitable<void> close();
    bool                         is_closed() const;

    // Wraps an attached page session; returns the existing page if known.
    std::shared_ptr<Page> adopt(const std::shared_ptr<CDP::Session>& session);
    void                  forget_page(const std::string& target_id);

    // Marks the context closed without talking to the browser.
    void mark_closed();

private:
    std::shared_ptr<CDP::Connection> connection_;
    std::weak_ptr<Browser>           browser_;
    std::string                      id_;

    mutable std::mutex                           mutex_;
    bool                                         closed_ = false;
    std::map<std::string, std::shared_ptr<Page>> pages_;
};

}  // namespace Browser
}  // namespace Tether
