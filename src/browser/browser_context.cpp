#include "browser_context.hpp"
#include <stdexcept>
#include "../core/logger/logger.hpp"
#include "browser.hpp"

namespace Tether {
namespace Browser {

using namespace Tether::Core;

BrowserContext::BrowserContext(std::shared_ptr<CDP::Connection> connection,
                               std::weak_ptr<Browser>           browser,
                               std::string                      id)
    : connection_(std::move(connection)), browser_(std::move(browser)), id_(std::move(id)) {
}

boost::asio::awaitable<std::shared_ptr<Page>> BrowserContext::new_page() {
    auto self = shared_from_this();
    if (is_closed())
        throw TargetClosedError::for_command("Target.createTarget", CloseReason::TargetDetached);

    nlohmann::json params = {{"url", "about:blank"}};
    if (!id_.empty())
        params["browserContextId"] = id_;

    auto created   = co_await connection_->call("Target.createTarget", params);
    auto target_id = created.at("targetId").get<std::string>();

    nlohmann::json attach_params = {{"targetId", target_id}, {"flatten", true}};
    auto attached = co_await connection_->call("Target.attachToTarget", attach_params);
    auto session  = connection_->attach_session(
        attached.at("sessionId").get<std::string>(), target_id, "page");

    if (auto reason = session->close_reason())
        throw TargetClosedError::for_command("Target.attachToTarget", *reason);
    co_return adopt(session);
}

std::shared_ptr<Page> BrowserContext::adopt(const std::shared_ptr<CDP::Session>& session) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = pages_.find(session->target_id());
        if (it != pages_.end())
            return it->second;
    }

    auto page = Page::create(session, connection_, weak_from_this());
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_ && !session->is_closed())
        pages_.emplace(session->target_id(), page);
    return page;
}

std::vector<std::shared_ptr<Page>> BrowserContext::pages() const {
    std::lock_guard<std::mutex>        lock(mutex_);
    std::vector<std::shared_ptr<Page>> result;
    for (const auto& [id, page] : pages_)
        result.push_back(page);
    return result;
}

void BrowserContext::forget_page(const std::string& target_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    pages_.erase(target_id);
}

boost::asio::awaitable<void> BrowserContext::close() {
    if (is_default())
        throw std::logic_error("Non-incognito profiles cannot be closed!");

    auto self = shared_from_this();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            co_return;
        closed_ = true;
    }

    auto pending = connection_->send("", "Target.disposeBrowserContext", {{"browserContextId", id_}});
    try {
        co_await pending->wait();
    } catch (const TargetClosedError& e) {
        Logger::debug("BrowserContext " + id_ + ": " + e.what());
    }

    std::map<std::string, std::shared_ptr<Page>> pages;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pages.swap(pages_);
    }
    for (auto& [target_id, page] : pages)
        page->session()->close(CloseReason::TargetDetached);

    if (auto browser = browser_.lock())
        browser->forget_context(id_);
}

bool BrowserContext::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

void BrowserContext::mark_closed() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

}  // namespace Browser
}  // namespace Tether
