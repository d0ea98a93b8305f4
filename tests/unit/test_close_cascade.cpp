#include <algorithm>
#include <atomic>
#include <utility>
#include <boost/asio/post.hpp>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <thread>
#include "../../src/browser/browser.hpp"
#include "../support/connection_fixture.hpp"

using namespace Tether;
using namespace Tether::Testing;
using Browser::Page;
using Core::CloseReason;
using Core::TargetClosedError;

namespace {

const std::string kUrl = "https://example.com/resource";

template <typename T>
std::string failure_message(const std::shared_ptr<CDP::Waiter<T>>& waiter) {
    try {
        Sync::SyncBridge::wait(waiter, kWait);
    } catch (const std::exception& e) {
        return e.what();
    }
    return "";
}

}  // namespace

class CloseCascadeTest : public ConnectionFixture {
protected:
    void SetUp() override {
        ConnectionFixture::SetUp();
        browser_->emulate_browser();
        chrome_ = Browser::Browser::create(connection_);
    }

    std::shared_ptr<Page> new_page() {
        auto chrome = chrome_;
        return run([chrome]() { return chrome->new_page(); });
    }

    void close_page(const std::shared_ptr<Page>& page,
                    Browser::PageCloseOptions options = Browser::PageCloseOptions()) {
        run([page, options]() { return page->close(options); });
    }

    bool listed(const std::shared_ptr<Page>& page) const {
        auto pages = chrome_->pages();
        return std::find(pages.begin(), pages.end(), page) != pages.end();
    }

    std::shared_ptr<Browser::Browser> chrome_;
};

TEST_F(CloseCascadeTest, NewPageIsAttachedAndListed) {
    auto page = new_page();
    ASSERT_NE(page, nullptr);
    EXPECT_FALSE(page->is_closed());
    EXPECT_EQ(page->target_id(), "T1");
    EXPECT_EQ(page->session()->id(), "S1");
    EXPECT_TRUE(listed(page));
    EXPECT_EQ(browser_->wait_for_command("Target.attachToTarget")["params"]["flatten"], true);
}

TEST_F(CloseCascadeTest, PageCloseRejectsPendingCommands) {
    auto page    = new_page();
    auto pending = page->send("Runtime.evaluate", {{"expression", "new Promise(() => {})"}});
    browser_->wait_for_command("Runtime.evaluate");

    close_page(page);

    try {
        Sync::SyncBridge::wait(pending, kWait);
        FAIL() << "expected TargetClosedError";
    } catch (const TargetClosedError& e) {
        EXPECT_NE(std::string(e.what()).find("Protocol error"), std::string::npos);
        EXPECT_EQ(e.close_reason(), "Target.detachedFromTarget");
    }
}

TEST_F(CloseCascadeTest, ClosedPageLeavesPages) {
    auto first  = new_page();
    auto second = new_page();
    ASSERT_EQ(chrome_->pages().size(), 2u);

    close_page(first);

    EXPECT_TRUE(first->is_closed());
    EXPECT_FALSE(listed(first));
    EXPECT_TRUE(listed(second));
    EXPECT_EQ(first->close_reason().value(), CloseReason::TargetDetached);
}

TEST_F(CloseCascadeTest, RemovedFromContextBeforeCloseListeners) {
    auto             page = new_page();
    std::atomic<int> seen_listed{-1};
    page->on_close([&](CloseReason) { seen_listed = listed(page) ? 1 : 0; });

    close_page(page);
    EXPECT_EQ(seen_listed.load(), 0);
}

TEST_F(CloseCascadeTest, PageNetworkWaitsEndWithTargetClosed) {
    auto page     = new_page();
    auto request  = page->wait_for_request(kUrl);
    auto response = page->wait_for_response(kUrl);

    connection_->dispose();

    for (const auto& message : {failure_message(request), failure_message(response)}) {
        EXPECT_NE(message.find("Target closed"), std::string::npos) << message;
        EXPECT_EQ(message.find("Timeout"), std::string::npos) << message;
    }
}

TEST_F(CloseCascadeTest, NetworkWaitsMatchTheirUrl) {
    auto page    = new_page();
    auto request = page->wait_for_request(kUrl);

    browser_->emit("Network.requestWillBeSent", {{"request", {{"url", "https://example.com/other"}}}}, "S1");
    browser_->emit("Network.requestWillBeSent", {{"request", {{"url", kUrl}}}, {"requestId", "9"}}, "S1");

    auto event = Sync::SyncBridge::wait(request, kWait);
    EXPECT_EQ(event.params["requestId"], "9");
}

TEST_F(CloseCascadeTest, ClosePageAfterConnectionDisposed) {
    auto page = new_page();
    connection_->dispose();

    EXPECT_NO_THROW(close_page(page));
    EXPECT_TRUE(page->is_closed());
    EXPECT_EQ(page->close_reason().value(), CloseReason::ExplicitClose);
}

TEST_F(CloseCascadeTest, PageDisposeClosesSynchronously) {
    auto page = new_page();
    page->dispose();
    EXPECT_TRUE(page->is_closed());
    EXPECT_FALSE(listed(page));
}

TEST_F(CloseCascadeTest, PageDisposeOnIoThreadClosesBeforeReturning) {
    auto page   = new_page();
    auto closed = std::make_shared<CDP::Waiter<bool>>();
    boost::asio::post(runner_.get_executor(), [this, page, closed]() {
        page->dispose();
        closed->resolve(page->is_closed() && !listed(page));
    });

    EXPECT_TRUE(Sync::SyncBridge::wait(closed, kWait));
    EXPECT_EQ(page->close_reason().value(), CloseReason::ExplicitClose);
    EXPECT_EQ(browser_->wait_for_command("Target.closeTarget")["params"]["targetId"], "T1");
}

TEST_F(CloseCascadeTest, SynchronousWaitOnPageClose) {
    auto page = new_page();
    auto done = Sync::SyncBridge::run(
        connection_->get_executor(),
        [page]() -> boost::asio::awaitable<bool> {
            co_await page->close();
            co_return page->is_closed();
        },
        std::chrono::seconds(10));
    EXPECT_TRUE(done);
}

TEST_F(CloseCascadeTest, RunBeforeUnloadOnlyRequestsClose) {
    auto page = new_page();

    Browser::PageCloseOptions options;
    options.run_before_unload = true;
    close_page(page, options);

    auto command = browser_->wait_for_command("Page.close");
    EXPECT_EQ(command["sessionId"], "S1");
    EXPECT_EQ(browser_->count("Target.closeTarget"), 0u);
    EXPECT_FALSE(page->is_closed());
}

TEST_F(CloseCascadeTest, ContextCloseCascadesToPages) {
    auto chrome  = chrome_;
    auto context = run([chrome]() { return chrome->create_browser_context(); });
    ASSERT_EQ(context->id(), "C1");
    EXPECT_EQ(chrome_->contexts().size(), 2u);

    auto page = run([context]() { return context->new_page(); });
    EXPECT_EQ(browser_->wait_for_command("Target.createTarget")["params"]["browserContextId"], "C1");
    auto pending = page->send("Runtime.evaluate", {{"expression", "1"}});

    run([context]() { return context->close(); });

    EXPECT_TRUE(context->is_closed());
    EXPECT_TRUE(context->pages().empty());
    EXPECT_TRUE(page->is_closed());
    EXPECT_EQ(chrome_->contexts().size(), 1u);
    EXPECT_NE(failure_message(pending).find("Target.detachedFromTarget"), std::string::npos);
}

TEST_F(CloseCascadeTest, DefaultContextCannotBeClosed) {
    auto context = chrome_->default_context();
    EXPECT_THROW(run([context]() { return context->close(); }), std::logic_error);
}

TEST_F(CloseCascadeTest, BrowserCloseRejectsEverything) {
    auto             page = new_page();
    std::atomic<int> disconnected{0};
    chrome_->on_disconnected([&](CloseReason) { ++disconnected; });

    auto pending = page->send("Runtime.evaluate", {{"expression", "1"}});
    auto waiter  = page->wait_for_response(kUrl);

    auto chrome = chrome_;
    run([chrome]() { return chrome->close(); });

    EXPECT_TRUE(chrome_->is_closed());
    EXPECT_TRUE(page->is_closed());
    EXPECT_EQ(disconnected.load(), 1);
    EXPECT_GE(browser_->count("Browser.close"), 1u);
    EXPECT_NE(failure_message(pending).find("Target closed"), std::string::npos);
    EXPECT_EQ(failure_message(waiter).find("Timeout"), std::string::npos);
    EXPECT_TRUE(chrome_->pages().empty());
}

TEST_F(CloseCascadeTest, BrowserNetworkWaitsAfterDispose) {
    auto page     = new_page();
    auto request  = page->wait_for_request(kUrl);
    auto response = page->wait_for_response(kUrl);

    chrome_->dispose();
    EXPECT_TRUE(chrome_->is_closed());

    for (const auto& message : {failure_message(request), failure_message(response)}) {
        EXPECT_NE(message.find("Target closed"), std::string::npos) << message;
        EXPECT_EQ(message.find("Timeout"), std::string::npos) << message;
    }
}

TEST_F(CloseCascadeTest, TransportDropClosesEveryPage) {
    auto first  = new_page();
    auto second = new_page();

    std::atomic<int> reason{-1};
    chrome_->on_disconnected([&](CloseReason r) { reason = static_cast<int>(r); });

    browser_->transport()->close();

    EXPECT_EQ(Sync::SyncBridge::wait(connection_->closed(), kWait), CloseReason::TransportClosed);
    EXPECT_EQ(reason.load(), static_cast<int>(CloseReason::TransportClosed));
    EXPECT_EQ(first->close_reason().value(), CloseReason::TransportClosed);
    EXPECT_EQ(second->close_reason().value(), CloseReason::TransportClosed);
    EXPECT_NO_THROW(close_page(first));
    EXPECT_THROW(new_page(), TargetClosedError);
}
