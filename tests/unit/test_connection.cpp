#include <atomic>
#include <utility>
#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>
#include "../support/connection_fixture.hpp"

using namespace Tether;
using namespace Tether::Testing;
using Core::CloseReason;
using Core::TargetClosedError;

namespace {

// Runs the waiter to completion and returns the close reason it was rejected with.
CloseReason rejection_reason(const CDP::PendingResult& pending) {
    try {
        Sync::SyncBridge::wait(pending, kWait);
    } catch (const TargetClosedError& e) {
        return e.reason();
    }
    ADD_FAILURE() << "command was not rejected with TargetClosedError";
    return CloseReason::ExplicitClose;
}

}  // namespace

class ConnectionTest : public ConnectionFixture {};

TEST_F(ConnectionTest, CallRoundTrip) {
    browser_->on("Browser.getVersion", [](FakeEndpoint& self, const nlohmann::json& command) {
        self.reply(command, {{"product", "HeadlessChrome/120.0"}});
    });

    auto version = await(connection_->send("", "Browser.getVersion"));
    EXPECT_EQ(version["product"], "HeadlessChrome/120.0");

    auto connection = connection_;
    auto again      = run([connection]() { return connection->call("Browser.getVersion"); });
    EXPECT_EQ(again["product"], "HeadlessChrome/120.0");
}

TEST_F(ConnectionTest, CommandIdsAreUniqueAndIncreasing) {
    connection_->send("", "Target.setDiscoverTargets", {{"discover", true}});
    connection_->send("", "Target.getTargets");
    connection_->send("", "Browser.getVersion");

    ASSERT_TRUE(eventually([&]() { return browser_->received_count() == 3; }));
    auto first  = browser_->wait_for_command("Target.setDiscoverTargets")["id"].get<std::uint64_t>();
    auto second = browser_->wait_for_command("Target.getTargets")["id"].get<std::uint64_t>();
    auto third  = browser_->wait_for_command("Browser.getVersion")["id"].get<std::uint64_t>();
    EXPECT_LT(first, second);
    EXPECT_LT(second, third);
    EXPECT_EQ(connection_->last_command_id(), 3u);
}

TEST_F(ConnectionTest, ProtocolErrorReachesOnlyItsCaller) {
    browser_->on("Target.closeTarget", [](FakeEndpoint& self, const nlohmann::json& command) {
        self.reply_error(command, -32602, "No target with given id found");
    });
    browser_->on("Browser.getVersion", [](FakeEndpoint& self, const nlohmann::json& command) {
        self.reply(command, {{"product", "x"}});
    });

    auto failing = connection_->send("", "Target.closeTarget", {{"targetId", "nope"}});
    auto fine    = connection_->send("", "Browser.getVersion");

    try {
        await(failing);
        FAIL() << "expected ProtocolError";
    } catch (const Core::ProtocolError& e) {
        EXPECT_EQ(e.code(), -32602);
        EXPECT_EQ(e.remote_message(), "No target with given id found");
    }
    EXPECT_EQ(await(fine)["product"], "x");
    EXPECT_FALSE(connection_->is_closed());
}

TEST_F(ConnectionTest, CloseRejectsPendingCommands) {
    auto pending = connection_->send("", "Runtime.evaluate", {{"expression", "new Promise(() => {})"}});
    browser_->wait_for_command("Runtime.evaluate");

    connection_->close();

    EXPECT_EQ(rejection_reason(pending), CloseReason::ExplicitClose);
    EXPECT_EQ(await(connection_->closed()), CloseReason::ExplicitClose);
}

TEST_F(ConnectionTest, SendAfterCloseDoesNotWrite) {
    connection_->close();
    EXPECT_TRUE(connection_->is_closed());

    const auto written = client_->frames_written();
    auto       pending = connection_->send("", "Browser.getVersion");

    EXPECT_TRUE(pending->is_rejected());
    EXPECT_EQ(rejection_reason(pending), CloseReason::ExplicitClose);
    EXPECT_EQ(client_->frames_written(), written);
}

TEST_F(ConnectionTest, PeerCloseIsTransportClosed) {
    auto pending = connection_->send("", "Page.navigate", {{"url", "about:blank"}});
    browser_->wait_for_command("Page.navigate");

    browser_->transport()->close();

    EXPECT_EQ(await(connection_->closed()), CloseReason::TransportClosed);
    EXPECT_EQ(rejection_reason(pending), CloseReason::TransportClosed);

    const auto written = client_->frames_written();
    auto       later   = connection_->send("", "Browser.getVersion");
    EXPECT_EQ(rejection_reason(later), CloseReason::TransportClosed);
    EXPECT_EQ(client_->frames_written(), written);
}

TEST_F(ConnectionTest, TransportErrorCascades) {
    auto session = attach("S1", "T1");
    ASSERT_NE(session, nullptr);
    auto root_pending    = connection_->send("", "Target.getTargets");
    auto session_pending = session->send("Runtime.evaluate", {{"expression", "1"}});

    client_->fail("connection reset by peer");

    EXPECT_EQ(rejection_reason(root_pending), CloseReason::TransportError);
    EXPECT_EQ(rejection_reason(session_pending), CloseReason::TransportError);
    EXPECT_EQ(session->close_reason().value(), CloseReason::TransportError);
    EXPECT_EQ(connection_->close_reason().value(), CloseReason::TransportError);
}

TEST_F(ConnectionTest, MalformedFramesAreSkipped) {
    browser_->on("Browser.getVersion", [](FakeEndpoint& self, const nlohmann::json& command) {
        self.send_raw("this is not json");
        self.send_raw(R"({"id":"seven"})");
        self.send_raw(R"({"params":{}})");
        self.send_raw(R"({"method":"Target.attachedToTarget","params":{"sessionId":1}})");
        self.reply(command, {{"product", "still alive"}});
    });

    EXPECT_EQ(await(connection_->send("", "Browser.getVersion"))["product"], "still alive");
    EXPECT_FALSE(connection_->is_closed());
}

TEST_F(ConnectionTest, ConcurrentClosesCollapseIntoOne) {
    std::atomic<int> notifications{0};
    connection_->events().on_close([&](CloseReason) { ++notifications; });

    const CloseReason reasons[] = {CloseReason::ExplicitClose,
                                   CloseReason::TransportClosed,
                                   CloseReason::TransportError,
                                   CloseReason::TargetDetached};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i]() { connection_->close(reasons[i % 4]); });
    }
    for (auto& t : threads)
        t.join();

    auto reason = await(connection_->closed());
    EXPECT_EQ(reason, connection_->close_reason().value());
    EXPECT_EQ(notifications.load(), 1);

    connection_->close(CloseReason::TransportError);
    EXPECT_EQ(connection_->close_reason().value(), reason);
}

TEST_F(ConnectionTest, DisposeReturnsClosed) {
    auto pending = connection_->send("", "Runtime.evaluate");

    connection_->dispose();

    EXPECT_TRUE(connection_->is_closed());
    EXPECT_TRUE(connection_->closed()->is_settled());
    EXPECT_TRUE(pending->is_rejected());
    EXPECT_NO_THROW(connection_->dispose());
}

TEST_F(ConnectionTest, AttachAndDetachManageSessions) {
    auto session = attach("S7", "T7");
    ASSERT_NE(session, nullptr);
    EXPECT_EQ(session->target_id(), "T7");
    EXPECT_EQ(session->target_type(), "page");
    EXPECT_EQ(connection_->sessions().size(), 1u);

    auto pending = session->send("Runtime.evaluate", {{"expression", "1"}});
    browser_->wait_for_command("Runtime.evaluate");

    browser_->emit("Target.detachedFromTarget", {{"sessionId", "S7"}, {"targetId", "T7"}});

    EXPECT_EQ(await(session->closed()), CloseReason::TargetDetached);
    EXPECT_EQ(rejection_reason(pending), CloseReason::TargetDetached);
    EXPECT_EQ(connection_->session("S7"), nullptr);
    EXPECT_FALSE(connection_->is_closed());
}

TEST_F(ConnectionTest, AttachIsIdempotent) {
    auto first  = connection_->attach_session("S1", "T1", "page");
    auto second = connection_->attach_session("S1", "T1", "page");
    EXPECT_EQ(first, second);
    EXPECT_EQ(attach("S1", "T1"), first);
}

TEST_F(ConnectionTest, EventsAreRoutedBySession) {
    auto session = attach("S1", "T1");
    ASSERT_NE(session, nullptr);

    std::atomic<int> session_events{0};
    std::atomic<int> root_events{0};
    session->events().subscribe("Page.loadEventFired", [&](const Protocol::Event& e) {
        EXPECT_EQ(e.session_id, "S1");
        ++session_events;
    });
    connection_->events().subscribe("Page.loadEventFired", [&](const Protocol::Event&) { ++root_events; });

    browser_->emit("Page.loadEventFired", {{"timestamp", 1.0}}, "S1");
    browser_->emit("Page.loadEventFired", {{"timestamp", 2.0}});
    browser_->emit("Page.loadEventFired", {{"timestamp", 3.0}}, "S-unknown");

    EXPECT_TRUE(eventually([&]() { return session_events == 1 && root_events == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(session_events.load(), 1);
    EXPECT_EQ(root_events.load(), 1);
}

TEST_F(ConnectionTest, RootPredicateWaiter) {
    auto waiter = connection_->wait_for_event(
        "Target.targetCreated",
        [](const Protocol::Event& e) { return e.params["targetInfo"].value("type", "") == "page"; },
        std::chrono::seconds(5));

    browser_->emit("Target.targetCreated", {{"targetInfo", {{"targetId", "W"}, {"type", "worker"}}}});
    browser_->emit("Target.targetCreated", {{"targetInfo", {{"targetId", "P"}, {"type", "page"}}}});

    auto event = await(waiter);
    EXPECT_EQ(event.params["targetInfo"]["targetId"], "P");
}

TEST_F(ConnectionTest, CloseWaitCompletesWhileFramesStream) {
    std::atomic<bool> streaming{true};
    std::thread       flood([&]() {
        int n = 0;
        while (streaming)
            browser_->emit("Network.dataReceived", {{"requestId", std::to_string(++n)}});
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    auto closed = connection_->close();
    auto reason = Sync::SyncBridge::wait(closed, kWait);

    streaming = false;
    flood.join();
    EXPECT_EQ(reason, CloseReason::ExplicitClose);
}

TEST(ConnectionCloseTest, FrameArrivingAfterCloseDoesNotSettleWaiters) {
    boost::asio::io_context io_context;
    auto [client, peer] = Transport::MemoryTransport::pair(io_context.get_executor());
    auto connection     = CDP::Connection::create(client, "memory://", Core::Config());
    io_context.poll();

    auto command = connection->send("", "Runtime.evaluate");
    auto event   = connection->wait_for_event(
        "Page.loadEventFired", [](const Protocol::Event&) { return true; },
        std::chrono::milliseconds(0));
    io_context.restart();
    io_context.poll();

    peer->write_frame(R"({"id":1,"result":{"late":true}})");
    peer->write_frame(R"({"method":"Page.loadEventFired","params":{}})");
    connection->close(CloseReason::ExplicitClose);
    io_context.restart();
    io_context.poll();

    ASSERT_TRUE(command->is_settled());
    ASSERT_TRUE(event->is_settled());
    EXPECT_TRUE(command->is_rejected());
    EXPECT_TRUE(event->is_rejected());
    try {
        command->wait_for(std::chrono::milliseconds(0));
        FAIL() << "expected TargetClosedError";
    } catch (const TargetClosedError& e) {
        EXPECT_EQ(e.reason(), CloseReason::ExplicitClose);
    }
    EXPECT_THROW(event->wait_for(std::chrono::milliseconds(0)), TargetClosedError);
}
