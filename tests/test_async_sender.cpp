#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "network/async_sender.h"
#include "protocol/fix_message.h"
#include "session/fix_session.h"
#include "utils/logger.h"
#include "loopback_server.h"
#include <chrono>
#include <future>
#include <memory>
#include <vector>

using namespace fix_order_entry::network;
using namespace fix_order_entry::protocol;
using namespace fix_order_entry::session;
using namespace fix_order_entry::utils;
using fix_order_entry::test::LoopbackServer;
using namespace testing;
using namespace std::chrono_literals;

// =================================================================
// TEST FIXTURE - AsyncSenderTest
// =================================================================

class AsyncSenderTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::getInstance().setLogLevel(LogLevel::FATAL);

        session_ = std::make_unique<FixSession>("CLIENT1", "SERVER1");

        builder_config_.clock = []()
        { return std::chrono::system_clock::time_point(std::chrono::seconds(1710495005)); };

        options_.connect_timeout = 1000ms;
        options_.read_timeout = 200ms;
    }

    void TearDown() override
    {
        if (sender_)
        {
            sender_->stop();
        }
    }

    AsyncSender &createSender(int port)
    {
        Endpoint endpoint;
        endpoint.host = "127.0.0.1";
        endpoint.port = port;
        sender_ = std::make_unique<AsyncSender>(*session_, builder_config_, endpoint, options_);
        return *sender_;
    }

    OrderRequest order(const std::string &symbol = "AAPL")
    {
        return OrderRequest::create(symbol, Side::Buy, 100, 150.0, "CLIENT1", "SERVER1");
    }

    std::vector<OrderEvent> drainEvents(AsyncSender &sender)
    {
        std::vector<OrderEvent> events;
        OrderEvent event;
        while (sender.waitEvent(event, 100ms))
        {
            events.push_back(event);
        }
        return events;
    }

    static std::vector<OrderEventType> types(const std::vector<OrderEvent> &events)
    {
        std::vector<OrderEventType> result;
        for (const auto &event : events)
        {
            result.push_back(event.type);
        }
        return result;
    }

    std::unique_ptr<FixSession> session_;
    FixBuilder::BuilderConfig builder_config_;
    TransportOptions options_;
    std::unique_ptr<AsyncSender> sender_;
};

// =================================================================
// LIFECYCLE
// =================================================================

TEST_F(AsyncSenderTest, StartAndStop)
{
    AsyncSender &sender = createSender(9876);
    EXPECT_FALSE(sender.isRunning());

    sender.start();
    EXPECT_TRUE(sender.isRunning());
    sender.start(); // idempotent

    sender.stop();
    EXPECT_FALSE(sender.isRunning());
    sender.stop(); // idempotent
}

TEST_F(AsyncSenderTest, SubmitRequiresRunningSender)
{
    AsyncSender &sender = createSender(9876);
    EXPECT_THROW(sender.submit(order()), std::runtime_error);
    EXPECT_EQ(1U, sender.getStats().total_jobs_rejected);
}

TEST_F(AsyncSenderTest, CannotRestartAfterStop)
{
    AsyncSender &sender = createSender(9876);
    sender.start();
    sender.stop();
    EXPECT_THROW(sender.start(), std::logic_error);
}

TEST_F(AsyncSenderTest, InvalidEndpointIsRejected)
{
    Endpoint endpoint;
    endpoint.port = 0;
    EXPECT_THROW(AsyncSender sender(*session_, builder_config_, endpoint, options_), std::invalid_argument);

    endpoint.port = 9876;
    endpoint.host = "";
    EXPECT_THROW(AsyncSender sender(*session_, builder_config_, endpoint, options_), std::invalid_argument);
}

// =================================================================
// SUBMISSION
// =================================================================

TEST_F(AsyncSenderTest, DeliversSentThenReceived)
{
    LoopbackServer server([](LoopbackServer &self, int fd)
                          {
        self.readMessage(fd);
        LoopbackServer::sendAll(fd, "8=FIX.4.2\x01" "35=8\x01");
        self.waitForClose(fd); });

    AsyncSender &sender = createSender(server.port());
    sender.start();

    auto future = sender.submit(order());
    ASSERT_EQ(std::future_status::ready, future.wait_for(5s));
    SubmissionResult result = future.get();

    EXPECT_TRUE(result.delivered());
    ASSERT_TRUE(std::holds_alternative<Received>(result.outcome));
    EXPECT_EQ(1, result.msgSeqNum);
    EXPECT_THAT(result.clOrdID, StartsWith("ORD-"));
    EXPECT_EQ(result.message, server.received());

    auto events = drainEvents(sender);
    ASSERT_THAT(types(events), ElementsAre(OrderEventType::SENT, OrderEventType::RECEIVED));
    for (const auto &event : events)
    {
        EXPECT_EQ(result.job_id, event.job_id);
    }
    EXPECT_THAT(events[1].text, HasSubstr("35=8"));
}

TEST_F(AsyncSenderTest, SilentPeerYieldsInfoEvent)
{
    LoopbackServer server([](LoopbackServer &self, int fd)
                          {
        self.readMessage(fd);
        self.waitForClose(fd); });

    AsyncSender &sender = createSender(server.port());
    sender.start();

    SubmissionResult result = sender.submit(order()).get();
    EXPECT_TRUE(std::holds_alternative<TimedOut>(result.outcome));
    EXPECT_TRUE(result.delivered());

    EXPECT_THAT(types(drainEvents(sender)), ElementsAre(OrderEventType::SENT, OrderEventType::INFO));
    EXPECT_EQ(1U, sender.getStats().total_orders_delivered);
}

TEST_F(AsyncSenderTest, RefusedConnectionYieldsErrorEvent)
{
    AsyncSender &sender = createSender(LoopbackServer::unusedPort());
    sender.start();

    SubmissionResult result = sender.submit(order()).get();
    EXPECT_TRUE(std::holds_alternative<Refused>(result.outcome));
    EXPECT_FALSE(result.delivered());

    EXPECT_THAT(types(drainEvents(sender)), ElementsAre(OrderEventType::SENT, OrderEventType::ERROR));
    EXPECT_EQ(1U, sender.getStats().total_orders_failed);
}

TEST_F(AsyncSenderTest, ValidationFailureTravelsThroughFuture)
{
    AsyncSender &sender = createSender(LoopbackServer::unusedPort());
    sender.start();

    OrderRequest invalid = order();
    invalid.symbol = "";

    auto future = sender.submit(invalid);
    EXPECT_THROW(future.get(), ValidationError);

    auto events = drainEvents(sender);
    ASSERT_EQ(1U, events.size());
    EXPECT_EQ(OrderEventType::ERROR, events[0].type);
    EXPECT_THAT(events[0].text, HasSubstr("Symbol"));
    EXPECT_EQ(1, session_->peekSeqNum());
}

TEST_F(AsyncSenderTest, StopExecutesQueuedJobs)
{
    AsyncSender &sender = createSender(LoopbackServer::unusedPort());
    sender.start();

    std::vector<std::future<SubmissionResult>> futures;
    for (int i = 0; i < 5; ++i)
    {
        futures.push_back(sender.submit(order()));
    }
    sender.stop();

    std::vector<int> seqNums;
    for (auto &future : futures)
    {
        ASSERT_EQ(std::future_status::ready, future.wait_for(0ms));
        seqNums.push_back(future.get().msgSeqNum);
    }
    EXPECT_THAT(seqNums, ElementsAre(1, 2, 3, 4, 5));
    EXPECT_EQ(5U, sender.getStats().total_jobs_submitted);
    EXPECT_THROW(sender.submit(order()), std::runtime_error);
}

TEST(OrderEventTest, TypeNames)
{
    EXPECT_STREQ("SENT", eventTypeName(OrderEventType::SENT));
    EXPECT_STREQ("RECEIVED", eventTypeName(OrderEventType::RECEIVED));
    EXPECT_STREQ("INFO", eventTypeName(OrderEventType::INFO));
    EXPECT_STREQ("ERROR", eventTypeName(OrderEventType::ERROR));
}
