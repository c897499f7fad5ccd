// test/unit/test_robust_channel.cpp
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "rabbitmq_recovery/connection.hpp"
#include "rabbitmq_recovery/robust_channel.hpp"
#include "utils/test_utils.hpp"
#include <future>
#include <thread>

using namespace rabbitmq_recovery;
using namespace rabbitmq_recovery::test;
using namespace testing;

class RobustChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = FutureStore::createRoot();
        session_ = createMockSession();
        log_ = std::make_shared<RecoveryLog>();
        channel_ = createChannel(session_, 1);
        ASSERT_TRUE(channel_->initialize());
    }

    std::unique_ptr<RobustChannel> createChannel(std::shared_ptr<ChannelSession> session, int channelId) {
        return std::make_unique<RobustChannel>(std::move(session), nullptr, channelId, root_->getChild(),
                                               std::make_shared<RecordingEntityFactory>(log_));
    }

    std::shared_ptr<FutureStore> root_;
    std::shared_ptr<NiceMockChannelSession> session_;
    std::shared_ptr<RecoveryLog> log_;
    std::unique_ptr<RobustChannel> channel_;
};

TEST_F(RobustChannelTest, InitializeOpensThenAppliesQos) {
    auto session = createMockSession();
    auto channel = createChannel(session, 3);

    {
        InSequence seq;
        EXPECT_CALL(*session, open(_, 3, _));
        EXPECT_CALL(*session, basicQos(0, 0u, false, _));
    }

    auto result = channel->initialize(std::chrono::milliseconds(500));
    ASSERT_TRUE(result);
    EXPECT_EQ(session, *result);
    EXPECT_TRUE(session->opened());
}

TEST_F(RobustChannelTest, SessionSharesChannelRegistry) {
    EXPECT_EQ(channel_->futures(), session_->futureStore());
    EXPECT_EQ(root_, channel_->futures()->getParent());
}

TEST_F(RobustChannelTest, CloseIsIdempotent) {
    EXPECT_CALL(*session_, close()).Times(1);
    EXPECT_CALL(*session_, release()).Times(1);

    EXPECT_TRUE(channel_->close());
    EXPECT_TRUE(channel_->isClosed());
    EXPECT_TRUE(channel_->close());
    EXPECT_TRUE(channel_->isClosed());
}

TEST_F(RobustChannelTest, CloseAfterBrokerCloseSkipsCloseRequest) {
    session_->brokerClose(ErrorType::ChannelError, "PRECONDITION_FAILED");

    EXPECT_CALL(*session_, close()).Times(0);
    EXPECT_TRUE(channel_->close());
    EXPECT_TRUE(channel_->isClosed());
}

TEST_F(RobustChannelTest, BrokerCloseFailsClosingSignal) {
    auto closing = channel_->closing();
    session_->brokerClose(ErrorType::ChannelError, "NOT_FOUND - no queue 'gone'");

    EXPECT_THROW(closing.get(), ChannelException);
}

TEST_F(RobustChannelTest, ClosedChannelRejectsOperations) {
    ASSERT_TRUE(channel_->close());

    EXPECT_CALL(*session_, declareQueue(_, _)).Times(0);
    EXPECT_CALL(*session_, basicQos(_, _, _, _)).Times(0);

    auto queue = channel_->declareQueue(TestConfig::queue("late"));
    EXPECT_FALSE(queue);
    EXPECT_EQ(ErrorType::ChannelError, queue.error);

    auto qos = channel_->setQos(5);
    EXPECT_FALSE(qos);
    EXPECT_EQ(ErrorType::ChannelError, qos.error);
}

TEST_F(RobustChannelTest, CloseForgetsRememberedEntities) {
    ASSERT_TRUE(channel_->declareExchange(TestConfig::exchange("events")));
    ASSERT_TRUE(channel_->declareQueue(TestConfig::queue("readings")));

    ASSERT_TRUE(channel_->close());
    EXPECT_TRUE(channel_->getRecoverableExchangeNames().empty());
    EXPECT_TRUE(channel_->getRecoverableQueueNames().empty());
}

TEST_F(RobustChannelTest, QosReappliedAfterReconnect) {
    ASSERT_TRUE(channel_->setQos(10));
    ASSERT_TRUE(channel_->setQos(25, 4096));

    {
        InSequence seq;
        EXPECT_CALL(*session_, open(_, 2, _));
        EXPECT_CALL(*session_, basicQos(25, 4096u, false, _));
    }

    ASSERT_TRUE(channel_->onReconnect(nullptr, 2));
    EXPECT_EQ((QosSettings{25, 4096}), channel_->getQos());
    EXPECT_EQ((QosSettings{25, 4096}), session_->lastQos());
}

TEST_F(RobustChannelTest, DefaultQosReappliedAfterReconnect) {
    EXPECT_CALL(*session_, basicQos(0, 0u, false, _)).Times(1);

    ASSERT_TRUE(channel_->onReconnect(nullptr, 2));
    EXPECT_EQ(QosSettings{}, channel_->getQos());
}

TEST_F(RobustChannelTest, QosRememberedEvenIfBrokerRejectsIt) {
    EXPECT_CALL(*session_, basicQos(50, 0u, false, _))
        .WillOnce(Return(Result<void>(ErrorType::ConnectionLost, "connection lost")))
        .WillOnce(Return(Result<void>()));

    EXPECT_FALSE(channel_->setQos(50));
    EXPECT_EQ(50, channel_->getQos().prefetchCount);

    ASSERT_TRUE(channel_->onReconnect(nullptr, 2));
}

TEST_F(RobustChannelTest, AllChannelsQosRejected) {
    ASSERT_TRUE(channel_->setQos(5));

    EXPECT_CALL(*session_, basicQos(_, _, _, _)).Times(0);

    auto result = channel_->setQos(1, 0, true);
    EXPECT_FALSE(result);
    EXPECT_EQ(ErrorType::UnsupportedOperation, result.error);
    EXPECT_EQ((QosSettings{5, 0}), channel_->getQos());
}

TEST_F(RobustChannelTest, InternalExchangeNotRemembered) {
    auto config = TestConfig::exchange("amq.internal", "topic");
    config.internal = true;

    ASSERT_TRUE(channel_->declareExchange(config));
    EXPECT_EQ(nullptr, channel_->findExchange("amq.internal"));
}

TEST_F(RobustChannelTest, NonRecoverableDeclarationsNotRemembered) {
    ASSERT_TRUE(channel_->declareExchange(TestConfig::exchange("scratch"), std::nullopt, false));
    ASSERT_TRUE(channel_->declareQueue(TestConfig::queue("ephemeral"), std::nullopt, false));

    EXPECT_TRUE(channel_->getRecoverableExchangeNames().empty());
    EXPECT_TRUE(channel_->getRecoverableQueueNames().empty());
}

TEST_F(RobustChannelTest, RecoverableEntitiesRemembered) {
    auto exchange = channel_->declareExchange(TestConfig::exchange("events", "fanout"));
    auto queue = channel_->declareQueue(TestConfig::queue("readings"));
    ASSERT_TRUE(exchange);
    ASSERT_TRUE(queue);

    EXPECT_EQ(*exchange, channel_->findExchange("events"));
    EXPECT_EQ(*queue, channel_->findQueue("readings"));
}

TEST_F(RobustChannelTest, ServerNamedQueueKeyedByResultingName) {
    auto queue = channel_->declareQueue(TestConfig::queue(""));
    ASSERT_TRUE(queue);

    EXPECT_EQ("amq.gen-1", (*queue)->getName());
    EXPECT_THAT(channel_->getRecoverableQueueNames(), ElementsAre("amq.gen-1"));

    QueueInfo regenerated;
    regenerated.name = "amq.gen-9";
    EXPECT_CALL(*session_, declareQueue(Field(&QueueConfig::name, ""), _))
        .WillOnce(Return(Result<QueueInfo>(regenerated)));
    ASSERT_TRUE(channel_->onReconnect(nullptr, 2));

    EXPECT_EQ("amq.gen-9", (*queue)->getName());
    EXPECT_THAT(channel_->getRecoverableQueueNames(), ElementsAre("amq.gen-9"));
    EXPECT_EQ(*queue, channel_->findQueue("amq.gen-9"));
    EXPECT_EQ(nullptr, channel_->findQueue("amq.gen-1"));
}

TEST_F(RobustChannelTest, RenamedQueueKeepsRecoveryOrder) {
    ASSERT_TRUE(channel_->declareQueue(TestConfig::queue("first")));
    ASSERT_TRUE(channel_->declareQueue(TestConfig::queue("")));
    ASSERT_TRUE(channel_->declareQueue(TestConfig::queue("last")));

    ASSERT_TRUE(channel_->onReconnect(nullptr, 2));
    EXPECT_THAT(channel_->getRecoverableQueueNames(), ElementsAre("first", "amq.gen-2", "last"));

    log_->clear();
    ASSERT_TRUE(channel_->onReconnect(nullptr, 3));
    EXPECT_THAT(log_->entries(), ElementsAre("queue:first", "queue:amq.gen-2", "queue:last"));
}

TEST_F(RobustChannelTest, FailedDeclareNotRemembered) {
    EXPECT_CALL(*session_, declareExchange(_, _))
        .WillOnce(Return(Result<void>(ErrorType::ChannelError, "ACCESS_REFUSED")));

    auto result = channel_->declareExchange(TestConfig::exchange("forbidden"));
    EXPECT_FALSE(result);
    EXPECT_EQ(ErrorType::ChannelError, result.error);
    EXPECT_TRUE(channel_->getRecoverableExchangeNames().empty());
}

TEST_F(RobustChannelTest, DeletedQueueNotRedeclared) {
    ASSERT_TRUE(channel_->declareQueue(TestConfig::queue("jobs")));
    ASSERT_TRUE(channel_->deleteQueue("jobs"));
    EXPECT_EQ(nullptr, channel_->findQueue("jobs"));

    EXPECT_CALL(*session_, declareQueue(_, _)).Times(0);
    ASSERT_TRUE(channel_->onReconnect(nullptr, 2));
    EXPECT_TRUE(log_->entries().empty());
}

TEST_F(RobustChannelTest, DeletedExchangeNotRedeclared) {
    ASSERT_TRUE(channel_->declareExchange(TestConfig::exchange("events")));
    ASSERT_TRUE(channel_->deleteExchange("events", std::nullopt, true));

    EXPECT_CALL(*session_, declareExchange(_, _)).Times(0);
    ASSERT_TRUE(channel_->onReconnect(nullptr, 2));
}

TEST_F(RobustChannelTest, DeleteRemovesNonRecoverableNames) {
    // Deleting something that was never remembered is not an error
    EXPECT_TRUE(channel_->deleteExchange("never-declared"));
    auto deleted = channel_->deleteQueue("never-declared");
    EXPECT_TRUE(deleted);
}

TEST_F(RobustChannelTest, FailedDeleteKeepsEntity) {
    ASSERT_TRUE(channel_->declareQueue(TestConfig::queue("jobs")));

    EXPECT_CALL(*session_, deleteQueue("jobs", false, true, false, _))
        .WillOnce(Return(Result<uint32_t>(ErrorType::ChannelError, "PRECONDITION_FAILED - queue not empty")));

    EXPECT_FALSE(channel_->deleteQueue("jobs", std::nullopt, false, true));
    EXPECT_NE(nullptr, channel_->findQueue("jobs"));
}

TEST_F(RobustChannelTest, ExchangesRecoveredBeforeQueues) {
    auto queue = channel_->declareQueue(TestConfig::queue("Y"));
    ASSERT_TRUE(queue);
    ASSERT_TRUE(channel_->declareExchange(TestConfig::exchange("X")));
    ASSERT_TRUE((*queue)->bind("X", "key"));

    {
        InSequence seq;
        EXPECT_CALL(*session_, declareExchange(Field(&ExchangeConfig::name, "X"), _));
        EXPECT_CALL(*session_, declareQueue(Field(&QueueConfig::name, "Y"), _));
        EXPECT_CALL(*session_, bindQueue(Field(&BindingConfig::exchange, "X"), _));
    }

    ASSERT_TRUE(channel_->onReconnect(nullptr, 2));
    EXPECT_THAT(log_->entries(), ElementsAre("exchange:X", "queue:Y"));
}

TEST_F(RobustChannelTest, EntitiesRecoveredInDeclarationOrder) {
    ASSERT_TRUE(channel_->declareExchange(TestConfig::exchange("b")));
    ASSERT_TRUE(channel_->declareExchange(TestConfig::exchange("a")));
    ASSERT_TRUE(channel_->declareQueue(TestConfig::queue("q2")));
    ASSERT_TRUE(channel_->declareQueue(TestConfig::queue("q1")));
    // Re-declaring keeps the original position
    ASSERT_TRUE(channel_->declareExchange(TestConfig::exchange("b")));

    ASSERT_TRUE(channel_->onReconnect(nullptr, 2));
    EXPECT_THAT(log_->entries(), ElementsAre("exchange:b", "exchange:a", "queue:q2", "queue:q1"));
}

TEST_F(RobustChannelTest, ReconnectAdoptsChannelNumber) {
    EXPECT_CALL(*session_, open(_, 7, _));

    ASSERT_TRUE(channel_->onReconnect(nullptr, 7));
    EXPECT_EQ(7, channel_->getChannelId());
    EXPECT_EQ(7, session_->openedChannelId());
}

TEST_F(RobustChannelTest, ReconnectRejectsOnlyOwnPendingOperations) {
    auto siblingSession = createMockSession();
    auto sibling = createChannel(siblingSession, 2);
    ASSERT_TRUE(sibling->initialize());

    auto pendingA = channel_->futures()->create<void>();
    auto pendingB = sibling->futures()->create<void>();

    ASSERT_TRUE(channel_->onReconnect(nullptr, 1));

    EXPECT_TRUE(pendingA->isDone());
    EXPECT_THROW(pendingA->getFuture().get(), ConnectionLostException);
    EXPECT_FALSE(pendingB->isDone());
    EXPECT_EQ(1u, sibling->futures()->size());
    EXPECT_TRUE(channel_->futures()->empty());
}

TEST_F(RobustChannelTest, ReconnectWakesBlockedOperation) {
    std::promise<void> started;
    auto startedFuture = started.get_future();

    EXPECT_CALL(*session_, declareQueue(Field(&QueueConfig::name, "slow"), _))
        .WillOnce(Invoke([this, &started](const QueueConfig&, Timeout) {
            auto operation = session_->futureStore()->create<QueueInfo>();
            started.set_value();
            return awaitOperation(*operation, std::nullopt, "queue.declare");
        }));

    Result<std::shared_ptr<Queue>> declared;
    std::thread caller([this, &declared] {
        declared = channel_->declareQueue(TestConfig::queue("slow"));
    });

    startedFuture.wait();
    ASSERT_TRUE(channel_->onReconnect(nullptr, 2));
    caller.join();

    EXPECT_FALSE(declared);
    EXPECT_EQ(ErrorType::ConnectionLost, declared.error);
    EXPECT_EQ(nullptr, channel_->findQueue("slow"));
    EXPECT_EQ(1u, channel_->getStats().operationsRejected);
}

TEST_F(RobustChannelTest, ReconnectInterruptsCallBlockedInTransport) {
    std::promise<void> started;
    auto startedFuture = started.get_future();
    std::promise<void> interrupted;
    auto interruptedFuture = interrupted.get_future();

    EXPECT_CALL(*session_, interrupt())
        .WillOnce(Invoke([&interrupted] { interrupted.set_value(); }));

    // Blocks inside the socket read, not on the registry future, until the
    // transport is shut down underneath it
    EXPECT_CALL(*session_, declareQueue(Field(&QueueConfig::name, "stuck"), _))
        .WillOnce(Invoke([this, &started, &interruptedFuture](const QueueConfig&, Timeout) {
            auto operation = session_->futureStore()->create<QueueInfo>();
            started.set_value();
            if (interruptedFuture.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
                return Result<QueueInfo>(ErrorType::TimeoutError, "transport never interrupted");
            }
            operation->reject(makeException(ErrorType::NetworkError, "a socket error occurred"));
            return awaitOperation(*operation, std::nullopt, "queue.declare");
        }));

    Result<std::shared_ptr<Queue>> declared;
    std::thread caller([this, &declared] {
        declared = channel_->declareQueue(TestConfig::queue("stuck"));
    });

    startedFuture.wait();
    auto replacement = std::make_shared<Connection>(ConnectionConfig{});
    ASSERT_TRUE(channel_->onReconnect(replacement, 2));
    caller.join();

    EXPECT_FALSE(declared);
    EXPECT_EQ(ErrorType::ConnectionLost, declared.error);
    EXPECT_EQ(replacement, channel_->getConnection());
    EXPECT_EQ(nullptr, channel_->findQueue("stuck"));
}

TEST_F(RobustChannelTest, SameConnectionIsNotInterrupted) {
    EXPECT_CALL(*session_, interrupt()).Times(0);
    ASSERT_TRUE(channel_->onReconnect(nullptr, 2));
}

TEST_F(RobustChannelTest, InitializeOnOpenChannelDoesNotReopen) {
    EXPECT_CALL(*session_, open(_, _, _)).Times(0);
    EXPECT_CALL(*session_, basicQos(_, _, _, _)).Times(0);

    auto result = channel_->initialize();
    ASSERT_TRUE(result);
    EXPECT_EQ(session_, *result);
}

TEST_F(RobustChannelTest, ReconnectRejectsPendingClosingSignal) {
    auto previous = channel_->closing();

    ASSERT_TRUE(channel_->onReconnect(nullptr, 2));

    EXPECT_THROW(previous.get(), ConnectionLostException);
    auto current = channel_->closing();
    EXPECT_NE(std::future_status::ready, current.wait_for(std::chrono::milliseconds(0)));
}

TEST_F(RobustChannelTest, CloseInterruptedByReconnect) {
    std::promise<void> closeRequested;
    auto closeRequestedFuture = closeRequested.get_future();

    // The broker never answers channel.close
    EXPECT_CALL(*session_, close())
        .WillOnce(Invoke([&closeRequested]() {
            closeRequested.set_value();
            return Result<void>();
        }));

    // A closed channel is not reopened
    EXPECT_CALL(*session_, open(_, _, _)).Times(0);

    Result<void> closed;
    std::thread closer([this, &closed] {
        closed = channel_->close();
    });

    closeRequestedFuture.wait();
    EXPECT_TRUE(channel_->onReconnect(nullptr, 2));
    closer.join();

    EXPECT_FALSE(closed);
    EXPECT_EQ(ErrorType::ConnectionLost, closed.error);
    EXPECT_TRUE(channel_->isClosed());
    EXPECT_TRUE(channel_->close());
}

TEST_F(RobustChannelTest, QueueHookFailureAbortsReconnect) {
    ASSERT_TRUE(channel_->declareExchange(TestConfig::exchange("events")));
    ASSERT_TRUE(channel_->declareQueue(TestConfig::queue("a")));
    ASSERT_TRUE(channel_->declareQueue(TestConfig::queue("b")));
    ASSERT_TRUE(channel_->declareQueue(TestConfig::queue("c")));
    log_->failOn("queue:b");

    auto result = channel_->onReconnect(nullptr, 2);
    EXPECT_FALSE(result);
    EXPECT_EQ(ErrorType::ChannelError, result.error);
    EXPECT_NE(std::string::npos, result.message.find("PRECONDITION_FAILED"));

    EXPECT_THAT(log_->entries(), ElementsAre("exchange:events", "queue:a", "queue:b"));

    auto stats = channel_->getStats();
    EXPECT_EQ(1u, stats.failedReconnects);
    EXPECT_EQ(1u, stats.exchangesRecovered);
    EXPECT_EQ(1u, stats.queuesRecovered);
}

TEST_F(RobustChannelTest, ReopenFailureSkipsRecoveryHooks) {
    ASSERT_TRUE(channel_->declareExchange(TestConfig::exchange("events")));

    EXPECT_CALL(*session_, open(_, 2, _))
        .WillOnce(Return(Result<void>(ErrorType::ConnectionError, "socket closed")));
    EXPECT_CALL(*session_, basicQos(_, _, _, _)).Times(0);

    auto result = channel_->onReconnect(nullptr, 2);
    EXPECT_FALSE(result);
    EXPECT_EQ(ErrorType::ConnectionError, result.error);
    EXPECT_TRUE(log_->entries().empty());
}

TEST_F(RobustChannelTest, FailedReconnectRetriedByNextReconnect) {
    ASSERT_TRUE(channel_->declareQueue(TestConfig::queue("a")));

    EXPECT_CALL(*session_, open(_, _, _))
        .WillOnce(Return(Result<void>(ErrorType::NetworkError, "connection refused")))
        .WillRepeatedly(DoDefault());

    EXPECT_FALSE(channel_->onReconnect(nullptr, 2));
    EXPECT_TRUE(channel_->onReconnect(nullptr, 2));
    EXPECT_THAT(log_->entries(), ElementsAre("queue:a"));

    auto stats = channel_->getStats();
    EXPECT_EQ(2u, stats.reconnects);
    EXPECT_EQ(1u, stats.failedReconnects);
    EXPECT_EQ(1u, stats.queuesRecovered);
}

TEST_F(RobustChannelTest, PlainFactoryEntitiesOnlyRedeclare) {
    auto session = createMockSession();
    RobustChannel channel(session, nullptr, 4, root_->getChild(), std::make_shared<PlainEntityFactory>());
    ASSERT_TRUE(channel.initialize());

    auto queue = channel.declareQueue(TestConfig::queue("plain"));
    ASSERT_TRUE(queue);
    ASSERT_TRUE((*queue)->bind("events", "#"));

    EXPECT_CALL(*session, declareQueue(Field(&QueueConfig::name, "plain"), _)).Times(1);
    EXPECT_CALL(*session, bindQueue(_, _)).Times(0);
    EXPECT_TRUE(channel.onReconnect(nullptr, 4));
}
