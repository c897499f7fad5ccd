// test/unit/test_robust_connection.cpp
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "rabbitmq_recovery/robust_connection.hpp"
#include "utils/test_utils.hpp"

using namespace rabbitmq_recovery;
using namespace rabbitmq_recovery::test;
using namespace testing;

class RobustConnectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_ = std::make_shared<RecoveryLog>();
    }

    std::unique_ptr<RobustConnection> createConnection(ChannelConfig channelConfig = {}) {
        return std::make_unique<RobustConnection>(
            nullptr, channelConfig,
            [this] {
                auto session = createMockSession();
                sessions_.push_back(session);
                return session;
            },
            std::make_shared<RecordingEntityFactory>(log_));
    }

    std::shared_ptr<RecoveryLog> log_;
    std::vector<std::shared_ptr<NiceMockChannelSession>> sessions_;
};

TEST_F(RobustConnectionTest, ChannelsGetSequentialNumbersAndChildRegistries) {
    auto connection = createConnection();

    auto first = connection->channel();
    auto second = connection->channel();
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);

    EXPECT_EQ(1, (*first)->getChannelId());
    EXPECT_EQ(2, (*second)->getChannelId());
    EXPECT_EQ(1, sessions_[0]->openedChannelId());
    EXPECT_EQ(2, sessions_[1]->openedChannelId());

    EXPECT_EQ(connection->futures(), (*first)->futures()->getParent());
    EXPECT_NE((*first)->futures(), (*second)->futures());
    EXPECT_EQ(2u, connection->getChannelCount());
}

TEST_F(RobustConnectionTest, ChannelConfigAppliesPrefetch) {
    ChannelConfig config;
    config.prefetchCount = 32;
    auto connection = createConnection(config);

    auto channel = connection->channel();
    ASSERT_TRUE(channel);
    EXPECT_EQ(32, (*channel)->getQos().prefetchCount);
    EXPECT_EQ(32, sessions_[0]->lastQos().prefetchCount);
}

TEST_F(RobustConnectionTest, FailedOpenReturnsError) {
    auto connection = std::make_unique<RobustConnection>(
        nullptr, ChannelConfig{},
        [] {
            auto session = createMockSession();
            ON_CALL(*session, open(_, _, _))
                .WillByDefault(Return(Result<void>(ErrorType::ResourceError, "NOT_ALLOWED - channel_max")));
            return session;
        });

    auto channel = connection->channel();
    EXPECT_FALSE(channel);
    EXPECT_EQ(ErrorType::ResourceError, channel.error);
    EXPECT_EQ(0u, connection->getChannelCount());
}

TEST_F(RobustConnectionTest, ReconnectFansOutInCreationOrder) {
    auto connection = createConnection();
    auto first = connection->channel();
    auto second = connection->channel();
    ASSERT_TRUE(first && second);

    ASSERT_TRUE((*second)->declareQueue(TestConfig::queue("second-queue")));
    ASSERT_TRUE((*first)->declareQueue(TestConfig::queue("first-queue")));

    ASSERT_TRUE(connection->reconnect(nullptr));
    EXPECT_THAT(log_->entries(), ElementsAre("queue:first-queue", "queue:second-queue"));

    // Channels keep their numbers across reconnects
    EXPECT_EQ(1, (*first)->getChannelId());
    EXPECT_EQ(2, (*second)->getChannelId());
}

TEST_F(RobustConnectionTest, ReconnectScopesRejectionToEachChannel) {
    auto connection = createConnection();
    auto channel = connection->channel();
    ASSERT_TRUE(channel);

    auto connectionLevel = connection->futures()->create<void>();
    auto channelLevel = (*channel)->futures()->create<void>();

    ASSERT_TRUE(connection->reconnect(nullptr));

    EXPECT_TRUE(channelLevel->isDone());
    EXPECT_FALSE(connectionLevel->isDone());
}

TEST_F(RobustConnectionTest, ReconnectForgetsClosedChannels) {
    auto connection = createConnection();
    auto closed = connection->channel();
    auto open = connection->channel();
    ASSERT_TRUE(closed && open);
    ASSERT_TRUE((*closed)->close());

    EXPECT_CALL(*sessions_[0], open(_, _, _)).Times(0);
    EXPECT_CALL(*sessions_[1], open(_, 2, _)).Times(1);

    ASSERT_TRUE(connection->reconnect(nullptr));
    EXPECT_EQ(1u, connection->getChannelCount());
}

TEST_F(RobustConnectionTest, FailingChannelDoesNotHoldBackSiblings) {
    auto connection = createConnection();
    auto first = connection->channel();
    auto second = connection->channel();
    ASSERT_TRUE(first && second);

    ASSERT_TRUE((*first)->declareQueue(TestConfig::queue("broken")));
    ASSERT_TRUE((*second)->declareQueue(TestConfig::queue("fine")));
    log_->failOn("queue:broken");

    auto pending = (*second)->futures()->create<void>();
    EXPECT_CALL(*sessions_[1], open(_, 2, _)).Times(1);

    auto result = connection->reconnect(nullptr);
    EXPECT_FALSE(result);
    EXPECT_EQ(ErrorType::ChannelError, result.error);
    EXPECT_NE(std::string::npos, result.message.find("broken"));

    EXPECT_THAT(log_->entries(), ElementsAre("queue:broken", "queue:fine"));
    EXPECT_THROW(pending->getFuture().get(), ConnectionLostException);
    EXPECT_EQ(1u, (*second)->getStats().reconnects);
    EXPECT_EQ(1u, (*second)->getStats().queuesRecovered);
    EXPECT_EQ(1u, (*first)->getStats().failedReconnects);
}

TEST_F(RobustConnectionTest, CloseClosesChannelsAndRejectsPending) {
    auto connection = createConnection();
    auto channel = connection->channel();
    ASSERT_TRUE(channel);

    auto pending = connection->futures()->create<void>();

    EXPECT_TRUE(connection->close());
    EXPECT_TRUE(connection->isClosed());
    EXPECT_TRUE((*channel)->isClosed());
    EXPECT_THROW(pending->getFuture().get(), ConnectionException);

    EXPECT_TRUE(connection->close());
    EXPECT_FALSE(connection->channel());
    EXPECT_FALSE(connection->reconnect(nullptr));
}
