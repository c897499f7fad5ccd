// test/unit/test_types.cpp
#include <gtest/gtest.h>
#include <amqp_framing.h>
#include "rabbitmq_recovery/types.hpp"
#include "utils/test_utils.hpp"

using namespace rabbitmq_recovery;

TEST(TypesTest, ErrorTypeConversions) {
    EXPECT_EQ("ConnectionLost", errorTypeToString(ErrorType::ConnectionLost));
    EXPECT_EQ("UnsupportedOperation", errorTypeToString(ErrorType::UnsupportedOperation));
    EXPECT_EQ("ChannelError", errorTypeToString(ErrorType::ChannelError));
}

TEST(TypesTest, StateConversions) {
    EXPECT_EQ("Connected", connectionStateToString(ConnectionState::Connected));
    EXPECT_EQ("Disconnecting", connectionStateToString(ConnectionState::Disconnecting));
    EXPECT_EQ("Open", channelStateToString(ChannelState::Open));
    EXPECT_EQ("Closing", channelStateToString(ChannelState::Closing));
}

TEST(TypesTest, AmqpErrorToErrorType) {
    EXPECT_EQ(ErrorType::None, amqpErrorToErrorType(AMQP_STATUS_OK));
    EXPECT_EQ(ErrorType::NetworkError, amqpErrorToErrorType(AMQP_STATUS_SOCKET_ERROR));
    EXPECT_EQ(ErrorType::ConnectionError, amqpErrorToErrorType(AMQP_STATUS_CONNECTION_CLOSED));
    EXPECT_EQ(ErrorType::TimeoutError, amqpErrorToErrorType(AMQP_STATUS_HEARTBEAT_TIMEOUT));

    std::string unknown = amqpErrorToString(-9999);
    EXPECT_NE(std::string::npos, unknown.find("-9999"));
}

TEST(TypesTest, ResultCarriesErrorAndValue) {
    Result<uint32_t> ok(42u);
    EXPECT_TRUE(ok);
    EXPECT_EQ(42u, *ok);

    Result<uint32_t> failed(ErrorType::ChannelError, "NOT_FOUND - no queue 'q'");
    EXPECT_FALSE(failed);
    EXPECT_EQ(ErrorType::ChannelError, failed.error);
    EXPECT_EQ("NOT_FOUND - no queue 'q'", failed.message);
}

TEST(TypesTest, MakeExceptionKeepsErrorType) {
    auto error = makeException(ErrorType::ConnectionLost, "gone");
    try {
        std::rethrow_exception(error);
        FAIL() << "expected an exception";
    } catch (const ConnectionLostException& e) {
        EXPECT_EQ(ErrorType::ConnectionLost, e.getErrorType());
        EXPECT_STREQ("gone", e.what());
    }

    try {
        std::rethrow_exception(makeException(ErrorType::ProtocolError, "bad frame"));
        FAIL() << "expected an exception";
    } catch (const RabbitMQException& e) {
        EXPECT_EQ(ErrorType::ProtocolError, e.getErrorType());
    }
}

TEST(TypesTest, RpcReplyNormalIsSuccess) {
    amqp_rpc_reply_t reply{};
    reply.reply_type = AMQP_RESPONSE_NORMAL;
    EXPECT_TRUE(rpcReplyToResult(reply, "queue.declare"));
}

TEST(TypesTest, RpcReplyLibraryException) {
    amqp_rpc_reply_t reply{};
    reply.reply_type = AMQP_RESPONSE_LIBRARY_EXCEPTION;
    reply.library_error = AMQP_STATUS_TIMEOUT;

    auto result = rpcReplyToResult(reply, "basic.qos");
    EXPECT_FALSE(result);
    EXPECT_EQ(ErrorType::TimeoutError, result.error);
    EXPECT_NE(std::string::npos, result.message.find("basic.qos"));
}

TEST(TypesTest, RpcReplyChannelCloseIsChannelError) {
    std::string text = "PRECONDITION_FAILED - inequivalent arg 'durable'";
    amqp_channel_close_t close{};
    close.reply_code = 406;
    close.reply_text.bytes = const_cast<char*>(text.data());
    close.reply_text.len = text.size();

    amqp_rpc_reply_t reply{};
    reply.reply_type = AMQP_RESPONSE_SERVER_EXCEPTION;
    reply.reply.id = AMQP_CHANNEL_CLOSE_METHOD;
    reply.reply.decoded = &close;

    auto result = rpcReplyToResult(reply, "exchange.declare");
    EXPECT_FALSE(result);
    EXPECT_EQ(ErrorType::ChannelError, result.error);
    EXPECT_NE(std::string::npos, result.message.find("406"));
    EXPECT_NE(std::string::npos, result.message.find("inequivalent arg"));
}

TEST(TypesTest, QosSettingsEquality) {
    QosSettings a;
    QosSettings b;
    EXPECT_EQ(a, b);

    b.prefetchCount = 10;
    EXPECT_NE(a, b);
}
