/*
 * test_message.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_message.cpp
 * @brief Tests for IPC framing and payload structures
 */

#include <gtest/gtest.h>
#include "ipc/message.hpp"

#include <vector>

using namespace warden::ipc;

// =============================================================================
// Message Type Tests
// =============================================================================

class MessageTypeTest : public ::testing::Test {};

TEST_F(MessageTypeTest, Categories) {
    EXPECT_TRUE(isControlMessage(MessageType::Handshake));
    EXPECT_TRUE(isControlMessage(MessageType::HandshakeAck));
    EXPECT_FALSE(isControlMessage(MessageType::Execute));

    EXPECT_TRUE(isExecutionMessage(MessageType::Execute));
    EXPECT_TRUE(isExecutionMessage(MessageType::Result));
    EXPECT_TRUE(isExecutionMessage(MessageType::Error));
    EXPECT_FALSE(isExecutionMessage(MessageType::Output));

    EXPECT_TRUE(isStreamMessage(MessageType::Output));
    EXPECT_TRUE(isStreamMessage(MessageType::Log));
    EXPECT_FALSE(isStreamMessage(MessageType::Handshake));
}

TEST_F(MessageTypeTest, Names) {
    EXPECT_EQ(messageTypeName(MessageType::Execute), "Execute");
    EXPECT_EQ(messageTypeName(MessageType::Output), "Output");
    EXPECT_EQ(messageTypeName(static_cast<MessageType>(0x7F)), "Unknown");
}

TEST_F(MessageTypeTest, ErrorNames) {
    EXPECT_EQ(ipcErrorToString(IPCError::Timeout), "Timeout");
    EXPECT_EQ(ipcErrorToString(IPCError::ChannelClosed), "Channel closed");
}

// =============================================================================
// MessageHeader Tests
// =============================================================================

class MessageHeaderTest : public ::testing::Test {};

TEST_F(MessageHeaderTest, SerializedSizeIsFixed) {
    MessageHeader header;
    EXPECT_EQ(header.serialize().size(), MessageHeader::SIZE);
    EXPECT_EQ(MessageHeader::SIZE, 16u);
}

TEST_F(MessageHeaderTest, RoundTrip) {
    MessageHeader header;
    header.type = MessageType::Result;
    header.payloadSize = 1234;
    header.sequenceId = 0xDEADBEEF;
    header.flags = 3;

    auto back = MessageHeader::deserialize(header.serialize());
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->type, MessageType::Result);
    EXPECT_EQ(back->payloadSize, 1234u);
    EXPECT_EQ(back->sequenceId, 0xDEADBEEFu);
    EXPECT_EQ(back->flags, 3);
    EXPECT_TRUE(back->isValid());
}

TEST_F(MessageHeaderTest, MagicIsBigEndian) {
    auto bytes = MessageHeader{}.serialize();
    EXPECT_EQ(bytes[0], 'W');
    EXPECT_EQ(bytes[1], 'A');
    EXPECT_EQ(bytes[2], 'R');
    EXPECT_EQ(bytes[3], 'D');
}

TEST_F(MessageHeaderTest, ShortBufferRejected) {
    std::vector<uint8_t> data(MessageHeader::SIZE - 1, 0);
    auto result = MessageHeader::deserialize(data);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), IPCError::InvalidMessage);
}

TEST_F(MessageHeaderTest, BadMagicRejected) {
    auto bytes = MessageHeader{}.serialize();
    bytes[0] = 'X';
    EXPECT_FALSE(MessageHeader::deserialize(bytes).has_value());
}

TEST_F(MessageHeaderTest, WrongVersionRejected) {
    MessageHeader header;
    header.version = MessageHeader::VERSION + 1;
    EXPECT_FALSE(header.isValid());
    EXPECT_FALSE(MessageHeader::deserialize(header.serialize()).has_value());
}

TEST_F(MessageHeaderTest, OversizedPayloadRejected) {
    MessageHeader header;
    header.payloadSize = static_cast<uint32_t>(ProtocolConstants::MAX_PAYLOAD_SIZE + 1);
    auto result = MessageHeader::deserialize(header.serialize());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), IPCError::MessageTooLarge);
}

// =============================================================================
// Message Tests
// =============================================================================

class MessageTest : public ::testing::Test {};

TEST_F(MessageTest, CreateFromJson) {
    auto msg = Message::create(MessageType::Execute, json{{"code", "x = 1"}}, 7);
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->header.type, MessageType::Execute);
    EXPECT_EQ(msg->header.sequenceId, 7u);
    EXPECT_EQ(msg->header.payloadSize, msg->payload.size());

    auto payload = msg->getPayloadAsJson();
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ((*payload)["code"], "x = 1");
}

TEST_F(MessageTest, EmptyPayloadReadsAsEmptyObject) {
    auto msg = Message::create(MessageType::Handshake, std::vector<uint8_t>{}, 0);
    auto payload = msg.getPayloadAsJson();
    ASSERT_TRUE(payload.has_value());
    EXPECT_TRUE(payload->is_object());
    EXPECT_TRUE(payload->empty());
}

TEST_F(MessageTest, SerializeDeserialize) {
    auto msg = Message::create(MessageType::Log, json{{"level", "warn"}}, 42);
    ASSERT_TRUE(msg.has_value());

    auto bytes = msg->serialize();
    EXPECT_EQ(bytes.size(), MessageHeader::SIZE + msg->payload.size());

    auto back = Message::deserialize(bytes);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->header.type, MessageType::Log);
    EXPECT_EQ(back->header.sequenceId, 42u);
    EXPECT_EQ(back->payload, msg->payload);
}

TEST_F(MessageTest, TruncatedPayloadRejected) {
    auto msg = Message::create(MessageType::Log, json{{"message", "hello"}}, 1);
    ASSERT_TRUE(msg.has_value());
    auto bytes = msg->serialize();
    bytes.pop_back();

    auto back = Message::deserialize(bytes);
    ASSERT_FALSE(back.has_value());
    EXPECT_EQ(back.error(), IPCError::InvalidMessage);
}

// =============================================================================
// Payload Structure Tests
// =============================================================================

class PayloadTest : public ::testing::Test {};

TEST_F(PayloadTest, ExecuteRequestKeys) {
    ExecuteRequest req;
    req.code = "print(1)";
    req.captureLocals = true;
    req.memoryLimitMB = 256;
    req.cpuLimitSeconds = 6;
    req.policy = {{"allowed_imports", {"math"}}};

    auto j = req.toJson();
    EXPECT_EQ(j["code"], "print(1)");
    EXPECT_EQ(j["capture_locals"], true);
    EXPECT_EQ(j["memory_limit_mb"], 256);
    EXPECT_EQ(j["cpu_limit_seconds"], 6);
    EXPECT_TRUE(j["globals"].is_object());

    auto back = ExecuteRequest::fromJson(j);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->code, "print(1)");
    EXPECT_TRUE(back->captureLocals);
    EXPECT_EQ(back->memoryLimitMB, 256u);
    EXPECT_EQ(back->policy, req.policy);
}

TEST_F(PayloadTest, ExecuteRequestRequiresCode) {
    auto result = ExecuteRequest::fromJson(json{{"globals", json::object()}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), IPCError::DeserializationFailed);
}

TEST_F(PayloadTest, ExecuteResultDefaults) {
    auto result = ExecuteResult::fromJson(json{{"success", true}});
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);
    EXPECT_TRUE(result->exceptionType.empty());
    EXPECT_FALSE(result->locals.has_value());
    EXPECT_FALSE(result->memoryError);
}

TEST_F(PayloadTest, ExecuteResultIgnoresNonObjectLocals) {
    auto result = ExecuteResult::fromJson(
        json{{"success", true}, {"locals", json::array()}});
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->locals.has_value());
}

TEST_F(PayloadTest, ExecuteResultException) {
    ExecuteResult res;
    res.exceptionType = "ZeroDivisionError";
    res.exceptionMessage = "division by zero";
    res.peakMemoryBytes = 1 << 20;

    auto back = ExecuteResult::fromJson(res.toJson());
    ASSERT_TRUE(back.has_value());
    EXPECT_FALSE(back->success);
    EXPECT_EQ(back->exceptionType, "ZeroDivisionError");
    EXPECT_EQ(back->exceptionMessage, "division by zero");
    EXPECT_EQ(back->peakMemoryBytes, 1u << 20);
}

TEST_F(PayloadTest, OutputChunkStreams) {
    OutputChunk chunk;
    chunk.stream = OutputStream::Stderr;
    chunk.data = "oops\n";
    chunk.truncated = true;

    auto j = chunk.toJson();
    EXPECT_EQ(j["stream"], "stderr");

    auto back = OutputChunk::fromJson(j);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->stream, OutputStream::Stderr);
    EXPECT_EQ(back->data, "oops\n");
    EXPECT_TRUE(back->truncated);
}

TEST_F(PayloadTest, OutputChunkUnknownStreamRejected) {
    auto back = OutputChunk::fromJson(json{{"stream", "stdin"}, {"data", "x"}});
    ASSERT_FALSE(back.has_value());
    EXPECT_EQ(back.error(), IPCError::InvalidMessage);
}

TEST_F(PayloadTest, ErrorPayloadRequiresKind) {
    EXPECT_FALSE(ErrorPayload::fromJson(json{{"message", "x"}}).has_value());

    auto back = ErrorPayload::fromJson(
        json{{"kind", "LimitSetupFailed"}, {"message", "setrlimit failed"}});
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->kind, "LimitSetupFailed");
}

TEST_F(PayloadTest, LogRecordDefaultsToInfo) {
    auto back = LogRecord::fromJson(json{{"message", "hi"}});
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->level, "info");
    EXPECT_EQ(back->message, "hi");
}

TEST_F(PayloadTest, HandshakePayloadKeys) {
    HandshakePayload payload;
    payload.version = "1.0";
    payload.pythonVersion = "3.11.4";
    payload.capabilities = {"execute", "output-stream"};
    payload.pid = 12345;

    auto j = payload.toJson();
    EXPECT_EQ(j["python_version"], "3.11.4");
    EXPECT_EQ(j["pid"], 12345);

    auto back = HandshakePayload::fromJson(j);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->capabilities.size(), 2u);
    EXPECT_EQ(back->pid, 12345u);
}
