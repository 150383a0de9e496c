#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <atomic>
#include <deque>
#include <thread>

#include "radlink/codec/byte_order.hpp"
#include "radlink/command/command_client.hpp"
#include "radlink/command/command_frame.hpp"
#include "radlink/command/command_processor.hpp"
#include "radlink/command/command_server.hpp"
#include "radlink/command/replay_table.hpp"
#include "radlink/crypto/crypto.hpp"
#include "radlink/crypto/hmac.hpp"

namespace radlink::command {
namespace {

using ::testing::_;
using ::testing::Return;

const std::vector<uint8_t> kKey(32, 0x42);
const std::string kPeer = "10.0.0.2:5000";

TEST(CommandFrameTest, Layout) {
    std::vector<uint8_t> payload = {1, 2, 3};
    auto frame = encode_command(kKey, 5, static_cast<uint16_t>(CommandId::GET_STATUS), payload);

    ASSERT_EQ(frame.size(), FRAME_HEADER_SIZE + 3);
    std::span<const uint8_t> view(frame);
    EXPECT_EQ(codec::read_u32_le(view), COMMAND_MAGIC);
    EXPECT_EQ(codec::read_u32_le(view.subspan(4)), 5u);
    EXPECT_EQ(codec::read_u16_le(view.subspan(8)), 0x10);
    EXPECT_EQ(codec::read_u16_le(view.subspan(10)), 3u);

    auto expected_mac = crypto::sign(kKey, view.first(MAC_OFFSET), payload);
    EXPECT_TRUE(std::equal(expected_mac.begin(), expected_mac.end(), frame.begin() + MAC_OFFSET));
    EXPECT_TRUE(verify_frame_mac(kKey, frame));
}

TEST(CommandFrameTest, DecodeRoundTrip) {
    std::vector<uint8_t> payload = {9, 8, 7, 6};
    auto frame = encode_command(kKey, 77, static_cast<uint16_t>(CommandId::SET_CONFIG), payload);
    auto decoded = decode_command(frame);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->sequence, 77u);
    EXPECT_EQ(decoded->command_id, static_cast<uint16_t>(CommandId::SET_CONFIG));
    EXPECT_EQ(decoded->payload, payload);

    auto response = encode_response(kKey, 77, ResponseStatus::BUSY, {});
    auto decoded_response = decode_response(response);
    ASSERT_TRUE(decoded_response.has_value());
    EXPECT_EQ(decoded_response->status, ResponseStatus::BUSY);
    EXPECT_TRUE(decoded_response->payload.empty());
    EXPECT_TRUE(verify_frame_mac(kKey, response));

    // Direction is carried by the magic
    EXPECT_FALSE(decode_command(response).has_value());
    EXPECT_FALSE(decode_response(frame).has_value());
}

TEST(CommandFrameTest, LengthChecks) {
    auto frame = encode_command(kKey, 1, 0x01, std::vector<uint8_t>{1, 2});
    EXPECT_TRUE(has_valid_length(frame));

    auto longer = frame;
    longer.push_back(0);
    EXPECT_FALSE(has_valid_length(longer));

    auto shorter = frame;
    shorter.pop_back();
    EXPECT_FALSE(has_valid_length(shorter));

    std::vector<uint8_t> tiny(FRAME_HEADER_SIZE - 1);
    EXPECT_FALSE(has_valid_length(tiny));
    EXPECT_FALSE(peek_magic(std::vector<uint8_t>{1, 2, 3}).has_value());
}

TEST(CommandFrameTest, OversizePayloadThrows) {
    std::vector<uint8_t> payload(MAX_COMMAND_PAYLOAD + 1);
    EXPECT_THROW(encode_command(kKey, 1, 0x01, payload), std::invalid_argument);
    EXPECT_THROW(encode_response(kKey, 1, ResponseStatus::OK, payload), std::invalid_argument);
}

TEST(CommandFrameTest, MacCoversHeaderAndPayload) {
    auto frame = encode_command(kKey, 3, 0x02, std::vector<uint8_t>{5, 5, 5});
    for (size_t i = 0; i < frame.size(); ++i) {
        auto damaged = frame;
        damaged[i] ^= 0x01;
        EXPECT_FALSE(verify_frame_mac(kKey, damaged)) << "byte " << i;
    }
    std::vector<uint8_t> other_key(32, 0x43);
    EXPECT_FALSE(verify_frame_mac(other_key, frame));
}

TEST(CommandFrameTest, Names) {
    EXPECT_TRUE(is_known_command(0x01));
    EXPECT_TRUE(is_known_command(0x20));
    EXPECT_FALSE(is_known_command(0x03));
    EXPECT_STREQ(command_id_to_string(0x10), "GET_STATUS");
    EXPECT_STREQ(command_id_to_string(0x99), "UNKNOWN");
    EXPECT_STREQ(response_status_to_string(ResponseStatus::INVALID_COMMAND), "INVALID_COMMAND");
}

class ReplayTableTest : public ::testing::Test {
protected:
    ReplayTable table;
};

TEST_F(ReplayTableTest, UnknownPeerStartsAtZero) {
    EXPECT_FALSE(table.check("a", 0));
    EXPECT_TRUE(table.check("a", 1));
    EXPECT_FALSE(table.last_accepted("a").has_value());
    EXPECT_FALSE(table.check_and_update("a", 0));
    EXPECT_EQ(table.size(), 0u);
}

TEST_F(ReplayTableTest, StrictlyIncreasing) {
    EXPECT_TRUE(table.check_and_update("a", 5));
    EXPECT_FALSE(table.check_and_update("a", 5));
    EXPECT_FALSE(table.check_and_update("a", 4));
    EXPECT_TRUE(table.check_and_update("a", 100));
    EXPECT_EQ(table.last_accepted("a"), 100u);
}

TEST_F(ReplayTableTest, PeersAreIndependent) {
    EXPECT_TRUE(table.check_and_update("a", 10));
    EXPECT_TRUE(table.check_and_update("b", 1));
    EXPECT_FALSE(table.check_and_update("a", 1));
    EXPECT_EQ(table.size(), 2u);
}

TEST_F(ReplayTableTest, EvictsLeastRecentlyUsed) {
    for (int i = 0; i < 16; ++i) {
        EXPECT_TRUE(table.check_and_update("peer" + std::to_string(i), 10));
    }
    // Touch peer0 so peer1 becomes the oldest
    EXPECT_TRUE(table.check_and_update("peer0", 11));

    EXPECT_TRUE(table.check_and_update("peer16", 1));
    EXPECT_EQ(table.size(), 16u);
    EXPECT_EQ(table.evictions(), 1u);
    EXPECT_TRUE(table.last_accepted("peer0").has_value());
    EXPECT_FALSE(table.last_accepted("peer1").has_value());

    // A forgotten peer starts over
    EXPECT_TRUE(table.check("peer1", 1));
}

TEST_F(ReplayTableTest, ZeroCapacityThrows) {
    EXPECT_THROW(ReplayTable(0), std::invalid_argument);
}

class CommandProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        crypto::init();
        processor = std::make_unique<CommandProcessor>(crypto::static_secret(kKey));
        processor->register_handler(CommandId::GET_STATUS, [](std::span<const uint8_t>) {
            return CommandResult{ResponseStatus::OK, {0x01, 0x02}};
        });
        processor->register_handler(CommandId::SET_CONFIG, [](std::span<const uint8_t> payload) {
            CommandResult result;
            result.payload.assign(payload.begin(), payload.end());
            return result;
        });
    }

    std::vector<uint8_t> command(uint32_t seq, CommandId id,
                                 std::vector<uint8_t> payload = {}) {
        return encode_command(kKey, seq, static_cast<uint16_t>(id), payload);
    }

    std::unique_ptr<CommandProcessor> processor;
};

TEST_F(CommandProcessorTest, ValidCommandAnswered) {
    ErrorCode error = ErrorCode::MALFORMED_HEADER;
    auto response = processor->process(command(1, CommandId::GET_STATUS), kPeer, &error);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(error, ErrorCode::SUCCESS);
    EXPECT_TRUE(verify_frame_mac(kKey, *response));

    auto decoded = decode_response(*response);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->sequence, 1u);
    EXPECT_EQ(decoded->status, ResponseStatus::OK);
    EXPECT_EQ(decoded->payload, (std::vector<uint8_t>{0x01, 0x02}));

    auto stats = processor->stats();
    EXPECT_EQ(stats.commands_accepted, 1u);
    EXPECT_EQ(stats.responses_sent, 1u);
}

TEST_F(CommandProcessorTest, ReplayedSequenceDropped) {
    auto frame = command(5, CommandId::GET_STATUS);
    EXPECT_TRUE(processor->process(frame, kPeer).has_value());

    ErrorCode error = ErrorCode::SUCCESS;
    EXPECT_FALSE(processor->process(frame, kPeer, &error).has_value());
    EXPECT_EQ(error, ErrorCode::REPLAY_REJECTED);

    // An older sequence is a replay too
    EXPECT_FALSE(processor->process(command(4, CommandId::GET_STATUS), kPeer, &error));
    EXPECT_EQ(error, ErrorCode::REPLAY_REJECTED);

    auto stats = processor->stats();
    EXPECT_EQ(stats.replay_rejections, 2u);
    EXPECT_EQ(stats.auth_failures, 2u);
    EXPECT_EQ(stats.mac_failures, 0u);
    EXPECT_EQ(stats.responses_sent, 1u);

    // Same sequence from another peer is fine
    EXPECT_TRUE(processor->process(frame, "10.0.0.3:5000").has_value());
}

TEST_F(CommandProcessorTest, ConcurrentReplayAcceptedOnce) {
    constexpr int kThreads = 8;
    constexpr uint32_t kSequences = 200;

    std::vector<std::vector<uint8_t>> frames;
    for (uint32_t seq = 1; seq <= kSequences; ++seq) {
        frames.push_back(command(seq, CommandId::GET_STATUS));
    }

    // Every thread sends the same signed frames from the same peer
    std::atomic<uint64_t> accepted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            for (const auto& frame : frames) {
                if (processor->process(frame, kPeer).has_value()) {
                    ++accepted;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto stats = processor->stats();
    EXPECT_GE(accepted.load(), 1u);
    EXPECT_LE(accepted.load(), kSequences);
    EXPECT_EQ(stats.commands_accepted, accepted.load());
    EXPECT_EQ(stats.replay_rejections, kThreads * kSequences - accepted.load());
    EXPECT_EQ(stats.auth_failures, stats.replay_rejections);
    EXPECT_EQ(stats.mac_failures, 0u);
    EXPECT_EQ(processor->replay_table().last_accepted(kPeer).value_or(0), kSequences);
}

TEST_F(CommandProcessorTest, ConcurrentSingleFrameAcceptedOnce) {
    constexpr int kThreads = 16;
    auto frame = command(1, CommandId::GET_STATUS);

    std::atomic<int> accepted{0};
    std::atomic<int> replayed{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            ErrorCode error = ErrorCode::SUCCESS;
            if (processor->process(frame, kPeer, &error).has_value()) {
                ++accepted;
            } else if (error == ErrorCode::REPLAY_REJECTED) {
                ++replayed;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(accepted.load(), 1);
    EXPECT_EQ(replayed.load(), kThreads - 1);
    EXPECT_EQ(processor->stats().replay_rejections, static_cast<uint64_t>(kThreads - 1));
}

TEST_F(CommandProcessorTest, TamperedPayloadDropped) {
    auto frame = command(1, CommandId::SET_CONFIG, {1, 2, 3, 4});
    frame[FRAME_HEADER_SIZE + 2] ^= 0x20;

    ErrorCode error = ErrorCode::SUCCESS;
    EXPECT_FALSE(processor->process(frame, kPeer, &error).has_value());
    EXPECT_EQ(error, ErrorCode::INTEGRITY_MISMATCH);

    auto stats = processor->stats();
    EXPECT_EQ(stats.auth_failures, 1u);
    EXPECT_EQ(stats.mac_failures, 1u);
    EXPECT_EQ(stats.responses_sent, 0u);

    // A rejected frame does not advance the replay state
    EXPECT_FALSE(processor->replay_table().last_accepted(kPeer).has_value());
}

TEST_F(CommandProcessorTest, FailureBreakdown) {
    auto frame = command(1, CommandId::GET_STATUS);

    auto truncated = frame;
    truncated.pop_back();
    ErrorCode error = ErrorCode::SUCCESS;
    EXPECT_FALSE(processor->process(truncated, kPeer, &error));
    EXPECT_EQ(error, ErrorCode::MALFORMED_HEADER);

    auto wrong_magic = encode_response(kKey, 1, ResponseStatus::OK, {});
    EXPECT_FALSE(processor->process(wrong_magic, kPeer, &error));
    EXPECT_EQ(error, ErrorCode::MALFORMED_HEADER);

    auto wrong_key = encode_command(std::vector<uint8_t>(32, 0x01), 1,
                                    static_cast<uint16_t>(CommandId::GET_STATUS), {});
    EXPECT_FALSE(processor->process(wrong_key, kPeer, &error));
    EXPECT_EQ(error, ErrorCode::INTEGRITY_MISMATCH);

    auto stats = processor->stats();
    EXPECT_EQ(stats.frames_received, 3u);
    EXPECT_EQ(stats.malformed, 1u);
    EXPECT_EQ(stats.bad_magic, 1u);
    EXPECT_EQ(stats.mac_failures, 1u);
    EXPECT_EQ(stats.auth_failures, 3u);
}

TEST_F(CommandProcessorTest, UnknownCommandAnsweredInvalid) {
    auto frame = encode_command(kKey, 1, 0x7777, {});
    auto response = processor->process(frame, kPeer);
    ASSERT_TRUE(response.has_value());
    auto decoded = decode_response(*response);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->status, ResponseStatus::INVALID_COMMAND);

    // Known id without a handler
    processor->unregister_handler(CommandId::GET_STATUS);
    response = processor->process(command(2, CommandId::GET_STATUS), kPeer);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(decode_response(*response)->status, ResponseStatus::INVALID_COMMAND);
    EXPECT_EQ(processor->stats().invalid_commands, 2u);
}

TEST_F(CommandProcessorTest, HandlerExceptionBecomesError) {
    processor->register_handler(CommandId::START_SCAN, [](std::span<const uint8_t>) -> CommandResult {
        throw std::runtime_error("detector offline");
    });

    auto response = processor->process(command(1, CommandId::START_SCAN), kPeer);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(decode_response(*response)->status, ResponseStatus::ERROR);
    EXPECT_EQ(processor->stats().handler_errors, 1u);
}

TEST_F(CommandProcessorTest, EchoesPayload) {
    std::vector<uint8_t> payload = {0xDE, 0xAD, 0xBE, 0xEF};
    auto response = processor->process(command(9, CommandId::SET_CONFIG, payload), kPeer);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(decode_response(*response)->payload, payload);
}

TEST_F(CommandProcessorTest, KeyRotationTakesEffect) {
    std::vector<uint8_t> current = kKey;
    CommandProcessor rotating([&current] { return current; });
    rotating.register_handler(CommandId::STOP_SCAN,
                              [](std::span<const uint8_t>) { return CommandResult{}; });

    EXPECT_TRUE(rotating.process(command(1, CommandId::STOP_SCAN), kPeer).has_value());
    current.assign(32, 0x99);
    EXPECT_FALSE(rotating.process(command(2, CommandId::STOP_SCAN), kPeer).has_value());
}

TEST_F(CommandProcessorTest, NullProviderThrows) {
    EXPECT_THROW(CommandProcessor{crypto::SecretProvider{}}, std::invalid_argument);
}

class MockTransport : public transport::DatagramTransport {
public:
    MOCK_METHOD(bool, send_to, (const std::string& peer, std::span<const uint8_t> data),
                (override));
    MOCK_METHOD(std::optional<transport::Datagram>, receive, (std::chrono::milliseconds timeout),
                (override));
};

class CommandClientTest : public ::testing::Test {
protected:
    void SetUp() override { crypto::init(); }

    CommandClient client{crypto::static_secret(kKey), 100};
};

TEST_F(CommandClientTest, BuildsSequencedCommands) {
    uint32_t seq = 0;
    auto first = client.build_command(CommandId::GET_STATUS, {}, &seq);
    EXPECT_EQ(seq, 100u);
    auto second = client.build_command(CommandId::GET_STATUS);
    EXPECT_EQ(decode_command(second)->sequence, 101u);
    EXPECT_EQ(client.next_sequence(), 102u);
    EXPECT_TRUE(verify_frame_mac(kKey, first));
}

TEST_F(CommandClientTest, ParseResponseChecks) {
    auto response = encode_response(kKey, 100, ResponseStatus::OK, std::vector<uint8_t>{1});

    ErrorCode error = ErrorCode::SUCCESS;
    EXPECT_TRUE(client.parse_response(response, 100, &error).has_value());
    EXPECT_EQ(error, ErrorCode::SUCCESS);

    EXPECT_FALSE(client.parse_response(response, 101, &error).has_value());
    EXPECT_EQ(error, ErrorCode::REPLAY_REJECTED);

    auto damaged = response;
    damaged.back() ^= 0x01;
    EXPECT_FALSE(client.parse_response(damaged, 100, &error).has_value());
    EXPECT_EQ(error, ErrorCode::INTEGRITY_MISMATCH);

    auto as_command = encode_command(kKey, 100, 0x10, {});
    EXPECT_FALSE(client.parse_response(as_command, 100, &error).has_value());
    EXPECT_EQ(error, ErrorCode::MALFORMED_HEADER);
}

TEST_F(CommandClientTest, InvalidConstruction) {
    EXPECT_THROW(CommandClient(crypto::static_secret(kKey), 0), std::invalid_argument);
    EXPECT_THROW(CommandClient{crypto::SecretProvider{}}, std::invalid_argument);
}

TEST_F(CommandClientTest, RequestRoundTripThroughProcessor) {
    CommandProcessor processor(crypto::static_secret(kKey));
    processor.register_handler(CommandId::GET_STATUS, [](std::span<const uint8_t>) {
        return CommandResult{ResponseStatus::OK, {0x2A}};
    });

    MockTransport transport;
    std::deque<transport::Datagram> inbox;
    EXPECT_CALL(transport, send_to(kPeer, _))
        .WillOnce([&](const std::string& peer, std::span<const uint8_t> data) {
            auto response = processor.process(data, "host:1");
            if (response) inbox.push_back({peer, *response});
            return true;
        });
    EXPECT_CALL(transport, receive(_)).WillRepeatedly([&](std::chrono::milliseconds) {
        std::optional<transport::Datagram> next;
        if (!inbox.empty()) {
            next = inbox.front();
            inbox.pop_front();
        }
        return next;
    });

    ErrorCode error = ErrorCode::INCOMPLETE_FRAME;
    auto response = client.request(transport, kPeer, CommandId::GET_STATUS, {},
                                   std::chrono::milliseconds(200), &error);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(error, ErrorCode::SUCCESS);
    EXPECT_EQ(response->sequence, 100u);
    EXPECT_EQ(response->payload, std::vector<uint8_t>{0x2A});
}

TEST_F(CommandClientTest, RequestSendFailure) {
    MockTransport transport;
    EXPECT_CALL(transport, send_to(_, _)).WillOnce(Return(false));
    EXPECT_CALL(transport, receive(_)).Times(0);

    ErrorCode error = ErrorCode::SUCCESS;
    EXPECT_FALSE(client.request(transport, kPeer, CommandId::STOP_SCAN, {},
                                std::chrono::milliseconds(50), &error));
    EXPECT_EQ(error, ErrorCode::RESOURCE_EXHAUSTED);
}

TEST_F(CommandClientTest, RequestTimesOut) {
    MockTransport transport;
    EXPECT_CALL(transport, send_to(_, _)).WillOnce(Return(true));
    EXPECT_CALL(transport, receive(_))
        .WillRepeatedly(Return(std::optional<transport::Datagram>{}));

    ErrorCode error = ErrorCode::SUCCESS;
    EXPECT_FALSE(client.request(transport, kPeer, CommandId::STOP_SCAN, {},
                                std::chrono::milliseconds(20), &error));
    EXPECT_EQ(error, ErrorCode::INCOMPLETE_FRAME);
}

TEST_F(CommandClientTest, StaleResponseIgnored) {
    MockTransport transport;
    auto stale = encode_response(kKey, 42, ResponseStatus::OK, {});
    EXPECT_CALL(transport, send_to(_, _)).WillOnce(Return(true));
    EXPECT_CALL(transport, receive(_))
        .WillOnce(Return(std::optional<transport::Datagram>(transport::Datagram{kPeer, stale})))
        .WillRepeatedly(Return(std::optional<transport::Datagram>{}));

    ErrorCode error = ErrorCode::SUCCESS;
    EXPECT_FALSE(client.request(transport, kPeer, CommandId::GET_STATUS, {},
                                std::chrono::milliseconds(20), &error));
    EXPECT_EQ(error, ErrorCode::REPLAY_REJECTED);
}

class CommandServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        crypto::init();
        processor.register_handler(CommandId::GET_STATUS,
                                   [](std::span<const uint8_t>) { return CommandResult{}; });
    }

    CommandProcessor processor{crypto::static_secret(kKey)};
    MockTransport transport;
};

TEST_F(CommandServerTest, AnswersValidCommand) {
    auto frame = encode_command(kKey, 1, static_cast<uint16_t>(CommandId::GET_STATUS), {});
    EXPECT_CALL(transport, receive(_))
        .WillOnce(Return(std::optional<transport::Datagram>(transport::Datagram{kPeer, frame})));

    std::vector<uint8_t> sent;
    EXPECT_CALL(transport, send_to(kPeer, _))
        .WillOnce([&](const std::string&, std::span<const uint8_t> data) {
            sent.assign(data.begin(), data.end());
            return true;
        });

    CommandServer server(transport, processor);
    EXPECT_TRUE(server.poll_once(std::chrono::milliseconds(10)));
    EXPECT_EQ(server.datagrams_received(), 1u);
    EXPECT_EQ(server.responses_sent(), 1u);
    auto response = decode_response(sent);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->sequence, 1u);
}

TEST_F(CommandServerTest, SilentOnBadFrame) {
    std::vector<uint8_t> junk(60, 0xFF);
    EXPECT_CALL(transport, receive(_))
        .WillOnce(Return(std::optional<transport::Datagram>(transport::Datagram{kPeer, junk})))
        .WillOnce(Return(std::optional<transport::Datagram>{}));
    EXPECT_CALL(transport, send_to(_, _)).Times(0);

    CommandServer server(transport, processor);
    EXPECT_TRUE(server.poll_once(std::chrono::milliseconds(10)));
    EXPECT_FALSE(server.poll_once(std::chrono::milliseconds(10)));
    EXPECT_EQ(server.responses_sent(), 0u);
    EXPECT_EQ(processor.stats().auth_failures, 1u);
}

TEST_F(CommandServerTest, CountsSendFailures) {
    auto frame = encode_command(kKey, 1, static_cast<uint16_t>(CommandId::GET_STATUS), {});
    EXPECT_CALL(transport, receive(_))
        .WillOnce(Return(std::optional<transport::Datagram>(transport::Datagram{kPeer, frame})));
    EXPECT_CALL(transport, send_to(_, _)).WillOnce(Return(false));

    CommandServer server(transport, processor);
    server.poll_once(std::chrono::milliseconds(10));
    EXPECT_EQ(server.send_failures(), 1u);
}

}  // namespace
}  // namespace radlink::command
