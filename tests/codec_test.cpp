#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "radlink/codec/byte_order.hpp"
#include "radlink/codec/crc16.hpp"
#include "radlink/common/error.hpp"

namespace radlink::codec {
namespace {

std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

TEST(ByteOrderTest, WriteIsLittleEndian) {
    std::vector<uint8_t> buffer;
    write_u16_le(buffer, 0x1234);
    write_u32_le(buffer, 0xD7E01234);
    write_u64_le(buffer, 0x0102030405060708ULL);

    std::vector<uint8_t> expected = {
        0x34, 0x12,
        0x34, 0x12, 0xE0, 0xD7,
        0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01};
    EXPECT_EQ(buffer, expected);
}

TEST(ByteOrderTest, ReadMatchesWrite) {
    std::vector<uint8_t> buffer;
    write_u16_le(buffer, 0xBEEF);
    write_u32_le(buffer, 0xCAFEBEEF);
    write_u64_le(buffer, 0xFFEEDDCCBBAA9988ULL);

    std::span<const uint8_t> view(buffer);
    EXPECT_EQ(read_u16_le(view), 0xBEEF);
    EXPECT_EQ(read_u32_le(view.subspan(2)), 0xCAFEBEEFu);
    EXPECT_EQ(read_u64_le(view.subspan(6)), 0xFFEEDDCCBBAA9988ULL);
}

TEST(ByteOrderTest, StoreInPlace) {
    std::vector<uint8_t> buffer(8, 0xAA);
    store_u32_le(std::span<uint8_t>(buffer).subspan(2), 0x11223344);

    std::vector<uint8_t> expected = {0xAA, 0xAA, 0x44, 0x33, 0x22, 0x11, 0xAA, 0xAA};
    EXPECT_EQ(buffer, expected);
}

TEST(Crc16Test, CheckValue) {
    auto data = bytes_of("123456789");
    EXPECT_EQ(crc16_ccitt(data), 0x29B1);
}

TEST(Crc16Test, EmptyInputIsInitialValue) {
    std::vector<uint8_t> empty;
    EXPECT_EQ(crc16_ccitt(empty), CRC16_INITIAL_VALUE);
}

TEST(Crc16Test, IncrementalMatchesOneShot) {
    auto data = bytes_of("detector line payload");
    std::span<const uint8_t> view(data);

    uint16_t crc = crc16_ccitt_update(CRC16_INITIAL_VALUE, view.first(7));
    crc = crc16_ccitt_update(crc, view.subspan(7));
    EXPECT_EQ(crc, crc16_ccitt(view));
}

TEST(Crc16Test, VerifyAcceptsMatchingCrc) {
    auto data = bytes_of("frame");
    EXPECT_TRUE(crc16_verify(data, crc16_ccitt(data)));
    EXPECT_FALSE(crc16_verify(data, static_cast<uint16_t>(crc16_ccitt(data) ^ 1)));
}

TEST(Crc16Test, EverySingleBitFlipDetected) {
    std::vector<uint8_t> data(64);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i * 37 + 11);
    }
    uint16_t crc = crc16_ccitt(data);

    for (size_t byte = 0; byte < data.size(); ++byte) {
        for (int bit = 0; bit < 8; ++bit) {
            auto corrupted = data;
            corrupted[byte] ^= static_cast<uint8_t>(1u << bit);
            EXPECT_FALSE(crc16_verify(corrupted, crc)) << "byte " << byte << " bit " << bit;
        }
    }
}

TEST(ErrorCodeTest, EveryCodeHasAName) {
    EXPECT_STREQ(error_to_string(ErrorCode::SUCCESS), "success");
    EXPECT_STREQ(error_to_string(ErrorCode::MALFORMED_HEADER), "malformed header");
    EXPECT_STREQ(error_to_string(ErrorCode::INTEGRITY_MISMATCH), "integrity mismatch");
    EXPECT_STREQ(error_to_string(ErrorCode::REPLAY_REJECTED), "replay rejected");
    EXPECT_STREQ(error_to_string(ErrorCode::OUT_OF_ORDER_PACKET), "out-of-order packet");
    EXPECT_STREQ(error_to_string(ErrorCode::INCOMPLETE_FRAME), "incomplete frame");
    EXPECT_STREQ(error_to_string(ErrorCode::INCOMPLETE_FRAGMENT_SET), "incomplete fragment set");
    EXPECT_STREQ(error_to_string(ErrorCode::RESOURCE_EXHAUSTED), "resource exhausted");
}

}  // namespace
}  // namespace radlink::codec
