#include "radlink/codec/crc16.hpp"

#include <array>

namespace radlink::codec {

namespace {

constexpr std::array<uint16_t, 256> make_table() {
    std::array<uint16_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        auto crc = static_cast<uint16_t>(i << 8);
        for (int bit = 0; bit < 8; ++bit) {
            if (crc & 0x8000) {
                crc = static_cast<uint16_t>((crc << 1) ^ CRC16_POLYNOMIAL);
            } else {
                crc = static_cast<uint16_t>(crc << 1);
            }
        }
        table[i] = crc;
    }
    return table;
}

constexpr auto CRC_TABLE = make_table();

}  // namespace

uint16_t crc16_ccitt_update(uint16_t crc, std::span<const uint8_t> data) {
    for (uint8_t byte : data) {
        uint8_t index = static_cast<uint8_t>((crc >> 8) ^ byte);
        crc = static_cast<uint16_t>((crc << 8) ^ CRC_TABLE[index]);
    }
    return crc;
}

uint16_t crc16_ccitt(std::span<const uint8_t> data) {
    return crc16_ccitt_update(CRC16_INITIAL_VALUE, data);
}

bool crc16_verify(std::span<const uint8_t> data, uint16_t expected) {
    return crc16_ccitt(data) == expected;
}

}  // namespace radlink::codec
