#include "radlink/codec/byte_order.hpp"

namespace radlink::codec {

void write_u16_le(std::vector<uint8_t>& buffer, uint16_t value) {
    buffer.push_back(static_cast<uint8_t>(value & 0xFF));
    buffer.push_back(static_cast<uint8_t>(value >> 8));
}

void write_u32_le(std::vector<uint8_t>& buffer, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        buffer.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

void write_u64_le(std::vector<uint8_t>& buffer, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        buffer.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

void store_u16_le(std::span<uint8_t> out, uint16_t value) {
    out[0] = static_cast<uint8_t>(value & 0xFF);
    out[1] = static_cast<uint8_t>(value >> 8);
}

void store_u32_le(std::span<uint8_t> out, uint32_t value) {
    for (size_t i = 0; i < 4; ++i) {
        out[i] = static_cast<uint8_t>(value >> (i * 8));
    }
}

void store_u64_le(std::span<uint8_t> out, uint64_t value) {
    for (size_t i = 0; i < 8; ++i) {
        out[i] = static_cast<uint8_t>(value >> (i * 8));
    }
}

uint16_t read_u16_le(std::span<const uint8_t> data) {
    return static_cast<uint16_t>(data[0] | (data[1] << 8));
}

uint32_t read_u32_le(std::span<const uint8_t> data) {
    uint32_t value = 0;
    for (int i = 3; i >= 0; --i) {
        value = (value << 8) | data[i];
    }
    return value;
}

uint64_t read_u64_le(std::span<const uint8_t> data) {
    uint64_t value = 0;
    for (int i = 7; i >= 0; --i) {
        value = (value << 8) | data[i];
    }
    return value;
}

}  // namespace radlink::codec
