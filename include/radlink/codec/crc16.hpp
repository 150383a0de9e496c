#pragma once

#include <cstdint>
#include <span>

namespace radlink::codec {

// CRC-16/CCITT-FALSE: x^16 + x^12 + x^5 + 1, no reflection, no final XOR.
// The single integrity check used by image packets, fragment headers and
// fragment payloads.
constexpr uint16_t CRC16_POLYNOMIAL = 0x1021;
constexpr uint16_t CRC16_INITIAL_VALUE = 0xFFFF;

// Table-driven CRC over the whole span
uint16_t crc16_ccitt(std::span<const uint8_t> data);

// Continue a running CRC (pass CRC16_INITIAL_VALUE to start)
uint16_t crc16_ccitt_update(uint16_t crc, std::span<const uint8_t> data);

// True if the CRC of data equals expected
bool crc16_verify(std::span<const uint8_t> data, uint16_t expected);

}  // namespace radlink::codec
