#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace radlink::codec {

// All multi-byte wire fields are little-endian.

// Append to a growing buffer
void write_u16_le(std::vector<uint8_t>& buffer, uint16_t value);
void write_u32_le(std::vector<uint8_t>& buffer, uint32_t value);
void write_u64_le(std::vector<uint8_t>& buffer, uint64_t value);

// Store in place; the destination must hold at least sizeof(value) bytes
void store_u16_le(std::span<uint8_t> out, uint16_t value);
void store_u32_le(std::span<uint8_t> out, uint32_t value);
void store_u64_le(std::span<uint8_t> out, uint64_t value);

// Read from the front of the span; the caller checks the length
uint16_t read_u16_le(std::span<const uint8_t> data);
uint32_t read_u32_le(std::span<const uint8_t> data);
uint64_t read_u64_le(std::span<const uint8_t> data);

}  // namespace radlink::codec
