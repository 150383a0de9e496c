#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "radlink/common/error.hpp"

namespace radlink::mux {

// Datagram fragment header (little-endian, 36 bytes):
// [magic: 4][frame_id: 4][fragment_index: 4][fragment_count: 4]
// [timestamp_ns: 8][rows: 4][cols: 4][crc16: 2][payload_crc16: 2]
// crc16 covers bytes 0..31, payload_crc16 covers the bytes after the header.
constexpr uint32_t FRAGMENT_MAGIC = 0xD7E01234;
constexpr size_t FRAGMENT_HEADER_SIZE = 36;
constexpr size_t FRAGMENT_HEADER_CRC_OFFSET = 32;
constexpr size_t FRAGMENT_PAYLOAD_CRC_OFFSET = 34;

struct FragmentHeader {
    uint32_t magic{FRAGMENT_MAGIC};
    uint32_t frame_id{0};
    uint32_t fragment_index{0};
    uint32_t fragment_count{0};
    uint64_t timestamp_ns{0};
    uint32_t rows{0};
    uint32_t cols{0};
    uint16_t crc16{0};
    uint16_t payload_crc16{0};
};

// Header plus a view of the payload inside the parsed datagram
struct FragmentView {
    FragmentHeader header;
    std::span<const uint8_t> payload;
};

// Write header and payload, stamping both CRC fields
std::vector<uint8_t> serialize_fragment(const FragmentHeader& header,
                                        std::span<const uint8_t> payload);

// Parse and validate the header only:
//   MALFORMED_HEADER   shorter than the header, bad magic, index >= count
//   INTEGRITY_MISMATCH header CRC does not match
std::optional<FragmentHeader> parse_fragment_header(std::span<const uint8_t> data,
                                                    ErrorCode* error = nullptr);

// Header validation plus the payload CRC (INTEGRITY_MISMATCH on failure)
std::optional<FragmentView> parse_fragment(std::span<const uint8_t> data,
                                           ErrorCode* error = nullptr);

}  // namespace radlink::mux
