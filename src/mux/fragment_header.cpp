#include "radlink/mux/fragment_header.hpp"

#include "radlink/codec/byte_order.hpp"
#include "radlink/codec/crc16.hpp"

namespace radlink::mux {

std::vector<uint8_t> serialize_fragment(const FragmentHeader& header,
                                        std::span<const uint8_t> payload) {
    std::vector<uint8_t> result;
    result.reserve(FRAGMENT_HEADER_SIZE + payload.size());

    codec::write_u32_le(result, header.magic);
    codec::write_u32_le(result, header.frame_id);
    codec::write_u32_le(result, header.fragment_index);
    codec::write_u32_le(result, header.fragment_count);
    codec::write_u64_le(result, header.timestamp_ns);
    codec::write_u32_le(result, header.rows);
    codec::write_u32_le(result, header.cols);

    uint16_t header_crc = codec::crc16_ccitt(std::span<const uint8_t>(result));
    codec::write_u16_le(result, header_crc);
    codec::write_u16_le(result, codec::crc16_ccitt(payload));

    result.insert(result.end(), payload.begin(), payload.end());
    return result;
}

std::optional<FragmentHeader> parse_fragment_header(std::span<const uint8_t> data,
                                                    ErrorCode* error) {
    if (data.size() < FRAGMENT_HEADER_SIZE) {
        if (error) *error = ErrorCode::MALFORMED_HEADER;
        return std::nullopt;
    }

    FragmentHeader header;
    header.magic = codec::read_u32_le(data);
    if (header.magic != FRAGMENT_MAGIC) {
        if (error) *error = ErrorCode::MALFORMED_HEADER;
        return std::nullopt;
    }

    header.crc16 = codec::read_u16_le(data.subspan(FRAGMENT_HEADER_CRC_OFFSET));
    if (!codec::crc16_verify(data.first(FRAGMENT_HEADER_CRC_OFFSET), header.crc16)) {
        if (error) *error = ErrorCode::INTEGRITY_MISMATCH;
        return std::nullopt;
    }

    header.frame_id = codec::read_u32_le(data.subspan(4));
    header.fragment_index = codec::read_u32_le(data.subspan(8));
    header.fragment_count = codec::read_u32_le(data.subspan(12));
    header.timestamp_ns = codec::read_u64_le(data.subspan(16));
    header.rows = codec::read_u32_le(data.subspan(24));
    header.cols = codec::read_u32_le(data.subspan(28));
    header.payload_crc16 = codec::read_u16_le(data.subspan(FRAGMENT_PAYLOAD_CRC_OFFSET));

    if (header.fragment_count == 0 || header.fragment_index >= header.fragment_count) {
        if (error) *error = ErrorCode::MALFORMED_HEADER;
        return std::nullopt;
    }

    if (error) *error = ErrorCode::SUCCESS;
    return header;
}

std::optional<FragmentView> parse_fragment(std::span<const uint8_t> data, ErrorCode* error) {
    auto header = parse_fragment_header(data, error);
    if (!header) {
        return std::nullopt;
    }

    auto payload = data.subspan(FRAGMENT_HEADER_SIZE);
    if (!codec::crc16_verify(payload, header->payload_crc16)) {
        if (error) *error = ErrorCode::INTEGRITY_MISMATCH;
        return std::nullopt;
    }

    if (error) *error = ErrorCode::SUCCESS;
    return FragmentView{*header, payload};
}

}  // namespace radlink::mux
