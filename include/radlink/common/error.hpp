#pragma once

#include <cstdint>

namespace radlink {

// Error taxonomy shared by every layer of the stack
enum class ErrorCode : uint8_t {
    SUCCESS,
    MALFORMED_HEADER,         // Buffer too short, bad magic, bad field value
    INTEGRITY_MISMATCH,       // CRC or MAC check failed
    REPLAY_REJECTED,          // Sequence number not newer than the peer's last
    OUT_OF_ORDER_PACKET,      // Unexpected packet kind or line index
    INCOMPLETE_FRAME,         // Frame ended or timed out with missing lines
    INCOMPLETE_FRAGMENT_SET,  // Fragment context evicted with missing fragments
    RESOURCE_EXHAUSTED        // Bounded table or buffer is full
};

const char* error_to_string(ErrorCode error);

}  // namespace radlink
