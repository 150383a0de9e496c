#include "radlink/common/error.hpp"

namespace radlink {

const char* error_to_string(ErrorCode error) {
    switch (error) {
        case ErrorCode::SUCCESS: return "success";
        case ErrorCode::MALFORMED_HEADER: return "malformed header";
        case ErrorCode::INTEGRITY_MISMATCH: return "integrity mismatch";
        case ErrorCode::REPLAY_REJECTED: return "replay rejected";
        case ErrorCode::OUT_OF_ORDER_PACKET: return "out-of-order packet";
        case ErrorCode::INCOMPLETE_FRAME: return "incomplete frame";
        case ErrorCode::INCOMPLETE_FRAGMENT_SET: return "incomplete fragment set";
        case ErrorCode::RESOURCE_EXHAUSTED: return "resource exhausted";
    }
    return "unknown";
}

}  // namespace radlink
