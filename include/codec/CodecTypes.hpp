#pragma once

#include <cstdint>
#include <ostream>

namespace bitguard {
namespace codec {

/**
 * @brief Outcome of a detection-only check
 */
enum class VerifyStatus : uint8_t {
    VALID,
    CORRUPTED
};

/**
 * @brief Outcome of a Hamming decode
 */
enum class HammingStatus : uint8_t {
    NO_ERROR,
    CORRECTED,
    UNCORRECTABLE   // Syndrome points outside the codeword
};

inline const char* toString(VerifyStatus status) {
    switch (status) {
        case VerifyStatus::VALID:     return "VALID";
        case VerifyStatus::CORRUPTED: return "CORRUPTED";
        default: return "UNKNOWN";
    }
}

inline const char* toString(HammingStatus status) {
    switch (status) {
        case HammingStatus::NO_ERROR:      return "NO_ERROR";
        case HammingStatus::CORRECTED:     return "CORRECTED";
        case HammingStatus::UNCORRECTABLE: return "UNCORRECTABLE";
        default: return "UNKNOWN";
    }
}

inline std::ostream& operator<<(std::ostream& os, VerifyStatus status) {
    return os << toString(status);
}

inline std::ostream& operator<<(std::ostream& os, HammingStatus status) {
    return os << toString(status);
}

} // namespace codec
} // namespace bitguard
