#include "codec/HammingCodec.hpp"
#include "codec/HammingLayout.hpp"
#include "utils/Error.hpp"
#include "utils/Logger.hpp"
#include <string>

namespace bitguard {
namespace codec {

using utils::BitString;
using utils::InvalidInput;

BitString HammingCodec::encode(const BitString& data) {
    if (data.empty()) {
        throw InvalidInput("HammingCodec: cannot encode empty data");
    }

    const size_t m = data.size();
    const size_t r = HammingLayout::parityBitsForData(m);
    const size_t n = m + r;

    BitString codeword(n);
    size_t data_idx = 0;
    for (size_t position = 1; position <= n; ++position) {
        if (HammingLayout::isParityPosition(position)) continue;
        codeword.set(HammingLayout::toIndex(position, n), data.get(data_idx++));
    }

    // Parity slots are still 0, so each check's parity is the bit it needs
    for (size_t i = 0; i < r; ++i) {
        size_t parity_position = static_cast<size_t>(1) << i;
        codeword.set(HammingLayout::toIndex(parity_position, n), parityOf(codeword, i));
    }

    LOG_DEBUG("HammingCodec: Encoded ", data, " -> ", codeword,
              " (", r, " parity bits)");
    return codeword;
}

HammingDecodeResult HammingCodec::decode(const BitString& received) {
    if (received.empty()) {
        throw InvalidInput("HammingCodec: cannot decode empty codeword");
    }
    if (!HammingLayout::isValidCodewordLength(received.size())) {
        throw InvalidInput("HammingCodec: no encoder produces a " +
                           std::to_string(received.size()) + "-bit codeword");
    }

    const size_t n = received.size();

    HammingDecodeResult result;
    result.corrected = received;
    result.syndrome = syndrome(received);

    if (result.syndrome == 0) {
        result.status = HammingStatus::NO_ERROR;
    } else if (result.syndrome <= n) {
        result.corrected.flip(HammingLayout::toIndex(result.syndrome, n));
        result.status = HammingStatus::CORRECTED;
        LOG_INFO("HammingCodec: Corrected bit at position ", result.syndrome);
    } else {
        result.status = HammingStatus::UNCORRECTABLE;
        LOG_WARN("HammingCodec: Syndrome ", result.syndrome, " points outside the ",
                 n, "-bit codeword");
    }

    result.data = extractData(result.corrected);
    return result;
}

size_t HammingCodec::syndrome(const BitString& codeword) {
    const size_t r = HammingLayout::parityBitsForCodeword(codeword.size());

    size_t value = 0;
    for (size_t i = 0; i < r; ++i) {
        if (parityOf(codeword, i)) {
            value |= static_cast<size_t>(1) << i;
        }
    }
    return value;
}

BitString HammingCodec::extractData(const BitString& codeword) {
    const size_t n = codeword.size();

    BitString data;
    for (size_t position = 1; position <= n; ++position) {
        if (!HammingLayout::isParityPosition(position)) {
            data.append(codeword.get(HammingLayout::toIndex(position, n)));
        }
    }
    return data;
}

bool HammingCodec::parityOf(const BitString& codeword, size_t check) {
    const size_t n = codeword.size();

    bool parity = false;
    for (size_t position = 1; position <= n; ++position) {
        if ((position >> check) & 0x01) {
            parity ^= codeword.get(HammingLayout::toIndex(position, n));
        }
    }
    return parity;
}

} // namespace codec
} // namespace bitguard
