#pragma once

#include "codec/CodecTypes.hpp"
#include "utils/BitString.hpp"
#include <cstddef>

namespace bitguard {
namespace codec {

struct HammingDecodeResult {
    HammingStatus status{HammingStatus::NO_ERROR};
    utils::BitString corrected;   // Codeword after correction (unchanged unless CORRECTED)
    utils::BitString data;        // Bits at non-parity positions of `corrected`
    size_t syndrome{0};           // 1-indexed error position, 0 if none
};

/**
 * @brief Single-error-correcting Hamming code
 *
 * Parity bit 2^i covers every 1-indexed position with bit i set and is
 * chosen so the XOR over that set is 0. Only single-bit errors are
 * guaranteed to be corrected; heavier damage is reported per the computed
 * syndrome and may be miscorrected.
 */
class HammingCodec {
public:
    /**
     * @throws InvalidInput if data is empty
     */
    static utils::BitString encode(const utils::BitString& data);

    /**
     * @throws InvalidInput if received is empty or has a length no
     *         encoder produces
     */
    static HammingDecodeResult decode(const utils::BitString& received);

    /**
     * @brief Parity-check vector; check i is bit i of the result
     */
    static size_t syndrome(const utils::BitString& codeword);

    /**
     * @brief Bits at non-power-of-two positions, in order
     */
    static utils::BitString extractData(const utils::BitString& codeword);

private:
    static bool parityOf(const utils::BitString& codeword, size_t check);
};

} // namespace codec
} // namespace bitguard
