#pragma once

#include <cstddef>

namespace bitguard {
namespace codec {

/**
 * @brief Position arithmetic for Hamming codewords
 *
 * Hamming positions are 1-indexed (parity bits sit at 1, 2, 4, 8, ...)
 * while BitString storage is 0-indexed. All translation between the two
 * goes through here.
 */
class HammingLayout {
public:
    static bool isParityPosition(size_t position) {
        return position != 0 && (position & (position - 1)) == 0;
    }

    /**
     * @brief Smallest r with 2^r >= m + r + 1
     */
    static size_t parityBitsForData(size_t data_bits);

    /**
     * @brief Number of power-of-two positions in an n-bit codeword
     */
    static size_t parityBitsForCodeword(size_t codeword_bits);

    /**
     * @brief True if an encoder can produce a codeword of this length
     */
    static bool isValidCodewordLength(size_t codeword_bits);

    /**
     * @brief 1-indexed position -> storage index
     * @throws InvalidInput if position is 0 or beyond length
     */
    static size_t toIndex(size_t position, size_t length);

    /**
     * @brief Storage index -> 1-indexed position
     * @throws InvalidInput if index >= length
     */
    static size_t toPosition(size_t index, size_t length);
};

} // namespace codec
} // namespace bitguard
