#include "codec/HammingLayout.hpp"
#include "utils/Error.hpp"
#include <string>

namespace bitguard {
namespace codec {

size_t HammingLayout::parityBitsForData(size_t data_bits) {
    size_t r = 0;
    while ((static_cast<size_t>(1) << r) < data_bits + r + 1) {
        ++r;
    }
    return r;
}

size_t HammingLayout::parityBitsForCodeword(size_t codeword_bits) {
    size_t r = 0;
    while ((static_cast<size_t>(1) << r) <= codeword_bits) {
        ++r;
    }
    return r;
}

bool HammingLayout::isValidCodewordLength(size_t codeword_bits) {
    size_t r = parityBitsForCodeword(codeword_bits);
    if (codeword_bits <= r) {
        return false;
    }
    return parityBitsForData(codeword_bits - r) == r;
}

size_t HammingLayout::toIndex(size_t position, size_t length) {
    if (position == 0 || position > length) {
        throw utils::InvalidInput("HammingLayout: position " + std::to_string(position) +
                                  " outside 1.." + std::to_string(length));
    }
    return position - 1;
}

size_t HammingLayout::toPosition(size_t index, size_t length) {
    if (index >= length) {
        throw utils::InvalidInput("HammingLayout: index " + std::to_string(index) +
                                  " outside [0, " + std::to_string(length) + ")");
    }
    return index + 1;
}

} // namespace codec
} // namespace bitguard
