#include "utils/BitString.hpp"
#include "utils/Error.hpp"
#include <algorithm>

namespace bitguard {
namespace utils {

BitString::BitString(size_t length, bool bit)
    : bits_(length, bit ? 1 : 0) {
}

BitString BitString::fromString(const std::string& text) {
    BitString result;
    result.bits_.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c != '0' && c != '1') {
            throw InvalidInput("BitString: non-binary character '" + std::string(1, c) +
                               "' at offset " + std::to_string(i));
        }
        result.bits_.push_back(c == '1' ? 1 : 0);
    }

    return result;
}

BitString BitString::fromBytes(const uint8_t* data, size_t length) {
    BitString result;
    if (length > 0 && data == nullptr) {
        throw InvalidInput("BitString: null byte buffer");
    }

    result.bits_.reserve(length * 8);
    for (size_t i = 0; i < length; ++i) {
        for (int bit = 7; bit >= 0; --bit) {
            result.bits_.push_back((data[i] >> bit) & 0x01);
        }
    }

    return result;
}

BitString BitString::fromBytes(const std::vector<uint8_t>& data) {
    return fromBytes(data.data(), data.size());
}

BitString BitString::fromUint(uint64_t value, size_t width) {
    if (width > 64) {
        throw InvalidInput("BitString: width " + std::to_string(width) + " exceeds 64 bits");
    }
    if (width < 64 && (value >> width) != 0) {
        throw InvalidInput("BitString: value does not fit in " + std::to_string(width) + " bits");
    }

    BitString result(width);
    for (size_t i = 0; i < width; ++i) {
        result.bits_[width - 1 - i] = static_cast<uint8_t>((value >> i) & 0x01);
    }
    return result;
}

bool BitString::get(size_t index) const {
    checkIndex(index);
    return bits_[index] != 0;
}

void BitString::set(size_t index, bool bit) {
    checkIndex(index);
    bits_[index] = bit ? 1 : 0;
}

void BitString::flip(size_t index) {
    checkIndex(index);
    bits_[index] ^= 0x01;
}

void BitString::append(const BitString& other) {
    bits_.insert(bits_.end(), other.bits_.begin(), other.bits_.end());
}

BitString BitString::slice(size_t offset, size_t length) const {
    if (offset > bits_.size() || length > bits_.size() - offset) {
        throw InvalidInput("BitString: slice [" + std::to_string(offset) + ", +" +
                           std::to_string(length) + ") outside " +
                           std::to_string(bits_.size()) + " bits");
    }

    BitString result;
    result.bits_.assign(bits_.begin() + offset, bits_.begin() + offset + length);
    return result;
}

bool BitString::isAllZero() const {
    return std::all_of(bits_.begin(), bits_.end(), [](uint8_t b) { return b == 0; });
}

bool BitString::isAllOnes() const {
    return std::all_of(bits_.begin(), bits_.end(), [](uint8_t b) { return b == 1; });
}

size_t BitString::countOnes() const {
    return static_cast<size_t>(std::count(bits_.begin(), bits_.end(), 1));
}

std::string BitString::toString() const {
    std::string text;
    text.reserve(bits_.size());
    for (uint8_t b : bits_) {
        text.push_back(b ? '1' : '0');
    }
    return text;
}

std::vector<uint8_t> BitString::toBytes() const {
    std::vector<uint8_t> bytes((bits_.size() + 7) / 8, 0);
    for (size_t i = 0; i < bits_.size(); ++i) {
        if (bits_[i]) {
            bytes[i / 8] |= static_cast<uint8_t>(0x80 >> (i % 8));
        }
    }
    return bytes;
}

uint64_t BitString::toUint() const {
    if (bits_.size() > 64) {
        throw InvalidInput("BitString: " + std::to_string(bits_.size()) +
                           " bits do not fit in 64");
    }

    uint64_t value = 0;
    for (uint8_t b : bits_) {
        value = (value << 1) | b;
    }
    return value;
}

void BitString::checkIndex(size_t index) const {
    if (index >= bits_.size()) {
        throw InvalidInput("BitString: index " + std::to_string(index) +
                           " out of range for " + std::to_string(bits_.size()) + " bits");
    }
}

BitString concat(const BitString& head, const BitString& tail) {
    BitString result = head;
    result.append(tail);
    return result;
}

std::ostream& operator<<(std::ostream& os, const BitString& bits) {
    return os << bits.toString();
}

} // namespace utils
} // namespace bitguard
