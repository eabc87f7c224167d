#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace bitguard {
namespace utils {

/**
 * @brief Explicitly sized sequence of bits, index 0 first
 *
 * Every stored digit is 0 or 1. All checked accessors throw InvalidInput
 * on an out-of-range index instead of wrapping or truncating.
 */
class BitString {
public:
    BitString() = default;

    /**
     * @brief Create `length` copies of `bit`
     */
    explicit BitString(size_t length, bool bit = false);

    /**
     * @brief Parse a text of '0'/'1' characters
     * @throws InvalidInput on any other character
     */
    static BitString fromString(const std::string& text);

    /**
     * @brief Unpack bytes, most significant bit of each byte first
     */
    static BitString fromBytes(const uint8_t* data, size_t length);
    static BitString fromBytes(const std::vector<uint8_t>& data);

    /**
     * @brief Encode `value` as exactly `width` bits, MSB first
     * @throws InvalidInput if width > 64 or value does not fit
     */
    static BitString fromUint(uint64_t value, size_t width);

    size_t size() const { return bits_.size(); }
    bool empty() const { return bits_.empty(); }

    bool get(size_t index) const;
    void set(size_t index, bool bit);
    void flip(size_t index);

    // Unchecked access for hot loops that already validated bounds
    bool operator[](size_t index) const { return bits_[index] != 0; }

    void append(bool bit) { bits_.push_back(bit ? 1 : 0); }
    void append(const BitString& other);

    /**
     * @brief Copy `length` bits starting at `offset`
     * @throws InvalidInput if the range leaves the sequence
     */
    BitString slice(size_t offset, size_t length) const;

    bool isAllZero() const;
    bool isAllOnes() const;
    size_t countOnes() const;

    std::string toString() const;

    /**
     * @brief Pack into bytes, zero-padding the last byte on the right
     */
    std::vector<uint8_t> toBytes() const;

    /**
     * @brief Interpret as an unsigned integer, MSB first
     * @throws InvalidInput for sequences longer than 64 bits
     */
    uint64_t toUint() const;

    bool operator==(const BitString& other) const { return bits_ == other.bits_; }
    bool operator!=(const BitString& other) const { return bits_ != other.bits_; }

private:
    void checkIndex(size_t index) const;

    std::vector<uint8_t> bits_;
};

BitString concat(const BitString& head, const BitString& tail);

std::ostream& operator<<(std::ostream& os, const BitString& bits);

} // namespace utils
} // namespace bitguard
