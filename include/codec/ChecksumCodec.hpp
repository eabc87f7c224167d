#pragma once

#include "codec/CodecTypes.hpp"
#include "utils/BitString.hpp"
#include <cstddef>
#include <vector>

namespace bitguard {
namespace codec {

/**
 * @brief Per-segment result of a segmented checksum verification
 */
struct SegmentReport {
    std::vector<VerifyStatus> segments;
    VerifyStatus overall{VerifyStatus::VALID};

    size_t corruptedCount() const;
};

/**
 * @brief 1's-complement block checksum
 *
 * Data is split into k-bit blocks (a short final block is zero-padded on
 * the right), summed with end-around carry, and the sum is complemented.
 */
class ChecksumCodec {
public:
    struct Config {
        size_t block_width = 4;     // k, bits per block and per checksum
        size_t segment_width = 20;  // Data bits covered by one checksum in segmented mode
    };

    explicit ChecksumCodec(const Config& config);
    ChecksumCodec();

    const Config& getConfig() const { return config_; }

    /**
     * @brief Compute the k-bit checksum of `data`
     * @throws InvalidInput if data is empty
     */
    utils::BitString encode(const utils::BitString& data) const;

    /**
     * @brief data followed by its checksum
     */
    utils::BitString frame(const utils::BitString& data) const;

    /**
     * @brief Check data+checksum as produced by frame()
     * @throws InvalidInput if received is empty
     */
    VerifyStatus verify(const utils::BitString& received) const;

    /**
     * @brief data followed by one checksum per segment_width bits of data
     */
    utils::BitString encodeSegmented(const utils::BitString& data) const;

    /**
     * @brief Verify every segment of an encodeSegmented() frame
     * @throws InvalidInput if no data length matches the frame length
     */
    SegmentReport verifySegmented(const utils::BitString& received) const;

    /**
     * @brief Data length n with n + ceil(n / segment_width) * block_width == frame_length
     * @return 0 if no such length exists
     */
    size_t segmentedDataLength(size_t frame_length) const;

    /**
     * @brief Checksum with an explicit block width
     */
    static utils::BitString calculate(const utils::BitString& data, size_t block_width);

    static VerifyStatus validate(const utils::BitString& received, size_t block_width);

    /**
     * @brief k-bit 1's-complement sum of a and b (end-around carry)
     */
    static utils::BitString onesComplementAdd(const utils::BitString& a,
                                              const utils::BitString& b);

    /**
     * @brief Sum of all k-bit blocks of data, last block zero-padded
     */
    static utils::BitString blockSum(const utils::BitString& data, size_t block_width);

private:
    Config config_;
};

} // namespace codec
} // namespace bitguard
