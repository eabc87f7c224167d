#include "codec/ChecksumCodec.hpp"
#include "utils/Error.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <string>

namespace bitguard {
namespace codec {

using utils::BitString;
using utils::InvalidInput;

size_t SegmentReport::corruptedCount() const {
    return static_cast<size_t>(
        std::count(segments.begin(), segments.end(), VerifyStatus::CORRUPTED));
}

ChecksumCodec::ChecksumCodec(const Config& config)
    : config_(config) {
    if (config_.block_width == 0) {
        throw InvalidInput("ChecksumCodec: block width must be positive");
    }
    if (config_.segment_width == 0) {
        throw InvalidInput("ChecksumCodec: segment width must be positive");
    }

    if (config_.block_width == 1) {
        LOG_WARN("ChecksumCodec: 1-bit blocks detect nothing; ",
                 "every frame with a 1 bit in it verifies VALID");
    }
}

ChecksumCodec::ChecksumCodec()
    : ChecksumCodec(Config{}) {
}

BitString ChecksumCodec::encode(const BitString& data) const {
    return calculate(data, config_.block_width);
}

BitString ChecksumCodec::frame(const BitString& data) const {
    return utils::concat(data, encode(data));
}

VerifyStatus ChecksumCodec::verify(const BitString& received) const {
    return validate(received, config_.block_width);
}

BitString ChecksumCodec::encodeSegmented(const BitString& data) const {
    if (data.empty()) {
        throw InvalidInput("ChecksumCodec: cannot checksum empty data");
    }

    const size_t n = data.size();
    BitString checksums;
    for (size_t offset = 0; offset < n; offset += config_.segment_width) {
        size_t length = std::min(config_.segment_width, n - offset);
        checksums.append(calculate(data.slice(offset, length), config_.block_width));
    }

    LOG_DEBUG("ChecksumCodec: ", checksums.size() / config_.block_width,
              " segment checksums ", checksums);
    return utils::concat(data, checksums);
}

size_t ChecksumCodec::segmentedDataLength(size_t frame_length) const {
    const size_t k = config_.block_width;
    const size_t s = config_.segment_width;

    for (size_t segments = 1; segments * k < frame_length; ++segments) {
        size_t n = frame_length - segments * k;
        if ((n + s - 1) / s == segments) {
            return n;
        }
    }
    return 0;
}

SegmentReport ChecksumCodec::verifySegmented(const BitString& received) const {
    const size_t k = config_.block_width;
    const size_t s = config_.segment_width;

    size_t n = segmentedDataLength(received.size());
    if (n == 0) {
        throw InvalidInput("ChecksumCodec: " + std::to_string(received.size()) +
                           " bits is not a valid segmented frame length");
    }

    SegmentReport report;
    size_t checksum_offset = n;
    for (size_t offset = 0; offset < n; offset += s, checksum_offset += k) {
        size_t length = std::min(s, n - offset);
        BitString segment = utils::concat(received.slice(offset, length),
                                          received.slice(checksum_offset, k));
        VerifyStatus status = validate(segment, k);
        report.segments.push_back(status);
        if (status == VerifyStatus::CORRUPTED) {
            report.overall = VerifyStatus::CORRUPTED;
        }
    }

    return report;
}

BitString ChecksumCodec::calculate(const BitString& data, size_t block_width) {
    if (block_width == 0) {
        throw InvalidInput("ChecksumCodec: block width must be positive");
    }
    if (data.empty()) {
        throw InvalidInput("ChecksumCodec: cannot checksum empty data");
    }

    BitString sum = blockSum(data, block_width);

    BitString checksum(block_width);
    for (size_t i = 0; i < block_width; ++i) {
        checksum.set(i, !sum[i]);
    }

    LOG_DEBUG("ChecksumCodec: sum=", sum, " checksum=", checksum);
    return checksum;
}

VerifyStatus ChecksumCodec::validate(const BitString& received, size_t block_width) {
    if (block_width == 0) {
        throw InvalidInput("ChecksumCodec: block width must be positive");
    }
    if (received.empty()) {
        throw InvalidInput("ChecksumCodec: nothing to verify");
    }
    if (received.size() <= block_width) {
        LOG_WARN("ChecksumCodec: ", received.size(), " bits carry no data beyond a ",
                 block_width, "-bit checksum");
        return VerifyStatus::CORRUPTED;
    }

    const size_t data_length = received.size() - block_width;
    BitString sum = onesComplementAdd(blockSum(received.slice(0, data_length), block_width),
                                      received.slice(data_length, block_width));

    if (!sum.isAllOnes()) {
        LOG_WARN("ChecksumCodec: Checksum mismatch (sum=", sum, ")");
        return VerifyStatus::CORRUPTED;
    }
    return VerifyStatus::VALID;
}

BitString ChecksumCodec::onesComplementAdd(const BitString& a, const BitString& b) {
    if (a.size() != b.size() || a.empty()) {
        throw InvalidInput("ChecksumCodec: cannot add " + std::to_string(a.size()) +
                           "-bit and " + std::to_string(b.size()) + "-bit blocks");
    }

    const size_t k = a.size();
    BitString result(k);
    bool carry = false;

    for (size_t i = k; i-- > 0;) {
        int total = a[i] + b[i] + (carry ? 1 : 0);
        result.set(i, (total & 0x01) != 0);
        carry = total > 1;
    }

    // End-around carry: fold overflow back into the low-order bit
    while (carry) {
        carry = false;
        bool add = true;
        for (size_t i = k; i-- > 0 && add;) {
            bool bit = result[i];
            result.set(i, !bit);
            add = bit;
        }
        carry = add;
    }

    return result;
}

BitString ChecksumCodec::blockSum(const BitString& data, size_t block_width) {
    BitString sum(block_width);

    for (size_t offset = 0; offset < data.size(); offset += block_width) {
        size_t length = std::min(block_width, data.size() - offset);
        BitString block = data.slice(offset, length);
        // Zero-pad a short final block on the right
        while (block.size() < block_width) {
            block.append(false);
        }
        sum = onesComplementAdd(sum, block);
    }

    return sum;
}

} // namespace codec
} // namespace bitguard
