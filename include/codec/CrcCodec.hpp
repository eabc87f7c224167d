#pragma once

#include "codec/CodecTypes.hpp"
#include "utils/BitString.hpp"
#include <string>

namespace bitguard {
namespace codec {

/**
 * @brief Cyclic redundancy check over GF(2)
 *
 * The generator is written MSB first; its degree r = length - 1 is the
 * number of check bits appended to the data.
 */
class CrcCodec {
public:
    // Common generators, MSB first
    static constexpr const char* CRC3 = "1011";                       // x^3 + x + 1
    static constexpr const char* CRC8 = "100000111";                  // x^8 + x^2 + x + 1
    static constexpr const char* CRC16_CCITT = "10001000000100001";   // 0x1021

    struct Config {
        std::string generator = CRC3;
    };

    /**
     * @throws InvalidInput if the generator is empty, non-binary or has a
     *         leading 0
     */
    explicit CrcCodec(const Config& config);
    CrcCodec();

    const utils::BitString& getGenerator() const { return generator_; }
    size_t getDegree() const { return generator_.size() - 1; }

    /**
     * @brief data followed by its r-bit remainder
     * @throws InvalidInput if data is empty
     */
    utils::BitString encode(const utils::BitString& data) const;

    /**
     * @brief r-bit remainder of data * x^r divided by the generator
     */
    utils::BitString remainder(const utils::BitString& data) const;

    /**
     * @brief VALID iff received divides evenly by the generator
     *
     * Frames shorter than the generator cannot be checked and are
     * reported CORRUPTED.
     */
    VerifyStatus verify(const utils::BitString& received) const;

    /**
     * @brief Mod-2 long division; returns the trailing r bits left after
     *        reducing `dividend` in place
     */
    static utils::BitString divide(utils::BitString dividend,
                                   const utils::BitString& generator);

    /**
     * @throws InvalidInput for an empty generator or a leading 0
     */
    static void validateGenerator(const utils::BitString& generator);

private:
    utils::BitString generator_;
};

} // namespace codec
} // namespace bitguard
