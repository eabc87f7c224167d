#include "codec/CrcCodec.hpp"
#include "utils/Error.hpp"
#include "utils/Logger.hpp"
#include <string>
#include <utility>

namespace bitguard {
namespace codec {

using utils::BitString;
using utils::InvalidInput;

CrcCodec::CrcCodec(const Config& config)
    : generator_(BitString::fromString(config.generator)) {
    validateGenerator(generator_);

    if (!generator_[generator_.size() - 1]) {
        LOG_WARN("CrcCodec: Generator ", generator_,
                 " does not end in 1; standard generators do");
    }
}

CrcCodec::CrcCodec()
    : CrcCodec(Config{}) {
}

BitString CrcCodec::encode(const BitString& data) const {
    if (data.empty()) {
        throw InvalidInput("CrcCodec: cannot encode empty data");
    }

    BitString codeword = utils::concat(data, remainder(data));
    LOG_DEBUG("CrcCodec: Encoded ", data.size(), " data bits -> ", codeword);
    return codeword;
}

BitString CrcCodec::remainder(const BitString& data) const {
    BitString augmented = utils::concat(data, BitString(getDegree()));
    return divide(std::move(augmented), generator_);
}

VerifyStatus CrcCodec::verify(const BitString& received) const {
    if (received.size() < generator_.size()) {
        LOG_WARN("CrcCodec: ", received.size(), " bits is shorter than the ",
                 generator_.size(), "-bit generator");
        return VerifyStatus::CORRUPTED;
    }

    BitString rest = divide(received, generator_);
    if (!rest.isAllZero()) {
        LOG_WARN("CrcCodec: Non-zero remainder ", rest);
        return VerifyStatus::CORRUPTED;
    }
    return VerifyStatus::VALID;
}

BitString CrcCodec::divide(BitString dividend, const BitString& generator) {
    validateGenerator(generator);

    const size_t r = generator.size() - 1;
    if (dividend.size() < generator.size()) {
        throw InvalidInput("CrcCodec: dividend of " + std::to_string(dividend.size()) +
                           " bits is shorter than the generator");
    }

    // Bits left of the window are never re-examined once cleared
    const size_t steps = dividend.size() - r;
    for (size_t i = 0; i < steps; ++i) {
        if (!dividend[i]) continue;
        for (size_t j = 0; j < generator.size(); ++j) {
            if (generator[j]) {
                dividend.flip(i + j);
            }
        }
    }

    return dividend.slice(steps, r);
}

void CrcCodec::validateGenerator(const BitString& generator) {
    if (generator.empty()) {
        throw InvalidInput("CrcCodec: generator polynomial is empty");
    }
    if (!generator[0]) {
        throw InvalidInput("CrcCodec: generator " + generator.toString() +
                           " has a leading 0");
    }
}

} // namespace codec
} // namespace bitguard
