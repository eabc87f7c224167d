#include "codec/CrcCodec.hpp"
#include "utils/Logger.hpp"
#include <iostream>
#include <iomanip>
#include <string>

using namespace bitguard;

int main() {
    utils::Logger::getInstance().setLevel(utils::LogLevel::WARN);
    utils::Logger::getInstance().configureFromEnvironment();

    std::cout << "=== CRC Demo ===" << std::endl;
    std::cout << std::endl;

    codec::CrcCodec codec;
    auto data = utils::BitString::fromString("1101011011");
    auto codeword = codec.encode(data);

    std::cout << "Original Data:        " << data << std::endl;
    std::cout << "Generator Polynomial: " << codec.getGenerator() << std::endl;
    std::cout << "Calculated CRC:       " << codec.remainder(data) << std::endl;
    std::cout << "Transmitted Data:     " << codeword << std::endl;
    std::cout << "Verification:         " << codec.verify(codeword) << std::endl;
    std::cout << std::endl;

    auto damaged = codeword;
    damaged.flip(4);
    std::cout << "Received Data:        " << damaged << " (bit 4 flipped)" << std::endl;
    std::cout << "Verification:         " << codec.verify(damaged) << std::endl;
    std::cout << std::endl;

    std::cout << "=== CRC-16-CCITT over bytes ===" << std::endl;
    codec::CrcCodec::Config config;
    config.generator = codec::CrcCodec::CRC16_CCITT;
    codec::CrcCodec ccitt(config);

    const std::string text = "123456789";
    auto bytes = utils::BitString::fromBytes(
        reinterpret_cast<const uint8_t*>(text.data()), text.size());
    std::cout << "  \"" << text << "\" -> 0x" << std::hex << std::setfill('0') << std::setw(4)
              << ccitt.remainder(bytes).toUint() << std::dec << std::endl;

    return 0;
}
