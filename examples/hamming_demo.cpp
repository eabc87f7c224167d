#include "codec/HammingCodec.hpp"
#include "codec/HammingLayout.hpp"
#include "utils/Logger.hpp"
#include <iostream>

using namespace bitguard;

int main() {
    utils::Logger::getInstance().setLevel(utils::LogLevel::WARN);
    utils::Logger::getInstance().configureFromEnvironment();

    std::cout << "=== Hamming Code Demo ===" << std::endl;
    std::cout << std::endl;

    auto data = utils::BitString::fromString("1011");
    auto codeword = codec::HammingCodec::encode(data);

    std::cout << "Original Data:    " << data << std::endl;
    std::cout << "Hamming Code:     " << codeword << " ("
              << codeword.size() - data.size() << " parity bits)" << std::endl;
    std::cout << std::endl;

    auto clean = codec::HammingCodec::decode(codeword);
    std::cout << "Clean decode:     " << clean.status
              << " | data=" << clean.data << std::endl;
    std::cout << std::endl;

    // Single error: always repaired
    auto damaged = codeword;
    damaged.flip(codec::HammingLayout::toIndex(3, damaged.size()));

    auto repaired = codec::HammingCodec::decode(damaged);
    std::cout << "Received Code:    " << damaged << " (position 3 flipped)" << std::endl;
    std::cout << "Status:           " << repaired.status
              << " at position " << repaired.syndrome << std::endl;
    std::cout << "Corrected Code:   " << repaired.corrected << std::endl;
    std::cout << "Extracted Data:   " << repaired.data << std::endl;
    std::cout << std::endl;

    // Two errors: beyond what the code can handle
    auto wide = codec::HammingCodec::encode(utils::BitString::fromString("10110"));
    wide.flip(codec::HammingLayout::toIndex(5, wide.size()));
    wide.flip(codec::HammingLayout::toIndex(9, wide.size()));

    auto lost = codec::HammingCodec::decode(wide);
    std::cout << "Two flips in " << wide.size() << "-bit codeword: " << lost.status
              << " (syndrome " << lost.syndrome << ")" << std::endl;

    return 0;
}
