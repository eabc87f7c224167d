#include "codec/ChecksumCodec.hpp"
#include "utils/Logger.hpp"
#include <iostream>
#include <random>

using namespace bitguard;

int main() {
    utils::Logger::getInstance().setLevel(utils::LogLevel::ERROR);
    utils::Logger::getInstance().configureFromEnvironment();

    std::cout << "=== Checksum Demo ===" << std::endl;
    std::cout << std::endl;

    // 100-bit word, one 4-bit checksum per 20-bit segment
    codec::ChecksumCodec::Config config;
    config.block_width = 4;
    config.segment_width = 20;
    codec::ChecksumCodec codec(config);

    std::mt19937 rng(2024);
    std::bernoulli_distribution coin(0.5);
    utils::BitString data(100);
    for (size_t i = 0; i < data.size(); ++i) {
        data.set(i, coin(rng));
    }

    auto transmitted = codec.encodeSegmented(data);
    std::cout << "Original 100-bit Data: " << data << std::endl;
    std::cout << "Segment Checksums:     " << transmitted.slice(100, 20) << std::endl;
    std::cout << std::endl;

    auto damaged = transmitted;
    damaged.flip(47);

    auto report = codec.verifySegmented(damaged);
    std::cout << "--- Receiver Verification (bit 47 flipped) ---" << std::endl;
    for (size_t i = 0; i < report.segments.size(); ++i) {
        std::cout << "Segment " << i + 1 << ": "
                  << (report.segments[i] == codec::VerifyStatus::VALID
                          ? "No error detected." : "Error detected!")
                  << std::endl;
    }
    std::cout << std::endl;
    std::cout << "Overall: " << report.overall << " (" << report.corruptedCount()
              << " segment(s) corrupted)" << std::endl;
    std::cout << std::endl;

    std::cout << "=== Whole-message checksum ===" << std::endl;
    auto framed = codec.frame(utils::BitString::fromString("11001010"));
    std::cout << "  Framed:   " << framed << std::endl;
    std::cout << "  Verified: " << codec.verify(framed) << std::endl;

    return 0;
}
