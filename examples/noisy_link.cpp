#include "channel/NoisyChannel.hpp"
#include "codec/ChecksumCodec.hpp"
#include "codec/CrcCodec.hpp"
#include "codec/HammingCodec.hpp"
#include "utils/Logger.hpp"
#include <iostream>
#include <iomanip>
#include <random>

using namespace bitguard;

namespace {

struct LinkStats {
    int frames = 0;
    int damaged = 0;     // At least one bit flipped in transit
    int flagged = 0;     // Codec reported an error
    int missed = 0;      // Damaged but reported clean
    int repaired = 0;    // Hamming only
};

void printStats(const char* name, const LinkStats& stats) {
    std::cout << "  " << std::left << std::setw(10) << name << std::right
              << " frames=" << stats.frames
              << " | damaged=" << std::setw(4) << stats.damaged
              << " | flagged=" << std::setw(4) << stats.flagged
              << " | missed=" << std::setw(3) << stats.missed
              << " | repaired=" << stats.repaired
              << std::endl;
}

} // namespace

int main() {
    utils::Logger::getInstance().setLevel(utils::LogLevel::ERROR);
    utils::Logger::getInstance().configureFromEnvironment();

    std::cout << "=== Noisy Link Simulation ===" << std::endl;
    std::cout << std::endl;

    channel::NoisyChannel::Config config;
    config.bit_error_rate = 0.01;
    config.seed = 7;
    channel::NoisyChannel link(config);

    codec::ChecksumCodec checksum;
    codec::CrcCodec::Config crc_config;
    crc_config.generator = codec::CrcCodec::CRC8;
    codec::CrcCodec crc(crc_config);

    std::mt19937 rng(1);
    std::bernoulli_distribution coin(0.5);

    LinkStats checksum_stats, crc_stats, hamming_stats;
    const int frames = 1000;

    for (int f = 0; f < frames; ++f) {
        utils::BitString data(32);
        for (size_t i = 0; i < data.size(); ++i) {
            data.set(i, coin(rng));
        }

        auto sent = checksum.frame(data);
        link.send(sent);
        auto received = *link.receive();
        bool hit = received != sent;
        checksum_stats.frames++;
        checksum_stats.damaged += hit;
        bool flagged = checksum.verify(received) == codec::VerifyStatus::CORRUPTED;
        checksum_stats.flagged += flagged;
        checksum_stats.missed += hit && !flagged;

        sent = crc.encode(data);
        link.send(sent);
        received = *link.receive();
        hit = received != sent;
        crc_stats.frames++;
        crc_stats.damaged += hit;
        flagged = crc.verify(received) == codec::VerifyStatus::CORRUPTED;
        crc_stats.flagged += flagged;
        crc_stats.missed += hit && !flagged;

        sent = codec::HammingCodec::encode(data);
        link.send(sent);
        received = *link.receive();
        hit = received != sent;
        auto result = codec::HammingCodec::decode(received);
        hamming_stats.frames++;
        hamming_stats.damaged += hit;
        hamming_stats.flagged += result.status != codec::HammingStatus::NO_ERROR;
        hamming_stats.missed += hit && result.status == codec::HammingStatus::NO_ERROR;
        hamming_stats.repaired += hit && result.data == data;
    }

    std::cout << "Bit error rate: " << config.bit_error_rate
              << ", " << link.getFlippedBits() << " bits flipped in total" << std::endl;
    std::cout << std::endl;
    printStats("Checksum", checksum_stats);
    printStats("CRC-8", crc_stats);
    printStats("Hamming", hamming_stats);

    return 0;
}
