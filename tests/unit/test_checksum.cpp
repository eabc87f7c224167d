#include <gtest/gtest.h>
#include "codec/ChecksumCodec.hpp"
#include "utils/Error.hpp"
#include <random>

using namespace bitguard::codec;
using namespace bitguard::utils;

namespace {

BitString randomBits(std::mt19937& rng, size_t length) {
    std::bernoulli_distribution coin(0.5);
    BitString bits(length);
    for (size_t i = 0; i < length; ++i) {
        bits.set(i, coin(rng));
    }
    return bits;
}

ChecksumCodec makeCodec(size_t block_width, size_t segment_width = 20) {
    ChecksumCodec::Config config;
    config.block_width = block_width;
    config.segment_width = segment_width;
    return ChecksumCodec(config);
}

} // namespace

class ChecksumTest : public ::testing::Test {};

TEST_F(ChecksumTest, OnesComplementAddWrapsCarry) {
    auto a = BitString::fromString("1111");
    auto b = BitString::fromString("0001");

    // 1111 + 0001 = 1 0000 -> 0000 + 1
    EXPECT_EQ(ChecksumCodec::onesComplementAdd(a, b).toString(), "0001");
    EXPECT_EQ(ChecksumCodec::onesComplementAdd(a, a).toString(), "1111");
    EXPECT_EQ(ChecksumCodec::onesComplementAdd(BitString::fromString("0101"),
                                               BitString::fromString("0010")).toString(),
              "0111");
}

TEST_F(ChecksumTest, OnesComplementAddRejectsMismatchedWidths) {
    EXPECT_THROW(ChecksumCodec::onesComplementAdd(BitString::fromString("101"),
                                                  BitString::fromString("10")),
                 InvalidInput);
}

TEST_F(ChecksumTest, KnownChecksums) {
    EXPECT_EQ(ChecksumCodec::calculate(
                  BitString::fromString("10011001111000100010010010000100"), 8).toString(),
              "11011010");
    EXPECT_EQ(ChecksumCodec::calculate(BitString::fromString("11001010"), 4).toString(), "1000");
    EXPECT_EQ(ChecksumCodec::calculate(BitString::fromString("0000"), 4).toString(), "1111");
    EXPECT_EQ(ChecksumCodec::calculate(BitString::fromString("11111111"), 4).toString(), "0000");
}

TEST_F(ChecksumTest, ShortFinalBlockIsZeroPadded) {
    // 101 -> blocks 10, 10 -> sum 100 -> 01 -> checksum 10
    EXPECT_EQ(ChecksumCodec::calculate(BitString::fromString("101"), 2).toString(), "10");

    auto codec = makeCodec(2);
    auto framed = codec.frame(BitString::fromString("101"));
    EXPECT_EQ(framed.toString(), "10110");
    EXPECT_EQ(codec.verify(framed), VerifyStatus::VALID);
}

TEST_F(ChecksumTest, InvalidArguments) {
    EXPECT_THROW(ChecksumCodec::calculate(BitString(), 4), InvalidInput);
    EXPECT_THROW(ChecksumCodec::calculate(BitString::fromString("1010"), 0), InvalidInput);
    EXPECT_THROW(ChecksumCodec::validate(BitString(), 4), InvalidInput);
    EXPECT_THROW(makeCodec(0), InvalidInput);
    EXPECT_THROW(makeCodec(4, 0), InvalidInput);
}

TEST_F(ChecksumTest, FrameWithoutDataIsCorrupted) {
    EXPECT_EQ(ChecksumCodec::validate(BitString::fromString("1111"), 4), VerifyStatus::CORRUPTED);
    EXPECT_EQ(ChecksumCodec::validate(BitString::fromString("11"), 4), VerifyStatus::CORRUPTED);
}

TEST_F(ChecksumTest, RoundTripIsValid) {
    std::mt19937 rng(7);
    for (size_t k : {2u, 3u, 4u, 8u, 16u, 70u}) {
        auto codec = makeCodec(k);
        for (size_t length : {1u, 5u, 16u, 33u, 100u}) {
            auto data = randomBits(rng, length);
            EXPECT_EQ(codec.encode(data).size(), k);
            EXPECT_EQ(codec.verify(codec.frame(data)), VerifyStatus::VALID)
                << "k=" << k << " data=" << data;
        }
    }
}

TEST_F(ChecksumTest, SingleBitFlipIsDetected) {
    std::mt19937 rng(11);
    for (size_t k : {2u, 4u, 8u, 12u}) {
        auto codec = makeCodec(k);
        auto framed = codec.frame(randomBits(rng, 37));

        for (size_t i = 0; i < framed.size(); ++i) {
            auto damaged = framed;
            damaged.flip(i);
            EXPECT_EQ(codec.verify(damaged), VerifyStatus::CORRUPTED)
                << "k=" << k << " flipped=" << i;
        }
    }
}

TEST_F(ChecksumTest, ZeroBlockInvertedGoesUndetected) {
    // 0000 and 1111 are both zero in 1's complement
    auto codec = makeCodec(4);
    auto framed = codec.frame(BitString::fromString("00001010"));
    ASSERT_EQ(framed.toString(), "000010100101");

    for (size_t i = 0; i < 4; ++i) {
        framed.flip(i);
    }
    EXPECT_EQ(codec.verify(framed), VerifyStatus::VALID);
}

TEST_F(ChecksumTest, OpposingFlipsInSameColumnCancel) {
    auto codec = makeCodec(4);
    auto framed = codec.frame(BitString::fromString("00010000"));

    framed.flip(3);  // 1 -> 0 in block 0
    framed.flip(7);  // 0 -> 1 in block 1
    EXPECT_EQ(codec.verify(framed), VerifyStatus::VALID);
}

TEST_F(ChecksumTest, WidthOneDetectsNothing) {
    // 1-bit 1's-complement sum of a frame is the OR of its bits
    auto codec = makeCodec(1);
    auto framed = codec.frame(BitString::fromString("1010"));
    ASSERT_EQ(framed.toString(), "10100");

    for (size_t i = 0; i < framed.size(); ++i) {
        auto damaged = framed;
        damaged.flip(i);
        EXPECT_EQ(codec.verify(damaged), VerifyStatus::VALID) << "flipped=" << i;
    }

    // Only a frame of all 0 bits fails
    auto zero = codec.frame(BitString::fromString("0"));
    ASSERT_EQ(zero.toString(), "01");
    zero.flip(1);
    EXPECT_EQ(codec.verify(zero), VerifyStatus::CORRUPTED);
}

TEST_F(ChecksumTest, SegmentedRoundTrip) {
    std::mt19937 rng(3);
    auto codec = makeCodec(4, 20);
    auto data = randomBits(rng, 100);

    auto framed = codec.encodeSegmented(data);
    ASSERT_EQ(framed.size(), 120);
    EXPECT_EQ(framed.slice(0, 100), data);

    auto report = codec.verifySegmented(framed);
    ASSERT_EQ(report.segments.size(), 5);
    EXPECT_EQ(report.overall, VerifyStatus::VALID);
    EXPECT_EQ(report.corruptedCount(), 0);
}

TEST_F(ChecksumTest, SegmentedLocatesDamagedSegment) {
    std::mt19937 rng(5);
    auto codec = makeCodec(4, 20);
    auto framed = codec.encodeSegmented(randomBits(rng, 100));

    framed.flip(45);         // Segment 3 data
    framed.flip(100 + 17);   // Segment 5 checksum

    auto report = codec.verifySegmented(framed);
    ASSERT_EQ(report.segments.size(), 5);
    EXPECT_EQ(report.segments[0], VerifyStatus::VALID);
    EXPECT_EQ(report.segments[1], VerifyStatus::VALID);
    EXPECT_EQ(report.segments[2], VerifyStatus::CORRUPTED);
    EXPECT_EQ(report.segments[3], VerifyStatus::VALID);
    EXPECT_EQ(report.segments[4], VerifyStatus::CORRUPTED);
    EXPECT_EQ(report.overall, VerifyStatus::CORRUPTED);
    EXPECT_EQ(report.corruptedCount(), 2);
}

TEST_F(ChecksumTest, SegmentedShortLastSegment) {
    std::mt19937 rng(9);
    auto codec = makeCodec(4, 20);
    auto framed = codec.encodeSegmented(randomBits(rng, 45));

    EXPECT_EQ(framed.size(), 45 + 3 * 4);
    EXPECT_EQ(codec.segmentedDataLength(framed.size()), 45);
    EXPECT_EQ(codec.verifySegmented(framed).segments.size(), 3);
}

TEST_F(ChecksumTest, SegmentedRejectsImpossibleLength) {
    auto codec = makeCodec(4, 20);

    // 20 data bits frame to 24, 21 to 29; nothing frames to 25
    EXPECT_EQ(codec.segmentedDataLength(25), 0);
    EXPECT_THROW(codec.verifySegmented(BitString(25)), InvalidInput);
    EXPECT_THROW(codec.verifySegmented(BitString(4)), InvalidInput);
    EXPECT_THROW(codec.encodeSegmented(BitString()), InvalidInput);
}
