#pragma once

#include "channel/IChannel.hpp"
#include <cstdint>
#include <deque>
#include <mutex>
#include <random>
#include <vector>

namespace bitguard {
namespace channel {

/**
 * @brief In-memory channel that flips bits in transit
 */
class NoisyChannel : public IChannel {
public:
    struct Config {
        size_t capacity = 64;          // Frames held before send() starts dropping
        double bit_error_rate = 0.0;   // Independent flip probability per bit (0.0 - 1.0)
        uint32_t seed = 0;             // 0 seeds from std::random_device
    };

    /**
     * @throws InvalidInput for a zero capacity or an error rate outside [0, 1]
     */
    explicit NoisyChannel(const Config& config);
    NoisyChannel();
    ~NoisyChannel() override = default;

    // IChannel interface
    bool send(const utils::BitString& frame) override;
    std::optional<utils::BitString> receive() override;
    size_t pending() const override;
    void clear() override;

    /**
     * @brief Flip the bit at `index` of the next frame sent
     *
     * May be called repeatedly to corrupt several bits of one frame;
     * repeating an index still flips that bit once.
     * send() throws InvalidInput if an index lies outside that frame.
     */
    void injectBitFlip(size_t index);

    /**
     * @brief Total bits flipped since construction
     */
    size_t getFlippedBits() const;

    const Config& getConfig() const { return config_; }

private:
    Config config_;
    std::deque<utils::BitString> frames_;
    std::vector<size_t> injected_flips_;
    size_t flipped_bits_;

    std::mt19937 rng_;
    std::bernoulli_distribution flip_dist_;
    mutable std::mutex mutex_;
};

} // namespace channel
} // namespace bitguard
