#include "channel/NoisyChannel.hpp"
#include "utils/Error.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <string>
#include <utility>

namespace bitguard {
namespace channel {

namespace {

uint32_t resolveSeed(uint32_t seed) {
    return seed != 0 ? seed : std::random_device{}();
}

} // namespace

NoisyChannel::NoisyChannel(const Config& config)
    : config_(config)
    , flipped_bits_(0)
    , rng_(resolveSeed(config.seed))
    , flip_dist_(0.0) {
    if (config_.capacity == 0) {
        throw utils::InvalidInput("NoisyChannel: capacity must be positive");
    }
    if (!(config_.bit_error_rate >= 0.0 && config_.bit_error_rate <= 1.0)) {
        throw utils::InvalidInput("NoisyChannel: bit error rate " +
                                  std::to_string(config_.bit_error_rate) +
                                  " outside [0, 1]");
    }
    flip_dist_ = std::bernoulli_distribution(config_.bit_error_rate);
}

NoisyChannel::NoisyChannel()
    : NoisyChannel(Config{}) {
}

bool NoisyChannel::send(const utils::BitString& frame) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (frames_.size() >= config_.capacity) {
        LOG_WARN("NoisyChannel: Queue full, dropped ", frame.size(), "-bit frame");
        injected_flips_.clear();
        return false;
    }

    utils::BitString delivered = frame;

    for (size_t index : injected_flips_) {
        if (index >= delivered.size()) {
            injected_flips_.clear();
            throw utils::InvalidInput("NoisyChannel: injected flip at " + std::to_string(index) +
                                      " outside " + std::to_string(delivered.size()) +
                                      "-bit frame");
        }
    }
    for (size_t index : injected_flips_) {
        delivered.flip(index);
        ++flipped_bits_;
        LOG_DEBUG("NoisyChannel: Injected bit flip at offset ", index);
    }
    injected_flips_.clear();

    if (config_.bit_error_rate > 0.0) {
        for (size_t i = 0; i < delivered.size(); ++i) {
            if (flip_dist_(rng_)) {
                delivered.flip(i);
                ++flipped_bits_;
                LOG_TRACE("NoisyChannel: Random bit flip at offset ", i);
            }
        }
    }

    frames_.push_back(std::move(delivered));
    LOG_TRACE("NoisyChannel: Queued ", frame.size(), "-bit frame");
    return true;
}

std::optional<utils::BitString> NoisyChannel::receive() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (frames_.empty()) {
        return std::nullopt;
    }

    utils::BitString frame = std::move(frames_.front());
    frames_.pop_front();
    return frame;
}

size_t NoisyChannel::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

void NoisyChannel::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    frames_.clear();
    injected_flips_.clear();
}

void NoisyChannel::injectBitFlip(size_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(injected_flips_.begin(), injected_flips_.end(), index) != injected_flips_.end()) {
        return;
    }
    injected_flips_.push_back(index);
}

size_t NoisyChannel::getFlippedBits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return flipped_bits_;
}

} // namespace channel
} // namespace bitguard
