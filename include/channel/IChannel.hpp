#pragma once

#include "utils/BitString.hpp"
#include <cstddef>
#include <optional>

namespace bitguard {
namespace channel {

/**
 * @brief Abstract carrier for encoded frames
 *
 * Lets codec round trips run against different backends:
 * - In-memory noisy channels (for testing and simulation)
 * - Adapters over a real byte transport supplied by the caller
 */
class IChannel {
public:
    virtual ~IChannel() = default;

    /**
     * @brief Queue a frame for delivery
     * @return false if the frame was dropped
     */
    virtual bool send(const utils::BitString& frame) = 0;

    /**
     * @brief Take the oldest delivered frame
     * @return nullopt if nothing is pending
     */
    virtual std::optional<utils::BitString> receive() = 0;

    /**
     * @brief Number of frames waiting to be received
     */
    virtual size_t pending() const = 0;

    /**
     * @brief Drop every pending frame
     */
    virtual void clear() = 0;
};

} // namespace channel
} // namespace bitguard
