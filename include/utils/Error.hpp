#pragma once

#include <stdexcept>
#include <string>

namespace bitguard {
namespace utils {

/**
 * @brief Raised for malformed or ill-sized arguments (caller bugs)
 *
 * Transmission errors are never reported this way; codecs return them
 * as status values.
 */
class InvalidInput : public std::invalid_argument {
public:
    explicit InvalidInput(const std::string& what)
        : std::invalid_argument(what) {}
};

} // namespace utils
} // namespace bitguard
