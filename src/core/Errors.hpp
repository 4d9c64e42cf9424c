#pragma once

/**
 * @file Errors.hpp
 * @brief Exception types raised by the HexMosaic core
 */

#include <stdexcept>
#include <string>

namespace hexmosaic {

/**
 * @brief Base class for all errors raised by the core
 */
class HexMosaicError : public std::runtime_error {
public:
    explicit HexMosaicError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A caller supplied a bad parameter or an unusable layer
 *
 * Raised before any computation starts, so nothing is partially written.
 */
class InvalidArgument : public HexMosaicError {
public:
    explicit InvalidArgument(const std::string& message)
        : HexMosaicError(message) {}
};

/**
 * @brief The zonal statistics engine reported a failure
 *
 * The inputs were accepted; the statistics computation itself did not
 * complete.
 */
class SamplingEngineError : public HexMosaicError {
public:
    explicit SamplingEngineError(const std::string& message)
        : HexMosaicError(message) {}
};

} // namespace hexmosaic
