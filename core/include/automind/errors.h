#pragma once

/**
 * @file errors.h
 * @brief Exception types raised by the audio pipeline
 *
 * Runtime failures of the capture path derive from AudioError and are
 * surfaced to the caller of Scheduler::run(). Configuration contract
 * violations derive from std::logic_error and are never caught.
 */

#include <stdexcept>
#include <string>

namespace automind {

/// @brief Base class for runtime audio errors
class AudioError : public std::runtime_error {
public:
    explicit AudioError(const std::string& what) : std::runtime_error(what) {}
};

/// @brief No input device matches the request
class DeviceUnavailable : public AudioError {
public:
    explicit DeviceUnavailable(const std::string& what) : AudioError(what) {}
};

/// @brief The device refused the requested rate, channel count or format
class ConfigurationRejected : public AudioError {
public:
    explicit ConfigurationRejected(const std::string& what) : AudioError(what) {}
};

/// @brief The stream stopped while the pipeline was still running
class StreamInterrupted : public AudioError {
public:
    explicit StreamInterrupted(const std::string& what) : AudioError(what) {}
};

/**
 * @brief Window size, hop size and bin count do not describe a valid transform
 *
 * Raised when a SpectralAnalyzer is constructed with a broken configuration.
 */
class TransformConfigurationMismatch : public std::logic_error {
public:
    explicit TransformConfigurationMismatch(const std::string& what) : std::logic_error(what) {}
};

} // namespace automind
