#pragma once

/**
 * @file capture_source.h
 * @brief Microphone / line-in capture using miniaudio
 */

#include <automind/audio_source.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace automind::audio {

/**
 * @brief Audio capture device information.
 */
struct AudioDeviceInfo {
    std::string name;
    uint32_t index;
    bool isDefault;
};

/**
 * @brief AudioSource reading float samples from a capture device
 *
 * The miniaudio period is set to the frame size, so in the common case each
 * device callback delivers exactly one frame. The callback only copies
 * samples into the ring; it never allocates, logs or blocks beyond the
 * ring's lock.
 *
 * @par Example
 * @code
 * CaptureSource mic(-1);              // default device
 * mic.open(44100, 1, 512);            // throws DeviceUnavailable / ConfigurationRejected
 * mic.setSink(&ring);
 * mic.start();
 * @endcode
 */
class CaptureSource : public AudioSource {
public:
    /// @param deviceIndex Index into listDevices(), -1 for the system default
    explicit CaptureSource(int deviceIndex = -1);
    ~CaptureSource() override;

    /**
     * @brief List available audio input devices.
     * @return Vector of device information, empty if enumeration failed.
     */
    static std::vector<AudioDeviceInfo> listDevices();

    void open(uint32_t sampleRate, uint32_t channels, uint32_t frameSize) override;
    void start() override;
    void close() override;
    std::string name() const override { return "AudioCapture"; }

    int deviceIndex() const { return m_deviceIndex; }

    /// @brief Name of the opened device, empty before open()
    const std::string& deviceName() const { return m_deviceName; }

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;

    int m_deviceIndex;
    std::string m_deviceName;
    std::atomic<bool> m_closing{false};
};

} // namespace automind::audio
