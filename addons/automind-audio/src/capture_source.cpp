// Prevent Windows.h from defining min/max macros
#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

#define MINIAUDIO_IMPLEMENTATION
#include "miniaudio.h"

#include <automind/audio/capture_source.h>
#include <automind/errors.h>
#include <iostream>
#include <string>

namespace automind::audio {

namespace {

struct ContextDeleter {
    void operator()(ma_context* context) const {
        ma_context_uninit(context);
        delete context;
    }
};

struct DeviceDeleter {
    void operator()(ma_device* device) const {
        ma_device_uninit(device);
        delete device;
    }
};

using ContextPtr = std::unique_ptr<ma_context, ContextDeleter>;
using DevicePtr = std::unique_ptr<ma_device, DeviceDeleter>;

ContextPtr createContext() {
    auto storage = std::make_unique<ma_context>();
    ma_result result = ma_context_init(nullptr, 0, nullptr, storage.get());
    if (result != MA_SUCCESS) {
        throw DeviceUnavailable(std::string("Failed to initialize audio context: ") +
                                ma_result_description(result));
    }
    return ContextPtr(storage.release());
}

// Owned by the context; valid until it is uninitialized
struct CaptureDevices {
    ma_device_info* infos = nullptr;
    ma_uint32 count = 0;
};

CaptureDevices enumerateCaptureDevices(ma_context* context) {
    CaptureDevices found;
    ma_result result = ma_context_get_devices(context, nullptr, nullptr, &found.infos, &found.count);
    if (result != MA_SUCCESS) {
        throw DeviceUnavailable(std::string("Failed to enumerate capture devices: ") +
                                ma_result_description(result));
    }
    return found;
}

} // namespace

struct CaptureSource::Impl {
    // Declaration order matters: the device is released before its context
    ContextPtr context;
    DevicePtr device;

    static void dataCallback(ma_device* pDevice, void* output, const void* input, ma_uint32 frameCount) {
        (void)output;

        auto* source = static_cast<CaptureSource*>(pDevice->pUserData);
        source->deliver(static_cast<const float*>(input), frameCount);
    }

    static void notificationCallback(const ma_device_notification* notification) {
        auto* source = static_cast<CaptureSource*>(notification->pDevice->pUserData);
        if (notification->type != ma_device_notification_type_stopped) return;
        if (source->m_closing.load() || !source->m_running.load()) return;

        // Stopped without close(): the device went away
        source->m_running = false;
        source->reportError(std::make_exception_ptr(
            StreamInterrupted("Capture device stopped unexpectedly")));
    }
};

CaptureSource::CaptureSource(int deviceIndex)
    : m_impl(std::make_unique<Impl>()), m_deviceIndex(deviceIndex) {}

CaptureSource::~CaptureSource() {
    close();
}

std::vector<AudioDeviceInfo> CaptureSource::listDevices() {
    std::vector<AudioDeviceInfo> devices;
    try {
        ContextPtr context = createContext();
        CaptureDevices found = enumerateCaptureDevices(context.get());
        for (ma_uint32 i = 0; i < found.count; i++) {
            AudioDeviceInfo info;
            info.name = found.infos[i].name;
            info.index = i;
            info.isDefault = found.infos[i].isDefault != 0;
            devices.push_back(info);
        }
    } catch (const DeviceUnavailable& e) {
        std::cerr << "[AudioCapture] " << e.what() << std::endl;
    }
    return devices;
}

void CaptureSource::open(uint32_t sampleRate, uint32_t channels, uint32_t frameSize) {
    close();

    if (sampleRate == 0 || channels == 0 || frameSize == 0) {
        throw ConfigurationRejected("Sample rate, channel count and frame size must be non-zero (got " +
                                    std::to_string(sampleRate) + "Hz, " + std::to_string(channels) +
                                    " ch, " + std::to_string(frameSize) + " frames)");
    }

    ContextPtr context = createContext();
    CaptureDevices found = enumerateCaptureDevices(context.get());
    if (found.count == 0) {
        throw DeviceUnavailable("No audio input devices found");
    }

    // Configure capture device
    ma_device_config config = ma_device_config_init(ma_device_type_capture);
    config.capture.format = ma_format_f32;
    config.capture.channels = channels;
    config.sampleRate = sampleRate;
    config.periodSizeInFrames = frameSize;
    config.dataCallback = &Impl::dataCallback;
    config.notificationCallback = &Impl::notificationCallback;
    config.pUserData = this;

    // Select specific device if requested
    if (m_deviceIndex >= 0) {
        if (static_cast<ma_uint32>(m_deviceIndex) >= found.count) {
            throw DeviceUnavailable("Capture device " + std::to_string(m_deviceIndex) +
                                    " does not exist (" + std::to_string(found.count) + " available)");
        }
        config.capture.pDeviceID = &found.infos[m_deviceIndex].id;
        m_deviceName = found.infos[m_deviceIndex].name;
    } else {
        m_deviceName = "default";
        for (ma_uint32 i = 0; i < found.count; i++) {
            if (found.infos[i].isDefault) {
                m_deviceName = found.infos[i].name;
                break;
            }
        }
    }

    // Assemble before the device exists so the first callback has storage
    prepareAssembly(sampleRate, channels, frameSize);
    m_closing = false;

    auto storage = std::make_unique<ma_device>();
    ma_result result = ma_device_init(context.get(), &config, storage.get());
    if (result != MA_SUCCESS) {
        std::string reason = ma_result_description(result);
        if (result == MA_NO_DEVICE || result == MA_DOES_NOT_EXIST || result == MA_DEVICE_NOT_INITIALIZED) {
            throw DeviceUnavailable("Failed to open capture device '" + m_deviceName + "': " + reason);
        }
        throw ConfigurationRejected("Capture device '" + m_deviceName + "' rejected " +
                                    std::to_string(sampleRate) + "Hz / " + std::to_string(channels) +
                                    " ch float: " + reason);
    }

    m_impl->context = std::move(context);
    m_impl->device = DevicePtr(storage.release());
    m_open = true;

    std::cout << "[AudioCapture] Initialized '" << m_deviceName << "': " << sampleRate << "Hz, "
              << channels << " channel(s), " << frameSize << " frames per period" << std::endl;
}

void CaptureSource::start() {
    if (!m_open.load()) {
        throw AudioError("Capture started before open()");
    }
    if (m_running.load()) return;

    m_running = true;
    ma_result result = ma_device_start(m_impl->device.get());
    if (result != MA_SUCCESS) {
        m_running = false;
        throw DeviceUnavailable(std::string("Failed to start capture: ") + ma_result_description(result));
    }
    std::cout << "[AudioCapture] Started capturing" << std::endl;
}

void CaptureSource::close() {
    m_closing = true;

    if (m_impl->device) {
        if (m_running.load() && ma_device_stop(m_impl->device.get()) != MA_SUCCESS) {
            std::cerr << "[AudioCapture] Failed to stop capture, releasing device anyway" << std::endl;
        }
        m_impl->device.reset();
    }
    m_impl->context.reset();

    bool wasOpen = m_open.exchange(false);
    m_running = false;

    if (wasOpen) {
        std::cout << "[AudioCapture] Closed after " << framesDelivered() << " frames" << std::endl;
    }
}

} // namespace automind::audio
