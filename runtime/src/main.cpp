// automind - Audio capture and visualization entry point

#include <automind/config.h>
#include <automind/errors.h>
#include <automind/feature_bus.h>
#include <automind/frame_ring_buffer.h>
#include <automind/presenter.h>
#include <automind/render_loop.h>
#include <automind/scheduler.h>
#include <automind/shutdown_signal.h>
#include <automind/audio/audio.h>
#include "window_presenter.h"

#include <CLI/CLI.hpp>
#include <algorithm>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#ifndef AUTOMIND_VERSION
#define AUTOMIND_VERSION "0.0.0"
#endif

namespace {

automind::ShutdownSignal g_shutdown;

void handleSignal(int) {
    g_shutdown.raise();
}

int listDevices() {
    auto devices = automind::audio::CaptureSource::listDevices();
    if (devices.empty()) {
        std::cout << "No audio input devices found\n";
        return 0;
    }
    std::cout << "Audio input devices:\n";
    for (const auto& device : devices) {
        std::cout << "  [" << device.index << "] " << device.name
                  << (device.isDefault ? " (default)" : "") << "\n";
    }
    return 0;
}

std::unique_ptr<automind::Presenter> createPresenter(const automind::PipelineConfig& config) {
    if (!config.render.headless) {
        try {
            return std::make_unique<automind::WindowPresenter>(
                config.render.width, config.render.height, "automind");
        } catch (const std::runtime_error& e) {
            std::cerr << "[Window] " << e.what() << ", falling back to headless output" << std::endl;
        }
    }
    uint32_t every = std::max<uint32_t>(1, static_cast<uint32_t>(config.render.fps / 2.0f));
    return std::make_unique<automind::LogPresenter>(every);
}

} // namespace

int main(int argc, char** argv) {
    using namespace automind;

    CLI::App app{"automind - real-time audio capture and visualization"};
    app.set_version_flag("-v,--version", std::string(AUTOMIND_VERSION));
    app.set_help_flag("-h,--help", "Show this help");

    PipelineConfig config;
    std::string configPath;
    std::string writeConfigPath;
    bool listOnly = false;

    app.add_option("-c,--config", configPath, "JSON configuration file")->check(CLI::ExistingFile);
    auto* rateOpt = app.add_option("-r,--rate", config.stream.sampleRate, "Sample rate in Hz");
    auto* channelsOpt = app.add_option("--channels", config.stream.channels, "Input channel count");
    auto* frameOpt = app.add_option("--frame-size", config.stream.frameSize, "Samples per channel per frame");
    auto* windowOpt = app.add_option("-w,--window", config.analyzer.windowSize, "FFT window size (power of two)");
    auto* hopOpt = app.add_option("--hop", config.analyzer.hopSize, "Samples between analysis windows");
    auto* fpsOpt = app.add_option("--fps", config.render.fps, "Render ticks per second");
    auto* deviceOpt = app.add_option("-d,--device", config.stream.deviceIndex, "Capture device index (-1 = default)");
    app.add_flag("-l,--list-devices", listOnly, "List audio input devices and exit");
    auto* syntheticOpt = app.add_flag("-s,--synthetic", config.source.synthetic, "Use a generated tone instead of a device");
    auto* toneOpt = app.add_option("--tone", config.source.frequency, "Synthetic tone frequency in Hz");
    auto* headlessOpt = app.add_flag("--headless", config.render.headless, "Print meters instead of opening a window");
    auto* framesOpt = app.add_option("-n,--frames", config.render.maxTicks, "Stop after this many render ticks");
    app.add_option("--write-config", writeConfigPath, "Write the effective configuration and exit");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    if (listOnly) {
        return listDevices();
    }

    // File first, then command-line values on top
    if (!configPath.empty()) {
        PipelineConfig cliValues = config;
        if (!loadConfigFile(configPath, config)) {
            std::cerr << "[Config] Using defaults" << std::endl;
        }
        if (rateOpt->count()) config.stream.sampleRate = cliValues.stream.sampleRate;
        if (channelsOpt->count()) config.stream.channels = cliValues.stream.channels;
        if (frameOpt->count()) config.stream.frameSize = cliValues.stream.frameSize;
        if (windowOpt->count()) config.analyzer.windowSize = cliValues.analyzer.windowSize;
        if (hopOpt->count()) config.analyzer.hopSize = cliValues.analyzer.hopSize;
        if (fpsOpt->count()) config.render.fps = cliValues.render.fps;
        if (deviceOpt->count()) config.stream.deviceIndex = cliValues.stream.deviceIndex;
        if (syntheticOpt->count()) config.source.synthetic = true;
        if (toneOpt->count()) config.source.frequency = cliValues.source.frequency;
        if (headlessOpt->count()) config.render.headless = true;
        if (framesOpt->count()) config.render.maxTicks = cliValues.render.maxTicks;
    }
    if (toneOpt->count()) config.source.synthetic = true;

    auto problems = config.validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            std::cerr << "[Config] " << problem << std::endl;
        }
        return 1;
    }

    if (!writeConfigPath.empty()) {
        if (!saveConfigFile(writeConfigPath, config)) return 1;
        std::cout << "[Config] Wrote " << writeConfigPath << std::endl;
        return 0;
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    std::unique_ptr<AudioSource> source;
    if (config.source.synthetic) {
        source = std::make_unique<audio::SignalSource>(config.source);
    } else {
        source = std::make_unique<audio::CaptureSource>(config.stream.deviceIndex);
    }

    const auto& stream = config.stream;
    FrameRingBuffer ring(config.resolvedRingCapacity(), stream.frameSize, stream.channels, stream.sampleRate);
    FeatureBus bus;
    audio::SpectralAnalyzer analyzer(config.analyzer, stream.sampleRate, bus, config.fatigue);

    auto presenter = createPresenter(config);
    presenter->setCommandHandler([&analyzer](PresenterCommand command) {
        switch (command) {
            case PresenterCommand::ResetFatigue:
                analyzer.requestFatigueReset();
                break;
            case PresenterCommand::SimulateFatigueEvent:
                analyzer.requestFatigueEvent();
                break;
        }
    });
    RenderLoop renderLoop(config.render, bus, *presenter);

    try {
        source->open(stream.sampleRate, stream.channels, stream.frameSize);

        Scheduler scheduler(*source, ring, analyzer, g_shutdown);
        scheduler.run(renderLoop);
    } catch (const AudioError& e) {
        std::cerr << "[automind] Audio error: " << e.what() << std::endl;
        source->close();
        return 1;
    }

    std::cout << "[automind] Shut down cleanly" << std::endl;
    return 0;
}
