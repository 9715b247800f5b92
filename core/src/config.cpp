#include <automind/config.h>
#include <automind/frame_ring_buffer.h>

#include <fstream>
#include <iostream>
#include <string>

using json = nlohmann::json;

namespace automind {

// Upper bounds also catch negative JSON values wrapped into unsigned fields
static constexpr uint32_t MAX_SAMPLE_RATE = 384000;
static constexpr uint32_t MAX_CHANNELS = 32;
static constexpr uint32_t MAX_FRAME_SIZE = 65536;
static constexpr uint32_t MAX_WINDOW_SIZE = 65536;

bool isPowerOfTwo(uint32_t n) {
    return n != 0 && (n & (n - 1)) == 0;
}

size_t PipelineConfig::resolvedRingCapacity() const {
    if (stream.ringCapacity > 0) return stream.ringCapacity;
    return FrameRingBuffer::capacityFor(stream.ringSeconds, stream.sampleRate, stream.frameSize);
}

std::vector<std::string> PipelineConfig::validate() const {
    std::vector<std::string> problems;
    auto fail = [&](const std::string& msg) { problems.push_back(msg); };

    if (stream.sampleRate == 0 || stream.sampleRate > MAX_SAMPLE_RATE) {
        fail("stream.sampleRate must be in [1, " + std::to_string(MAX_SAMPLE_RATE) + "]");
    }
    if (stream.channels == 0 || stream.channels > MAX_CHANNELS) {
        fail("stream.channels must be in [1, " + std::to_string(MAX_CHANNELS) + "]");
    }
    if (stream.frameSize == 0 || stream.frameSize > MAX_FRAME_SIZE) {
        fail("stream.frameSize must be in [1, " + std::to_string(MAX_FRAME_SIZE) + "]");
    }

    if (!isPowerOfTwo(analyzer.windowSize) || analyzer.windowSize < 16 ||
        analyzer.windowSize > MAX_WINDOW_SIZE) {
        fail("analyzer.windowSize must be a power of two in [16, " +
             std::to_string(MAX_WINDOW_SIZE) + "]");
    }
    if (analyzer.hopSize == 0 || analyzer.hopSize >= analyzer.windowSize) {
        fail("analyzer.hopSize must be positive and smaller than windowSize");
    }
    if (analyzer.binCount != 0 && analyzer.binCount != analyzer.windowSize / 2) {
        fail("analyzer.binCount must be 0 or windowSize / 2");
    }

    if (render.fps <= 0.0f) fail("render.fps must be positive");
    if (render.bars == 0) fail("render.bars must be positive");
    if (render.attack <= 0.0f || render.attack > 1.0f) fail("render.attack must be in (0, 1]");
    if (render.release <= 0.0f || render.release > 1.0f) fail("render.release must be in (0, 1]");

    if (fatigue.enabled && fatigue.evaluationPeriod <= 0.0f) {
        fail("fatigue.evaluationPeriod must be positive");
    }

    if (source.synthetic && source.frequency <= 0.0f) {
        fail("source.frequency must be positive");
    }

    return problems;
}

// -----------------------------------------------------------------------------
// JSON
// -----------------------------------------------------------------------------

static json bandToJson(const BandRange& band) {
    return json::array({band.lowHz, band.highHz});
}

static void bandFromJson(const json& j, const char* key, BandRange& band) {
    if (!j.contains(key)) return;
    const json& b = j.at(key);
    if (b.is_array() && b.size() == 2) {
        band.lowHz = b[0].get<float>();
        band.highHz = b[1].get<float>();
    }
}

void to_json(json& j, const PipelineConfig& c) {
    j = json{
        {"stream", {
            {"sampleRate", c.stream.sampleRate},
            {"channels", c.stream.channels},
            {"frameSize", c.stream.frameSize},
            {"deviceIndex", c.stream.deviceIndex},
            {"ringCapacity", c.stream.ringCapacity},
            {"ringSeconds", c.stream.ringSeconds},
        }},
        {"analyzer", {
            {"windowSize", c.analyzer.windowSize},
            {"hopSize", c.analyzer.hopSize},
            {"binCount", c.analyzer.binCount},
            {"bass", bandToJson(c.analyzer.bass)},
            {"mid", bandToJson(c.analyzer.mid)},
            {"treble", bandToJson(c.analyzer.treble)},
            {"onsetSensitivity", c.analyzer.onsetSensitivity},
            {"onsetHoldMs", c.analyzer.onsetHoldMs},
            {"onsetHistory", c.analyzer.onsetHistory},
        }},
        {"fatigue", {
            {"enabled", c.fatigue.enabled},
            {"evaluationPeriod", c.fatigue.evaluationPeriod},
            {"energyThreshold", c.fatigue.energyThreshold},
            {"warningCount", c.fatigue.warningCount},
            {"eventWindow", c.fatigue.eventWindow},
            {"manualEventSpacing", c.fatigue.manualEventSpacing},
            {"alertInterval", c.fatigue.alertInterval},
        }},
        {"render", {
            {"fps", c.render.fps},
            {"bars", c.render.bars},
            {"attack", c.render.attack},
            {"release", c.render.release},
            {"holdTicks", c.render.holdTicks},
            {"pulseDecay", c.render.pulseDecay},
            {"barGain", c.render.barGain},
            {"bandGain", c.render.bandGain},
            {"presentFinalFrame", c.render.presentFinalFrame},
            {"headless", c.render.headless},
            {"width", c.render.width},
            {"height", c.render.height},
            {"maxTicks", c.render.maxTicks},
        }},
        {"source", {
            {"synthetic", c.source.synthetic},
            {"frequency", c.source.frequency},
            {"amplitude", c.source.amplitude},
            {"noise", c.source.noise},
            {"paced", c.source.paced},
            {"frameLimit", c.source.frameLimit},
        }},
    };
}

void from_json(const json& j, PipelineConfig& c) {
    if (j.contains("stream")) {
        const json& s = j.at("stream");
        c.stream.sampleRate = s.value("sampleRate", c.stream.sampleRate);
        c.stream.channels = s.value("channels", c.stream.channels);
        c.stream.frameSize = s.value("frameSize", c.stream.frameSize);
        c.stream.deviceIndex = s.value("deviceIndex", c.stream.deviceIndex);
        c.stream.ringCapacity = s.value("ringCapacity", c.stream.ringCapacity);
        c.stream.ringSeconds = s.value("ringSeconds", c.stream.ringSeconds);
    }

    if (j.contains("analyzer")) {
        const json& a = j.at("analyzer");
        c.analyzer.windowSize = a.value("windowSize", c.analyzer.windowSize);
        c.analyzer.hopSize = a.value("hopSize", c.analyzer.hopSize);
        c.analyzer.binCount = a.value("binCount", c.analyzer.binCount);
        bandFromJson(a, "bass", c.analyzer.bass);
        bandFromJson(a, "mid", c.analyzer.mid);
        bandFromJson(a, "treble", c.analyzer.treble);
        c.analyzer.onsetSensitivity = a.value("onsetSensitivity", c.analyzer.onsetSensitivity);
        c.analyzer.onsetHoldMs = a.value("onsetHoldMs", c.analyzer.onsetHoldMs);
        c.analyzer.onsetHistory = a.value("onsetHistory", c.analyzer.onsetHistory);
    }

    if (j.contains("fatigue")) {
        const json& f = j.at("fatigue");
        c.fatigue.enabled = f.value("enabled", c.fatigue.enabled);
        c.fatigue.evaluationPeriod = f.value("evaluationPeriod", c.fatigue.evaluationPeriod);
        c.fatigue.energyThreshold = f.value("energyThreshold", c.fatigue.energyThreshold);
        c.fatigue.warningCount = f.value("warningCount", c.fatigue.warningCount);
        c.fatigue.eventWindow = f.value("eventWindow", c.fatigue.eventWindow);
        c.fatigue.manualEventSpacing = f.value("manualEventSpacing", c.fatigue.manualEventSpacing);
        c.fatigue.alertInterval = f.value("alertInterval", c.fatigue.alertInterval);
    }

    if (j.contains("render")) {
        const json& r = j.at("render");
        c.render.fps = r.value("fps", c.render.fps);
        c.render.bars = r.value("bars", c.render.bars);
        c.render.attack = r.value("attack", c.render.attack);
        c.render.release = r.value("release", c.render.release);
        c.render.holdTicks = r.value("holdTicks", c.render.holdTicks);
        c.render.pulseDecay = r.value("pulseDecay", c.render.pulseDecay);
        c.render.barGain = r.value("barGain", c.render.barGain);
        c.render.bandGain = r.value("bandGain", c.render.bandGain);
        c.render.presentFinalFrame = r.value("presentFinalFrame", c.render.presentFinalFrame);
        c.render.headless = r.value("headless", c.render.headless);
        c.render.width = r.value("width", c.render.width);
        c.render.height = r.value("height", c.render.height);
        c.render.maxTicks = r.value("maxTicks", c.render.maxTicks);
    }

    if (j.contains("source")) {
        const json& s = j.at("source");
        c.source.synthetic = s.value("synthetic", c.source.synthetic);
        c.source.frequency = s.value("frequency", c.source.frequency);
        c.source.amplitude = s.value("amplitude", c.source.amplitude);
        c.source.noise = s.value("noise", c.source.noise);
        c.source.paced = s.value("paced", c.source.paced);
        c.source.frameLimit = s.value("frameLimit", c.source.frameLimit);
    }
}

bool loadConfigFile(const std::string& path, PipelineConfig& config) {
    std::ifstream file(path);
    if (!file) {
        std::cerr << "[Config] Cannot open " << path << std::endl;
        return false;
    }

    try {
        json j;
        file >> j;
        PipelineConfig loaded = config;
        from_json(j, loaded);
        config = loaded;
    } catch (const json::exception& e) {
        std::cerr << "[Config] Error loading " << path << ": " << e.what() << std::endl;
        return false;
    }

    std::cout << "[Config] Loaded " << path << std::endl;
    return true;
}

bool saveConfigFile(const std::string& path, const PipelineConfig& config) {
    std::ofstream file(path);
    if (!file) {
        std::cerr << "[Config] Cannot write " << path << std::endl;
        return false;
    }

    json j = config;
    file << j.dump(2) << std::endl;
    return static_cast<bool>(file);
}

} // namespace automind
