#include <automind/feature_vector.h>

namespace automind {

const char* featureName(Feature feature) {
    switch (feature) {
        case Feature::Bass:   return "bass";
        case Feature::Mid:    return "mid";
        case Feature::Treble: return "treble";
        case Feature::Rms:    return "rms";
        case Feature::Peak:   return "peak";
        case Feature::Flux:   return "flux";
        case Feature::Beat:   return "beat";
        case Feature::Count:  break;
    }
    return "unknown";
}

const char* fatigueLevelName(FatigueLevel level) {
    switch (level) {
        case FatigueLevel::Normal:   return "NORMAL";
        case FatigueLevel::Warning:  return "WARNING";
        case FatigueLevel::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

size_t FeatureVector::peakBin() const {
    size_t best = 0;
    float bestMag = -1.0f;
    for (size_t i = 1; i < magnitudes.size(); i++) {
        if (magnitudes[i] > bestMag) {
            bestMag = magnitudes[i];
            best = i;
        }
    }
    return best;
}

} // namespace automind
