#pragma once

/**
 * @file visual_state.h
 * @brief Per-tick drawable state owned by the render loop
 */

#include <automind/feature_vector.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <vector>

namespace automind {

/**
 * @brief What the presenter draws on a tick
 *
 * Derived from the latest FeatureVector and the previous VisualState. Lives
 * on the render thread only.
 */
struct VisualState {
    std::vector<float> bars;        ///< Spectrum bars, 0-1, low to high frequency
    float bass = 0.0f;              ///< Smoothed display levels, 0-1
    float mid = 0.0f;
    float treble = 0.0f;
    float level = 0.0f;             ///< Smoothed overall loudness, 0-1
    float pulse = 0.0f;             ///< 1 on a beat, decays each tick

    FatigueLevel fatigue = FatigueLevel::Normal;
    uint32_t fatigueEvents = 0;
    glm::vec3 background{0.08f, 0.12f, 0.2f};

    uint64_t tick = 0;              ///< Ticks presented so far
    uint32_t staleTicks = 0;        ///< Ticks since the last fresh vector
    bool hasData = false;           ///< A vector has been seen at least once
    double audioTime = 0.0;         ///< Timestamp of the latest vector seen

    /// @brief Largest display value, useful to check decay
    float energy() const;
};

/// @brief Background colour for a fatigue level
glm::vec3 fatigueColor(FatigueLevel level);

} // namespace automind
