#pragma once

/**
 * @file feature_bus.h
 * @brief Latest-value handoff from the analyzer to the render loop
 */

#include <automind/feature_vector.h>
#include <atomic>
#include <cstdint>
#include <mutex>

namespace automind {

/**
 * @brief Single-slot publish point for FeatureVectors
 *
 * The analyzer publishes, any number of readers take the newest vector.
 * There is no queue: a reader that falls behind simply skips vectors.
 * Publishing swaps a shared pointer under a short lock, so readers always
 * see a complete vector.
 *
 * @par Example
 * @code
 * // Analysis thread
 * bus.publish(std::make_shared<FeatureVector>(features));
 *
 * // Render thread
 * if (FeatureVectorPtr latest = bus.readLatest()) {
 *     drawBars(latest->magnitudes);
 * }
 * @endcode
 */
class FeatureBus {
public:
    FeatureBus() = default;

    FeatureBus(const FeatureBus&) = delete;
    FeatureBus& operator=(const FeatureBus&) = delete;

    /// @brief Replace the held vector
    void publish(FeatureVectorPtr vector);

    /**
     * @brief Newest published vector
     * @return nullptr until the first publish()
     */
    FeatureVectorPtr readLatest() const;

    /// @brief Number of publishes so far; changes whenever a new vector lands
    uint64_t version() const { return m_version.load(std::memory_order_acquire); }

    bool hasData() const { return version() > 0; }

private:
    mutable std::mutex m_mutex;
    FeatureVectorPtr m_latest;
    std::atomic<uint64_t> m_version{0};
};

} // namespace automind
