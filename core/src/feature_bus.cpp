#include <automind/feature_bus.h>

#include <utility>

namespace automind {

void FeatureBus::publish(FeatureVectorPtr vector) {
    FeatureVectorPtr previous;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        previous = std::exchange(m_latest, std::move(vector));
        m_version.fetch_add(1, std::memory_order_release);
    }
    // previous is released outside the lock
}

FeatureVectorPtr FeatureBus::readLatest() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_latest;
}

} // namespace automind
