#include "proximity.hpp"
#include <algorithm>
#include <utility>

namespace lazylist {

ProximityEntry compute_intersection(const SentinelGeometry& geometry, const float margin) {
    const float root_top = geometry.viewport_top - margin;
    const float root_bottom = geometry.viewport_bottom + margin;
    const float top = std::min(geometry.sentinel_top, geometry.sentinel_bottom);
    const float bottom = std::max(geometry.sentinel_top, geometry.sentinel_bottom);

    ProximityEntry entry;
    if (bottom - top <= 0.0f) {
        entry.is_intersecting = top >= root_top && top <= root_bottom;
        entry.intersection_ratio = entry.is_intersecting ? 1.0f : 0.0f;
        return entry;
    }

    const float overlap = std::min(bottom, root_bottom) - std::max(top, root_top);
    if (overlap < 0.0f) {
        return entry;
    }

    // Touching edges count as intersecting with a zero ratio
    entry.is_intersecting = true;
    entry.intersection_ratio = std::clamp(overlap / (bottom - top), 0.0f, 1.0f);
    return entry;
}

bool entry_triggers(const ProximityEntry& entry, const float threshold) {
    return entry.is_intersecting && entry.intersection_ratio >= threshold;
}

GeometricProximityObserver::GeometricProximityObserver(const float margin, const float threshold)
    : margin_(margin)
    , threshold_(threshold) {
}

GeometricProximityObserver::GeometricProximityObserver(const LoaderConfig& config)
    : GeometricProximityObserver(config.lookahead_margin, config.intersection_threshold) {
}

void GeometricProximityObserver::observe(ProximityCallback callback) {
    callback_ = std::move(callback);
    last_triggering_.reset();
    observe_count_++;
}

void GeometricProximityObserver::disconnect() {
    if (!callback_) return;
    callback_ = nullptr;
    last_triggering_.reset();
    disconnect_count_++;
}

bool GeometricProximityObserver::update(const SentinelGeometry& geometry) {
    if (!callback_) return false;

    const ProximityEntry entry = compute_intersection(geometry, margin_);
    const bool triggering = entry_triggers(entry, threshold_);
    if (last_triggering_ && *last_triggering_ == triggering) {
        return false;
    }
    last_triggering_ = triggering;

    // The callback may disconnect this observer
    const ProximityCallback callback = callback_;
    callback(entry);
    return true;
}

void ObserverConnection::connect(ProximityCallback callback) {
    if (!observer_ || active_) return;
    observer_->observe(std::move(callback));
    active_ = true;
}

void ObserverConnection::release() {
    if (!observer_ || !active_) return;
    active_ = false;
    observer_->disconnect();
}

} // namespace lazylist
