#pragma once

#include "interfaces/i_proximity_observer.hpp"
#include "loader_config.hpp"
#include <optional>

namespace lazylist {

// Vertical extents in one coordinate space (content or screen)
struct SentinelGeometry {
    float sentinel_top = 0.0f;
    float sentinel_bottom = 0.0f;
    float viewport_top = 0.0f;
    float viewport_bottom = 0.0f;
};

// Intersect the sentinel with the viewport grown by margin on both edges.
// A zero-height sentinel intersects (ratio 1) when it lies inside the range.
[[nodiscard]] ProximityEntry compute_intersection(const SentinelGeometry& geometry, float margin);

// Whether an entry should trigger pagination
[[nodiscard]] bool entry_triggers(const ProximityEntry& entry, float threshold);

// Observer fed by the host with sentinel geometry once per frame. Behaves
// like a visibility observer: reports after observe() and on every change of
// the triggering state, not on every update.
class GeometricProximityObserver : public IProximityObserver {
public:
    GeometricProximityObserver(float margin, float threshold);
    explicit GeometricProximityObserver(const LoaderConfig& config);

    void observe(ProximityCallback callback) override;
    void disconnect() override;
    [[nodiscard]] bool is_connected() const override { return static_cast<bool>(callback_); }

    // Feed the current geometry. Returns true if the callback was invoked.
    bool update(const SentinelGeometry& geometry);

    [[nodiscard]] int observe_count() const { return observe_count_; }
    [[nodiscard]] int disconnect_count() const { return disconnect_count_; }

private:
    float margin_;
    float threshold_;
    ProximityCallback callback_;
    std::optional<bool> last_triggering_;
    int observe_count_ = 0;
    int disconnect_count_ = 0;
};

// Scoped observer registration: observes on connect(), disconnects on
// release() and on destruction.
class ObserverConnection {
public:
    ObserverConnection() = default;
    explicit ObserverConnection(IProximityObserver* observer) : observer_(observer) {}
    ~ObserverConnection() { release(); }

    ObserverConnection(const ObserverConnection&) = delete;
    ObserverConnection& operator=(const ObserverConnection&) = delete;

    void connect(ProximityCallback callback);
    void release();

    [[nodiscard]] bool is_active() const { return active_; }
    [[nodiscard]] bool has_observer() const { return observer_ != nullptr; }

private:
    IProximityObserver* observer_ = nullptr;
    bool active_ = false;
};

} // namespace lazylist
