#pragma once

#include <functional>

namespace lazylist {

// One observation of the sentinel against the (margin-extended) viewport
struct ProximityEntry {
    bool is_intersecting = false;
    float intersection_ratio = 0.0f;  // visible fraction of the sentinel, 0..1
};

using ProximityCallback = std::function<void(const ProximityEntry&)>;

// Watches the sentinel placed after the last rendered item. Reports once
// after observe() and then whenever the intersection state changes.
class IProximityObserver {
public:
    virtual ~IProximityObserver() = default;

    virtual void observe(ProximityCallback callback) = 0;
    virtual void disconnect() = 0;
    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace lazylist
