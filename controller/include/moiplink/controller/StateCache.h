#pragma once

#include "moiplink/controller/Events.h"
#include "moiplink/controller/Model.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace moiplink::controller {

struct SerialMessage {
    std::vector<std::uint8_t> data;
    TimePoint at{};
};

// Immutable once published. Readers hold a shared pointer to a version that
// no writer will touch again.
struct State {
    std::uint64_t version{0};
    // Set while the line plane is not READY and until the next full
    // resynchronisation completes.
    bool stale{true};
    std::optional<TimePoint> refreshedAt;

    line::DeviceCounts counts;
    std::map<int, Device> transmitters;
    std::map<int, Device> receivers;
    RoutingTable routing;
    std::map<int, rest::UnitRecord> units;
    std::map<std::pair<DeviceKind, int>, std::deque<SerialMessage>> serial;
    std::map<Plane, ConnectionState> connections;
};

class StateCache;

// Keeps a listener registered for as long as it lives.
class Subscription {
public:
    Subscription() = default;
    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void reset();
    bool active() const noexcept { return id_ != 0; }

private:
    friend class StateCache;
    struct Registry;

    Subscription(std::weak_ptr<Registry> registry, std::uint64_t id);

    std::weak_ptr<Registry> registry_;
    std::uint64_t id_{0};
};

// The single owner of device, routing and live status state. apply() is the
// only mutation and is called from the dispatcher thread; every read returns
// a copy.
class StateCache {
public:
    using Listener = std::function<void(const Event& event, const State& state)>;

    explicit StateCache(std::size_t serialHistory = 32);

    void apply(const Event& event);

    std::shared_ptr<const State> snapshot() const;
    std::vector<Device> devices() const;
    std::vector<Device> devices(DeviceKind kind) const;
    std::optional<Device> device(DeviceKind kind, int index) const;
    RoutingTable routing() const;
    std::optional<int> sourceOf(int rx) const;
    std::vector<SerialMessage> serialMessages(DeviceKind kind, int index) const;
    ConnectionState connection(Plane plane) const;
    std::uint64_t version() const;
    bool stale() const;

    // Listeners run on the applying thread after the new state is published.
    [[nodiscard]] Subscription subscribe(Listener listener);

private:
    void applyTo(State& state, const RoutingReplaced& event) const;
    void applyTo(State& state, const RouteConfirmed& event) const;
    void applyTo(State& state, const Resynchronized& event) const;
    void applyTo(State& state, const RestInventory& event) const;
    void applyTo(State& state, const DeviceRenamed& event) const;
    void applyTo(State& state, const UnitStatusChanged& event) const;
    void applyTo(State& state, const SerialReceived& event) const;
    void applyTo(State& state, const ResourceChanged& event) const;
    void applyTo(State& state, const ConnectionChanged& event) const;

    std::size_t serialHistory_;
    std::mutex applyMutex_;
    mutable std::mutex stateMutex_;
    std::shared_ptr<const State> state_;
    std::shared_ptr<Subscription::Registry> registry_;
};

}  // namespace moiplink::controller
