#include "moiplink/controller/StateCache.h"

#include <spdlog/spdlog.h>

#include <set>

namespace moiplink::controller {

struct Subscription::Registry {
    std::mutex mutex;
    std::map<std::uint64_t, StateCache::Listener> listeners;
    std::uint64_t nextId{1};
};

Subscription::Subscription(std::weak_ptr<Registry> registry, std::uint64_t id)
    : registry_(std::move(registry)), id_(id) {}

Subscription::Subscription(Subscription&& other) noexcept
    : registry_(std::move(other.registry_)), id_(std::exchange(other.id_, 0)) {}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        registry_ = std::move(other.registry_);
        id_ = std::exchange(other.id_, 0);
    }
    return *this;
}

Subscription::~Subscription() {
    reset();
}

void Subscription::reset() {
    if (id_ == 0) {
        return;
    }
    if (auto registry = registry_.lock()) {
        std::lock_guard<std::mutex> lock(registry->mutex);
        registry->listeners.erase(id_);
    }
    registry_.reset();
    id_ = 0;
}

namespace {

Device& ensureDevice(std::map<int, Device>& devices, DeviceKind kind, int index) {
    auto [it, inserted] = devices.try_emplace(index);
    if (inserted) {
        it->second.index = index;
        it->second.kind = kind;
        it->second.name = defaultDeviceName(kind, index);
    }
    return it->second;
}

std::map<int, Device>& devicesOf(State& state, DeviceKind kind) {
    return kind == DeviceKind::Transmitter ? state.transmitters : state.receivers;
}

// Receivers the table does not mention are unassigned. Any route that
// arrived after the incoming table survives it; everything else is replaced.
RoutingTable mergeRouting(const RoutingTable& previous,
                          RoutingTable incoming,
                          int receiverCount,
                          RouteOrigin origin,
                          TimePoint arrivedAt) {
    for (int rx = 1; rx <= receiverCount; ++rx) {
        incoming.try_emplace(rx, Route{rx, 0, origin, arrivedAt});
    }
    for (const auto& [rx, route] : previous) {
        if (route.updatedAt > arrivedAt) {
            incoming[rx] = route;
        }
    }
    return incoming;
}

}  // namespace

StateCache::StateCache(std::size_t serialHistory)
    : serialHistory_(serialHistory),
      state_(std::make_shared<const State>()),
      registry_(std::make_shared<Subscription::Registry>()) {}

void StateCache::apply(const Event& event) {
    std::lock_guard<std::mutex> applyLock(applyMutex_);

    auto next = std::make_shared<State>(*snapshot());
    std::visit([this, &next](const auto& typed) { applyTo(*next, typed); }, event);
    ++next->version;

    std::shared_ptr<const State> published = next;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        state_ = published;
    }

    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        listeners.reserve(registry_->listeners.size());
        for (const auto& [id, listener] : registry_->listeners) {
            (void)id;
            listeners.push_back(listener);
        }
    }
    for (const auto& listener : listeners) {
        try {
            listener(event, *published);
        } catch (const std::exception& ex) {
            spdlog::error("State listener failed on {}: {}", eventName(event), ex.what());
        }
    }
}

void StateCache::applyTo(State& state, const RoutingReplaced& event) const {
    state.routing = mergeRouting(state.routing, event.table, state.counts.receivers, event.origin, event.arrivedAt);
}

void StateCache::applyTo(State& state, const RouteConfirmed& event) const {
    if (auto it = state.routing.find(event.rx);
        it != state.routing.end() && it->second.origin != RouteOrigin::LocalConfirm && it->second.updatedAt > event.at) {
        // The device reported this receiver after the switch was issued.
        return;
    }
    auto table = state.routing;
    table[event.rx] = Route{event.rx, event.tx, RouteOrigin::LocalConfirm, event.at};
    state.routing = std::move(table);
}

void StateCache::applyTo(State& state, const Resynchronized& event) const {
    state.counts = event.counts;

    std::map<int, std::string> txNames;
    std::map<int, std::string> rxNames;
    for (const auto& entry : event.names) {
        (entry.kind == DeviceKind::Transmitter ? txNames : rxNames)[entry.index] = entry.name;
    }

    // Devices beyond the reported count stay known but go offline.
    auto rebuild = [](const std::map<int, Device>& previous,
                      DeviceKind kind,
                      int count,
                      const std::map<int, std::string>& names) {
        std::map<int, Device> devices = previous;
        for (int index = 1; index <= count; ++index) {
            Device& device = ensureDevice(devices, kind, index);
            if (auto it = names.find(index); it != names.end() && !it->second.empty()) {
                device.name = it->second;
            }
        }
        for (auto& [index, device] : devices) {
            if (index > count && device.online) {
                spdlog::info("{} {} no longer reported by the controller; marking it offline", toString(kind), index);
                device.online = false;
            }
        }
        return devices;
    };
    state.transmitters = rebuild(state.transmitters, DeviceKind::Transmitter, event.counts.transmitters, txNames);
    state.receivers = rebuild(state.receivers, DeviceKind::Receiver, event.counts.receivers, rxNames);

    state.routing = mergeRouting(state.routing, event.table, event.counts.receivers, RouteOrigin::Query, event.at);
    state.stale = false;
    state.refreshedAt = event.at;
}

void StateCache::applyTo(State& state, const RestInventory& event) const {
    state.units.clear();
    for (const auto& unit : event.units) {
        state.units[unit.id] = unit;
    }

    auto merge = [&state, &event](const std::vector<rest::GroupRecord>& groups, DeviceKind kind) {
        auto& devices = devicesOf(state, kind);
        std::set<int> seen;
        for (const auto& group : groups) {
            if (!group.index) {
                continue;
            }
            if (!seen.insert(*group.index).second) {
                spdlog::warn("Several {} groups claim index {}; keeping group {}",
                             toString(kind),
                             *group.index,
                             devices.at(*group.index).groupId.value_or(0));
                continue;
            }
            Device& device = ensureDevice(devices, kind, *group.index);
            device.groupId = group.id;
            device.unitId = group.association("unit");
            if (!group.name.empty()) {
                device.name = group.name;
            }

            const rest::UnitRecord* unit = nullptr;
            if (device.unitId) {
                if (auto it = state.units.find(*device.unitId); it != state.units.end()) {
                    unit = &it->second;
                }
            }
            device.model = unit != nullptr ? unit->model : std::string();
            device.subtype = determineSubtype(group.type, device.model);
            device.online = unit != nullptr && unit->online();
            if (device.online) {
                device.lastSeen = event.at;
            }
        }
    };
    merge(event.transmitters, DeviceKind::Transmitter);
    merge(event.receivers, DeviceKind::Receiver);
}

void StateCache::applyTo(State& state, const DeviceRenamed& event) const {
    auto& devices = devicesOf(state, event.kind);
    if (auto it = devices.find(event.index); it != devices.end()) {
        it->second.name = event.name;
    }
}

void StateCache::applyTo(State& state, const UnitStatusChanged& event) const {
    auto [it, inserted] = state.units.try_emplace(event.unitId);
    auto& unit = it->second;
    if (inserted) {
        unit.id = event.unitId;
    }
    if (event.status.is_object()) {
        if (auto ip = event.status.find("ip"); ip != event.status.end() && ip->is_string()) {
            unit.ip = ip->get<std::string>();
        }
        if (auto model = event.status.find("model"); model != event.status.end() && model->is_string()) {
            unit.model = model->get<std::string>();
        }
    }

    for (auto* devices : {&state.transmitters, &state.receivers}) {
        for (auto& [index, device] : *devices) {
            (void)index;
            if (device.unitId == event.unitId) {
                device.online = unit.online();
                device.model = unit.model;
                if (device.online) {
                    device.lastSeen = event.at;
                }
            }
        }
    }
}

void StateCache::applyTo(State& state, const SerialReceived& event) const {
    auto& queue = state.serial[{event.kind, event.index}];
    queue.push_back(SerialMessage{event.data, event.at});
    while (queue.size() > serialHistory_) {
        queue.pop_front();
    }
}

void StateCache::applyTo(State& state, const ResourceChanged& event) const {
    (void)state;
    spdlog::debug("Management resource {} {} {}", event.resource, event.id, event.action);
}

void StateCache::applyTo(State& state, const ConnectionChanged& event) const {
    state.connections[event.plane] = event.state;
    if (event.plane == Plane::Line && event.state != ConnectionState::Ready) {
        state.stale = true;
    }
}

std::shared_ptr<const State> StateCache::snapshot() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

std::vector<Device> StateCache::devices() const {
    const auto state = snapshot();
    std::vector<Device> out;
    out.reserve(state->transmitters.size() + state->receivers.size());
    for (const auto& [index, device] : state->transmitters) {
        (void)index;
        out.push_back(device);
    }
    for (const auto& [index, device] : state->receivers) {
        (void)index;
        out.push_back(device);
    }
    return out;
}

std::vector<Device> StateCache::devices(DeviceKind kind) const {
    const auto state = snapshot();
    const auto& devices = kind == DeviceKind::Transmitter ? state->transmitters : state->receivers;
    std::vector<Device> out;
    out.reserve(devices.size());
    for (const auto& [index, device] : devices) {
        (void)index;
        out.push_back(device);
    }
    return out;
}

std::optional<Device> StateCache::device(DeviceKind kind, int index) const {
    const auto state = snapshot();
    const auto& devices = kind == DeviceKind::Transmitter ? state->transmitters : state->receivers;
    if (auto it = devices.find(index); it != devices.end()) {
        return it->second;
    }
    return std::nullopt;
}

RoutingTable StateCache::routing() const {
    return snapshot()->routing;
}

std::optional<int> StateCache::sourceOf(int rx) const {
    const auto state = snapshot();
    if (auto it = state->routing.find(rx); it != state->routing.end()) {
        return it->second.tx;
    }
    return std::nullopt;
}

std::vector<SerialMessage> StateCache::serialMessages(DeviceKind kind, int index) const {
    const auto state = snapshot();
    if (auto it = state->serial.find({kind, index}); it != state->serial.end()) {
        return {it->second.begin(), it->second.end()};
    }
    return {};
}

ConnectionState StateCache::connection(Plane plane) const {
    const auto state = snapshot();
    if (auto it = state->connections.find(plane); it != state->connections.end()) {
        return it->second;
    }
    return ConnectionState::Disconnected;
}

std::uint64_t StateCache::version() const {
    return snapshot()->version;
}

bool StateCache::stale() const {
    return snapshot()->stale;
}

Subscription StateCache::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    const auto id = registry_->nextId++;
    registry_->listeners.emplace(id, std::move(listener));
    return Subscription(registry_, id);
}

}  // namespace moiplink::controller
