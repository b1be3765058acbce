#pragma once

#include "moiplink/common/Types.h"
#include "moiplink/controller/Model.h"
#include "moiplink/line/LineCodec.h"
#include "moiplink/rest/RestApiClient.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace moiplink::controller {

using TimePoint = std::chrono::steady_clock::time_point;

// `~Receivers` broadcast or a fresh `?Receivers` answer. A complete table.
struct RoutingReplaced {
    RoutingTable table;
    RouteOrigin origin{RouteOrigin::Broadcast};
    TimePoint arrivedAt{};
};

// A locally issued `!Switch` the device answered with OK. `at` is the instant
// the command was sent.
struct RouteConfirmed {
    int rx{0};
    int tx{0};
    TimePoint at{};
};

// Full line-plane state read back after a (re)connection.
struct Resynchronized {
    line::DeviceCounts counts;
    std::vector<line::NameEntry> names;
    RoutingTable table;
    // Arrival of the ?Receivers reply the table was built from.
    TimePoint at{};
};

// Full management-plane inventory.
struct RestInventory {
    std::vector<rest::GroupRecord> transmitters;
    std::vector<rest::GroupRecord> receivers;
    std::vector<rest::UnitRecord> units;
    TimePoint at{};
};

struct DeviceRenamed {
    DeviceKind kind{DeviceKind::Transmitter};
    int index{0};
    std::string name;
};

struct UnitStatusChanged {
    int unitId{0};
    nlohmann::json status;
    TimePoint at{};
};

struct SerialReceived {
    DeviceKind kind{DeviceKind::Receiver};
    int index{0};
    std::vector<std::uint8_t> data;
    TimePoint at{};
};

// Any other management-plane change notification, passed through.
struct ResourceChanged {
    std::string resource;
    int id{0};
    std::string action;
    nlohmann::json data;
};

struct ConnectionChanged {
    Plane plane{Plane::Line};
    ConnectionState state{ConnectionState::Disconnected};
    TimePoint at{};
};

using Event = std::variant<RoutingReplaced,
                           RouteConfirmed,
                           Resynchronized,
                           RestInventory,
                           DeviceRenamed,
                           UnitStatusChanged,
                           SerialReceived,
                           ResourceChanged,
                           ConnectionChanged>;

std::string_view eventName(const Event& event) noexcept;

}  // namespace moiplink::controller
