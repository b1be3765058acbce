#pragma once

#include "moiplink/common/Types.h"
#include "moiplink/line/LineCodec.h"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace moiplink::controller {

enum class DeviceSubtype {
    Av,
    Audio,
    VideoWall,
};

std::string_view toString(DeviceSubtype subtype) noexcept;

// Group type wins when the controller reports one; otherwise the unit model
// decides ("-a-rx"/"-a-tx" are audio endpoints).
DeviceSubtype determineSubtype(const std::string& groupType, const std::string& model);

struct Device {
    int index{0};
    DeviceKind kind{DeviceKind::Transmitter};
    DeviceSubtype subtype{DeviceSubtype::Av};
    std::string name;
    std::optional<int> unitId;
    std::optional<int> groupId;
    std::string model;
    bool online{false};
    std::optional<std::chrono::steady_clock::time_point> lastSeen;
};

std::string defaultDeviceName(DeviceKind kind, int index);

enum class RouteOrigin {
    Query,
    Broadcast,
    LocalConfirm,
};

std::string_view toString(RouteOrigin origin) noexcept;

struct Route {
    int rx{0};
    int tx{0};
    RouteOrigin origin{RouteOrigin::Query};
    std::chrono::steady_clock::time_point updatedAt{};

    bool assigned() const noexcept { return tx > 0; }
};

// One entry per receiver index, keyed by rx.
using RoutingTable = std::map<int, Route>;

// Builds a complete table from reported pairs. Receivers 1..receiverCount
// that the report does not mention are unassigned.
RoutingTable buildRoutingTable(const std::vector<line::RoutePair>& pairs,
                               int receiverCount,
                               RouteOrigin origin,
                               std::chrono::steady_clock::time_point at);

enum class Plane {
    Line,
    Rest,
    EventStream,
};

std::string_view toString(Plane plane) noexcept;

}  // namespace moiplink::controller
