#include "moiplink/controller/Model.h"

#include <algorithm>
#include <cctype>

namespace moiplink::controller {

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

}  // namespace

std::string_view toString(DeviceSubtype subtype) noexcept {
    switch (subtype) {
    case DeviceSubtype::Av:
        return "av";
    case DeviceSubtype::Audio:
        return "audio";
    case DeviceSubtype::VideoWall:
        return "videowall";
    }
    return "av";
}

DeviceSubtype determineSubtype(const std::string& groupType, const std::string& model) {
    const auto type = lowercase(groupType);
    if (type == "audio") {
        return DeviceSubtype::Audio;
    }
    if (type == "videowall" || type == "video_wall" || type == "video wall") {
        return DeviceSubtype::VideoWall;
    }
    if (type == "av" || type == "video") {
        return DeviceSubtype::Av;
    }

    const auto lowered = lowercase(model);
    if (lowered.find("-a-rx") != std::string::npos || lowered.find("-a-tx") != std::string::npos) {
        return DeviceSubtype::Audio;
    }
    if (lowered.find("wall") != std::string::npos) {
        return DeviceSubtype::VideoWall;
    }
    return DeviceSubtype::Av;
}

std::string defaultDeviceName(DeviceKind kind, int index) {
    return (kind == DeviceKind::Transmitter ? "Tx" : "Rx") + std::to_string(index);
}

std::string_view toString(RouteOrigin origin) noexcept {
    switch (origin) {
    case RouteOrigin::Query:
        return "query";
    case RouteOrigin::Broadcast:
        return "broadcast";
    case RouteOrigin::LocalConfirm:
        return "local";
    }
    return "query";
}

RoutingTable buildRoutingTable(const std::vector<line::RoutePair>& pairs,
                               int receiverCount,
                               RouteOrigin origin,
                               std::chrono::steady_clock::time_point at) {
    RoutingTable table;
    for (int rx = 1; rx <= receiverCount; ++rx) {
        table[rx] = Route{rx, 0, origin, at};
    }
    for (const auto& pair : pairs) {
        // "N:0" reports receiver N with no source.
        if (pair.rx == 0) {
            table[pair.tx] = Route{pair.tx, 0, origin, at};
        } else {
            table[pair.rx] = Route{pair.rx, pair.tx, origin, at};
        }
    }
    return table;
}

std::string_view toString(Plane plane) noexcept {
    switch (plane) {
    case Plane::Line:
        return "line";
    case Plane::Rest:
        return "rest";
    case Plane::EventStream:
        return "events";
    }
    return "line";
}

}  // namespace moiplink::controller
