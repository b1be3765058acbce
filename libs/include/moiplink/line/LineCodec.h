#pragma once

#include "moiplink/common/Types.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace moiplink::line {

struct DeviceCounts {
    int transmitters{0};
    int receivers{0};

    bool operator==(const DeviceCounts& other) const {
        return transmitters == other.transmitters && receivers == other.receivers;
    }
    bool operator!=(const DeviceCounts& other) const { return !(*this == other); }
};

struct RoutePair {
    int tx{0};
    int rx{0};
};

struct NameEntry {
    DeviceKind kind{DeviceKind::Transmitter};
    int index{0};
    std::string name;
};

struct SerialPayload {
    DeviceKind kind{DeviceKind::Receiver};
    int index{0};
    std::vector<std::uint8_t> data;
};

struct SerialFormat {
    int baud{9600};
    int dataBits{8};
    char parity{'n'};
    int stopBits{1};
};

// Field grammars. Each takes the text after '=' and throws ProtocolViolation
// on malformed input.
DeviceCounts parseDevices(std::string_view value);
std::vector<RoutePair> parseReceivers(std::string_view value);
NameEntry parseName(std::string_view value);
SerialPayload parseSerial(std::string_view value);

std::vector<std::uint8_t> parseHexBytes(std::string_view text);
std::string formatHexBytes(const std::vector<std::uint8_t>& bytes);

SerialFormat parseSerialFormat(std::string_view text);
std::string formatSerialFormat(const SerialFormat& format);

std::string switchCommand(int tx, int rx);
std::string nameQuery(DeviceKind kind);
std::string cecCommand(int rx, std::string_view hexBytes);

inline constexpr std::string_view kDevicesQuery = "?Devices";
inline constexpr std::string_view kReceiversQuery = "?Receivers";

}  // namespace moiplink::line
