#pragma once

#include <string>
#include <string_view>

namespace moiplink {

enum class DeviceKind {
    Transmitter,
    Receiver,
};

enum class ConnectionState {
    Disconnected,
    Connecting,
    Authenticating,
    Ready,
    Degraded,
};

std::string_view toString(DeviceKind kind) noexcept;
std::string_view toString(ConnectionState state) noexcept;

// Accepts "tx"/"rx" and the long forms, case-insensitive.
DeviceKind parseDeviceKind(std::string_view text);

// The line protocol addresses receivers as 0 and transmitters as 1
// (`?Name=0`, `~Serial=1,...`).
int lineProtocolCode(DeviceKind kind) noexcept;
DeviceKind deviceKindFromLineCode(int code);

}  // namespace moiplink
