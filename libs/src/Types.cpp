#include "moiplink/common/Types.h"

#include "moiplink/common/Errors.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace moiplink {

namespace {

std::string lowerCopy(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return out;
}

std::string kindLabel(DeviceKind kind) {
    return kind == DeviceKind::Transmitter ? "transmitter" : "receiver";
}

}  // namespace

CommandRejected::CommandRejected(std::string detail, int status)
    : Error(status == 0 ? "Command rejected: " + detail
                        : "Command rejected (HTTP " + std::to_string(status) + "): " + detail),
      detail_(std::move(detail)),
      status_(status) {}

CorrelationConflict::CorrelationConflict(DeviceKind kind, int index)
    : Error("More than one group claims " + kindLabel(kind) + " index " + std::to_string(index)),
      kind_(kind),
      index_(index) {}

std::string_view toString(DeviceKind kind) noexcept {
    switch (kind) {
    case DeviceKind::Transmitter:
        return "tx";
    case DeviceKind::Receiver:
        return "rx";
    }
    return "unknown";
}

std::string_view toString(ConnectionState state) noexcept {
    switch (state) {
    case ConnectionState::Disconnected:
        return "DISCONNECTED";
    case ConnectionState::Connecting:
        return "CONNECTING";
    case ConnectionState::Authenticating:
        return "AUTHENTICATING";
    case ConnectionState::Ready:
        return "READY";
    case ConnectionState::Degraded:
        return "DEGRADED";
    }
    return "UNKNOWN";
}

DeviceKind parseDeviceKind(std::string_view text) {
    const auto lower = lowerCopy(text);
    if (lower == "tx" || lower == "transmitter") {
        return DeviceKind::Transmitter;
    }
    if (lower == "rx" || lower == "receiver") {
        return DeviceKind::Receiver;
    }
    throw std::invalid_argument("Unknown device kind: " + std::string(text));
}

int lineProtocolCode(DeviceKind kind) noexcept {
    return kind == DeviceKind::Transmitter ? 1 : 0;
}

DeviceKind deviceKindFromLineCode(int code) {
    if (code == 1) {
        return DeviceKind::Transmitter;
    }
    if (code == 0) {
        return DeviceKind::Receiver;
    }
    throw ProtocolViolation("Unknown device type code " + std::to_string(code));
}

}  // namespace moiplink
