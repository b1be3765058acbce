#include "moiplink/line/LineCodec.h"

#include "moiplink/common/Errors.h"

#include <cctype>
#include <charconv>
#include <iomanip>
#include <sstream>

namespace moiplink::line {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

int parseInt(std::string_view text, std::string_view field) {
    text = trim(text);
    int value = 0;
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc{} || ptr != end) {
        throw ProtocolViolation("Invalid " + std::string(field) + " '" + std::string(text) + "'");
    }
    return value;
}

std::vector<std::string_view> split(std::string_view text, char delimiter, std::size_t maxParts = 0) {
    std::vector<std::string_view> parts;
    while (true) {
        if (maxParts != 0 && parts.size() + 1 == maxParts) {
            parts.push_back(text);
            break;
        }
        const auto pos = text.find(delimiter);
        if (pos == std::string_view::npos) {
            parts.push_back(text);
            break;
        }
        parts.push_back(text.substr(0, pos));
        text.remove_prefix(pos + 1);
    }
    return parts;
}

}  // namespace

DeviceCounts parseDevices(std::string_view value) {
    const auto parts = split(value, ',');
    if (parts.size() != 2) {
        throw ProtocolViolation("Devices reply must be TX,RX: '" + std::string(value) + "'");
    }
    DeviceCounts counts;
    counts.transmitters = parseInt(parts[0], "transmitter count");
    counts.receivers = parseInt(parts[1], "receiver count");
    if (counts.transmitters < 0 || counts.receivers < 0) {
        throw ProtocolViolation("Negative device count: '" + std::string(value) + "'");
    }
    return counts;
}

std::vector<RoutePair> parseReceivers(std::string_view value) {
    std::vector<RoutePair> pairs;
    value = trim(value);
    if (value.empty()) {
        return pairs;
    }
    for (auto item : split(value, ',')) {
        item = trim(item);
        if (item.empty()) {
            continue;
        }
        const auto fields = split(item, ':');
        if (fields.size() != 2) {
            throw ProtocolViolation("Receivers entry must be TX:RX: '" + std::string(item) + "'");
        }
        RoutePair pair;
        pair.tx = parseInt(fields[0], "transmitter index");
        pair.rx = parseInt(fields[1], "receiver index");
        if (pair.tx < 0 || pair.rx < 0 || (pair.tx == 0 && pair.rx == 0)) {
            throw ProtocolViolation("Receivers entry out of range: '" + std::string(item) + "'");
        }
        pairs.push_back(pair);
    }
    return pairs;
}

NameEntry parseName(std::string_view value) {
    const auto parts = split(value, ',', 3);
    if (parts.size() != 3) {
        throw ProtocolViolation("Name reply must be TYPE,INDEX,NAME: '" + std::string(value) + "'");
    }
    NameEntry entry;
    entry.kind = deviceKindFromLineCode(parseInt(parts[0], "device type"));
    entry.index = parseInt(parts[1], "device index");
    entry.name = std::string(trim(parts[2]));
    if (entry.index < 1) {
        throw ProtocolViolation("Name reply index out of range: '" + std::string(value) + "'");
    }
    return entry;
}

SerialPayload parseSerial(std::string_view value) {
    const auto parts = split(value, ',', 3);
    if (parts.size() != 3) {
        throw ProtocolViolation("Serial message must be TYPE,INDEX,DATA: '" + std::string(value) + "'");
    }
    SerialPayload payload;
    payload.kind = deviceKindFromLineCode(parseInt(parts[0], "device type"));
    payload.index = parseInt(parts[1], "device index");
    payload.data = parseHexBytes(parts[2]);
    return payload;
}

std::vector<std::uint8_t> parseHexBytes(std::string_view text) {
    std::vector<std::uint8_t> bytes;
    for (auto token : split(trim(text), ' ')) {
        token = trim(token);
        if (token.empty()) {
            continue;
        }
        unsigned int byte = 0;
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), byte, 16);
        if (token.size() > 2 || ec != std::errc{} || ptr != token.data() + token.size()) {
            throw ProtocolViolation("Invalid hex byte '" + std::string(token) + "'");
        }
        bytes.push_back(static_cast<std::uint8_t>(byte));
    }
    return bytes;
}

std::string formatHexBytes(const std::vector<std::uint8_t>& bytes) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i != 0) {
            oss << ' ';
        }
        oss << std::setw(2) << static_cast<unsigned int>(bytes[i]);
    }
    return oss.str();
}

SerialFormat parseSerialFormat(std::string_view text) {
    text = trim(text);
    const auto dash = text.find('-');
    if (dash == std::string_view::npos || text.size() - dash != 4) {
        throw ProtocolViolation("Serial format must look like 9600-8n1: '" + std::string(text) + "'");
    }
    SerialFormat format;
    format.baud = parseInt(text.substr(0, dash), "baud rate");
    const auto frame = text.substr(dash + 1);
    if (!std::isdigit(static_cast<unsigned char>(frame[0])) || !std::isdigit(static_cast<unsigned char>(frame[2]))) {
        throw ProtocolViolation("Serial format must look like 9600-8n1: '" + std::string(text) + "'");
    }
    format.dataBits = frame[0] - '0';
    format.parity = static_cast<char>(std::tolower(static_cast<unsigned char>(frame[1])));
    format.stopBits = frame[2] - '0';
    if (format.baud <= 0 || format.dataBits < 5 || format.dataBits > 8 ||
        (format.parity != 'n' && format.parity != 'e' && format.parity != 'o') ||
        (format.stopBits != 1 && format.stopBits != 2)) {
        throw ProtocolViolation("Unsupported serial format '" + std::string(text) + "'");
    }
    return format;
}

std::string formatSerialFormat(const SerialFormat& format) {
    return std::to_string(format.baud) + "-" + std::to_string(format.dataBits) + format.parity +
           std::to_string(format.stopBits);
}

std::string switchCommand(int tx, int rx) {
    return "!Switch=" + std::to_string(tx) + "," + std::to_string(rx);
}

std::string nameQuery(DeviceKind kind) {
    return "?Name=" + std::to_string(lineProtocolCode(kind));
}

std::string cecCommand(int rx, std::string_view hexBytes) {
    return "!CEC=" + std::to_string(rx) + "," + std::string(hexBytes);
}

}  // namespace moiplink::line
