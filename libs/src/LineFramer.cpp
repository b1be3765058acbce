#include "moiplink/line/LineFramer.h"

#include <spdlog/spdlog.h>

namespace moiplink::line {

std::string Frame::name() const {
    if (type == FrameType::Ok || type == FrameType::Error || text.size() < 2) {
        return {};
    }
    const auto eq = text.find('=');
    return text.substr(1, eq == std::string::npos ? std::string::npos : eq - 1);
}

std::string Frame::value() const {
    const auto eq = text.find('=');
    if (eq == std::string::npos) {
        return {};
    }
    return text.substr(eq + 1);
}

std::optional<FrameType> classifyLine(std::string_view line) noexcept {
    if (line.empty()) {
        return std::nullopt;
    }
    switch (line.front()) {
    case '?':
        return FrameType::Query;
    case '!':
        return FrameType::Control;
    case '#':
        return FrameType::Error;
    case '~':
        return FrameType::Broadcast;
    default:
        break;
    }
    if (line == "OK") {
        return FrameType::Ok;
    }
    return std::nullopt;
}

std::string_view toString(FrameType type) noexcept {
    switch (type) {
    case FrameType::Query:
        return "query";
    case FrameType::Control:
        return "control";
    case FrameType::Error:
        return "error";
    case FrameType::Broadcast:
        return "broadcast";
    case FrameType::Ok:
        return "ok";
    }
    return "unknown";
}

LineFramer::LineFramer(std::size_t maxLineLength)
    : maxLineLength_(maxLineLength) {}

std::vector<Frame> LineFramer::feed(std::string_view bytes, std::chrono::steady_clock::time_point now) {
    std::vector<Frame> frames;
    for (char ch : bytes) {
        if (ch == '\n') {
            if (discarding_) {
                discarding_ = false;
                buffer_.clear();
                continue;
            }
            completeLine(frames, now);
            continue;
        }
        if (discarding_) {
            continue;
        }
        buffer_.push_back(ch);
        if (buffer_.size() > maxLineLength_) {
            ++violations_;
            spdlog::warn("Line protocol: dropping line longer than {} bytes", maxLineLength_);
            buffer_.clear();
            discarding_ = true;
        }
    }
    return frames;
}

void LineFramer::reset() {
    buffer_.clear();
    discarding_ = false;
}

void LineFramer::completeLine(std::vector<Frame>& out, std::chrono::steady_clock::time_point now) {
    std::string line;
    line.swap(buffer_);
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
        line.pop_back();
    }
    if (line.empty()) {
        return;
    }

    auto type = classifyLine(line);
    if (!type) {
        ++violations_;
        spdlog::warn("Line protocol: discarding unclassified line '{}'", line);
        return;
    }
    out.push_back(Frame{*type, std::move(line), now});
}

}  // namespace moiplink::line
