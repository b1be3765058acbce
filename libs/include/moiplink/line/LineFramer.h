#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace moiplink::line {

enum class FrameType {
    Query,      // ?Name=VALUE
    Control,    // !Name=VALUE
    Error,      // #ErrorText
    Broadcast,  // ~Name=VALUE
    Ok,         // OK
};

struct Frame {
    FrameType type{FrameType::Ok};
    std::string text;
    std::chrono::steady_clock::time_point receivedAt{};

    // "Receivers" for "?Receivers=1:2". Empty for OK and error frames.
    std::string name() const;
    // Everything after the first '=', or empty.
    std::string value() const;
};

std::optional<FrameType> classifyLine(std::string_view line) noexcept;
std::string_view toString(FrameType type) noexcept;

// Splits a byte stream into newline-terminated, prefix-classified frames.
// Unclassifiable lines are dropped and counted; an overlong line is dropped
// and the framer resynchronises on the next newline.
class LineFramer {
public:
    static constexpr std::size_t kDefaultMaxLineLength = 8192;

    explicit LineFramer(std::size_t maxLineLength = kDefaultMaxLineLength);

    std::vector<Frame> feed(std::string_view bytes,
                            std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    void reset();

    std::uint64_t violations() const noexcept { return violations_; }
    const std::string& pending() const noexcept { return buffer_; }

private:
    void completeLine(std::vector<Frame>& out, std::chrono::steady_clock::time_point now);

    std::size_t maxLineLength_;
    std::string buffer_;
    bool discarding_{false};
    std::uint64_t violations_{0};
};

}  // namespace moiplink::line
