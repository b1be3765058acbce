#include "moiplink/controller/EventDispatcher.h"

#include "moiplink/common/Errors.h"
#include "moiplink/line/LineCodec.h"

#include <spdlog/spdlog.h>

namespace moiplink::controller {

namespace {

using json = nlohmann::json;

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::optional<DeviceKind> groupKind(const std::string& resource) {
    if (resource == "group_tx") {
        return DeviceKind::Transmitter;
    }
    if (resource == "group_rx") {
        return DeviceKind::Receiver;
    }
    return std::nullopt;
}

}  // namespace

std::string_view eventName(const Event& event) noexcept {
    return std::visit(Overloaded{
                          [](const RoutingReplaced&) { return std::string_view("RoutingReplaced"); },
                          [](const RouteConfirmed&) { return std::string_view("RouteConfirmed"); },
                          [](const Resynchronized&) { return std::string_view("Resynchronized"); },
                          [](const RestInventory&) { return std::string_view("RestInventory"); },
                          [](const DeviceRenamed&) { return std::string_view("DeviceRenamed"); },
                          [](const UnitStatusChanged&) { return std::string_view("UnitStatusChanged"); },
                          [](const SerialReceived&) { return std::string_view("SerialReceived"); },
                          [](const ResourceChanged&) { return std::string_view("ResourceChanged"); },
                          [](const ConnectionChanged&) { return std::string_view("ConnectionChanged"); },
                      },
                      event);
}

EventDispatcher::EventDispatcher(StateCache& cache) : cache_(cache) {}

EventDispatcher::~EventDispatcher() {
    stop();
}

void EventDispatcher::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        stopping_ = false;
    }
    worker_ = std::thread([this]() { workerLoop(); });
}

void EventDispatcher::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        stopping_ = true;
    }
    queueCv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    std::lock_guard<std::mutex> lock(queueMutex_);
    if (!queue_.empty()) {
        spdlog::debug("Event dispatcher stopped with {} queued events", queue_.size());
        dropped_ += queue_.size();
        queue_.clear();
    }
}

void EventDispatcher::addSink(Sink sink) {
    sinks_.push_back(std::move(sink));
}

std::uint64_t EventDispatcher::post(Event event) {
    std::uint64_t sequence = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        sequence = nextSequence_++;
        queue_.emplace_back(sequence, std::move(event));
    }
    queueCv_.notify_one();
    return sequence;
}

bool EventDispatcher::postAndWait(Event event, std::chrono::milliseconds timeout) {
    return waitUntilApplied(post(std::move(event)), timeout);
}

bool EventDispatcher::waitUntilApplied(std::uint64_t sequence, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(appliedMutex_);
    return appliedCv_.wait_for(lock, timeout, [&]() { return applied_ >= sequence; });
}

std::uint64_t EventDispatcher::applied() const {
    std::lock_guard<std::mutex> lock(appliedMutex_);
    return applied_;
}

void EventDispatcher::workerLoop() {
    for (;;) {
        std::pair<std::uint64_t, Event> next;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            queueCv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (stopping_) {
                return;
            }
            next = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            cache_.apply(next.second);
        } catch (const std::exception& ex) {
            spdlog::error("Failed to apply {}: {}", eventName(next.second), ex.what());
        }
        for (const auto& sink : sinks_) {
            try {
                sink(next.second);
            } catch (const std::exception& ex) {
                spdlog::error("Event sink failed on {}: {}", eventName(next.second), ex.what());
            }
        }

        {
            std::lock_guard<std::mutex> lock(appliedMutex_);
            applied_ = next.first;
        }
        appliedCv_.notify_all();
    }
}

std::optional<Event> EventDispatcher::decodeBroadcast(const line::Frame& frame) {
    if (frame.type != line::FrameType::Broadcast) {
        throw ProtocolViolation("Not a broadcast frame: '" + frame.text + "'");
    }
    const auto name = frame.name();
    if (name == "Receivers") {
        // Receivers absent from the broadcast are filled in by the cache.
        return RoutingReplaced{
            buildRoutingTable(line::parseReceivers(frame.value()), 0, RouteOrigin::Broadcast, frame.receivedAt),
            RouteOrigin::Broadcast,
            frame.receivedAt};
    }
    if (name == "Serial") {
        auto payload = line::parseSerial(frame.value());
        return SerialReceived{payload.kind, payload.index, std::move(payload.data), frame.receivedAt};
    }
    return std::nullopt;
}

std::vector<Event> EventDispatcher::decodeRestEvent(const json& event, TimePoint at) {
    if (!event.is_object()) {
        throw ProtocolViolation("Change event is not an object");
    }
    ResourceChanged changed;
    try {
        changed.resource = event.at("resource").get<std::string>();
        if (auto id = event.find("id"); id != event.end() && id->is_number_integer()) {
            changed.id = id->get<int>();
        }
        changed.action = event.value("action", std::string("update"));
        changed.data = event.value("data", json::object());
    } catch (const json::exception& ex) {
        throw ProtocolViolation(std::string("Malformed change event: ") + ex.what());
    }

    std::vector<Event> out;
    if (changed.resource == "unit" && changed.data.is_object() && changed.data.contains("status")) {
        out.emplace_back(UnitStatusChanged{changed.id, changed.data.at("status"), at});
        return out;
    }
    if (auto kind = groupKind(changed.resource)) {
        const auto settings = changed.data.is_object() ? changed.data.value("settings", json::object()) : json::object();
        auto index = settings.find("index");
        auto name = settings.find("name");
        if (index != settings.end() && index->is_number_integer() && name != settings.end() && name->is_string()) {
            out.emplace_back(DeviceRenamed{*kind, index->get<int>(), name->get<std::string>()});
        }
    }
    out.emplace_back(std::move(changed));
    return out;
}

void EventDispatcher::onLineBroadcast(const line::Frame& frame) {
    try {
        if (auto event = decodeBroadcast(frame)) {
            post(std::move(*event));
        } else {
            spdlog::debug("Unhandled broadcast {}", frame.text);
        }
    } catch (const ProtocolViolation& ex) {
        dropped_++;
        spdlog::warn("Dropping malformed broadcast '{}': {}", frame.text, ex.what());
    }
}

void EventDispatcher::onRestEvent(const json& event) {
    try {
        for (auto& decoded : decodeRestEvent(event, std::chrono::steady_clock::now())) {
            post(std::move(decoded));
        }
    } catch (const ProtocolViolation& ex) {
        dropped_++;
        spdlog::warn("Dropping malformed change event: {}", ex.what());
    }
}

}  // namespace moiplink::controller
