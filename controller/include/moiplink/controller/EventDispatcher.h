#pragma once

#include "moiplink/controller/Events.h"
#include "moiplink/controller/StateCache.h"
#include "moiplink/line/LineFramer.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace moiplink::controller {

// Merges line-protocol broadcasts, management-plane change events and local
// confirmations into one ordered queue. A single worker thread applies each
// event to the StateCache, then hands it to the registered sinks.
class EventDispatcher {
public:
    using Sink = std::function<void(const Event&)>;

    explicit EventDispatcher(StateCache& cache);
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    void start();
    void stop();
    bool running() const noexcept { return running_.load(); }

    // Sinks must be added before start().
    void addSink(Sink sink);

    // Returns the sequence number of the queued event.
    std::uint64_t post(Event event);
    // False when the event was not applied within the timeout.
    bool postAndWait(Event event, std::chrono::milliseconds timeout);
    bool waitUntilApplied(std::uint64_t sequence, std::chrono::milliseconds timeout);

    void onLineBroadcast(const line::Frame& frame);
    void onRestEvent(const nlohmann::json& event);

    // Decoding only; throws ProtocolViolation on malformed payloads.
    // Broadcasts the cache does not track yield nullopt.
    static std::optional<Event> decodeBroadcast(const line::Frame& frame);
    static std::vector<Event> decodeRestEvent(const nlohmann::json& event, TimePoint at);

    std::uint64_t applied() const;
    std::uint64_t dropped() const noexcept { return dropped_.load(); }

private:
    void workerLoop();

    StateCache& cache_;
    std::vector<Sink> sinks_;

    std::mutex queueMutex_;
    std::condition_variable queueCv_;
    std::deque<std::pair<std::uint64_t, Event>> queue_;
    std::uint64_t nextSequence_{1};
    bool stopping_{false};

    mutable std::mutex appliedMutex_;
    std::condition_variable appliedCv_;
    std::uint64_t applied_{0};

    std::thread worker_;
    std::atomic_bool running_{false};
    std::atomic_uint64_t dropped_{0};
};

}  // namespace moiplink::controller
