#pragma once

#include "moiplink/common/Types.h"
#include "moiplink/controller/Backoff.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace moiplink::controller {

// One connection the supervisor keeps alive.
class SupervisedChannel {
public:
    virtual ~SupervisedChannel() = default;

    virtual std::string name() const = 0;
    // Opens the transport. Throws NetworkError.
    virtual void connect() = 0;
    // Presents credentials once connected. Throws AuthError or NetworkError.
    virtual void authenticate() = 0;
    // Cheap local liveness check, no I/O.
    virtual bool alive() const = 0;
    // Heartbeat round trip. Throws on failure.
    virtual void probe() = 0;
    virtual void disconnect() = 0;
};

struct SupervisorOptions {
    std::chrono::milliseconds tick{250};
    std::chrono::milliseconds heartbeat{15000};
    BackoffPolicy backoff;
    std::optional<std::uint32_t> seed;
};

// Per-channel state machine driven by tick():
// READY -> (failure or missed heartbeat) -> DISCONNECTED -> CONNECTING
// (after backoff) -> AUTHENTICATING -> READY once the ready handler has
// resynchronised.
// A failed connect or resync schedules the next attempt; the supervisor
// never gives up on a channel.
class ReconnectionSupervisor {
public:
    // Runs after every successful connect; a throw counts as a failed attempt.
    using ReadyHandler = std::function<void()>;
    using StateHandler = std::function<void(const std::string& channel, ConnectionState state)>;
    using Clock = std::chrono::steady_clock;

    explicit ReconnectionSupervisor(SupervisorOptions options = {});
    ~ReconnectionSupervisor();

    ReconnectionSupervisor(const ReconnectionSupervisor&) = delete;
    ReconnectionSupervisor& operator=(const ReconnectionSupervisor&) = delete;

    // Channels are registered before start() and must outlive the supervisor.
    void addChannel(SupervisedChannel& channel, ReadyHandler onReady = {});
    void setStateHandler(StateHandler handler);

    void tick(Clock::time_point now);

    void start();
    void stop();
    bool running() const noexcept { return running_.load(); }

    // Marks a channel as failed; the next tick tears it down and reconnects.
    void reportFailure(const std::string& channel, const std::string& reason);

    ConnectionState state(const std::string& channel) const;
    bool waitForState(const std::string& channel, ConnectionState state, std::chrono::milliseconds timeout) const;
    int attempts(const std::string& channel) const;
    std::optional<Clock::time_point> nextAttempt(const std::string& channel) const;

private:
    struct Tracked {
        SupervisedChannel* channel{nullptr};
        std::string name;
        ReadyHandler onReady;
        Backoff backoff;
        ConnectionState state{ConnectionState::Disconnected};
        Clock::time_point nextAttempt{};
        Clock::time_point lastProbe{};
        std::atomic_bool failed{false};
        std::string failure;

        Tracked(SupervisedChannel& ch, ReadyHandler ready, Backoff bo)
            : channel(&ch), name(ch.name()), onReady(std::move(ready)), backoff(std::move(bo)) {}
    };

    void attemptConnect(Tracked& tracked, Clock::time_point now);
    void checkHealth(Tracked& tracked, Clock::time_point now);
    void drop(Tracked& tracked, Clock::time_point now, const std::string& reason);
    void scheduleRetry(Tracked& tracked, Clock::time_point now);
    void setState(Tracked& tracked, ConnectionState state);
    const Tracked* find(const std::string& channel) const;
    void loop();

    SupervisorOptions options_;
    std::vector<std::unique_ptr<Tracked>> channels_;

    std::mutex tickMutex_;
    mutable std::mutex stateMutex_;
    mutable std::condition_variable stateCv_;
    StateHandler stateHandler_;

    std::mutex loopMutex_;
    std::condition_variable loopCv_;
    bool stopping_{false};
    std::thread worker_;
    std::atomic_bool running_{false};
};

}  // namespace moiplink::controller
