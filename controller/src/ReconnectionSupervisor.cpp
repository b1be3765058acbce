#include "moiplink/controller/ReconnectionSupervisor.h"

#include "moiplink/common/Errors.h"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace moiplink::controller {

ReconnectionSupervisor::ReconnectionSupervisor(SupervisorOptions options) : options_(std::move(options)) {}

ReconnectionSupervisor::~ReconnectionSupervisor() {
    stop();
}

void ReconnectionSupervisor::addChannel(SupervisedChannel& channel, ReadyHandler onReady) {
    if (running_) {
        throw std::logic_error("Channels must be added before the supervisor starts");
    }
    const auto seed = options_.seed ? *options_.seed + static_cast<std::uint32_t>(channels_.size())
                                    : std::random_device{}();
    channels_.push_back(std::make_unique<Tracked>(channel, std::move(onReady), Backoff(options_.backoff, seed)));
}

void ReconnectionSupervisor::setStateHandler(StateHandler handler) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    stateHandler_ = std::move(handler);
}

void ReconnectionSupervisor::tick(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(tickMutex_);
    for (auto& tracked : channels_) {
        switch (tracked->state) {
        case ConnectionState::Ready:
        case ConnectionState::Degraded:
            checkHealth(*tracked, now);
            break;
        case ConnectionState::Disconnected:
            if (now >= tracked->nextAttempt) {
                attemptConnect(*tracked, now);
            }
            break;
        case ConnectionState::Connecting:
        case ConnectionState::Authenticating:
            break;
        }
    }
}

void ReconnectionSupervisor::attemptConnect(Tracked& tracked, Clock::time_point now) {
    tracked.failed = false;
    setState(tracked, ConnectionState::Connecting);
    try {
        tracked.channel->connect();
        setState(tracked, ConnectionState::Authenticating);
        tracked.channel->authenticate();
        if (tracked.onReady) {
            tracked.onReady();
        }
    } catch (const AuthError& ex) {
        spdlog::error("{}: authentication failed: {}", tracked.name, ex.what());
        tracked.channel->disconnect();
        scheduleRetry(tracked, now);
        return;
    } catch (const std::exception& ex) {
        spdlog::warn("{}: connection attempt {} failed: {}", tracked.name, tracked.backoff.attempts() + 1, ex.what());
        tracked.channel->disconnect();
        scheduleRetry(tracked, now);
        return;
    }

    if (tracked.backoff.attempts() > 0) {
        spdlog::info("{}: reconnected after {} attempts", tracked.name, tracked.backoff.attempts());
    }
    tracked.backoff.reset();
    tracked.lastProbe = now;
    setState(tracked, ConnectionState::Ready);
}

void ReconnectionSupervisor::checkHealth(Tracked& tracked, Clock::time_point now) {
    if (tracked.failed.exchange(false)) {
        std::string reason;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            reason = tracked.failure;
        }
        drop(tracked, now, reason);
        return;
    }
    if (!tracked.channel->alive()) {
        drop(tracked, now, "connection lost");
        return;
    }
    if (now - tracked.lastProbe < options_.heartbeat) {
        return;
    }
    tracked.lastProbe = now;
    try {
        tracked.channel->probe();
    } catch (const TimeoutError& ex) {
        // One missed heartbeat degrades the channel; two drop it.
        if (tracked.state == ConnectionState::Ready) {
            spdlog::warn("{}: heartbeat timed out: {}", tracked.name, ex.what());
            setState(tracked, ConnectionState::Degraded);
            return;
        }
        drop(tracked, now, ex.what());
        return;
    } catch (const std::exception& ex) {
        drop(tracked, now, ex.what());
        return;
    }
    if (tracked.state == ConnectionState::Degraded) {
        setState(tracked, ConnectionState::Ready);
    }
}

void ReconnectionSupervisor::drop(Tracked& tracked, Clock::time_point now, const std::string& reason) {
    spdlog::warn("{}: dropping connection: {}", tracked.name, reason);
    tracked.channel->disconnect();
    scheduleRetry(tracked, now);
}

void ReconnectionSupervisor::scheduleRetry(Tracked& tracked, Clock::time_point now) {
    const auto delay = tracked.backoff.next();
    tracked.nextAttempt = now + delay;
    setState(tracked, ConnectionState::Disconnected);
    spdlog::info("{}: next connection attempt in {} ms", tracked.name, delay.count());
}

void ReconnectionSupervisor::setState(Tracked& tracked, ConnectionState state) {
    StateHandler handler;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (tracked.state == state) {
            return;
        }
        tracked.state = state;
        handler = stateHandler_;
    }
    stateCv_.notify_all();
    spdlog::debug("{}: {}", tracked.name, toString(state));
    if (handler) {
        handler(tracked.name, state);
    }
}

void ReconnectionSupervisor::reportFailure(const std::string& channel, const std::string& reason) {
    for (auto& tracked : channels_) {
        if (tracked->name == channel) {
            {
                std::lock_guard<std::mutex> lock(stateMutex_);
                tracked->failure = reason;
            }
            tracked->failed = true;
            loopCv_.notify_all();
            return;
        }
    }
}

const ReconnectionSupervisor::Tracked* ReconnectionSupervisor::find(const std::string& channel) const {
    for (const auto& tracked : channels_) {
        if (tracked->name == channel) {
            return tracked.get();
        }
    }
    return nullptr;
}

ConnectionState ReconnectionSupervisor::state(const std::string& channel) const {
    const auto* tracked = find(channel);
    if (tracked == nullptr) {
        throw std::invalid_argument("Unknown channel: " + channel);
    }
    std::lock_guard<std::mutex> lock(stateMutex_);
    return tracked->state;
}

bool ReconnectionSupervisor::waitForState(const std::string& channel,
                                          ConnectionState state,
                                          std::chrono::milliseconds timeout) const {
    const auto* tracked = find(channel);
    if (tracked == nullptr) {
        throw std::invalid_argument("Unknown channel: " + channel);
    }
    std::unique_lock<std::mutex> lock(stateMutex_);
    return stateCv_.wait_for(lock, timeout, [&]() { return tracked->state == state; });
}

int ReconnectionSupervisor::attempts(const std::string& channel) const {
    const auto* tracked = find(channel);
    if (tracked == nullptr) {
        throw std::invalid_argument("Unknown channel: " + channel);
    }
    return tracked->backoff.attempts();
}

std::optional<ReconnectionSupervisor::Clock::time_point> ReconnectionSupervisor::nextAttempt(
    const std::string& channel) const {
    const auto* tracked = find(channel);
    if (tracked == nullptr || tracked->state != ConnectionState::Disconnected) {
        return std::nullopt;
    }
    return tracked->nextAttempt;
}

void ReconnectionSupervisor::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(loopMutex_);
        stopping_ = false;
    }
    worker_ = std::thread([this]() { loop(); });
}

void ReconnectionSupervisor::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(loopMutex_);
        stopping_ = true;
    }
    loopCv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }

    std::lock_guard<std::mutex> lock(tickMutex_);
    for (auto& tracked : channels_) {
        tracked->channel->disconnect();
        tracked->backoff.reset();
        tracked->nextAttempt = {};
        setState(*tracked, ConnectionState::Disconnected);
    }
}

void ReconnectionSupervisor::loop() {
    for (;;) {
        tick(Clock::now());
        std::unique_lock<std::mutex> lock(loopMutex_);
        loopCv_.wait_for(lock, options_.tick, [this]() { return stopping_; });
        if (stopping_) {
            return;
        }
    }
}

}  // namespace moiplink::controller
