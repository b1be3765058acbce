#include "moiplink/line/LineTransport.h"

#include "moiplink/common/Errors.h"
#include "moiplink/line/LoginNegotiator.h"

#include <spdlog/spdlog.h>

#include <string_view>
#include <utility>

namespace moiplink::line {

namespace {

using Clock = std::chrono::steady_clock;

std::string commandName(const std::string& command) {
    if (command.size() < 2) {
        return {};
    }
    const auto eq = command.find('=');
    return command.substr(1, eq == std::string::npos ? std::string::npos : eq - 1);
}

std::chrono::milliseconds remaining(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(1);
}

// True for the start of a frame line, including a partial "OK".
bool startsProtocolLine(std::string_view text) {
    if (text.empty()) {
        return false;
    }
    switch (text.front()) {
    case '?':
    case '!':
    case '#':
    case '~':
        return true;
    default:
        return std::string_view("OK").substr(0, text.size()) == text;
    }
}

}  // namespace

LineTransport::LineTransport(LineTransportOptions options, ConnectionFactory factory)
    : options_(std::move(options)), factory_(std::move(factory)) {
    if (!factory_) {
        factory_ = [] { return std::make_unique<TcpLineConnection>(); };
    }
}

LineTransport::~LineTransport() {
    try {
        disconnect();
    } catch (const std::exception& ex) {
        spdlog::warn("Line protocol shutdown failed: {}", ex.what());
    }
}

void LineTransport::setBroadcastHandler(BroadcastHandler handler) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    broadcastHandler_ = std::move(handler);
}

void LineTransport::setStateHandler(StateHandler handler) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    stateHandler_ = std::move(handler);
}

void LineTransport::connect() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    if (running_) {
        return;
    }

    {
        // Reap a session whose reader died on its own.
        std::lock_guard<std::timed_mutex> slot(requestSlot_);
        if (reader_.joinable()) {
            reader_.join();
        }
        if (connection_) {
            connection_->close();
            connection_.reset();
        }
    }

    setState(ConnectionState::Connecting);
    auto connection = factory_();
    try {
        connection->open(options_.host, options_.port, options_.connectTimeout);
        spdlog::info("Line protocol connected to {}:{}", options_.host, options_.port);
        setState(ConnectionState::Authenticating);
        authenticate(*connection);
    } catch (...) {
        connection->close();
        setState(ConnectionState::Disconnected);
        throw;
    }

    {
        std::lock_guard<std::timed_mutex> slot(requestSlot_);
        {
            std::lock_guard<std::mutex> lock(responseMutex_);
            responses_.clear();
            sessionLost_ = false;
        }
        connection_ = std::move(connection);
        running_ = true;
        reader_ = std::thread([this] { readerLoop(); });
    }
    setState(ConnectionState::Ready);
}

void LineTransport::authenticate(LineConnection& connection) {
    LoginNegotiator negotiator(!options_.username.empty(), options_.maxLoginAttempts);
    const auto deadline = Clock::now() + options_.connectTimeout;

    {
        std::lock_guard<std::mutex> lock(framerMutex_);
        framer_.reset();
    }

    while (true) {
        if (Clock::now() >= deadline) {
            throw TimeoutError("Line protocol login did not complete within " +
                               std::to_string(options_.connectTimeout.count()) + " ms");
        }

        std::string chunk;
        LoginNegotiator::Action action;
        try {
            chunk = connection.read(options_.loginSettle);
        } catch (const NetworkError& ex) {
            if (negotiator.attempts() > 0) {
                throw AuthError(std::string("Controller closed the session during login: ") + ex.what());
            }
            throw;
        }
        action = chunk.empty() ? negotiator.onQuiet() : negotiator.onText(chunk);

        switch (action) {
        case LoginNegotiator::Action::None:
            break;
        case LoginNegotiator::Action::SendUsername:
            spdlog::debug("Line protocol login: sending username (attempt {})", negotiator.attempts());
            connection.write(options_.username + "\n", remaining(deadline));
            break;
        case LoginNegotiator::Action::SendPassword:
            connection.write(options_.password + "\n", remaining(deadline));
            break;
        case LoginNegotiator::Action::Rejected:
            spdlog::error("Line protocol login to {} failed: {}", options_.host, negotiator.reason());
            throw AuthError("Line protocol login failed: " + negotiator.reason());
        case LoginNegotiator::Action::Authenticated:
            if (!chunk.empty()) {
                handleFrames(framesAfterLogin(chunk));
            }
            return;
        }
    }
}

// Complete lines that share a chunk with the end of the login exchange are
// kept when they are protocol frames; banner text is dropped without counting
// it. An unterminated protocol tail stays in the framer for the reader to
// finish; a trailing prompt is dropped.
std::vector<Frame> LineTransport::framesAfterLogin(const std::string& chunk) {
    const auto now = Clock::now();
    const auto lastNewline = chunk.rfind('\n');
    std::vector<Frame> frames;
    std::size_t start = 0;
    while (lastNewline != std::string::npos && start <= lastNewline) {
        const auto end = chunk.find('\n', start);
        std::string line = chunk.substr(start, end - start);
        while (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (auto type = classifyLine(line)) {
            frames.push_back(Frame{*type, std::move(line), now});
        }
        start = end + 1;
    }
    const std::string_view tail = std::string_view(chunk).substr(start);
    if (startsProtocolLine(tail)) {
        std::lock_guard<std::mutex> lock(framerMutex_);
        framer_.feed(tail, now);
    }
    return frames;
}

void LineTransport::disconnect() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    running_ = false;
    if (connection_) {
        connection_->close();
    }
    {
        std::lock_guard<std::mutex> lock(responseMutex_);
        sessionLost_ = true;
    }
    responseCv_.notify_all();
    if (reader_.joinable()) {
        reader_.join();
    }
    {
        std::lock_guard<std::timed_mutex> slot(requestSlot_);
        connection_.reset();
    }
    setState(ConnectionState::Disconnected);
}

ConnectionState LineTransport::state() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

std::vector<Frame> LineTransport::request(const std::string& command,
                                          std::size_t replyLines,
                                          std::optional<std::chrono::milliseconds> timeout) {
    const auto limit = timeout.value_or(options_.requestTimeout);
    const auto deadline = Clock::now() + limit;

    std::unique_lock<std::timed_mutex> slot(requestSlot_, std::defer_lock);
    if (!slot.try_lock_until(deadline)) {
        throw TimeoutError("Timed out waiting for the line protocol request slot ('" + command + "')");
    }
    if (!running_ || !connection_) {
        throw NetworkError("Line protocol session is not connected");
    }

    {
        std::lock_guard<std::mutex> lock(responseMutex_);
        if (sessionLost_) {
            throw NetworkError("Line protocol session is not connected");
        }
        if (!responses_.empty()) {
            spdlog::warn("Line protocol: discarding {} stale reply line(s) before '{}'", responses_.size(), command);
            responses_.clear();
        }
    }

    spdlog::debug("Line protocol -> {}", command);
    connection_->write(command + "\n", remaining(deadline));

    const std::string name = commandName(command);
    std::vector<Frame> reply;
    std::unique_lock<std::mutex> lock(responseMutex_);
    while (true) {
        const bool signalled = responseCv_.wait_until(lock, deadline, [this] {
            return sessionLost_ || !responses_.empty();
        });
        if (!signalled) {
            throw TimeoutError("No reply to '" + command + "' within " + std::to_string(limit.count()) + " ms");
        }
        if (responses_.empty()) {
            throw NetworkError("Line protocol session lost while waiting for '" + command + "'");
        }

        Frame frame = std::move(responses_.front());
        responses_.pop_front();
        spdlog::debug("Line protocol <- {}", frame.text);

        switch (frame.type) {
        case FrameType::Error:
            throw CommandRejected(frame.text);
        case FrameType::Ok:
            if (replyLines == 0) {
                return reply;
            }
            spdlog::warn("Line protocol: unexpected OK while waiting for '{}'", command);
            break;
        case FrameType::Query:
            if (replyLines > 0 && frame.name() == name) {
                reply.push_back(std::move(frame));
                if (reply.size() == replyLines) {
                    return reply;
                }
                break;
            }
            spdlog::warn("Line protocol: ignoring unrelated reply '{}' to '{}'", frame.text, command);
            break;
        case FrameType::Control:
        case FrameType::Broadcast:
            spdlog::warn("Line protocol: ignoring unrelated reply '{}' to '{}'", frame.text, command);
            break;
        }
    }
}

void LineTransport::command(const std::string& command, std::optional<std::chrono::milliseconds> timeout) {
    request(command, 0, timeout);
}

Frame LineTransport::query(const std::string& query, std::optional<std::chrono::milliseconds> timeout) {
    return request(query, 1, timeout).front();
}

std::vector<Frame> LineTransport::queryLines(const std::string& query,
                                             std::size_t lines,
                                             std::optional<std::chrono::milliseconds> timeout) {
    if (lines == 0) {
        return {};
    }
    return request(query, lines, timeout);
}

std::uint64_t LineTransport::violations() const {
    std::lock_guard<std::mutex> lock(framerMutex_);
    return framer_.violations();
}

void LineTransport::readerLoop() {
    while (running_) {
        std::string chunk;
        try {
            chunk = connection_->read(options_.readPoll);
        } catch (const NetworkError& ex) {
            if (running_) {
                failSession(ex.what());
            }
            return;
        }
        if (chunk.empty()) {
            continue;
        }

        std::vector<Frame> frames;
        {
            std::lock_guard<std::mutex> lock(framerMutex_);
            frames = framer_.feed(chunk);
        }
        handleFrames(std::move(frames));
    }
}

void LineTransport::handleFrames(std::vector<Frame> frames) {
    BroadcastHandler handler;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        handler = broadcastHandler_;
    }

    bool queued = false;
    for (auto& frame : frames) {
        if (frame.type == FrameType::Broadcast) {
            if (!handler) {
                spdlog::debug("Line protocol broadcast without handler: {}", frame.text);
                continue;
            }
            try {
                handler(frame);
            } catch (const std::exception& ex) {
                spdlog::warn("Line protocol broadcast handler failed for '{}': {}", frame.text, ex.what());
            }
            continue;
        }
        std::lock_guard<std::mutex> lock(responseMutex_);
        responses_.push_back(std::move(frame));
        queued = true;
    }
    if (queued) {
        responseCv_.notify_all();
    }
}

void LineTransport::setState(ConnectionState state) {
    StateHandler handler;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ == state) {
            return;
        }
        state_ = state;
        handler = stateHandler_;
    }
    spdlog::info("Line protocol {}:{} is {}", options_.host, options_.port, toString(state));
    if (handler) {
        handler(state);
    }
}

void LineTransport::failSession(const std::string& reason) {
    spdlog::warn("Line protocol session to {} lost: {}", options_.host, reason);
    running_ = false;
    {
        std::lock_guard<std::mutex> lock(responseMutex_);
        sessionLost_ = true;
    }
    responseCv_.notify_all();
    setState(ConnectionState::Disconnected);
}

}  // namespace moiplink::line
