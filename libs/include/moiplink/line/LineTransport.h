#pragma once

#include "moiplink/common/Types.h"
#include "moiplink/line/LineConnection.h"
#include "moiplink/line/LineFramer.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace moiplink::line {

struct LineTransportOptions {
    std::string host;
    std::uint16_t port{23};
    std::string username;
    std::string password;
    std::chrono::milliseconds connectTimeout{10000};
    std::chrono::milliseconds requestTimeout{10000};
    std::chrono::milliseconds loginSettle{400};
    std::chrono::milliseconds readPoll{200};
    int maxLoginAttempts{3};
};

// One persistent, authenticated session to the control port. Requests are
// strictly serialised through a single in-flight slot; unsolicited `~`
// frames are handed to the broadcast handler from the reader thread.
class LineTransport {
public:
    using BroadcastHandler = std::function<void(const Frame&)>;
    using StateHandler = std::function<void(ConnectionState)>;
    using ConnectionFactory = std::function<std::unique_ptr<LineConnection>()>;

    explicit LineTransport(LineTransportOptions options, ConnectionFactory factory = {});
    ~LineTransport();

    LineTransport(const LineTransport&) = delete;
    LineTransport& operator=(const LineTransport&) = delete;

    void setBroadcastHandler(BroadcastHandler handler);
    void setStateHandler(StateHandler handler);

    // Throws NetworkError or AuthError; the transport is left DISCONNECTED.
    void connect();
    void disconnect();

    ConnectionState state() const;
    bool ready() const { return state() == ConnectionState::Ready; }

    // Issues one command and waits for its reply. `replyLines == 0` means a
    // control command answered by OK; otherwise that many `?` lines carrying
    // the command's name are collected. `#` replies throw CommandRejected.
    std::vector<Frame> request(const std::string& command,
                               std::size_t replyLines,
                               std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    void command(const std::string& command, std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    Frame query(const std::string& query, std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    std::vector<Frame> queryLines(const std::string& query,
                                  std::size_t lines,
                                  std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    std::uint64_t violations() const;

private:
    void authenticate(LineConnection& connection);
    std::vector<Frame> framesAfterLogin(const std::string& chunk);
    void readerLoop();
    void handleFrames(std::vector<Frame> frames);
    void setState(ConnectionState state);
    void failSession(const std::string& reason);

    LineTransportOptions options_;
    ConnectionFactory factory_;

    mutable std::mutex lifecycleMutex_;
    std::unique_ptr<LineConnection> connection_;
    std::thread reader_;
    std::atomic_bool running_{false};

    std::timed_mutex requestSlot_;

    mutable std::mutex responseMutex_;
    std::condition_variable responseCv_;
    std::deque<Frame> responses_;
    bool sessionLost_{false};

    mutable std::mutex framerMutex_;
    LineFramer framer_;

    mutable std::mutex stateMutex_;
    ConnectionState state_{ConnectionState::Disconnected};
    StateHandler stateHandler_;
    BroadcastHandler broadcastHandler_;
};

}  // namespace moiplink::line
