#pragma once

#include "moiplink/rest/HttpsClient.h"
#include "moiplink/rest/SessionTokenManager.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace moiplink::rest {

// Splits the change-event stream into JSON documents. Accepts both
// server-sent-event framing (`data:` lines ending with a blank line) and
// newline-delimited JSON.
class EventStreamDecoder {
public:
    std::vector<nlohmann::json> feed(std::string_view bytes);
    void reset();

    std::uint64_t violations() const noexcept { return violations_; }

private:
    void handleLine(std::string line, std::vector<nlohmann::json>& out);
    void flushBlock(std::vector<nlohmann::json>& out);
    void emit(const std::string& text, std::vector<nlohmann::json>& out);

    std::string buffer_;
    std::string block_;
    bool inBlock_{false};
    std::uint64_t violations_{0};
};

// The long-lived REST event channel. Runs on its own thread with its own
// io_context; stop() closes the socket from that context so a blocked read
// returns promptly.
class RestEventStream {
public:
    using EventHandler = std::function<void(const nlohmann::json&)>;
    using StoppedHandler = std::function<void(const std::string& reason)>;

    RestEventStream(HttpsEndpoint endpoint,
                    SessionTokenManager& tokens,
                    std::string path,
                    std::chrono::milliseconds idleTimeout);
    ~RestEventStream();

    RestEventStream(const RestEventStream&) = delete;
    RestEventStream& operator=(const RestEventStream&) = delete;

    void setEventHandler(EventHandler handler);
    void setStoppedHandler(StoppedHandler handler);

    void start();
    void stop();
    bool running() const noexcept { return running_.load(); }

private:
    void run();
    void stream();

    HttpsEndpoint endpoint_;
    SessionTokenManager& tokens_;
    std::string path_;
    std::chrono::milliseconds idleTimeout_;
    std::shared_ptr<boost::asio::ssl::context> tls_;

    std::mutex mutex_;
    EventHandler eventHandler_;
    StoppedHandler stoppedHandler_;
    boost::asio::io_context* activeContext_{nullptr};
    TlsConnection* activeConnection_{nullptr};

    std::thread worker_;
    std::atomic_bool running_{false};
    std::atomic_bool stopRequested_{false};
};

}  // namespace moiplink::rest
