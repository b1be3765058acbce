#include "moiplink/rest/RestEventStream.h"

#include "moiplink/common/Errors.h"

#include <boost/asio/post.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/version.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <utility>

namespace moiplink::rest {

namespace {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using json = nlohmann::json;

bool startsWith(const std::string& text, std::string_view prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

std::string afterField(const std::string& line, std::size_t prefixLength) {
    std::string value = line.substr(prefixLength);
    if (!value.empty() && value.front() == ' ') {
        value.erase(0, 1);
    }
    return value;
}

}  // namespace

std::vector<json> EventStreamDecoder::feed(std::string_view bytes) {
    std::vector<json> out;
    buffer_.append(bytes.data(), bytes.size());
    std::size_t start = 0;
    for (auto pos = buffer_.find('\n', start); pos != std::string::npos; pos = buffer_.find('\n', start)) {
        std::string line = buffer_.substr(start, pos - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        handleLine(std::move(line), out);
        start = pos + 1;
    }
    buffer_.erase(0, start);
    return out;
}

void EventStreamDecoder::reset() {
    buffer_.clear();
    block_.clear();
    inBlock_ = false;
}

void EventStreamDecoder::handleLine(std::string line, std::vector<json>& out) {
    if (line.empty()) {
        flushBlock(out);
        return;
    }
    if (startsWith(line, "data:")) {
        if (inBlock_) {
            block_ += '\n';
        }
        block_ += afterField(line, 5);
        inBlock_ = true;
        return;
    }
    if (line.front() == ':' || startsWith(line, "event:") || startsWith(line, "id:") || startsWith(line, "retry:")) {
        return;
    }
    if (line.front() == '{') {
        emit(line, out);
        return;
    }
    ++violations_;
    spdlog::warn("Ignoring unrecognised event stream line: {}", line);
}

void EventStreamDecoder::flushBlock(std::vector<json>& out) {
    if (!inBlock_) {
        return;
    }
    std::string text = std::move(block_);
    block_.clear();
    inBlock_ = false;
    emit(text, out);
}

void EventStreamDecoder::emit(const std::string& text, std::vector<json>& out) {
    try {
        out.push_back(json::parse(text));
    } catch (const json::parse_error& ex) {
        ++violations_;
        spdlog::warn("Discarding malformed change event: {}", ex.what());
    }
}

RestEventStream::RestEventStream(HttpsEndpoint endpoint,
                                 SessionTokenManager& tokens,
                                 std::string path,
                                 std::chrono::milliseconds idleTimeout)
    : endpoint_(std::move(endpoint)),
      tokens_(tokens),
      path_(std::move(path)),
      idleTimeout_(idleTimeout),
      tls_(makeTlsContext(endpoint_)) {}

RestEventStream::~RestEventStream() {
    stop();
}

void RestEventStream::setEventHandler(EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    eventHandler_ = std::move(handler);
}

void RestEventStream::setStoppedHandler(StoppedHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    stoppedHandler_ = std::move(handler);
}

void RestEventStream::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    stopRequested_ = false;
    worker_ = std::thread([this]() { run(); });
}

void RestEventStream::stop() {
    stopRequested_ = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (activeContext_ != nullptr && activeConnection_ != nullptr) {
            auto* connection = activeConnection_;
            asio::post(*activeContext_, [connection]() {
                beast::error_code ignored;
                beast::get_lowest_layer(connection->stream()).socket().close(ignored);
            });
        }
    }
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

void RestEventStream::run() {
    std::string reason = "stream ended";
    try {
        stream();
    } catch (const Error& ex) {
        reason = ex.what();
    } catch (const std::exception& ex) {
        reason = std::string("unexpected failure: ") + ex.what();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        activeContext_ = nullptr;
        activeConnection_ = nullptr;
    }
    running_ = false;

    if (stopRequested_) {
        spdlog::info("Change event stream stopped");
        return;
    }
    spdlog::warn("Change event stream lost: {}", reason);
    StoppedHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = stoppedHandler_;
    }
    if (handler) {
        handler(reason);
    }
}

void RestEventStream::stream() {
    asio::io_context ioContext;
    TlsConnection connection(ioContext, *tls_, endpoint_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopRequested_) {
            return;
        }
        activeContext_ = &ioContext;
        activeConnection_ = &connection;
    }

    connection.connect(endpoint_.timeout);

    TlsConnection::Request request{http::verb::get, path_, 11};
    request.set(http::field::host, endpoint_.host);
    request.set(http::field::user_agent, "moiplink/0.1");
    request.set(http::field::accept, "text/event-stream, application/x-ndjson");
    request.set(http::field::authorization, "Bearer " + tokens_.ensureValid());
    connection.send(request, endpoint_.timeout);

    http::response_parser<http::buffer_body> parser;
    parser.body_limit(boost::none);
    beast::get_lowest_layer(connection.stream()).expires_after(endpoint_.timeout);
    http::async_read_header(connection.stream(), connection.buffer(), parser, connection.handler());
    connection.run("Event stream header");

    const unsigned status = parser.get().result_int();
    if (status == 401 || status == 403) {
        tokens_.invalidate();
        throw AuthError("Event stream rejected the session token (HTTP " + std::to_string(status) + ")");
    }
    if (status != 200) {
        throw NetworkError("Event stream unavailable (HTTP " + std::to_string(status) + ")");
    }
    spdlog::info("Change event stream open on {}", path_);

    EventStreamDecoder decoder;
    std::array<char, 4096> chunk{};
    while (!parser.is_done() && !stopRequested_) {
        parser.get().body().data = chunk.data();
        parser.get().body().size = chunk.size();
        beast::get_lowest_layer(connection.stream()).expires_after(idleTimeout_);

        boost::system::error_code error;
        http::async_read(connection.stream(),
                         connection.buffer(),
                         parser,
                         [&error](const boost::system::error_code& ec, std::size_t) { error = ec; });
        ioContext.restart();
        ioContext.run();
        if (error && error != http::error::need_buffer) {
            if (error == beast::error::timeout) {
                throw TimeoutError("Event stream idle for too long");
            }
            throw NetworkError("Event stream read failed: " + error.message());
        }

        const std::size_t used = chunk.size() - parser.get().body().size;
        if (used == 0) {
            continue;
        }
        EventHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = eventHandler_;
        }
        for (auto& event : decoder.feed(std::string_view(chunk.data(), used))) {
            if (handler) {
                handler(event);
            }
        }
    }
}

}  // namespace moiplink::rest
