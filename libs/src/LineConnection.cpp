#include "moiplink/line/LineConnection.h"

#include "moiplink/common/Errors.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>

#include <spdlog/spdlog.h>

#include <memory>

namespace moiplink::line {

namespace {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

// Completion of a posted operation is bounded by its own timer; this is the
// extra time allowed for the io thread to deliver the result.
constexpr std::chrono::milliseconds kIoGrace{2000};

template <typename T>
void awaitResult(std::future<T>& future, std::chrono::milliseconds limit, const std::string& what) {
    if (future.wait_for(limit + kIoGrace) != std::future_status::ready) {
        throw TimeoutError(what + " did not complete");
    }
}

std::exception_ptr networkFailure(const std::string& what,
                                  const boost::system::error_code& ec,
                                  bool timedOut) {
    if (timedOut) {
        return std::make_exception_ptr(TimeoutError(what + " timed out"));
    }
    if (ec == asio::error::eof) {
        return std::make_exception_ptr(NetworkError("Connection closed by controller"));
    }
    return std::make_exception_ptr(NetworkError(what + " failed: " + ec.message()));
}

}  // namespace

TcpLineConnection::TcpLineConnection()
    : runner_("line-protocol"),
      resolver_(runner_.context()),
      socket_(runner_.context()),
      connectTimer_(runner_.context()),
      writeTimer_(runner_.context()) {}

TcpLineConnection::~TcpLineConnection() {
    try {
        close();
    } catch (const std::exception& ex) {
        spdlog::debug("Line connection close during destruction failed: {}", ex.what());
    }
    runner_.stop();
}

void TcpLineConnection::open(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout) {
    runner_.start();
    pendingRead_.reset();

    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();
    auto timedOut = std::make_shared<std::atomic_bool>(false);
    const std::string what = "Connect to " + host + ":" + std::to_string(port);

    asio::post(runner_.context(), [this, host, port, timeout, done, timedOut, what] {
        connectTimer_.expires_after(timeout);
        connectTimer_.async_wait([this, timedOut](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            timedOut->store(true);
            resolver_.cancel();
            boost::system::error_code ignored;
            socket_.close(ignored);
        });
        resolver_.async_resolve(
            host,
            std::to_string(port),
            [this, done, timedOut, what](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                if (ec) {
                    connectTimer_.cancel();
                    done->set_exception(networkFailure(what, ec, timedOut->load()));
                    return;
                }
                asio::async_connect(
                    socket_,
                    results,
                    [this, done, timedOut, what](const boost::system::error_code& connectEc, const tcp::endpoint&) {
                        connectTimer_.cancel();
                        if (connectEc) {
                            done->set_exception(networkFailure(what, connectEc, timedOut->load()));
                            return;
                        }
                        boost::system::error_code ignored;
                        socket_.set_option(tcp::no_delay(true), ignored);
                        socket_.set_option(asio::socket_base::keep_alive(true), ignored);
                        done->set_value();
                    });
            });
    });

    awaitResult(future, timeout, what);
    future.get();
    open_ = true;
}

void TcpLineConnection::write(const std::string& data, std::chrono::milliseconds timeout) {
    if (!open_) {
        throw NetworkError("Line connection is not open");
    }

    auto payload = std::make_shared<std::string>(data);
    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();
    auto timedOut = std::make_shared<std::atomic_bool>(false);

    asio::post(runner_.context(), [this, payload, timeout, done, timedOut] {
        writeTimer_.expires_after(timeout);
        writeTimer_.async_wait([this, timedOut](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            // A stalled write means the link is gone; closing also fails the reader.
            timedOut->store(true);
            boost::system::error_code ignored;
            socket_.close(ignored);
        });
        asio::async_write(
            socket_,
            asio::buffer(*payload),
            [this, payload, done, timedOut](const boost::system::error_code& ec, std::size_t) {
                writeTimer_.cancel();
                if (ec) {
                    done->set_exception(networkFailure("Write", ec, timedOut->load()));
                    return;
                }
                done->set_value();
            });
    });

    awaitResult(future, timeout, "Write");
    try {
        future.get();
    } catch (const NetworkError&) {
        open_ = false;
        throw;
    }
}

std::string TcpLineConnection::read(std::chrono::milliseconds timeout) {
    if (!pendingRead_) {
        if (!open_) {
            throw NetworkError("Line connection is not open");
        }
        auto promise = std::make_shared<std::promise<std::size_t>>();
        pendingRead_ = promise->get_future();
        asio::post(runner_.context(), [this, promise] {
            socket_.async_read_some(
                asio::buffer(buffer_),
                [promise](const boost::system::error_code& ec, std::size_t bytes) {
                    if (ec) {
                        promise->set_exception(networkFailure("Read", ec, false));
                        return;
                    }
                    promise->set_value(bytes);
                });
        });
    }

    if (pendingRead_->wait_for(timeout) != std::future_status::ready) {
        return {};
    }

    auto future = std::move(*pendingRead_);
    pendingRead_.reset();
    try {
        const std::size_t bytes = future.get();
        return std::string(buffer_.data(), bytes);
    } catch (const NetworkError&) {
        open_ = false;
        throw;
    }
}

void TcpLineConnection::close() {
    if (!runner_.running()) {
        open_ = false;
        return;
    }

    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();
    asio::post(runner_.context(), [this, done] {
        boost::system::error_code ignored;
        connectTimer_.cancel();
        writeTimer_.cancel();
        if (socket_.is_open()) {
            socket_.shutdown(tcp::socket::shutdown_both, ignored);
            socket_.close(ignored);
        }
        done->set_value();
    });
    open_ = false;
    if (future.wait_for(kIoGrace) != std::future_status::ready) {
        spdlog::warn("Line connection close did not complete in time");
    }
}

}  // namespace moiplink::line
