#pragma once

#include "moiplink/common/IoContextRunner.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <optional>
#include <string>

namespace moiplink::line {

// Byte-level link to the control port. Implementations must allow one
// reader thread and one writer thread to use the connection concurrently.
class LineConnection {
public:
    virtual ~LineConnection() = default;

    virtual void open(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout) = 0;
    virtual void write(const std::string& data, std::chrono::milliseconds timeout) = 0;
    // Returns received bytes, or an empty string when nothing arrived within
    // `timeout`. Throws NetworkError once the peer has closed the link.
    virtual std::string read(std::chrono::milliseconds timeout) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
};

class TcpLineConnection : public LineConnection {
public:
    TcpLineConnection();
    ~TcpLineConnection() override;

    TcpLineConnection(const TcpLineConnection&) = delete;
    TcpLineConnection& operator=(const TcpLineConnection&) = delete;

    void open(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout) override;
    void write(const std::string& data, std::chrono::milliseconds timeout) override;
    std::string read(std::chrono::milliseconds timeout) override;
    void close() override;
    bool isOpen() const override { return open_.load(); }

private:
    IoContextRunner runner_;
    boost::asio::ip::tcp::resolver resolver_;
    boost::asio::ip::tcp::socket socket_;
    boost::asio::steady_timer connectTimer_;
    boost::asio::steady_timer writeTimer_;
    std::array<char, 4096> buffer_{};
    std::optional<std::future<std::size_t>> pendingRead_;
    std::atomic_bool open_{false};
};

}  // namespace moiplink::line
