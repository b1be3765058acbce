#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <optional>
#include <string>
#include <thread>

namespace moiplink {

// Runs an io_context on a dedicated worker thread until stopped. Restartable.
class IoContextRunner {
public:
    explicit IoContextRunner(std::string name = "io");
    ~IoContextRunner();

    IoContextRunner(const IoContextRunner&) = delete;
    IoContextRunner& operator=(const IoContextRunner&) = delete;

    boost::asio::io_context& context() noexcept { return ioContext_; }

    void start();
    void stop();
    bool running() const noexcept { return running_.load(); }

private:
    std::string name_;
    boost::asio::io_context ioContext_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> workGuard_;
    std::thread worker_;
    std::atomic_bool running_{false};
};

}  // namespace moiplink
