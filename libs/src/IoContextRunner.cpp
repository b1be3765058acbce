#include "moiplink/common/IoContextRunner.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace moiplink {

IoContextRunner::IoContextRunner(std::string name)
    : name_(std::move(name)) {}

IoContextRunner::~IoContextRunner() {
    stop();
}

void IoContextRunner::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }

    workGuard_.emplace(boost::asio::make_work_guard(ioContext_));
    worker_ = std::thread([this] {
        try {
            ioContext_.run();
        } catch (const std::exception& ex) {
            spdlog::error("IoContextRunner '{}' crashed: {}", name_, ex.what());
        }
    });
}

void IoContextRunner::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }

    if (workGuard_) {
        workGuard_->reset();
        workGuard_.reset();
    }
    ioContext_.stop();
    if (worker_.joinable()) {
        worker_.join();
    }
    ioContext_.restart();
}

}  // namespace moiplink
