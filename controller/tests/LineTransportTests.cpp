#include "moiplink/common/Errors.h"
#include "moiplink/line/LineCodec.h"
#include "moiplink/line/LineTransport.h"
#include "support/FakeController.h"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace moiplink;
using namespace moiplink::line;
using moiplink::testing::FakeLineDevice;
using moiplink::testing::eventually;
using moiplink::testing::fakeFactory;
using namespace std::chrono_literals;

namespace {

LineTransportOptions fastOptions() {
    LineTransportOptions options;
    options.host = "matrix.test";
    options.port = 23;
    options.connectTimeout = 1000ms;
    options.requestTimeout = 500ms;
    options.loginSettle = 20ms;
    options.readPoll = 10ms;
    return options;
}

class StateLog {
public:
    void record(ConnectionState state) {
        std::lock_guard<std::mutex> lock(mutex_);
        states_.push_back(state);
    }

    std::vector<ConnectionState> states() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return states_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<ConnectionState> states_;
};

}  // namespace

TEST_CASE("LineTransport issues queries and commands over one session", "[line]") {
    auto device = std::make_shared<FakeLineDevice>(4, 8);
    LineTransport transport(fastOptions(), fakeFactory(device));
    StateLog log;
    transport.setStateHandler([&log](ConnectionState state) { log.record(state); });

    transport.connect();
    REQUIRE(transport.ready());

    const auto devices = transport.query(std::string(kDevicesQuery));
    REQUIRE(devices.name() == "Devices");
    REQUIRE(parseDevices(devices.value()) == DeviceCounts{4, 8});

    transport.command(switchCommand(2, 5));
    REQUIRE(device->route(5) == 2);

    const auto names = transport.queryLines(nameQuery(DeviceKind::Receiver), 8);
    REQUIRE(names.size() == 8);
    REQUIRE(parseName(names.back().value()).name == "Display 8");

    SECTION("device errors surface as CommandRejected") {
        REQUIRE_THROWS_AS(transport.command(switchCommand(9, 1)), CommandRejected);
        REQUIRE(transport.ready());
        REQUIRE_THROWS_AS(transport.query("?Bogus"), CommandRejected);
    }

    SECTION("unanswered requests time out and the session stays usable") {
        device->silence("?Receivers");
        REQUIRE_THROWS_AS(transport.query(std::string(kReceiversQuery), 50ms), TimeoutError);
        device->unsilence("?Receivers");
        REQUIRE(transport.query(std::string(kReceiversQuery)).name() == "Receivers");
    }

    transport.disconnect();
    REQUIRE(transport.state() == ConnectionState::Disconnected);
    const auto states = log.states();
    REQUIRE(states.front() == ConnectionState::Connecting);
    REQUIRE(states.back() == ConnectionState::Disconnected);
    REQUIRE_THROWS_AS(transport.query(std::string(kDevicesQuery)), NetworkError);
}

TEST_CASE("LineTransport completes the login exchange", "[line]") {
    auto device = std::make_shared<FakeLineDevice>(2, 2);
    device->requireLogin("admin", "secret");

    SECTION("valid credentials") {
        auto options = fastOptions();
        options.username = "admin";
        options.password = "secret";
        LineTransport transport(options, fakeFactory(device));
        transport.connect();
        REQUIRE(transport.ready());
        REQUIRE(parseDevices(transport.query("?Devices").value()) == DeviceCounts{2, 2});
    }

    SECTION("wrong password") {
        auto options = fastOptions();
        options.username = "admin";
        options.password = "wrong";
        LineTransport transport(options, fakeFactory(device));
        REQUIRE_THROWS_AS(transport.connect(), AuthError);
        REQUIRE(transport.state() == ConnectionState::Disconnected);
    }

    SECTION("missing credentials") {
        LineTransport transport(fastOptions(), fakeFactory(device));
        REQUIRE_THROWS_AS(transport.connect(), AuthError);
    }
}

TEST_CASE("LineTransport finishes a broadcast split across the end of login", "[line]") {
    auto device = std::make_shared<FakeLineDevice>(2, 2);
    device->requireLogin("admin", "secret");
    device->setWelcome("Welcome\r\n~Receivers=1:");

    auto options = fastOptions();
    options.username = "admin";
    options.password = "secret";
    LineTransport transport(options, fakeFactory(device));

    std::mutex mutex;
    std::vector<std::string> broadcasts;
    transport.setBroadcastHandler([&](const Frame& frame) {
        std::lock_guard<std::mutex> lock(mutex);
        broadcasts.push_back(frame.text);
    });
    transport.connect();
    REQUIRE(transport.ready());

    device->broadcast("2,2:0\r\n");
    REQUIRE(eventually([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return broadcasts.size() == 1;
    }));
    {
        std::lock_guard<std::mutex> lock(mutex);
        REQUIRE(broadcasts[0] == "~Receivers=1:2,2:0");
    }
    REQUIRE(transport.violations() == 0);
    REQUIRE(parseDevices(transport.query("?Devices").value()) == DeviceCounts{2, 2});
}

TEST_CASE("LineTransport drops a prompt left after login", "[line]") {
    auto device = std::make_shared<FakeLineDevice>(2, 2);
    device->requireLogin("admin", "secret");
    device->setWelcome("Welcome\r\nMoIP> ");

    auto options = fastOptions();
    options.username = "admin";
    options.password = "secret";
    LineTransport transport(options, fakeFactory(device));
    transport.connect();

    REQUIRE(parseDevices(transport.query("?Devices").value()) == DeviceCounts{2, 2});
    REQUIRE(transport.violations() == 0);
}

TEST_CASE("LineTransport hands broadcasts to the handler", "[line]") {
    auto device = std::make_shared<FakeLineDevice>(2, 2);
    device->overrideReply("?Receivers", "~Receivers=2:1,2:0\r\n?Receivers=1:1,2:0\r\n");
    LineTransport transport(fastOptions(), fakeFactory(device));

    std::mutex mutex;
    std::vector<std::string> broadcasts;
    transport.setBroadcastHandler([&](const Frame& frame) {
        std::lock_guard<std::mutex> lock(mutex);
        broadcasts.push_back(frame.text);
    });
    transport.connect();

    const auto reply = transport.query("?Receivers");
    REQUIRE(reply.text == "?Receivers=1:1,2:0");

    device->broadcast("~Serial=0,1,41 42\r\nnoise\r\n");
    REQUIRE(eventually([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return broadcasts.size() == 2;
    }));
    std::lock_guard<std::mutex> lock(mutex);
    REQUIRE(broadcasts[0] == "~Receivers=2:1,2:0");
    REQUIRE(broadcasts[1] == "~Serial=0,1,41 42");
    REQUIRE(transport.violations() == 1);
}

TEST_CASE("LineTransport reports a dropped session and reconnects", "[line]") {
    auto device = std::make_shared<FakeLineDevice>(1, 1);
    LineTransport transport(fastOptions(), fakeFactory(device));
    transport.connect();

    device->dropAll();
    REQUIRE(eventually([&] { return transport.state() == ConnectionState::Disconnected; }));
    REQUIRE_THROWS_AS(transport.query("?Devices"), NetworkError);

    transport.connect();
    REQUIRE(transport.ready());
    REQUIRE(device->connections() == 2);
    REQUIRE(transport.query("?Devices").value() == "1,1");
}

TEST_CASE("LineTransport surfaces refused connections", "[line]") {
    auto device = std::make_shared<FakeLineDevice>(1, 1);
    device->setRefuseConnections(true);
    LineTransport transport(fastOptions(), fakeFactory(device));

    REQUIRE_THROWS_AS(transport.connect(), NetworkError);
    REQUIRE(transport.state() == ConnectionState::Disconnected);
}

TEST_CASE("LineTransport serialises concurrent requests", "[line]") {
    auto device = std::make_shared<FakeLineDevice>(3, 6);
    LineTransport transport(fastOptions(), fakeFactory(device));
    transport.connect();

    std::atomic_int mismatches{0};
    std::vector<std::thread> workers;
    for (int worker = 0; worker < 4; ++worker) {
        workers.emplace_back([&, worker] {
            for (int i = 0; i < 10; ++i) {
                if (worker % 2 == 0) {
                    if (transport.query("?Devices").value() != "3,6") {
                        ++mismatches;
                    }
                } else {
                    if (transport.queryLines("?Name=1", 3).size() != 3) {
                        ++mismatches;
                    }
                }
            }
        });
    }
    for (auto& thread : workers) {
        thread.join();
    }
    REQUIRE(mismatches == 0);
}
