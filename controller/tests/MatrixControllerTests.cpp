#include "moiplink/common/Errors.h"
#include "moiplink/controller/MatrixController.h"
#include "support/FakeController.h"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace moiplink;
using namespace moiplink::controller;
using moiplink::testing::FakeHttpClient;
using moiplink::testing::FakeLineDevice;
using moiplink::testing::FakeManagementApi;
using moiplink::testing::eventually;
using moiplink::testing::fakeFactory;
using moiplink::testing::makeGroup;
using namespace std::chrono_literals;

namespace {

Settings testSettings() {
    Settings settings;
    settings.controller.host = "matrix.test";
    settings.controller.timeout = 1000ms;
    settings.telnet.loginSettle = 20ms;
    settings.api.username = "admin";
    settings.api.password = "secret";
    settings.supervisor.tick = 10ms;
    settings.supervisor.heartbeat = 60000ms;
    settings.supervisor.backoffInitial = 20ms;
    settings.supervisor.backoffMax = 50ms;
    settings.supervisor.backoffJitter = 0.0;
    return settings;
}

// A 4x8 installation with both planes answering.
struct Installation {
    std::shared_ptr<FakeLineDevice> device = std::make_shared<FakeLineDevice>(4, 8);
    std::shared_ptr<FakeManagementApi> api = std::make_shared<FakeManagementApi>();
    FakeHttpClient* http{nullptr};
    std::unique_ptr<MatrixController> controller;

    explicit Installation(Settings settings = testSettings()) {
        device->setRoute(2, 1);
        device->setRoute(7, 5);
        device->setName(DeviceKind::Transmitter, 1, "Cable Box");

        api->groupsTx[11] = makeGroup(11, 1, "Cable Box", {{"unit", 101}, {"video_tx", 201}, {"audio_tx", 301}});
        api->groupsTx[12] = makeGroup(12, 2, "Apple TV", {{"unit", 102}, {"video_tx", 202}});
        api->groupsRx[21] = makeGroup(21, 1, "Bar TV", {{"unit", 103}, {"video_rx", 401}});
        api->groupsRx[22] = makeGroup(22, 2, "Patio", {{"unit", 104}, {"video_rx", 402}});
        api->units[101] = {{"id", 101}, {"settings", {{"name", "Cable Box"}}}, {"status", {{"model", "B-900-MOIP-4K-TX"}, {"ip", "10.0.0.11"}}}};
        api->units[102] = {{"id", 102}, {"settings", {{"name", "Apple TV"}}}, {"status", {{"model", "B-900-MOIP-4K-TX"}, {"ip", "10.0.0.12"}}}};
        api->units[103] = {{"id", 103}, {"settings", {{"name", "Bar TV"}}}, {"status", {{"model", "B-900-MOIP-4K-RX"}, {"ip", "10.0.0.13"}}}};
        api->units[104] = {{"id", 104}, {"settings", {{"name", "Patio"}}}, {"status", {{"model", "B-160-MOIP-A-RX"}, {"ip", "0.0.0.0"}}}};
        api->videoTx[201] = {{"id", 201}, {"status", {{"resolution", "1080p60"}}}};
        api->videoRx[401] = {{"id", 401}, {"settings", {{"resolution", "auto"}, {"hdcp", "auto"}}}};
        api->videoRx[402] = {{"id", 402}, {"settings", {{"resolution", "auto"}, {"hdcp", "auto"}}}};

        auto client = std::make_unique<FakeHttpClient>(
            [api = api](const rest::HttpRequest& request) { return api->handle(request); });
        http = client.get();
        controller = std::make_unique<MatrixController>(std::move(settings), std::move(client), fakeFactory(device));
    }

    void startAndWait() {
        controller->start();
        REQUIRE(controller->waitUntilReady(Plane::Line, 3s));
        REQUIRE(controller->waitUntilReady(Plane::Rest, 3s));
        REQUIRE(eventually([this] { return !controller->snapshot()->stale; }));
    }

    // Source of `rx` in the cached routing table, -1 when absent.
    int routeOf(int rx) const {
        const auto table = controller->routing();
        auto it = table.find(rx);
        return it == table.end() ? -1 : it->second.tx;
    }
};

}  // namespace

TEST_CASE("MatrixController reads the installation on start", "[controller]") {
    Installation site;
    site.device->overrideReply("?Receivers", "?Receivers=1:2,3:0,5:7\n");
    site.startAndWait();
    auto& controller = *site.controller;

    const auto snapshot = controller.snapshot();
    REQUIRE(snapshot->counts.transmitters == 4);
    REQUIRE(snapshot->counts.receivers == 8);
    REQUIRE(controller.devices(DeviceKind::Transmitter).size() == 4);
    REQUIRE(controller.devices(DeviceKind::Receiver).size() == 8);
    REQUIRE(controller.devices().size() == 12);

    const auto routing = controller.routing();
    REQUIRE(routing.size() == 8);
    REQUIRE(routing.at(2).tx == 1);
    REQUIRE(routing.at(7).tx == 5);
    for (int rx : {1, 3, 4, 5, 6, 8}) {
        REQUIRE_FALSE(routing.at(rx).assigned());
    }

    const auto tx1 = snapshot->transmitters.at(1);
    REQUIRE(tx1.name == "Cable Box");
    REQUIRE(eventually([&] { return controller.snapshot()->transmitters.at(1).groupId == 11; }));
    const auto enriched = controller.snapshot();
    REQUIRE(enriched->transmitters.at(1).online);
    REQUIRE(enriched->receivers.at(2).subtype == DeviceSubtype::Audio);
    REQUIRE_FALSE(enriched->receivers.at(2).online);
    REQUIRE(enriched->transmitters.at(3).name == "Source 3");
    REQUIRE(controller.connectionState(Plane::Line) == ConnectionState::Ready);
}

TEST_CASE("MatrixController switches routes", "[controller]") {
    Installation site;
    site.startAndWait();
    auto& controller = *site.controller;

    SECTION("eager writes update the cache before any broadcast") {
        controller.switchRoute(3, 4);
        REQUIRE(site.device->route(4) == 3);
        REQUIRE(site.routeOf(4) == 3);
        REQUIRE(controller.routing().at(4).origin == RouteOrigin::LocalConfirm);
    }

    SECTION("a later broadcast wins over the eager write") {
        controller.switchRoute(3, 4);
        site.device->setRoute(4, 2);
        site.device->broadcastRouting();
        REQUIRE(eventually([&] { return site.routeOf(4) == 2; }));
        REQUIRE(controller.routing().at(4).origin == RouteOrigin::Broadcast);
    }

    SECTION("switching to zero unassigns") {
        controller.switchRoute(0, 2);
        REQUIRE(site.device->route(2) == 0);
        REQUIRE_FALSE(controller.routing().at(2).assigned());
        REQUIRE(site.device->log().back() == "!Switch=0,2");

        controller.unassign(7);
        REQUIRE(site.device->log().back() == "!Switch=0,7");
        REQUIRE(site.routeOf(7) == 0);
    }

    SECTION("invalid routes") {
        REQUIRE_THROWS_AS(controller.switchRoute(1, 0), std::invalid_argument);
        REQUIRE_THROWS_AS(controller.switchRoute(-1, 1), std::invalid_argument);
        REQUIRE_THROWS_AS(controller.switchRoute(9, 1), CommandRejected);
        REQUIRE(site.routeOf(1) == 0);
    }
}

TEST_CASE("MatrixController waits for the device when eager writes are off", "[controller]") {
    auto settings = testSettings();
    settings.eagerRouteWrites = false;
    Installation site(settings);
    site.device->setBroadcastOnSwitch(true);
    site.startAndWait();

    site.controller->switchRoute(4, 6);
    REQUIRE(site.device->route(6) == 4);
    REQUIRE(eventually([&] { return site.routeOf(6) == 4; }));
    REQUIRE(site.controller->routing().at(6).origin == RouteOrigin::Broadcast);
}

TEST_CASE("MatrixController renames devices on the management plane", "[controller]") {
    Installation site;
    site.startAndWait();
    auto& controller = *site.controller;

    controller.rename(DeviceKind::Receiver, 1, "Lobby");
    REQUIRE(site.api->groupsRx[21]["settings"]["name"] == "Lobby");
    REQUIRE(site.api->units[103]["settings"]["name"] == "Lobby");
    REQUIRE(controller.snapshot()->receivers.at(1).name == "Lobby");

    REQUIRE_THROWS_AS(controller.rename(DeviceKind::Receiver, 1, ""), std::invalid_argument);
    REQUIRE_THROWS_AS(controller.rename(DeviceKind::Receiver, 1, std::string(51, 'x')), std::invalid_argument);
    REQUIRE_THROWS_AS(controller.rename(DeviceKind::Receiver, 0, "Zero"), std::invalid_argument);
    REQUIRE_THROWS_AS(controller.rename(DeviceKind::Receiver, 7, "Unmapped"), UnknownDevice);
    REQUIRE_NOTHROW(controller.rename(DeviceKind::Transmitter, 2, std::string(50, 'y')));
}

TEST_CASE("MatrixController rebuilds a stale correlation once", "[controller]") {
    Installation site;
    site.startAndWait();
    auto& controller = *site.controller;

    REQUIRE(controller.mapper().restGroupFor(1, DeviceKind::Receiver) == 21);
    const auto before = controller.mapper().enumerationCount();

    // The group was recreated under a new id behind our back.
    auto group = site.api->groupsRx[21];
    group["id"] = 29;
    site.api->groupsRx.erase(21);
    site.api->groupsRx[29] = group;

    controller.rename(DeviceKind::Receiver, 1, "Recreated");
    REQUIRE(site.api->groupsRx[29]["settings"]["name"] == "Recreated");
    REQUIRE(controller.mapper().restGroupFor(1, DeviceKind::Receiver) == 29);
    REQUIRE(controller.mapper().enumerationCount() == before + 1);
}

TEST_CASE("MatrixController changes receiver video settings", "[controller]") {
    Installation site;
    site.startAndWait();
    auto& controller = *site.controller;

    const auto resolution = controller.setResolution(2, "1080p60");
    REQUIRE(resolution["settings"]["resolution"] == "1080p60");
    const auto hdcp = controller.setHdcp(2, "1.4");
    REQUIRE(hdcp["settings"]["hdcp"] == "1.4");
    REQUIRE(site.api->videoRx[402]["settings"]["resolution"] == "1080p60");
    REQUIRE(controller.receiverVideo(1)["settings"]["hdcp"] == "auto");

    REQUIRE_THROWS_AS(controller.setResolution(2, ""), std::invalid_argument);
    REQUIRE_THROWS_AS(controller.setHdcp(0, "2.2"), std::invalid_argument);
}

TEST_CASE("MatrixController keeps the management session after a slow request", "[controller]") {
    Installation site;
    site.startAndWait();
    auto& controller = *site.controller;
    const int logins = site.api->logins();

    site.api->stall("/moip/video_rx/401");
    REQUIRE_THROWS_AS(controller.receiverVideo(1), TimeoutError);

    // Several supervisor ticks.
    std::this_thread::sleep_for(100ms);
    REQUIRE(controller.connectionState(Plane::Rest) == ConnectionState::Ready);
    REQUIRE(site.api->logins() == logins);

    site.api->release("/moip/video_rx/401");
    REQUIRE(controller.receiverVideo(1)["settings"]["resolution"] == "auto");
}

TEST_CASE("MatrixController reads transmitter resources", "[controller]") {
    Installation site;
    site.startAndWait();
    auto& controller = *site.controller;

    const auto image = controller.previewImage(1);
    REQUIRE(image.substr(0, 2) == "\xFF\xD8");
    REQUIRE(controller.transmitterVideo(1)["status"]["resolution"] == "1080p60");
    REQUIRE_THROWS_AS(controller.transmitterAudio(2), UnknownDevice);
    REQUIRE_THROWS_AS(controller.previewImage(0), std::invalid_argument);

    const auto info = controller.controllerInfo();
    REQUIRE(info["device_counts"]["transmitters"] == 4);
    REQUIRE(info["device_counts"]["receivers"] == 8);
    REQUIRE(info["controller_ip"] == "matrix.test");
    REQUIRE(info["lan"]["resource"] == "/base/lan");
    REQUIRE(info["time"]["resource"] == "/base/time");
}

TEST_CASE("MatrixController sends CEC and raw commands", "[controller]") {
    Installation site;
    site.startAndWait();
    auto& controller = *site.controller;

    controller.sendCec(2, parseCecAction("volume_up"));
    const auto log = site.device->log();
    REQUIRE(log[log.size() - 2] == "!CEC=2,44 41");
    REQUIRE(log.back() == "!CEC=2,45");
    REQUIRE_THROWS_AS(parseCecAction("dance"), std::invalid_argument);
    REQUIRE(cecFrames(CecAction::PowerOn) == std::vector<std::string>{"04"});

    const auto reply = controller.sendRaw("?Devices");
    REQUIRE(reply.size() == 1);
    REQUIRE(reply.front().value() == "4,8");
    REQUIRE(controller.sendRaw("?Name=1", 4).size() == 4);
    REQUIRE(controller.sendRaw("!Switch=1,1").empty());
    REQUIRE_THROWS_AS(controller.sendRaw("Devices"), std::invalid_argument);
    REQUIRE_THROWS_AS(controller.sendRaw("?Devices\n?Receivers"), std::invalid_argument);
    REQUIRE_THROWS_AS(controller.sendRaw("!Bogus=1"), CommandRejected);
}

TEST_CASE("MatrixController records serial traffic and notifies subscribers", "[controller]") {
    Installation site;
    site.startAndWait();
    auto& controller = *site.controller;

    std::mutex mutex;
    std::vector<std::string> seen;
    auto subscription = controller.subscribe([&](const Event& event, const State&) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.emplace_back(eventName(event));
    });

    site.device->broadcast("~Serial=0,3,48 49\r\n");
    REQUIRE(eventually([&] { return controller.serialMessages(DeviceKind::Receiver, 3).size() == 1; }));
    REQUIRE(controller.serialMessages(DeviceKind::Receiver, 3).front().data == std::vector<std::uint8_t>{0x48, 0x49});

    std::lock_guard<std::mutex> lock(mutex);
    REQUIRE(std::find(seen.begin(), seen.end(), "SerialReceived") != seen.end());
}

TEST_CASE("MatrixController recovers from a dropped line session", "[controller]") {
    Installation site;
    site.startAndWait();
    auto& controller = *site.controller;
    REQUIRE(site.device->connections() == 1);

    site.device->setRefuseConnections(true);
    site.device->dropAll();
    REQUIRE(eventually([&] { return controller.snapshot()->stale; }));
    REQUIRE_THROWS_AS(controller.switchRoute(1, 1), NetworkError);

    // Routing changed while we were away.
    site.device->setRoute(5, 4);
    site.device->setRefuseConnections(false);

    REQUIRE(eventually([&] { return site.device->connections() >= 2 && !controller.snapshot()->stale; }, 5s));
    REQUIRE(controller.waitUntilReady(Plane::Line, 3s));
    REQUIRE(site.routeOf(5) == 4);
    REQUIRE(controller.connectionState(Plane::Rest) == ConnectionState::Ready);
}

TEST_CASE("MatrixController serves the line plane while management is down", "[controller]") {
    Installation site;
    site.api->unreachable = true;
    site.controller->start();

    REQUIRE(site.controller->waitUntilReady(Plane::Line, 3s));
    REQUIRE_FALSE(site.controller->waitUntilReady(Plane::Rest, 100ms));
    REQUIRE(eventually([&] { return !site.controller->snapshot()->stale; }));
    REQUIRE(site.controller->devices().size() == 12);
    REQUIRE_THROWS_AS(site.controller->setResolution(1, "auto"), NetworkError);

    site.api->unreachable = false;
    REQUIRE(site.controller->waitUntilReady(Plane::Rest, 3s));
    REQUIRE(site.controller->setResolution(1, "auto")["settings"]["resolution"] == "auto");

    site.controller->stop();
    REQUIRE(site.controller->connectionState(Plane::Line) == ConnectionState::Disconnected);
}
