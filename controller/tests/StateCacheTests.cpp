#include "moiplink/controller/StateCache.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <stdexcept>
#include <vector>

using namespace moiplink;
using namespace moiplink::controller;
using namespace std::chrono_literals;

namespace {

const TimePoint kStart = TimePoint(10s);

Resynchronized scenario(TimePoint at) {
    Resynchronized event;
    event.counts = {4, 8};
    event.names = {{DeviceKind::Transmitter, 1, "Cable Box"}, {DeviceKind::Receiver, 2, "Bar TV"}};
    event.table = buildRoutingTable({{1, 2}, {3, 0}, {5, 7}}, 8, RouteOrigin::Query, at);
    event.at = at;
    return event;
}

rest::GroupRecord group(int id, DeviceKind kind, int index, const std::string& name, int unit, std::string type = {}) {
    rest::GroupRecord record;
    record.id = id;
    record.kind = kind;
    record.index = index;
    record.name = name;
    record.type = std::move(type);
    record.associations = {{"unit", unit}};
    return record;
}

rest::UnitRecord unit(int id, const std::string& model, const std::string& ip) {
    rest::UnitRecord record;
    record.id = id;
    record.model = model;
    record.ip = ip;
    return record;
}

}  // namespace

TEST_CASE("Resynchronisation builds devices and routing", "[cache]") {
    StateCache cache;
    REQUIRE(cache.stale());
    REQUIRE(cache.version() == 0);

    cache.apply(scenario(kStart));

    REQUIRE_FALSE(cache.stale());
    REQUIRE(cache.version() == 1);
    REQUIRE(cache.devices(DeviceKind::Transmitter).size() == 4);
    REQUIRE(cache.devices(DeviceKind::Receiver).size() == 8);
    REQUIRE(cache.devices().size() == 12);
    REQUIRE(cache.device(DeviceKind::Transmitter, 1)->name == "Cable Box");
    REQUIRE(cache.device(DeviceKind::Transmitter, 2)->name == "Tx2");
    REQUIRE(cache.device(DeviceKind::Receiver, 2)->name == "Bar TV");

    const auto routing = cache.routing();
    REQUIRE(routing.size() == 8);
    REQUIRE(routing.at(2).tx == 1);
    REQUIRE(routing.at(7).tx == 5);
    REQUIRE_FALSE(routing.at(3).assigned());
    for (int rx : {1, 4, 5, 6, 8}) {
        REQUIRE(routing.at(rx).tx == 0);
    }
    REQUIRE(cache.sourceOf(2) == 1);
    REQUIRE_FALSE(cache.sourceOf(9).has_value());
}

TEST_CASE("Snapshots are immutable once published", "[cache]") {
    StateCache cache;
    cache.apply(scenario(kStart));
    const auto before = cache.snapshot();

    cache.apply(RouteConfirmed{4, 2, kStart + 1s});

    REQUIRE(before->routing.at(4).tx == 0);
    REQUIRE(cache.snapshot()->routing.at(4).tx == 2);
    REQUIRE(cache.snapshot()->version == before->version + 1);
}

TEST_CASE("Routing updates are ordered by arrival", "[cache]") {
    StateCache cache;
    cache.apply(scenario(kStart));

    SECTION("a later broadcast overrides an eager write") {
        cache.apply(RouteConfirmed{4, 2, kStart + 1s});
        REQUIRE(cache.sourceOf(4) == 2);

        cache.apply(RoutingReplaced{buildRoutingTable({{3, 4}}, 0, RouteOrigin::Broadcast, kStart + 2s),
                                    RouteOrigin::Broadcast,
                                    kStart + 2s});
        REQUIRE(cache.sourceOf(4) == 3);
        REQUIRE(cache.routing().at(4).origin == RouteOrigin::Broadcast);
        REQUIRE(cache.sourceOf(2) == 0);
    }

    SECTION("an older broadcast keeps a newer eager write") {
        cache.apply(RouteConfirmed{4, 2, kStart + 3s});
        cache.apply(RoutingReplaced{buildRoutingTable({{1, 1}}, 0, RouteOrigin::Broadcast, kStart + 2s),
                                    RouteOrigin::Broadcast,
                                    kStart + 2s});
        REQUIRE(cache.sourceOf(4) == 2);
        REQUIRE(cache.sourceOf(1) == 1);
        REQUIRE(cache.routing().size() == 8);
    }

    SECTION("a confirmation older than the last report is ignored") {
        cache.apply(RoutingReplaced{buildRoutingTable({{3, 4}}, 0, RouteOrigin::Broadcast, kStart + 5s),
                                    RouteOrigin::Broadcast,
                                    kStart + 5s});
        cache.apply(RouteConfirmed{4, 2, kStart + 4s});
        REQUIRE(cache.sourceOf(4) == 3);
    }

    SECTION("a resynchronisation read before the last broadcast keeps the broadcast routes") {
        cache.apply(RoutingReplaced{buildRoutingTable({{3, 1}}, 0, RouteOrigin::Broadcast, kStart + 4s),
                                    RouteOrigin::Broadcast,
                                    kStart + 4s});
        cache.apply(scenario(kStart + 3s));
        REQUIRE(cache.sourceOf(1) == 3);
        REQUIRE(cache.routing().at(1).origin == RouteOrigin::Broadcast);
        REQUIRE(cache.sourceOf(2) == 0);

        cache.apply(scenario(kStart + 5s));
        REQUIRE(cache.sourceOf(1) == 0);
        REQUIRE(cache.sourceOf(2) == 1);
        REQUIRE(cache.routing().at(2).origin == RouteOrigin::Query);
    }

    SECTION("switching to zero unassigns") {
        cache.apply(RouteConfirmed{2, 0, kStart + 1s});
        REQUIRE(cache.sourceOf(2) == 0);
        REQUIRE_FALSE(cache.routing().at(2).assigned());
    }
}

TEST_CASE("Management inventory enriches devices", "[cache]") {
    StateCache cache;
    cache.apply(scenario(kStart));

    RestInventory inventory;
    inventory.transmitters = {group(11, DeviceKind::Transmitter, 1, "Satellite", 101),
                              group(12, DeviceKind::Transmitter, 2, "", 102, "audio"),
                              group(13, DeviceKind::Transmitter, 2, "Duplicate", 103)};
    inventory.receivers = {group(21, DeviceKind::Receiver, 3, "Patio", 104)};
    inventory.units = {unit(101, "B-900-MOIP-4K-TX", "10.0.0.11"),
                       unit(102, "B-160-MOIP-A-TX", "0.0.0.0"),
                       unit(104, "B-900-MOIP-4K-WALL-RX", "10.0.0.14")};
    inventory.at = kStart + 1s;
    cache.apply(inventory);

    const auto tx1 = *cache.device(DeviceKind::Transmitter, 1);
    REQUIRE(tx1.name == "Satellite");
    REQUIRE(tx1.groupId == 11);
    REQUIRE(tx1.unitId == 101);
    REQUIRE(tx1.online);
    REQUIRE(tx1.lastSeen == kStart + 1s);
    REQUIRE(tx1.subtype == DeviceSubtype::Av);

    const auto tx2 = *cache.device(DeviceKind::Transmitter, 2);
    REQUIRE(tx2.name == "Tx2");
    REQUIRE(tx2.groupId == 12);
    REQUIRE(tx2.subtype == DeviceSubtype::Audio);
    REQUIRE_FALSE(tx2.online);

    const auto rx3 = *cache.device(DeviceKind::Receiver, 3);
    REQUIRE(rx3.subtype == DeviceSubtype::VideoWall);

    SECTION("unit status changes flip online state") {
        cache.apply(UnitStatusChanged{102, {{"ip", "10.0.0.12"}}, kStart + 2s});
        REQUIRE(cache.device(DeviceKind::Transmitter, 2)->online);
        cache.apply(UnitStatusChanged{101, {{"ip", "0.0.0.0"}}, kStart + 3s});
        REQUIRE_FALSE(cache.device(DeviceKind::Transmitter, 1)->online);
        REQUIRE(cache.device(DeviceKind::Transmitter, 1)->lastSeen == kStart + 1s);
    }

    SECTION("resynchronisation keeps management fields") {
        cache.apply(scenario(kStart + 5s));
        const auto again = *cache.device(DeviceKind::Transmitter, 1);
        REQUIRE(again.groupId == 11);
        REQUIRE(again.name == "Cable Box");
    }

    SECTION("renames apply to known devices only") {
        cache.apply(DeviceRenamed{DeviceKind::Receiver, 3, "Pool"});
        cache.apply(DeviceRenamed{DeviceKind::Receiver, 30, "Nowhere"});
        REQUIRE(cache.device(DeviceKind::Receiver, 3)->name == "Pool");
        REQUIRE_FALSE(cache.device(DeviceKind::Receiver, 30).has_value());
    }
}

TEST_CASE("Devices missing from a resynchronisation stay known and go offline", "[cache]") {
    StateCache cache;
    cache.apply(scenario(kStart));

    RestInventory inventory;
    inventory.transmitters = {group(14, DeviceKind::Transmitter, 4, "Roku", 104)};
    inventory.units = {unit(104, "B-900-MOIP-4K-TX", "10.0.0.14")};
    inventory.at = kStart + 1s;
    cache.apply(inventory);
    REQUIRE(cache.device(DeviceKind::Transmitter, 4)->online);

    auto shrunk = scenario(kStart + 2s);
    shrunk.counts = {3, 8};
    cache.apply(shrunk);

    REQUIRE(cache.devices(DeviceKind::Transmitter).size() == 4);
    const auto tx4 = *cache.device(DeviceKind::Transmitter, 4);
    REQUIRE_FALSE(tx4.online);
    REQUIRE(tx4.name == "Roku");
    REQUIRE(tx4.groupId == 14);
    REQUIRE(cache.device(DeviceKind::Transmitter, 3)->name == "Tx3");
    REQUIRE(cache.devices(DeviceKind::Receiver).size() == 8);
}

TEST_CASE("Serial history is bounded per device", "[cache]") {
    StateCache cache(2);
    for (std::uint8_t i = 0; i < 4; ++i) {
        cache.apply(SerialReceived{DeviceKind::Receiver, 1, {i}, kStart + std::chrono::seconds(i)});
    }
    const auto messages = cache.serialMessages(DeviceKind::Receiver, 1);
    REQUIRE(messages.size() == 2);
    REQUIRE(messages[0].data == std::vector<std::uint8_t>{2});
    REQUIRE(messages[1].data == std::vector<std::uint8_t>{3});
    REQUIRE(cache.serialMessages(DeviceKind::Transmitter, 1).empty());
}

TEST_CASE("Line connection loss marks the cache stale", "[cache]") {
    StateCache cache;
    cache.apply(scenario(kStart));
    cache.apply(ConnectionChanged{Plane::Line, ConnectionState::Ready, kStart});
    REQUIRE(cache.connection(Plane::Line) == ConnectionState::Ready);
    REQUIRE_FALSE(cache.stale());

    cache.apply(ConnectionChanged{Plane::Rest, ConnectionState::Disconnected, kStart + 1s});
    REQUIRE_FALSE(cache.stale());

    cache.apply(ConnectionChanged{Plane::Line, ConnectionState::Disconnected, kStart + 2s});
    REQUIRE(cache.stale());
    REQUIRE(cache.connection(Plane::EventStream) == ConnectionState::Disconnected);
    REQUIRE(cache.routing().at(2).tx == 1);

    cache.apply(scenario(kStart + 3s));
    REQUIRE_FALSE(cache.stale());
    REQUIRE(cache.snapshot()->refreshedAt == kStart + 3s);
}

TEST_CASE("Subscriptions receive events until released", "[cache]") {
    StateCache cache;
    std::vector<std::string> seen;
    auto subscription = cache.subscribe([&seen](const Event& event, const State& state) {
        seen.push_back(std::string(eventName(event)) + "@" + std::to_string(state.version));
    });
    auto failing = cache.subscribe([](const Event&, const State&) { throw std::runtime_error("listener bug"); });
    REQUIRE(subscription.active());

    cache.apply(scenario(kStart));
    cache.apply(DeviceRenamed{DeviceKind::Transmitter, 1, "Roku"});
    REQUIRE(seen == std::vector<std::string>{"Resynchronized@1", "DeviceRenamed@2"});

    Subscription moved = std::move(subscription);
    REQUIRE_FALSE(subscription.active());
    moved.reset();
    cache.apply(DeviceRenamed{DeviceKind::Transmitter, 1, "Apple TV"});
    REQUIRE(seen.size() == 2);
    REQUIRE(cache.device(DeviceKind::Transmitter, 1)->name == "Apple TV");
}

TEST_CASE("Subtype follows group type before model", "[cache]") {
    REQUIRE(determineSubtype("Audio", "B-900-MOIP-4K-TX") == DeviceSubtype::Audio);
    REQUIRE(determineSubtype("video_wall", "") == DeviceSubtype::VideoWall);
    REQUIRE(determineSubtype("av", "B-160-MOIP-A-RX") == DeviceSubtype::Av);
    REQUIRE(determineSubtype("", "B-160-MOIP-A-RX") == DeviceSubtype::Audio);
    REQUIRE(determineSubtype("", "B-900-MOIP-4K-WALL-RX") == DeviceSubtype::VideoWall);
    REQUIRE(determineSubtype("", "") == DeviceSubtype::Av);
    REQUIRE(toString(DeviceSubtype::VideoWall) == "videowall");
}
