#include "moiplink/controller/MatrixController.h"

#include "moiplink/common/Errors.h"
#include "moiplink/line/LineCodec.h"
#include "moiplink/rest/HttpsClient.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace moiplink::controller {

namespace {

using json = nlohmann::json;
using Clock = std::chrono::steady_clock;

line::LineTransportOptions lineOptions(const Settings& settings) {
    line::LineTransportOptions options;
    options.host = settings.controller.host;
    options.port = settings.controller.telnetPort;
    options.username = settings.telnet.username;
    options.password = settings.telnet.password;
    options.connectTimeout = settings.controller.timeout;
    options.requestTimeout = settings.controller.timeout;
    options.loginSettle = settings.telnet.loginSettle;
    options.maxLoginAttempts = settings.telnet.maxLoginAttempts;
    return options;
}

rest::HttpsEndpoint httpsEndpoint(const Settings& settings) {
    rest::HttpsEndpoint endpoint;
    endpoint.host = settings.controller.host;
    endpoint.port = settings.controller.apiPort;
    endpoint.verifyPeer = settings.api.verifyTls;
    endpoint.caFile = settings.api.caFile;
    endpoint.timeout = settings.controller.timeout;
    return endpoint;
}

SupervisorOptions supervisorOptions(const Settings& settings) {
    SupervisorOptions options;
    options.tick = settings.supervisor.tick;
    options.heartbeat = settings.supervisor.heartbeat;
    options.backoff.initial = settings.supervisor.backoffInitial;
    options.backoff.max = settings.supervisor.backoffMax;
    options.backoff.multiplier = settings.supervisor.backoffMultiplier;
    options.backoff.jitter = settings.supervisor.backoffJitter;
    return options;
}

std::unique_ptr<rest::RestEventStream> makeEventStream(const Settings& settings, rest::SessionTokenManager& tokens) {
    if (!settings.events.enabled) {
        return nullptr;
    }
    return std::make_unique<rest::RestEventStream>(
        httpsEndpoint(settings), tokens, settings.events.path, settings.events.idleTimeout);
}

const char* channelFor(Plane plane) {
    return plane == Plane::Line ? kLineChannel : kRestChannel;
}

void requireReceiver(int rx) {
    if (rx < 1) {
        throw std::invalid_argument("Receiver index must be 1 or greater, got " + std::to_string(rx));
    }
}

void requireTransmitter(int tx) {
    if (tx < 1) {
        throw std::invalid_argument("Transmitter index must be 1 or greater, got " + std::to_string(tx));
    }
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

}  // namespace

CecAction parseCecAction(const std::string& text) {
    const auto action = lowercase(text);
    if (action == "on" || action == "power_on" || action == "power-on") {
        return CecAction::PowerOn;
    }
    if (action == "off" || action == "standby" || action == "power_off" || action == "power-off") {
        return CecAction::Standby;
    }
    if (action == "volume_up" || action == "volume-up" || action == "volup") {
        return CecAction::VolumeUp;
    }
    if (action == "volume_down" || action == "volume-down" || action == "voldown") {
        return CecAction::VolumeDown;
    }
    if (action == "mute") {
        return CecAction::Mute;
    }
    throw std::invalid_argument("Unknown CEC action: " + text);
}

std::vector<std::string> cecFrames(CecAction action) {
    // User Control Pressed (44 xx) is followed by User Control Released (45).
    switch (action) {
    case CecAction::PowerOn:
        return {"04"};
    case CecAction::Standby:
        return {"36"};
    case CecAction::VolumeUp:
        return {"44 41", "45"};
    case CecAction::VolumeDown:
        return {"44 42", "45"};
    case CecAction::Mute:
        return {"44 43", "45"};
    }
    return {};
}

MatrixController::MatrixController(Settings settings) : MatrixController(std::move(settings), nullptr, {}) {}

MatrixController::MatrixController(Settings settings,
                                   std::unique_ptr<rest::HttpClient> http,
                                   line::LineTransport::ConnectionFactory lineFactory)
    : settings_(std::move(settings)),
      cache_(settings_.serialHistory),
      dispatcher_(cache_),
      transport_(lineOptions(settings_), std::move(lineFactory)),
      http_(http ? std::move(http) : std::make_unique<rest::HttpsClient>(httpsEndpoint(settings_))),
      tokens_(*http_, settings_.api.username, settings_.api.password, settings_.controller.apiBasePath),
      api_(*http_, tokens_, settings_.controller.apiBasePath),
      events_(makeEventStream(settings_, tokens_)),
      mapper_([this](DeviceKind kind) { return api_.groups(kind); }),
      lineChannel_(transport_, settings_.controller.timeout),
      restChannel_(tokens_, api_, events_.get()),
      supervisor_(supervisorOptions(settings_)) {
    wire();
}

MatrixController::~MatrixController() {
    stop();
}

void MatrixController::wire() {
    dispatcher_.addSink([this](const Event& event) { onEvent(event); });

    transport_.setBroadcastHandler([this](const line::Frame& frame) { dispatcher_.onLineBroadcast(frame); });
    transport_.setStateHandler(
        [this](ConnectionState state) { publish(ConnectionChanged{Plane::Line, state, Clock::now()}); });

    api_.setFailureHandler(
        [this](const std::exception& error) { supervisor_.reportFailure(kRestChannel, error.what()); });

    if (events_) {
        events_->setEventHandler([this](const json& event) { dispatcher_.onRestEvent(event); });
        events_->setStoppedHandler([this](const std::string& reason) {
            publish(ConnectionChanged{Plane::EventStream, ConnectionState::Disconnected, Clock::now()});
            supervisor_.reportFailure(kRestChannel, "event stream stopped: " + reason);
        });
    }

    supervisor_.addChannel(lineChannel_, [this]() { resynchronizeLine(); });
    supervisor_.addChannel(restChannel_, [this]() {
        resynchronizeRest();
        if (events_) {
            publish(ConnectionChanged{Plane::EventStream, ConnectionState::Ready, Clock::now()});
        }
    });
    supervisor_.setStateHandler([this](const std::string& channel, ConnectionState state) {
        publish(ConnectionChanged{channel == kLineChannel ? Plane::Line : Plane::Rest, state, Clock::now()});
    });
}

void MatrixController::start() {
    spdlog::info("Starting controller link to {} (line port {}, management port {})",
                 settings_.controller.host,
                 settings_.controller.telnetPort,
                 settings_.controller.apiPort);
    dispatcher_.start();
    supervisor_.start();
}

void MatrixController::stop() {
    supervisor_.stop();
    dispatcher_.stop();
}

bool MatrixController::waitUntilReady(Plane plane, std::chrono::milliseconds timeout) const {
    return supervisor_.waitForState(channelFor(plane), ConnectionState::Ready, timeout);
}

std::vector<Device> MatrixController::devices() const {
    return cache_.devices();
}

std::vector<Device> MatrixController::devices(DeviceKind kind) const {
    return cache_.devices(kind);
}

RoutingTable MatrixController::routing() const {
    return cache_.routing();
}

std::shared_ptr<const State> MatrixController::snapshot() const {
    return cache_.snapshot();
}

ConnectionState MatrixController::connectionState(Plane plane) const {
    return supervisor_.state(channelFor(plane));
}

void MatrixController::publish(Event event) {
    dispatcher_.post(std::move(event));
}

void MatrixController::onEvent(const Event& event) {
    if (const auto* changed = std::get_if<ResourceChanged>(&event)) {
        if (changed->resource == "group_tx") {
            mapper_.invalidate(DeviceKind::Transmitter);
        } else if (changed->resource == "group_rx") {
            mapper_.invalidate(DeviceKind::Receiver);
        }
    }
}

template <class Fn>
auto MatrixController::retryOnStaleCorrelation(DeviceKind kind, Fn&& fn) {
    try {
        return fn();
    } catch (const CommandRejected& ex) {
        if (ex.status() != 404) {
            throw;
        }
        spdlog::info("Management resource for a {} vanished; rebuilding correlation", toString(kind));
        mapper_.invalidate(kind);
        return fn();
    }
}

void MatrixController::resynchronizeLine() {
    const auto counts = line::parseDevices(transport_.query(std::string(line::kDevicesQuery)).value());
    const auto receivers = transport_.query(std::string(line::kReceiversQuery));
    const auto pairs = line::parseReceivers(receivers.value());
    const auto at = receivers.receivedAt;

    std::vector<line::NameEntry> names;
    for (auto kind : {DeviceKind::Transmitter, DeviceKind::Receiver}) {
        const int count = kind == DeviceKind::Transmitter ? counts.transmitters : counts.receivers;
        for (const auto& frame : transport_.queryLines(line::nameQuery(kind), static_cast<std::size_t>(count))) {
            names.push_back(line::parseName(frame.value()));
        }
    }

    mapper_.invalidate();
    Resynchronized event{counts, std::move(names), buildRoutingTable(pairs, counts.receivers, RouteOrigin::Query, at), at};
    if (!dispatcher_.postAndWait(std::move(event), settings_.controller.timeout)) {
        throw TimeoutError("State cache did not apply the line resynchronisation in time");
    }
    spdlog::info("Line plane resynchronised: {} transmitters, {} receivers", counts.transmitters, counts.receivers);
}

void MatrixController::resynchronizeRest() {
    RestInventory inventory;
    inventory.at = Clock::now();
    inventory.transmitters = api_.groups(DeviceKind::Transmitter);
    inventory.receivers = api_.groups(DeviceKind::Receiver);
    inventory.units = api_.units();

    mapper_.reconcile(DeviceKind::Transmitter, inventory.transmitters);
    mapper_.reconcile(DeviceKind::Receiver, inventory.receivers);

    const auto groups = inventory.transmitters.size() + inventory.receivers.size();
    const auto units = inventory.units.size();
    if (!dispatcher_.postAndWait(std::move(inventory), settings_.controller.timeout)) {
        throw TimeoutError("State cache did not apply the management inventory in time");
    }
    spdlog::info("Management plane resynchronised: {} groups, {} units", groups, units);
}

void MatrixController::resynchronize() {
    resynchronizeLine();
    resynchronizeRest();
}

void MatrixController::switchRoute(int tx, int rx) {
    requireReceiver(rx);
    if (tx < 0) {
        throw std::invalid_argument("Transmitter index must be 0 (unassign) or greater, got " + std::to_string(tx));
    }

    const auto sentAt = Clock::now();
    transport_.command(line::switchCommand(tx, rx));
    spdlog::info("Receiver {} switched to {}", rx, tx == 0 ? std::string("nothing") : "transmitter " + std::to_string(tx));

    if (settings_.eagerRouteWrites &&
        !dispatcher_.postAndWait(RouteConfirmed{rx, tx, sentAt}, settings_.controller.timeout)) {
        spdlog::warn("Route {} -> {} confirmed by the device but not yet applied to the cache", tx, rx);
    }
}

void MatrixController::unassign(int rx) {
    switchRoute(0, rx);
}

void MatrixController::rename(DeviceKind kind, int index, const std::string& name) {
    if (index < 1) {
        throw std::invalid_argument("Device index must be 1 or greater, got " + std::to_string(index));
    }
    if (name.empty() || name.size() > kMaxNameLength) {
        throw std::invalid_argument("Device name must be 1 to " + std::to_string(kMaxNameLength) + " characters");
    }

    retryOnStaleCorrelation(kind, [&]() {
        const auto correlation = mapper_.correlation(kind, index);
        api_.setGroupName(kind, correlation.groupId, name);
        if (correlation.unitId) {
            api_.setUnitName(*correlation.unitId, name);
        }
    });
    spdlog::info("Renamed {} {} to '{}'", toString(kind), index, name);

    if (!dispatcher_.postAndWait(DeviceRenamed{kind, index, name}, settings_.controller.timeout)) {
        spdlog::warn("Rename of {} {} not yet applied to the cache", toString(kind), index);
    }
}

json MatrixController::setResolution(int rx, const std::string& value) {
    requireReceiver(rx);
    if (value.empty()) {
        throw std::invalid_argument("Resolution must not be empty");
    }
    return retryOnStaleCorrelation(DeviceKind::Receiver, [&]() {
        return api_.updateVideoRx(mapper_.restVideoFor(rx, DeviceKind::Receiver), json{{"resolution", value}});
    });
}

json MatrixController::setHdcp(int rx, const std::string& value) {
    requireReceiver(rx);
    if (value.empty()) {
        throw std::invalid_argument("HDCP mode must not be empty");
    }
    return retryOnStaleCorrelation(DeviceKind::Receiver, [&]() {
        return api_.updateVideoRx(mapper_.restVideoFor(rx, DeviceKind::Receiver), json{{"hdcp", value}});
    });
}

std::string MatrixController::previewImage(int tx) {
    requireTransmitter(tx);
    return retryOnStaleCorrelation(DeviceKind::Transmitter, [&]() {
        return api_.videoTxPreview(mapper_.restVideoFor(tx, DeviceKind::Transmitter));
    });
}

json MatrixController::transmitterVideo(int tx) {
    requireTransmitter(tx);
    return retryOnStaleCorrelation(DeviceKind::Transmitter, [&]() {
        return api_.videoTx(mapper_.restVideoFor(tx, DeviceKind::Transmitter));
    });
}

json MatrixController::transmitterAudio(int tx) {
    requireTransmitter(tx);
    return retryOnStaleCorrelation(DeviceKind::Transmitter, [&]() {
        return api_.audioTx(mapper_.restAudioFor(tx, DeviceKind::Transmitter));
    });
}

json MatrixController::receiverVideo(int rx) {
    requireReceiver(rx);
    return retryOnStaleCorrelation(DeviceKind::Receiver, [&]() {
        return api_.videoRx(mapper_.restVideoFor(rx, DeviceKind::Receiver));
    });
}

json MatrixController::controllerInfo() {
    const auto state = cache_.snapshot();
    return json{
        {"base", api_.baseInfo()},
        {"stats", api_.baseStats()},
        {"lan", api_.lanInfo()},
        {"time", api_.timeInfo()},
        {"firmware", api_.firmwareInfo()},
        {"device_counts", {{"transmitters", state->counts.transmitters}, {"receivers", state->counts.receivers}}},
        {"controller_ip", settings_.controller.host},
    };
}

void MatrixController::sendCec(int rx, CecAction action) {
    requireReceiver(rx);
    for (const auto& frame : cecFrames(action)) {
        transport_.command(line::cecCommand(rx, frame));
    }
}

std::vector<line::Frame> MatrixController::sendRaw(const std::string& command, std::size_t replyLines) {
    if (command.size() < 2 || (command.front() != '?' && command.front() != '!')) {
        throw std::invalid_argument("Raw commands start with '?' or '!': '" + command + "'");
    }
    if (command.find('\n') != std::string::npos) {
        throw std::invalid_argument("Raw commands must be a single line");
    }
    if (command.front() == '?' && replyLines == 0) {
        replyLines = 1;
    }
    return transport_.request(command, replyLines);
}

std::vector<SerialMessage> MatrixController::serialMessages(DeviceKind kind, int index) const {
    return cache_.serialMessages(kind, index);
}

Subscription MatrixController::subscribe(StateCache::Listener listener) {
    return cache_.subscribe(std::move(listener));
}

}  // namespace moiplink::controller
