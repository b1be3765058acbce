#pragma once

#include "moiplink/common/Settings.h"
#include "moiplink/controller/Channels.h"
#include "moiplink/controller/EventDispatcher.h"
#include "moiplink/controller/IdentifierMapper.h"
#include "moiplink/controller/ReconnectionSupervisor.h"
#include "moiplink/controller/StateCache.h"
#include "moiplink/line/LineTransport.h"
#include "moiplink/rest/HttpClient.h"
#include "moiplink/rest/RestApiClient.h"
#include "moiplink/rest/RestEventStream.h"
#include "moiplink/rest/SessionTokenManager.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace moiplink::controller {

enum class CecAction {
    PowerOn,
    Standby,
    VolumeUp,
    VolumeDown,
    Mute,
};

CecAction parseCecAction(const std::string& text);
// CEC frames sent for one action, in order.
std::vector<std::string> cecFrames(CecAction action);

// Entry point for the dashboard layer. Routes each operation to the plane
// that owns it, translating indices through the IdentifierMapper, and keeps
// the StateCache current. Safe to call from several threads.
class MatrixController {
public:
    static constexpr std::size_t kMaxNameLength = 50;

    explicit MatrixController(Settings settings);
    // Injection seam for tests and embedders bringing their own transports.
    MatrixController(Settings settings,
                     std::unique_ptr<rest::HttpClient> http,
                     line::LineTransport::ConnectionFactory lineFactory);
    ~MatrixController();

    MatrixController(const MatrixController&) = delete;
    MatrixController& operator=(const MatrixController&) = delete;

    void start();
    void stop();
    // Waits until the plane is READY; false on timeout.
    bool waitUntilReady(Plane plane, std::chrono::milliseconds timeout) const;

    std::vector<Device> devices() const;
    std::vector<Device> devices(DeviceKind kind) const;
    RoutingTable routing() const;
    std::shared_ptr<const State> snapshot() const;
    ConnectionState connectionState(Plane plane) const;

    void switchRoute(int tx, int rx);
    void unassign(int rx);
    void rename(DeviceKind kind, int index, const std::string& name);
    nlohmann::json setResolution(int rx, const std::string& value);
    nlohmann::json setHdcp(int rx, const std::string& value);
    std::string previewImage(int tx);

    nlohmann::json transmitterVideo(int tx);
    nlohmann::json transmitterAudio(int tx);
    nlohmann::json receiverVideo(int rx);
    nlohmann::json controllerInfo();

    void sendCec(int rx, CecAction action);
    std::vector<line::Frame> sendRaw(const std::string& command, std::size_t replyLines = 0);
    std::vector<SerialMessage> serialMessages(DeviceKind kind, int index) const;

    [[nodiscard]] Subscription subscribe(StateCache::Listener listener);

    // Full refresh of both planes. Throws if either plane is unavailable.
    void resynchronize();

    IdentifierMapper& mapper() noexcept { return mapper_; }
    ReconnectionSupervisor& supervisor() noexcept { return supervisor_; }
    const Settings& settings() const noexcept { return settings_; }

private:
    void wire();
    void resynchronizeLine();
    void resynchronizeRest();
    void publish(Event event);
    void onEvent(const Event& event);
    template <class Fn>
    auto retryOnStaleCorrelation(DeviceKind kind, Fn&& fn);

    Settings settings_;
    StateCache cache_;
    EventDispatcher dispatcher_;

    line::LineTransport transport_;
    std::unique_ptr<rest::HttpClient> http_;
    rest::SessionTokenManager tokens_;
    rest::RestApiClient api_;
    std::unique_ptr<rest::RestEventStream> events_;
    IdentifierMapper mapper_;

    LineChannel lineChannel_;
    RestChannel restChannel_;
    ReconnectionSupervisor supervisor_;
};

}  // namespace moiplink::controller
