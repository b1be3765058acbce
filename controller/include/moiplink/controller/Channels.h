#pragma once

#include "moiplink/controller/ReconnectionSupervisor.h"
#include "moiplink/line/LineTransport.h"
#include "moiplink/rest/RestApiClient.h"
#include "moiplink/rest/RestEventStream.h"
#include "moiplink/rest/SessionTokenManager.h"

#include <chrono>
#include <string>

namespace moiplink::controller {

inline constexpr const char* kLineChannel = "line";
inline constexpr const char* kRestChannel = "rest";

// The control-port session. Heartbeat is a `?Devices` round trip.
class LineChannel : public SupervisedChannel {
public:
    LineChannel(line::LineTransport& transport, std::chrono::milliseconds probeTimeout);

    std::string name() const override { return kLineChannel; }
    void connect() override;
    void authenticate() override;
    bool alive() const override;
    void probe() override;
    void disconnect() override;

private:
    line::LineTransport& transport_;
    std::chrono::milliseconds probeTimeout_;
};

// The management plane: a fresh login plus, when enabled, the change-event
// stream. Heartbeat is a system info request.
class RestChannel : public SupervisedChannel {
public:
    RestChannel(rest::SessionTokenManager& tokens, rest::RestApiClient& api, rest::RestEventStream* events);

    std::string name() const override { return kRestChannel; }
    void connect() override;
    void authenticate() override;
    bool alive() const override;
    void probe() override;
    void disconnect() override;

private:
    rest::SessionTokenManager& tokens_;
    rest::RestApiClient& api_;
    rest::RestEventStream* events_;
};

}  // namespace moiplink::controller
