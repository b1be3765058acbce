#include "moiplink/controller/Channels.h"

#include "moiplink/common/Errors.h"
#include "moiplink/line/LineCodec.h"

namespace moiplink::controller {

LineChannel::LineChannel(line::LineTransport& transport, std::chrono::milliseconds probeTimeout)
    : transport_(transport), probeTimeout_(probeTimeout) {}

void LineChannel::connect() {
    transport_.connect();
}

// The transport completes the login exchange inside connect().
void LineChannel::authenticate() {
    if (!transport_.ready()) {
        throw NetworkError("Line protocol session closed right after login");
    }
}

bool LineChannel::alive() const {
    return transport_.ready();
}

void LineChannel::probe() {
    line::parseDevices(transport_.query(std::string(line::kDevicesQuery), probeTimeout_).value());
}

void LineChannel::disconnect() {
    transport_.disconnect();
}

RestChannel::RestChannel(rest::SessionTokenManager& tokens, rest::RestApiClient& api, rest::RestEventStream* events)
    : tokens_(tokens), api_(api), events_(events) {}

// Requests open their own connections, so the first call is the login.
void RestChannel::connect() {}

void RestChannel::authenticate() {
    tokens_.refresh();
    if (events_ != nullptr) {
        events_->start();
    }
}

bool RestChannel::alive() const {
    return events_ == nullptr || events_->running();
}

void RestChannel::probe() {
    api_.systemInfo();
}

void RestChannel::disconnect() {
    if (events_ != nullptr) {
        events_->stop();
    }
    tokens_.invalidate();
}

}  // namespace moiplink::controller
