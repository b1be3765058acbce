#pragma once

#include "moiplink/common/Types.h"
#include "moiplink/rest/HttpClient.h"
#include "moiplink/rest/SessionTokenManager.h"

#include <nlohmann/json.hpp>

#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace moiplink::rest {

// A `group_tx` / `group_rx` resource. The group carries the line-protocol
// index and the ids of the resources that make up the endpoint.
struct GroupRecord {
    int id{0};
    DeviceKind kind{DeviceKind::Transmitter};
    std::optional<int> index;
    std::string name;
    std::string type;
    nlohmann::json associations = nlohmann::json::object();

    std::optional<int> association(const std::string& key) const;
};

struct UnitRecord {
    int id{0};
    std::string name;
    std::string model;
    std::string ip;
    std::string mac;
    std::string firmware;
    nlohmann::json raw;

    bool online() const { return !ip.empty() && ip != "0.0.0.0"; }
};

GroupRecord parseGroup(const nlohmann::json& body, DeviceKind kind);
UnitRecord parseUnit(const nlohmann::json& body);

// Typed calls against the management protocol. Every call carries the bearer
// token from the SessionTokenManager; a 401 invalidates it and the call is
// retried once with a fresh token.
class RestApiClient {
public:
    // Invoked with the failure before it propagates, for transport-level
    // errors (NetworkError/AuthError) only.
    using FailureHandler = std::function<void(const std::exception&)>;

    RestApiClient(HttpClient& http, SessionTokenManager& tokens, std::string basePath = "/api/v1");

    void setFailureHandler(FailureHandler handler);

    // Returns null for 204 and empty bodies. Non-2xx throws CommandRejected.
    nlohmann::json request(boost::beast::http::verb method,
                           const std::string& path,
                           const std::optional<nlohmann::json>& body = std::nullopt);

    std::vector<int> unitIds();
    UnitRecord unit(int unitId);
    std::vector<UnitRecord> units();
    void setUnitName(int unitId, const std::string& name);

    std::vector<int> groupIds(DeviceKind kind);
    GroupRecord group(DeviceKind kind, int groupId);
    std::vector<GroupRecord> groups(DeviceKind kind);
    void setGroupName(DeviceKind kind, int groupId, const std::string& name);

    nlohmann::json videoTx(int videoTxId);
    std::string videoTxPreview(int videoTxId);
    nlohmann::json audioTx(int audioTxId);
    nlohmann::json videoRx(int videoRxId);
    nlohmann::json updateVideoRx(int videoRxId, const nlohmann::json& settings);

    nlohmann::json systemInfo();
    nlohmann::json systemStatus();
    nlohmann::json baseInfo();
    nlohmann::json baseStats();
    nlohmann::json lanInfo();
    nlohmann::json timeInfo();
    nlohmann::json firmwareInfo();

    const std::string& basePath() const noexcept { return basePath_; }

private:
    HttpResponse send(boost::beast::http::verb method,
                      const std::string& path,
                      const std::optional<nlohmann::json>& body);
    HttpResponse attempt(const HttpRequest& request, const std::string& token);
    void notifyFailure(const std::exception& error);
    std::vector<int> itemIds(const std::string& path);

    HttpClient& http_;
    SessionTokenManager& tokens_;
    std::string basePath_;

    std::mutex handlerMutex_;
    FailureHandler failureHandler_;
};

std::string_view groupResource(DeviceKind kind) noexcept;

}  // namespace moiplink::rest
