#include "moiplink/rest/RestApiClient.h"

#include "moiplink/common/Errors.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace moiplink::rest {

namespace {

using json = nlohmann::json;
namespace http = boost::beast::http;

std::string stringField(const json& object, const char* key) {
    if (!object.is_object()) {
        return {};
    }
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

const json& section(const json& body, const char* key) {
    static const json empty = json::object();
    if (!body.is_object()) {
        return empty;
    }
    auto it = body.find(key);
    return it != body.end() && it->is_object() ? *it : empty;
}

}  // namespace

std::string_view groupResource(DeviceKind kind) noexcept {
    return kind == DeviceKind::Transmitter ? "group_tx" : "group_rx";
}

std::optional<int> GroupRecord::association(const std::string& key) const {
    auto it = associations.find(key);
    if (it == associations.end() || !it->is_number_integer()) {
        return std::nullopt;
    }
    const int value = it->get<int>();
    if (value <= 0) {
        return std::nullopt;
    }
    return value;
}

GroupRecord parseGroup(const json& body, DeviceKind kind) {
    GroupRecord record;
    record.kind = kind;
    try {
        record.id = body.at("id").get<int>();
    } catch (const json::exception& ex) {
        throw ProtocolViolation(std::string("Group resource without id: ") + ex.what());
    }
    const auto& settings = section(body, "settings");
    if (auto it = settings.find("index"); it != settings.end() && it->is_number_integer()) {
        record.index = it->get<int>();
    }
    record.name = stringField(settings, "name");
    record.type = stringField(settings, "type");
    record.associations = section(body, "associations");
    return record;
}

UnitRecord parseUnit(const json& body) {
    UnitRecord record;
    try {
        record.id = body.at("id").get<int>();
    } catch (const json::exception& ex) {
        throw ProtocolViolation(std::string("Unit resource without id: ") + ex.what());
    }
    const auto& settings = section(body, "settings");
    const auto& status = section(body, "status");
    record.name = stringField(settings, "name");
    record.model = stringField(status, "model");
    record.ip = stringField(status, "ip");
    record.mac = stringField(status, "mac");
    record.firmware = stringField(status, "firmware");
    record.raw = body;
    return record;
}

RestApiClient::RestApiClient(HttpClient& http, SessionTokenManager& tokens, std::string basePath)
    : http_(http), tokens_(tokens), basePath_(std::move(basePath)) {}

void RestApiClient::setFailureHandler(FailureHandler handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    failureHandler_ = std::move(handler);
}

void RestApiClient::notifyFailure(const std::exception& error) {
    FailureHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlerMutex_);
        handler = failureHandler_;
    }
    if (handler) {
        handler(error);
    }
}

HttpResponse RestApiClient::attempt(const HttpRequest& request, const std::string& token) {
    HttpRequest authorised = request;
    authorised.headers.emplace_back("Authorization", "Bearer " + token);
    return http_.perform(authorised);
}

HttpResponse RestApiClient::send(http::verb method, const std::string& path, const std::optional<json>& body) {
    HttpRequest request;
    request.method = method;
    request.target = basePath_ + path;
    if (body) {
        request.body = body->dump();
        request.contentType = "application/json";
    }

    try {
        HttpResponse response = attempt(request, tokens_.ensureValid());
        if (response.status == 401) {
            spdlog::info("Session token rejected on {}; logging in again", request.target);
            tokens_.invalidate();
            response = attempt(request, tokens_.refresh());
            if (response.status == 401) {
                throw AuthError("Management request " + request.target + " unauthorised after re-login");
            }
        }
        if (!response.ok()) {
            spdlog::warn("Management request {} {} rejected with HTTP {}",
                         std::string(http::to_string(method)),
                         request.target,
                         response.status);
            throw CommandRejected(response.body.empty() ? "HTTP " + std::to_string(response.status) : response.body,
                                  static_cast<int>(response.status));
        }
        return response;
    } catch (const TimeoutError& error) {
        // Caller timeouts do not drop the session.
        spdlog::warn("Management request {} timed out: {}", request.target, error.what());
        throw;
    } catch (const NetworkError& error) {
        notifyFailure(error);
        throw;
    } catch (const AuthError& error) {
        notifyFailure(error);
        throw;
    }
}

json RestApiClient::request(http::verb method, const std::string& path, const std::optional<json>& body) {
    HttpResponse response = send(method, path, body);
    if (response.status == 204 || response.body.empty()) {
        return nullptr;
    }
    try {
        return json::parse(response.body);
    } catch (const json::parse_error& ex) {
        throw ProtocolViolation("Malformed JSON from " + path + ": " + ex.what());
    }
}

std::vector<int> RestApiClient::itemIds(const std::string& path) {
    const json body = request(http::verb::get, path);
    std::vector<int> ids;
    if (!body.is_object() || !body.contains("items")) {
        return ids;
    }
    try {
        for (const auto& item : body.at("items")) {
            ids.push_back(item.get<int>());
        }
    } catch (const json::exception& ex) {
        throw ProtocolViolation("Malformed item list from " + path + ": " + ex.what());
    }
    return ids;
}

std::vector<int> RestApiClient::unitIds() {
    return itemIds("/moip/unit");
}

UnitRecord RestApiClient::unit(int unitId) {
    return parseUnit(request(http::verb::get, "/moip/unit/" + std::to_string(unitId)));
}

std::vector<UnitRecord> RestApiClient::units() {
    std::vector<UnitRecord> out;
    for (int id : unitIds()) {
        out.push_back(unit(id));
    }
    return out;
}

void RestApiClient::setUnitName(int unitId, const std::string& name) {
    request(http::verb::put, "/moip/unit/" + std::to_string(unitId), json{{"settings", {{"name", name}}}});
}

std::vector<int> RestApiClient::groupIds(DeviceKind kind) {
    return itemIds("/moip/" + std::string(groupResource(kind)));
}

GroupRecord RestApiClient::group(DeviceKind kind, int groupId) {
    return parseGroup(
        request(http::verb::get, "/moip/" + std::string(groupResource(kind)) + "/" + std::to_string(groupId)), kind);
}

std::vector<GroupRecord> RestApiClient::groups(DeviceKind kind) {
    std::vector<GroupRecord> out;
    for (int id : groupIds(kind)) {
        out.push_back(group(kind, id));
    }
    return out;
}

void RestApiClient::setGroupName(DeviceKind kind, int groupId, const std::string& name) {
    request(http::verb::put,
            "/moip/" + std::string(groupResource(kind)) + "/" + std::to_string(groupId),
            json{{"settings", {{"name", name}}}});
}

json RestApiClient::videoTx(int videoTxId) {
    return request(http::verb::get, "/moip/video_tx/" + std::to_string(videoTxId));
}

std::string RestApiClient::videoTxPreview(int videoTxId) {
    return send(http::verb::get, "/moip/video_tx/" + std::to_string(videoTxId) + "/preview", std::nullopt).body;
}

json RestApiClient::audioTx(int audioTxId) {
    return request(http::verb::get, "/moip/audio_tx/" + std::to_string(audioTxId));
}

json RestApiClient::videoRx(int videoRxId) {
    return request(http::verb::get, "/moip/video_rx/" + std::to_string(videoRxId));
}

json RestApiClient::updateVideoRx(int videoRxId, const json& settings) {
    return request(http::verb::put, "/moip/video_rx/" + std::to_string(videoRxId), json{{"settings", settings}});
}

json RestApiClient::systemInfo() {
    return request(http::verb::get, "/moip/system");
}

json RestApiClient::systemStatus() {
    return request(http::verb::get, "/moip/system/status");
}

json RestApiClient::baseInfo() {
    return request(http::verb::get, "/base");
}

json RestApiClient::baseStats() {
    return request(http::verb::get, "/base/stats");
}

json RestApiClient::lanInfo() {
    return request(http::verb::get, "/base/lan");
}

json RestApiClient::timeInfo() {
    return request(http::verb::get, "/base/time");
}

json RestApiClient::firmwareInfo() {
    return request(http::verb::get, "/base/firmware");
}

}  // namespace moiplink::rest
