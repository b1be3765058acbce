#include "moiplink/rest/SessionTokenManager.h"

#include "moiplink/common/Errors.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <utility>

namespace moiplink::rest {

namespace {

using json = nlohmann::json;

}  // namespace

SessionTokenManager::SessionTokenManager(HttpClient& http,
                                         std::string username,
                                         std::string password,
                                         std::string basePath,
                                         std::chrono::seconds margin,
                                         Clock clock)
    : http_(http),
      username_(std::move(username)),
      password_(std::move(password)),
      basePath_(std::move(basePath)),
      margin_(margin),
      clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

std::string SessionTokenManager::ensureValid() {
    std::uint64_t observed = 0;
    {
        std::lock_guard<std::mutex> lock(tokenMutex_);
        if (usableLocked(clock_())) {
            return token_->value;
        }
        observed = generation_;
    }
    return refreshLocked(observed);
}

std::string SessionTokenManager::refresh() {
    return refreshLocked(std::nullopt);
}

std::string SessionTokenManager::refreshLocked(std::optional<std::uint64_t> observedGeneration) {
    std::lock_guard<std::mutex> flight(refreshMutex_);
    if (observedGeneration) {
        // Someone else refreshed while we waited for the flight.
        std::lock_guard<std::mutex> lock(tokenMutex_);
        if (generation_ != *observedGeneration && usableLocked(clock_())) {
            return token_->value;
        }
    }

    try {
        SessionToken fresh = login();
        std::lock_guard<std::mutex> lock(tokenMutex_);
        token_ = fresh;
        ++generation_;
        return fresh.value;
    } catch (...) {
        std::lock_guard<std::mutex> lock(tokenMutex_);
        token_.reset();
        ++generation_;
        throw;
    }
}

void SessionTokenManager::invalidate() {
    std::lock_guard<std::mutex> lock(tokenMutex_);
    token_.reset();
    ++generation_;
}

std::optional<SessionToken> SessionTokenManager::current() const {
    std::lock_guard<std::mutex> lock(tokenMutex_);
    return token_;
}

bool SessionTokenManager::usableLocked(std::chrono::steady_clock::time_point now) const {
    return token_.has_value() && now + margin_ < token_->expiresAt;
}

SessionToken SessionTokenManager::login() {
    HttpRequest request;
    request.method = boost::beast::http::verb::post;
    request.target = basePath_ + "/base/auth/login";
    request.contentType = "application/json";
    request.body = json{{"username", username_}, {"password", password_}}.dump();

    ++logins_;
    const auto requestedAt = clock_();
    HttpResponse response = http_.perform(request);

    if (response.status == 401 || response.status == 403) {
        spdlog::error("Management login rejected (HTTP {})", response.status);
        throw AuthError("Management login rejected (HTTP " + std::to_string(response.status) + ")");
    }
    if (response.status >= 500) {
        throw NetworkError("Management login failed with HTTP " + std::to_string(response.status));
    }
    if (!response.ok()) {
        throw AuthError("Management login failed with HTTP " + std::to_string(response.status) + ": " + response.body);
    }

    SessionToken token;
    try {
        const auto body = json::parse(response.body);
        token.value = body.at("accessToken").get<std::string>();
        const auto lifetime = body.contains("expiresIn") ? std::chrono::seconds(body.at("expiresIn").get<long long>())
                                                         : kDefaultLifetime;
        token.expiresAt = requestedAt + lifetime;
    } catch (const json::exception& ex) {
        throw ProtocolViolation(std::string("Malformed login response: ") + ex.what());
    }
    if (token.value.empty()) {
        throw ProtocolViolation("Login response carried an empty access token");
    }

    spdlog::info("Management session token refreshed (valid for {} s)",
                 std::chrono::duration_cast<std::chrono::seconds>(token.expiresAt - requestedAt).count());
    return token;
}

}  // namespace moiplink::rest
