#pragma once

#include "moiplink/rest/HttpClient.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace moiplink::rest {

struct SessionToken {
    std::string value;
    std::chrono::steady_clock::time_point expiresAt{};
};

// Owns the bearer token of the management protocol. The token is replaced
// wholesale on refresh and dropped when a refresh fails. Refreshes are
// single-flight: callers arriving while a login is running wait for it and
// reuse its token.
class SessionTokenManager {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    static constexpr std::chrono::seconds kDefaultMargin{60};
    static constexpr std::chrono::seconds kDefaultLifetime{900};

    SessionTokenManager(HttpClient& http,
                        std::string username,
                        std::string password,
                        std::string basePath = "/api/v1",
                        std::chrono::seconds margin = kDefaultMargin,
                        Clock clock = {});

    // Returns a token that stays valid for at least the safety margin,
    // logging in first when needed. Throws AuthError or NetworkError.
    std::string ensureValid();
    // Logs in unconditionally.
    std::string refresh();
    void invalidate();

    std::optional<SessionToken> current() const;
    std::uint64_t loginCount() const noexcept { return logins_.load(); }

private:
    bool usableLocked(std::chrono::steady_clock::time_point now) const;
    std::string refreshLocked(std::optional<std::uint64_t> observedGeneration);
    SessionToken login();

    HttpClient& http_;
    std::string username_;
    std::string password_;
    std::string basePath_;
    std::chrono::seconds margin_;
    Clock clock_;

    std::mutex refreshMutex_;
    mutable std::mutex tokenMutex_;
    std::optional<SessionToken> token_;
    std::uint64_t generation_{0};
    std::atomic_uint64_t logins_{0};
};

}  // namespace moiplink::rest
