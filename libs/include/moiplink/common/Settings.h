#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace moiplink {

struct ControllerSettings {
    std::string host;
    std::uint16_t telnetPort{23};
    std::uint16_t apiPort{443};
    std::chrono::milliseconds timeout{10000};
    std::string apiBasePath{"/api/v1"};
};

struct TelnetSettings {
    std::string username;
    std::string password;
    int maxLoginAttempts{3};
    std::chrono::milliseconds loginSettle{400};
};

struct ApiSettings {
    std::string username;
    std::string password;
    bool verifyTls{false};
    std::string caFile;
};

struct SupervisorSettings {
    std::chrono::milliseconds tick{250};
    std::chrono::milliseconds heartbeat{15000};
    std::chrono::milliseconds backoffInitial{500};
    std::chrono::milliseconds backoffMax{30000};
    double backoffMultiplier{2.0};
    double backoffJitter{0.2};
};

struct EventStreamSettings {
    bool enabled{false};
    std::string path{"/api/v1/moip/events"};
    std::chrono::milliseconds idleTimeout{120000};
};

// Read-only configuration of the communication layer. Supplied by the
// embedding application; re-read only when a controller is constructed.
struct Settings {
    ControllerSettings controller;
    TelnetSettings telnet;
    ApiSettings api;
    SupervisorSettings supervisor;
    EventStreamSettings events;
    bool eagerRouteWrites{true};
    std::size_t serialHistory{32};
    std::string logLevel{"info"};
};

}  // namespace moiplink
