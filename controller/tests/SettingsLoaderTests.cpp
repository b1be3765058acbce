#include "moiplink/controller/SettingsLoader.h"

#include <catch2/catch_test_macros.hpp>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>

using namespace moiplink;
using namespace moiplink::controller;
using namespace std::chrono_literals;

namespace {

std::filesystem::path writeConfig(const std::string& content) {
    static std::size_t counter = 0;
    const auto suffix = std::to_string(std::chrono::steady_clock::now().time_since_epoch().count() + counter++);
    const auto path = std::filesystem::temp_directory_path() / ("moiplink-" + suffix + ".yaml");
    std::ofstream output(path);
    REQUIRE(output.good());
    output << content;
    output.close();
    return path;
}

EnvironmentLookup fakeEnvironment(std::map<std::string, std::string> values) {
    return [values = std::move(values)](const std::string& name) -> std::optional<std::string> {
        if (auto it = values.find(name); it != values.end()) {
            return it->second;
        }
        return std::nullopt;
    };
}

}  // namespace

TEST_CASE("Settings load from YAML with defaults", "[config]") {
    const auto path = writeConfig(R"(
controller:
  host: 192.168.1.50
  telnet_port: 2323
  timeout_ms: 5000
telnet:
  username: installer
  password: hunter2
api:
  username: admin
  password: secret
  verify_tls: true
supervisor:
  heartbeat_ms: 20000
  backoff_jitter: 0.1
events:
  enabled: true
routing:
  eager_writes: false
serial:
  history: 8
logging:
  level: debug
)");
    const auto settings = loadSettings(path.string(), fakeEnvironment({}));
    std::filesystem::remove(path);

    REQUIRE(settings.controller.host == "192.168.1.50");
    REQUIRE(settings.controller.telnetPort == 2323);
    REQUIRE(settings.controller.apiPort == 443);
    REQUIRE(settings.controller.timeout == 5000ms);
    REQUIRE(settings.controller.apiBasePath == "/api/v1");
    REQUIRE(settings.telnet.username == "installer");
    REQUIRE(settings.telnet.maxLoginAttempts == 3);
    REQUIRE(settings.api.verifyTls);
    REQUIRE(settings.supervisor.heartbeat == 20000ms);
    REQUIRE(settings.supervisor.backoffInitial == 500ms);
    REQUIRE(settings.supervisor.backoffJitter == 0.1);
    REQUIRE(settings.events.enabled);
    REQUIRE(settings.events.path == "/api/v1/moip/events");
    REQUIRE_FALSE(settings.eagerRouteWrites);
    REQUIRE(settings.serialHistory == 8);
    REQUIRE(settings.logLevel == "debug");
}

TEST_CASE("Environment overrides the configuration file", "[config]") {
    const auto path = writeConfig("controller:\n  host: 10.0.0.1\n");
    const auto settings = loadSettings(path.string(),
                                       fakeEnvironment({{"MOIP_HOST", "10.0.0.2"},
                                                        {"MOIP_TELNET_PORT", "24"},
                                                        {"MOIP_API_PORT", "8443"},
                                                        {"MOIP_API_USERNAME", "ops"},
                                                        {"MOIP_API_PASSWORD", "pw"},
                                                        {"MOIP_VERIFY_SSL", "Yes"},
                                                        {"MOIP_TIMEOUT", "3"}}));
    std::filesystem::remove(path);

    REQUIRE(settings.controller.host == "10.0.0.2");
    REQUIRE(settings.controller.telnetPort == 24);
    REQUIRE(settings.controller.apiPort == 8443);
    REQUIRE(settings.api.username == "ops");
    REQUIRE(settings.api.password == "pw");
    REQUIRE(settings.api.verifyTls);
    REQUIRE(settings.controller.timeout == 3000ms);

    SECTION("malformed overrides are rejected") {
        Settings copy = settings;
        REQUIRE_THROWS_AS(applyEnvironment(copy, fakeEnvironment({{"MOIP_TIMEOUT", "3s"}})), std::runtime_error);
        REQUIRE_THROWS_AS(applyEnvironment(copy, fakeEnvironment({{"MOIP_VERIFY_SSL", "maybe"}})), std::runtime_error);
        REQUIRE_THROWS_AS(applyEnvironment(copy, fakeEnvironment({{"MOIP_API_PORT", "70000"}})), std::runtime_error);
    }
}

TEST_CASE("Settings validation names the offending field", "[config]") {
    SECTION("missing host") {
        const auto path = writeConfig("telnet:\n  username: admin\n");
        try {
            loadSettings(path.string(), fakeEnvironment({}));
            FAIL("expected a validation error");
        } catch (const std::runtime_error& error) {
            REQUIRE(std::string(error.what()).find("controller.host") != std::string::npos);
        }
        std::filesystem::remove(path);
    }

    SECTION("bad values") {
        REQUIRE_THROWS_AS(parseSettings(YAML::Load("controller:\n  telnet_port: 0\n")), std::runtime_error);
        REQUIRE_THROWS_AS(parseSettings(YAML::Load("controller:\n  timeout_ms: soon\n")), std::runtime_error);
        REQUIRE_THROWS_AS(parseSettings(YAML::Load("controller:\n  host: [a, b]\n")), std::runtime_error);
        REQUIRE_THROWS_AS(parseSettings(YAML::Load("- just\n- a list\n")), std::runtime_error);
    }

    SECTION("inconsistent supervisor settings") {
        Settings settings;
        settings.controller.host = "matrix";
        REQUIRE_NOTHROW(validateSettings(settings));
        settings.supervisor.backoffMax = 100ms;
        REQUIRE_THROWS_AS(validateSettings(settings), std::runtime_error);
    }

    SECTION("unreadable file") {
        REQUIRE_THROWS_AS(loadSettings("/nonexistent/moiplink.yaml", fakeEnvironment({})), std::runtime_error);
    }
}

TEST_CASE("An empty document yields defaults", "[config]") {
    const auto settings = parseSettings(YAML::Load(""));
    REQUIRE(settings.controller.host.empty());
    REQUIRE(settings.controller.telnetPort == 23);
    REQUIRE(settings.eagerRouteWrites);
    REQUIRE(settings.serialHistory == 32);
}
