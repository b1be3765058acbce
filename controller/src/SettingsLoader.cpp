#include "moiplink/controller/SettingsLoader.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace moiplink::controller {

namespace {

template <typename T>
T scalarOrThrow(const YAML::Node& node, const std::string& field) {
    if (!node || !node.IsScalar()) {
        throw std::runtime_error("Field '" + field + "' must be a scalar");
    }
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion&) {
        throw std::runtime_error("Field '" + field + "' has an invalid value '" + node.Scalar() + "'");
    }
}

template <typename T>
void readOptional(const YAML::Node& section, const char* key, const std::string& prefix, T& target) {
    if (section && section[key]) {
        target = scalarOrThrow<T>(section[key], prefix + "." + key);
    }
}

void readMillis(const YAML::Node& section, const char* key, const std::string& prefix, std::chrono::milliseconds& target) {
    if (section && section[key]) {
        target = std::chrono::milliseconds(scalarOrThrow<long long>(section[key], prefix + "." + key));
    }
}

void readPort(const YAML::Node& section, const char* key, const std::string& prefix, std::uint16_t& target) {
    if (section && section[key]) {
        const auto field = prefix + "." + key;
        const auto value = scalarOrThrow<long long>(section[key], field);
        if (value < 1 || value > std::numeric_limits<std::uint16_t>::max()) {
            throw std::runtime_error("Field '" + field + "' must be a port number");
        }
        target = static_cast<std::uint16_t>(value);
    }
}

std::optional<std::string> processEnvironment(const std::string& name) {
    if (const char* value = std::getenv(name.c_str()); value != nullptr && *value != '\0') {
        return std::string(value);
    }
    return std::nullopt;
}

bool parseFlag(std::string text, const std::string& field) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (text == "1" || text == "true" || text == "yes" || text == "on") {
        return true;
    }
    if (text == "0" || text == "false" || text == "no" || text == "off") {
        return false;
    }
    throw std::runtime_error("Environment variable " + field + " must be a boolean");
}

long long parseNumber(const std::string& text, const std::string& field) {
    try {
        std::size_t used = 0;
        const auto value = std::stoll(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw std::runtime_error("Environment variable " + field + " must be an integer");
    }
}

std::uint16_t parsePort(const std::string& text, const std::string& field) {
    const auto value = parseNumber(text, field);
    if (value < 1 || value > std::numeric_limits<std::uint16_t>::max()) {
        throw std::runtime_error("Environment variable " + field + " must be a port number");
    }
    return static_cast<std::uint16_t>(value);
}

}  // namespace

Settings parseSettings(const YAML::Node& root) {
    Settings settings;
    if (!root || root.IsNull()) {
        return settings;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Configuration root must be a mapping");
    }

    const auto controller = root["controller"];
    readOptional(controller, "host", "controller", settings.controller.host);
    readPort(controller, "telnet_port", "controller", settings.controller.telnetPort);
    readPort(controller, "api_port", "controller", settings.controller.apiPort);
    readMillis(controller, "timeout_ms", "controller", settings.controller.timeout);
    readOptional(controller, "api_base_path", "controller", settings.controller.apiBasePath);

    const auto telnet = root["telnet"];
    readOptional(telnet, "username", "telnet", settings.telnet.username);
    readOptional(telnet, "password", "telnet", settings.telnet.password);
    readOptional(telnet, "max_login_attempts", "telnet", settings.telnet.maxLoginAttempts);
    readMillis(telnet, "login_settle_ms", "telnet", settings.telnet.loginSettle);

    const auto api = root["api"];
    readOptional(api, "username", "api", settings.api.username);
    readOptional(api, "password", "api", settings.api.password);
    readOptional(api, "verify_tls", "api", settings.api.verifyTls);
    readOptional(api, "ca_file", "api", settings.api.caFile);

    const auto supervisor = root["supervisor"];
    readMillis(supervisor, "tick_ms", "supervisor", settings.supervisor.tick);
    readMillis(supervisor, "heartbeat_ms", "supervisor", settings.supervisor.heartbeat);
    readMillis(supervisor, "backoff_initial_ms", "supervisor", settings.supervisor.backoffInitial);
    readMillis(supervisor, "backoff_max_ms", "supervisor", settings.supervisor.backoffMax);
    readOptional(supervisor, "backoff_multiplier", "supervisor", settings.supervisor.backoffMultiplier);
    readOptional(supervisor, "backoff_jitter", "supervisor", settings.supervisor.backoffJitter);

    const auto events = root["events"];
    readOptional(events, "enabled", "events", settings.events.enabled);
    readOptional(events, "path", "events", settings.events.path);
    readMillis(events, "idle_timeout_ms", "events", settings.events.idleTimeout);

    readOptional(root["routing"], "eager_writes", "routing", settings.eagerRouteWrites);
    readOptional(root["serial"], "history", "serial", settings.serialHistory);
    readOptional(root["logging"], "level", "logging", settings.logLevel);
    return settings;
}

void applyEnvironment(Settings& settings, const EnvironmentLookup& environment) {
    const EnvironmentLookup lookup = environment ? environment : EnvironmentLookup(processEnvironment);

    if (auto value = lookup("MOIP_HOST")) {
        settings.controller.host = *value;
    }
    if (auto value = lookup("MOIP_TELNET_PORT")) {
        settings.controller.telnetPort = parsePort(*value, "MOIP_TELNET_PORT");
    }
    if (auto value = lookup("MOIP_API_PORT")) {
        settings.controller.apiPort = parsePort(*value, "MOIP_API_PORT");
    }
    if (auto value = lookup("MOIP_API_USERNAME")) {
        settings.api.username = *value;
    }
    if (auto value = lookup("MOIP_API_PASSWORD")) {
        settings.api.password = *value;
    }
    if (auto value = lookup("MOIP_VERIFY_SSL")) {
        settings.api.verifyTls = parseFlag(*value, "MOIP_VERIFY_SSL");
    }
    if (auto value = lookup("MOIP_TIMEOUT")) {
        // Seconds, as the dashboard always stored it.
        settings.controller.timeout = std::chrono::seconds(parseNumber(*value, "MOIP_TIMEOUT"));
    }
}

void validateSettings(const Settings& settings) {
    if (settings.controller.host.empty()) {
        throw std::runtime_error("Field 'controller.host' is required");
    }
    if (settings.controller.timeout.count() <= 0) {
        throw std::runtime_error("Field 'controller.timeout_ms' must be positive");
    }
    if (settings.controller.apiBasePath.empty() || settings.controller.apiBasePath.front() != '/') {
        throw std::runtime_error("Field 'controller.api_base_path' must start with '/'");
    }
    if (settings.telnet.maxLoginAttempts < 1) {
        throw std::runtime_error("Field 'telnet.max_login_attempts' must be at least 1");
    }
    if (settings.telnet.loginSettle.count() <= 0) {
        throw std::runtime_error("Field 'telnet.login_settle_ms' must be positive");
    }
    if (settings.supervisor.tick.count() <= 0) {
        throw std::runtime_error("Field 'supervisor.tick_ms' must be positive");
    }
    if (settings.supervisor.heartbeat.count() <= 0) {
        throw std::runtime_error("Field 'supervisor.heartbeat_ms' must be positive");
    }
    if (settings.supervisor.backoffInitial.count() <= 0) {
        throw std::runtime_error("Field 'supervisor.backoff_initial_ms' must be positive");
    }
    if (settings.supervisor.backoffMax < settings.supervisor.backoffInitial) {
        throw std::runtime_error("Field 'supervisor.backoff_max_ms' must not be below backoff_initial_ms");
    }
    if (settings.supervisor.backoffMultiplier < 1.0) {
        throw std::runtime_error("Field 'supervisor.backoff_multiplier' must be at least 1");
    }
    if (settings.supervisor.backoffJitter < 0.0 || settings.supervisor.backoffJitter > 1.0) {
        throw std::runtime_error("Field 'supervisor.backoff_jitter' must be between 0 and 1");
    }
    if (settings.events.enabled && (settings.events.path.empty() || settings.events.path.front() != '/')) {
        throw std::runtime_error("Field 'events.path' must start with '/'");
    }
    if (settings.events.idleTimeout.count() <= 0) {
        throw std::runtime_error("Field 'events.idle_timeout_ms' must be positive");
    }
}

Settings loadSettings(const std::string& path, const EnvironmentLookup& environment) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& ex) {
        throw std::runtime_error("Failed to read configuration " + path + ": " + ex.what());
    }
    Settings settings = parseSettings(root);
    applyEnvironment(settings, environment);
    validateSettings(settings);
    return settings;
}

}  // namespace moiplink::controller
