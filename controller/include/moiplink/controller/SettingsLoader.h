#pragma once

#include "moiplink/common/Settings.h"

#include <functional>
#include <optional>
#include <string>

namespace YAML {
class Node;
}

namespace moiplink::controller {

using EnvironmentLookup = std::function<std::optional<std::string>(const std::string& name)>;

// Reads `path`, applies MOIP_* environment overrides and validates.
Settings loadSettings(const std::string& path, const EnvironmentLookup& environment = {});

Settings parseSettings(const YAML::Node& root);
void applyEnvironment(Settings& settings, const EnvironmentLookup& environment = {});
// Throws std::runtime_error naming the offending field.
void validateSettings(const Settings& settings);

}  // namespace moiplink::controller
