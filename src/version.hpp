#pragma once

#include "ide.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// One published plugin release and the IDE builds it declares support for.
struct PluginRelease {
    std::string version;
    std::optional<std::string> since_build;
    std::optional<std::string> until_build;
};

// Compares two build numbers segment by segment. Returns <0, 0 or >0.
int compare_build_numbers(std::string_view a, std::string_view b);

// "231.*" -> "231.0"
std::string lower_bound_build(std::string_view since);
// "231.*" -> "231.99999999"
std::string upper_bound_build(std::string_view until);

bool build_in_range(std::string_view build, const PluginRelease& release);

// Returns the first release in the given order that admits the IDE's build.
// The order is never changed: upstream lists the preferred release first.
std::optional<PluginRelease> supported_release(const IdeIdentity& ide, const std::vector<PluginRelease>& releases);
