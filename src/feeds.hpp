#pragma once

#include "config.hpp"
#include "http.hpp"
#include "ide.hpp"
#include "version.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Releases listed by the plugin details endpoint, in upstream order.
// Returns none if the response carries no category (no data for the plugin).
std::optional<std::vector<PluginRelease>> parse_plugin_details(std::string_view xml);

// IDE releases from JetBrains' updates.xml
std::vector<IdeIdentity> parse_jetbrains_updates(std::string_view xml, const Config& config);

// IDE releases from the Android Studio release list
std::vector<IdeIdentity> parse_android_studio_releases(std::string_view json_text, const Config& config);

// A JSON array of plugin ids
std::vector<std::string> parse_plugin_index(std::string_view json_text);

// Fetches both IDE feeds concurrently.
std::vector<IdeIdentity> collect_ides(const Config& config, HttpClient& http);

std::vector<std::string> fetch_plugin_index(const std::string& url, HttpClient& http);
