#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

// Run configuration, built once at startup and passed to every component.
struct Config {
    // Plugin details endpoint, the plugin id is appended
    std::string plugin_details_url = "https://plugins.jetbrains.com/plugins/list?pluginId=";
    // Download endpoint, probed with ?pluginId=<id>&version=<version>
    std::string plugin_download_url = "https://plugins.jetbrains.com/plugin/download";
    // Every resolved download URL starts with this; it is stripped before storing
    std::string download_prefix = "https://downloads.marketplace.jetbrains.com/";
    std::vector<std::string> plugin_indices = {
        "https://downloads.marketplace.jetbrains.com/files/pluginsXMLIds.json",
        "https://downloads.marketplace.jetbrains.com/files/jbPluginsXMLIds.json",
    };
    std::string jetbrains_updates_url = "https://www.jetbrains.com/updates/updates.xml";
    std::string android_studio_releases_url = "https://jb.gg/android-studio-releases-list.json";

    // Only IDE versions starting with one of these are processed
    std::vector<std::string> version_prefixes = {"2027.", "2026.", "2025.", "2024.3."};

    size_t jobs = 16;
    int max_retries = 3;
    std::chrono::milliseconds backoff_base{250};
    std::chrono::seconds task_timeout{1200};
    std::chrono::seconds http_timeout{600};

    std::filesystem::path nix_prefetch_url;
    std::filesystem::path nix_store;
};

// Overlays key=value settings from a file onto `config`.
void load_config_file(const std::filesystem::path& path, Config& config);

// Fills in tool paths that were not configured explicitly from $PATH.
void resolve_tool_paths(Config& config);

bool allowed_ide_version(const Config& config, const std::string& version);
