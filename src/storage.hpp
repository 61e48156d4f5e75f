#pragma once

#include "plugin_db.hpp"

#include <filesystem>
#include <string_view>

inline constexpr std::string_view ALL_PLUGINS_JSON = "all_plugins.json";
inline constexpr std::string_view IDES_DIR = "ides";

// Loads all_plugins.json only. A missing file yields an empty database.
PluginDatabase db_load(const std::filesystem::path& out_dir);

// Loads all_plugins.json and every IDE mapping. Build numbers stay empty,
// so the result is only good for garbage collection, never for resolution.
PluginDatabase db_load_full(const std::filesystem::path& out_dir);

// Writes every file to a temporary name first and renames them into place
// once all of them were written.
void db_save(const std::filesystem::path& out_dir, const PluginDatabase& db);
