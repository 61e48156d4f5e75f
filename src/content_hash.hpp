#pragma once

#include "config.hpp"
#include "hash_tool.hpp"
#include "http.hpp"
#include "plugin_db.hpp"
#include "supervisor.hpp"

#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>

// Plugin releases whose download probe returned 404 during this run.
class NotFoundCache {
public:
    bool contains(const PluginKey& key) const;
    void insert(const PluginKey& key);
    size_t size() const;

private:
    mutable std::shared_mutex mtx;
    std::set<PluginKey> keys_;
};

// Finds the content address of a plugin release: the database first, then
// the 404 cache, then a download probe followed by the external hash tool.
class ContentHashResolver {
public:
    ContentHashResolver(const Config& config, const PluginDatabase& db, NotFoundCache& not_found, HttpClient& http,
                        HashTool& tool);

    // None if the release has no downloadable artifact.
    std::optional<PluginEntry> resolve(const std::string& plugin_id, const std::string& version, const TaskContext& ctx);

    std::string download_probe_url(const std::string& plugin_id, const std::string& version) const;

    // Strips the query and the download prefix. Throws if the prefix is missing.
    std::string relative_download_path(std::string_view url) const;

private:
    const Config& config_;
    const PluginDatabase& db_;
    NotFoundCache& not_found_;
    HttpClient& http_;
    HashTool& tool_;
};

// True for artifacts hashed as a single executable file instead of unpacked
bool is_single_file_artifact(std::string_view path);
