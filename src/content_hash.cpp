#include "content_hash.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <mutex>

namespace {

constexpr long HTTP_NOT_FOUND = 404;

} // anonymous namespace

bool NotFoundCache::contains(const PluginKey& key) const {
    std::shared_lock lock(mtx);
    return keys_.contains(key);
}

void NotFoundCache::insert(const PluginKey& key) {
    std::unique_lock lock(mtx);
    keys_.insert(key);
}

size_t NotFoundCache::size() const {
    std::shared_lock lock(mtx);
    return keys_.size();
}

bool is_single_file_artifact(std::string_view path) {
    return path.ends_with(".jar");
}

ContentHashResolver::ContentHashResolver(const Config& config, const PluginDatabase& db, NotFoundCache& not_found,
                                         HttpClient& http, HashTool& tool)
    : config_(config), db_(db), not_found_(not_found), http_(http), tool_(tool) {}

std::string ContentHashResolver::download_probe_url(const std::string& plugin_id, const std::string& version) const {
    return config_.plugin_download_url + "?pluginId=" + url_escape(plugin_id) + "&version=" + url_escape(version);
}

std::string ContentHashResolver::relative_download_path(std::string_view url) const {
    // Query parameters only feed upstream analytics; the file is the same without them.
    url = url.substr(0, url.find_first_of("?#"));
    if (!url.starts_with(config_.download_prefix)) {
        throw PlugdbException(string_format("error.unexpected_download_url", std::string(url), config_.download_prefix));
    }
    url.remove_prefix(config_.download_prefix.size());
    if (url.empty()) {
        throw PlugdbException(string_format("error.unexpected_download_url", config_.download_prefix, config_.download_prefix));
    }
    return std::string(url);
}

std::optional<PluginEntry> ContentHashResolver::resolve(const std::string& plugin_id, const std::string& version,
                                                        const TaskContext& ctx) {
    const PluginKey key{plugin_id, version};

    if (auto entry = db_.find_entry(key)) {
        return entry;
    }
    if (not_found_.contains(key)) {
        return std::nullopt;
    }

    log_info(string_format("info.hashing_plugin", plugin_id, version));

    const HttpResponse probe = http_.head(download_probe_url(plugin_id, version), ctx);
    if (probe.status == HTTP_NOT_FOUND) {
        log_warning(string_format("warning.plugin_not_available", plugin_id, version));
        not_found_.insert(key);
        return std::nullopt;
    }
    if (!probe.ok()) {
        throw PlugdbException(string_format("error.probe_failed", plugin_id, version, probe.status));
    }

    PluginEntry entry;
    entry.path = relative_download_path(probe.effective_url);
    const bool single_file = is_single_file_artifact(entry.path);
    const std::string url = config_.download_prefix + entry.path;

    const PrefetchResult result = tool_.prefetch(sanitize_name(plugin_id + "-" + version + "-source"), url, !single_file, single_file, ctx);

    // Only the hash is needed; drop the store copy to keep disk usage bounded.
    try {
        tool_.forget(result.store_path, ctx);
    } catch (const TaskCancelled&) {
        throw;
    } catch (const std::exception& e) {
        log_warning(string_format("warning.store_delete_failed", result.store_path, e.what()));
    }
    entry.hash = nix32_to_base64(result.nix32_hash);

    log_debug(string_format("debug.hashed_plugin", plugin_id, version, entry.path, entry.hash));
    return entry;
}
