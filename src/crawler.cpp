#include "crawler.hpp"
#include "exception.hpp"
#include "feeds.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include "version.hpp"

#include <atomic>
#include <map>

std::optional<std::string> details_key_for(const std::string& plugin_id) {
    static const std::map<std::string, std::optional<std::string>, std::less<>> exceptions = {
        // The real id trips up the details endpoint
        {"23.bytecode-disassembler", "bytecode-disassembler"},
        // Invalid version numbers
        {"com.valord577.mybatis-navigator", std::nullopt},
        // ZIP contains invalid file names
        {"io.github.kings1990.FastRequest", std::nullopt},
        {"com.majera.intellij.codereview.gitlab", std::nullopt},
    };

    auto it = exceptions.find(plugin_id);
    if (it != exceptions.end()) return it->second;
    return plugin_id;
}

Crawler::Crawler(const Config& config, PluginDatabase& db, HttpClient& http, HashTool& tool)
    : config_(config), db_(db), http_(http), resolver_(config, db, not_found_, http, tool) {}

void Crawler::run(const std::vector<IdeIdentity>& ides, const std::vector<std::string>& plugin_ids) {
    const BackoffPolicy policy{config_.backoff_base, 2.0, config_.max_retries};
    const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config_.task_timeout);
    std::atomic<bool> cancelled{false};
    std::atomic<size_t> done{0};

    log_info(string_format("info.crawl_start", plugin_ids.size(), ides.size(), config_.jobs));

    run_bounded(config_.jobs, plugin_ids.size(), [&](size_t index) {
        const std::string& plugin_id = plugin_ids[index];
        run_supervised(plugin_id, timeout, policy, cancelled, [&](const TaskContext& ctx) {
            process_plugin(plugin_id, ides, ctx);
        });
        const size_t finished = ++done;
        if (finished % 500 == 0) {
            log_info(string_format("info.crawl_progress", finished, plugin_ids.size()));
        }
    }, cancelled);

    log_info(string_format("info.crawl_done", plugin_ids.size(), db_.entry_count(), not_found_.size()));
}

void Crawler::process_plugin(const std::string& plugin_id, const std::vector<IdeIdentity>& ides, const TaskContext& ctx) {
    log_debug(string_format("debug.processing_plugin", plugin_id));

    const auto details_key = details_key_for(plugin_id);
    if (!details_key) {
        log_warning(string_format("warning.plugin_broken", plugin_id));
        return;
    }

    const std::string url = config_.plugin_details_url + url_escape(*details_key);
    const HttpResponse response = http_.get(url, ctx);
    if (!response.ok()) {
        throw PlugdbException(string_format("error.details_request_failed", plugin_id, response.status));
    }

    const auto releases = parse_plugin_details(response.body);
    if (!releases) {
        log_warning(string_format("warning.no_plugin_details", plugin_id));
        return;
    }

    for (const auto& ide : ides) {
        ctx.check();
        const auto release = supported_release(ide, *releases);
        if (!release) {
            log_debug(string_format("debug.ide_not_supported", plugin_id, ide.display_name()));
            continue;
        }
        if (auto entry = resolver_.resolve(plugin_id, release->version, ctx)) {
            db_.insert(ide, plugin_id, release->version, *entry);
        }
    }
}
