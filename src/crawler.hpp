#pragma once

#include "config.hpp"
#include "content_hash.hpp"
#include "hash_tool.hpp"
#include "http.hpp"
#include "ide.hpp"
#include "plugin_db.hpp"
#include "supervisor.hpp"

#include <optional>
#include <string>
#include <vector>

// Id to query the details endpoint with. None for plugins known to be
// broken upstream, which are skipped without any request.
std::optional<std::string> details_key_for(const std::string& plugin_id);

// Resolves, for every candidate plugin and every IDE, the newest compatible
// release and merges it with its content address into the database.
class Crawler {
public:
    Crawler(const Config& config, PluginDatabase& db, HttpClient& http, HashTool& tool);

    // Processes every plugin on a bounded worker pool. Each plugin is retried
    // on failure; the first plugin that runs out of retries aborts the run
    // and its error is rethrown.
    void run(const std::vector<IdeIdentity>& ides, const std::vector<std::string>& plugin_ids);

    // One attempt at one plugin.
    void process_plugin(const std::string& plugin_id, const std::vector<IdeIdentity>& ides, const TaskContext& ctx);

    const NotFoundCache& not_found() const { return not_found_; }

private:
    const Config& config_;
    PluginDatabase& db_;
    HttpClient& http_;
    NotFoundCache not_found_;
    ContentHashResolver resolver_;
};
