#include "config.hpp"
#include "crawler.hpp"
#include "exception.hpp"
#include "feeds.hpp"
#include "hash_tool.hpp"
#include "http.hpp"
#include "localization.hpp"
#include "storage.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <future>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.commands") << std::endl;
    std::cerr << get_string("info.generate_desc") << std::endl;
    std::cerr << get_string("info.cleanup_desc") << std::endl;
}

void generate(const fs::path& out_dir, Config& config) {
    resolve_tool_paths(config);
    CurlHttpClient http(config.http_timeout);
    NixPrefetchTool tool(config.nix_prefetch_url, config.nix_store);

    log_info(get_string("info.starting"));
    auto ides_future = std::async(std::launch::async, [&] { return collect_ides(config, http); });
    std::vector<std::future<std::vector<std::string>>> index_futures;
    for (const auto& url : config.plugin_indices) {
        index_futures.push_back(std::async(std::launch::async, [&http, url] { return fetch_plugin_index(url, http); }));
    }

    const std::vector<IdeIdentity> ides = ides_future.get();
    std::vector<std::string> plugins;
    for (auto& future : index_futures) {
        auto index = future.get();
        plugins.insert(plugins.end(), index.begin(), index.end());
    }
    log_info(string_format("info.indexing", ides.size(), plugins.size()));

    log_info(get_string("info.loading_db"));
    PluginDatabase db = db_load(out_dir);

    Crawler crawler(config, db, http, tool);
    crawler.run(ides, plugins);

    log_info(get_string("info.saving_db"));
    db_save(out_dir, db);
}

void cleanup(const fs::path& out_dir) {
    log_info(get_string("info.loading_db"));
    PluginDatabase db = db_load_full(out_dir);
    const size_t removed = db.garbage_collect();
    log_info(string_format("info.cleanup_removed", removed, db.entry_count()));
    db_save(out_dir, db);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CurlGlobalInitializer curl_initializer;
    try {
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("help.help"))
            ("o,output-path", get_string("help.output_path"), cxxopts::value<std::string>())
            ("c,config", get_string("help.config"), cxxopts::value<std::string>())
            ("j,jobs", get_string("help.jobs"), cxxopts::value<size_t>())
            ("v,verbose", get_string("help.verbose"), cxxopts::value<bool>()->default_value("false"))
            ("command", "", cxxopts::value<std::string>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        set_verbose(result["verbose"].as<bool>());

        if (!result.count("command") || !result.count("output-path")) {
            print_usage(options);
            return 1;
        }

        Config config;
        if (result.count("config")) {
            load_config_file(result["config"].as<std::string>(), config);
        }
        if (result.count("jobs")) {
            config.jobs = result["jobs"].as<size_t>();
            if (config.jobs == 0) {
                throw PlugdbException(get_string("error.invalid_jobs"));
            }
        }

        const fs::path out_dir = result["output-path"].as<std::string>();
        const std::string& command = result["command"].as<std::string>();

        if (command == "generate") {
            DBLock lock(out_dir);
            generate(out_dir, config);
        } else if (command == "cleanup") {
            DBLock lock(out_dir);
            cleanup(out_dir);
        } else {
            print_usage(options);
            return 1;
        }
        log_info(get_string("info.done"));

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const PlugdbException& e) {
        log_error(string_format("error.plugdb_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
