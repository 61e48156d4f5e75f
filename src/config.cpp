#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <charconv>
#include <fstream>
#include <string_view>

namespace {

std::string_view trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

template<typename T>
T parse_number(std::string_view key, std::string_view value, const std::filesystem::path& path) {
    T result{};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size() || result <= 0) {
        throw PlugdbException(string_format("error.invalid_config_value", path.string(), std::string(key), std::string(value)));
    }
    return result;
}

std::vector<std::string> parse_list(std::string_view value) {
    std::vector<std::string> items;
    while (!value.empty()) {
        const size_t pos = value.find(',');
        auto item = trim(value.substr(0, pos));
        if (!item.empty()) items.emplace_back(item);
        if (pos == std::string_view::npos) break;
        value.remove_prefix(pos + 1);
    }
    return items;
}

} // anonymous namespace

void load_config_file(const std::filesystem::path& path, Config& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw PlugdbException(string_format("error.open_file_failed", path.string()));
    }

    std::string line;
    while (std::getline(file, line)) {
        std::string_view sv = trim(line);
        if (sv.empty() || sv.front() == '#') continue;

        const size_t eq = sv.find('=');
        if (eq == std::string_view::npos) {
            throw PlugdbException(string_format("error.invalid_config_line", path.string(), std::string(sv)));
        }
        const std::string_view key = trim(sv.substr(0, eq));
        const std::string_view value = trim(sv.substr(eq + 1));

        if (key == "jobs") {
            config.jobs = parse_number<size_t>(key, value, path);
        } else if (key == "retries") {
            // Zero retries is valid: one attempt only.
            config.max_retries = value == "0" ? 0 : parse_number<int>(key, value, path);
        } else if (key == "backoff_ms") {
            config.backoff_base = std::chrono::milliseconds(parse_number<long>(key, value, path));
        } else if (key == "task_timeout_s") {
            config.task_timeout = std::chrono::seconds(parse_number<long>(key, value, path));
        } else if (key == "http_timeout_s") {
            config.http_timeout = std::chrono::seconds(parse_number<long>(key, value, path));
        } else if (key == "version_prefixes") {
            config.version_prefixes = parse_list(value);
        } else if (key == "nix_prefetch_url") {
            config.nix_prefetch_url = std::string(value);
        } else if (key == "nix_store") {
            config.nix_store = std::string(value);
        } else {
            throw PlugdbException(string_format("error.unknown_config_key", path.string(), std::string(key)));
        }
    }
}

void resolve_tool_paths(Config& config) {
    auto resolve = [](std::filesystem::path& tool, std::string_view name) {
        if (!tool.empty()) return;
        auto found = find_in_path(name);
        if (!found) {
            throw PlugdbException(string_format("error.tool_not_found", std::string(name)));
        }
        tool = *found;
        log_debug(string_format("debug.tool_found", std::string(name), tool.string()));
    };
    resolve(config.nix_prefetch_url, "nix-prefetch-url");
    resolve(config.nix_store, "nix-store");
}

bool allowed_ide_version(const Config& config, const std::string& version) {
    for (const auto& prefix : config.version_prefixes) {
        if (version.starts_with(prefix)) return true;
    }
    return false;
}
