#include "localization.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <fstream>
#include <mutex>
#include <string>
#include <unordered_map>
#include <limits.h> // For PATH_MAX
#include <unistd.h> // For readlink

namespace fs = std::filesystem;

namespace {
    std::unordered_map<std::string, std::string> translations;
    std::unordered_map<std::string, std::string> missing_key_placeholders;
    std::mutex missing_mutex;

    fs::path get_executable_dir() {
        char result[PATH_MAX];
        ssize_t count = readlink("/proc/self/exe", result, PATH_MAX - 1);
        if (count != -1) {
            result[count] = '\0';
            return fs::path(result).parent_path();
        }
        return fs::current_path();
    }

    void load_strings(const std::string& lang, const fs::path& base_dir) {
        auto file_path = base_dir / (lang + ".txt");
        std::ifstream file(file_path);
        if (!file.is_open()) {
            if (lang != "en") {
                load_strings("en", base_dir);
            }
            return;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (line.empty() || line[0] == '#') continue;
            if (line.back() == '\r') line.pop_back();
            size_t pos = line.find('=');
            if (pos != std::string::npos) {
                translations[line.substr(0, pos)] = line.substr(pos + 1);
            }
        }
    }
}

void init_localization() {
    if (!translations.empty()) return;

    const char* lang_env = getenv("LANG");
    std::string lang = "en";
    if (lang_env && std::string(lang_env).find("zh") == 0) {
        lang = "zh";
    }

    // Prefer l10n next to the build tree, then the installed copy.
    fs::path exec_dir = get_executable_dir();
    for (const auto& candidate : {exec_dir / ".." / "l10n", exec_dir / "l10n", fs::path(PLUGDB_L10N_DIR)}) {
        if (fs::exists(candidate / "en.txt")) {
            load_strings(lang, candidate);
            return;
        }
    }
}

const std::string& get_string(const std::string& key) {
    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    // Workers may hit a missing key concurrently.
    std::lock_guard<std::mutex> lock(missing_mutex);
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}
