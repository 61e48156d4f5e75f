#pragma once

#include "exception.hpp"
#include <string>
#include <string_view>
#include <optional>
#include <filesystem>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_BLUE = "\033[1;34m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions, safe to call from worker threads
void log_debug(std::string_view msg);
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);

void set_verbose(bool enable);

// Exclusive lock on an output directory (RAII). Locks the directory itself,
// so nothing is added to its contents.
class DBLock {
public:
    explicit DBLock(const fs::path& dir);
    ~DBLock();
    DBLock(const DBLock&) = delete;
    DBLock& operator=(const DBLock&) = delete;
private:
    int lock_fd = -1;
};

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);
std::string read_text_file(const fs::path& path);
// Writes to <path>.tmp; the caller renames it into place with commit_file.
fs::path write_tmp_file(const fs::path& path, std::string_view content);
void commit_file(const fs::path& tmp_path, const fs::path& path);

// Looks up an executable in $PATH
std::optional<fs::path> find_in_path(std::string_view name);

// Replaces every character that is not [A-Za-z0-9] with '-'
std::string sanitize_name(std::string_view name);
