#include "utils.hpp"

#include "localization.hpp"

#include <sys/file.h>
#include <unistd.h>
#include <fcntl.h>

#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>

namespace {
    std::mutex log_mutex;
    std::atomic<bool> verbose{false};
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;

    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);

        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }

        bool current_stream_is_tty = (&stream == &std::cout) ? is_stdout_tty : is_stderr_tty;

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }
}

void log_debug(std::string_view msg) {
    if (!verbose) return;
    log_internal(get_string("debug.prefix") + " ", COLOR_BLUE, msg, std::cerr);
}

void log_info(std::string_view msg) {
    log_internal(get_string("info.log_prefix"), COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

void set_verbose(bool enable) {
    verbose = enable;
}

DBLock::DBLock(const fs::path& dir) {
    ensure_dir_exists(dir);
    lock_fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (lock_fd < 0) {
        throw PlugdbException(string_format("error.db_lock_failed", dir.string()) + ": " + strerror(errno));
    }

    // flock locks belong to the open file description, so a second DBLock in
    // the same process conflicts just like another process would.
    if (flock(lock_fd, LOCK_EX | LOCK_NB) < 0) {
        int err = errno;
        close(lock_fd);
        lock_fd = -1;
        if (err == EWOULDBLOCK) {
            throw PlugdbException(string_format("error.db_locked", dir.string()));
        }
        throw PlugdbException(string_format("error.db_lock_failed", dir.string()) + ": " + strerror(err));
    }
}

DBLock::~DBLock() {
    if (lock_fd != -1) {
        flock(lock_fd, LOCK_UN);
        close(lock_fd);
        lock_fd = -1;
    }
}

void ensure_dir_exists(const fs::path& path) {
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec)) {
            throw PlugdbException(string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
        }
    } else if (!fs::is_directory(path)) {
        throw PlugdbException(string_format("error.path_not_dir", path.string()));
    }
}

std::string read_text_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw PlugdbException(string_format("error.open_file_failed", path.string()));
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        throw PlugdbException(string_format("error.read_file_failed", path.string()));
    }
    return ss.str();
}

fs::path write_tmp_file(const fs::path& path, std::string_view content) {
    fs::path tmp_path = path.string() + ".tmp";
    std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw PlugdbException(string_format("error.create_file_failed", tmp_path.string()));
    }
    file << content;
    file.close();
    if (!file) {
        throw PlugdbException(string_format("error.write_file_failed", tmp_path.string()));
    }
    return tmp_path;
}

void commit_file(const fs::path& tmp_path, const fs::path& path) {
    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        throw PlugdbException(string_format("error.rename_failed", tmp_path.string(), path.string()) + ": " + ec.message());
    }
}

std::optional<fs::path> find_in_path(std::string_view name) {
    const char* path_env = getenv("PATH");
    if (!path_env) return std::nullopt;

    std::string_view dirs = path_env;
    while (!dirs.empty()) {
        size_t pos = dirs.find(':');
        std::string_view dir = dirs.substr(0, pos);
        dirs = (pos == std::string_view::npos) ? std::string_view{} : dirs.substr(pos + 1);
        if (dir.empty()) continue;

        fs::path candidate = fs::path(dir) / name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::string sanitize_name(std::string_view name) {
    std::string result(name);
    for (auto& c : result) {
        if (!std::isalnum(static_cast<unsigned char>(c))) c = '-';
    }
    return result;
}
