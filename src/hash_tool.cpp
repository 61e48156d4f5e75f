#include "hash_tool.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <openssl/evp.h>

#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>

#include <cerrno>
#include <cstring>

namespace {

constexpr std::string_view NIX32_ALPHABET = "0123456789abcdfghijklmnpqrsvwxyz";
constexpr int POLL_INTERVAL_MS = 100;

// Closes a file descriptor on scope exit
struct FdGuard {
    int fd = -1;
    ~FdGuard() {
        if (fd != -1) close(fd);
    }
};

int wait_for_child(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

} // anonymous namespace

ProcessResult run_process(const std::vector<std::string>& argv, const TaskContext& ctx) {
    ctx.check();

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw PlugdbException(string_format("error.spawn_failed", argv.front(), strerror(errno)));
    }
    FdGuard read_end{fds[0]};
    FdGuard write_end{fds[1]};

    std::vector<char*> c_args;
    for (const auto& arg : argv) c_args.push_back(const_cast<char*>(arg.c_str()));
    c_args.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        throw PlugdbException(string_format("error.spawn_failed", argv.front(), strerror(errno)));
    }
    if (pid == 0) {
        dup2(fds[1], STDOUT_FILENO);
        execv(c_args[0], c_args.data());
        _exit(127);
    }
    close(write_end.fd);
    write_end.fd = -1;

    ProcessResult result;
    char buffer[4096];
    while (true) {
        if (ctx.cancelled() || ctx.expired()) {
            kill(pid, SIGKILL);
            wait_for_child(pid);
            ctx.check();
        }

        pollfd pfd{read_end.fd, POLLIN, 0};
        int ready = poll(&pfd, 1, POLL_INTERVAL_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            kill(pid, SIGKILL);
            wait_for_child(pid);
            throw PlugdbException(string_format("error.spawn_failed", argv.front(), strerror(errno)));
        }
        if (ready == 0) continue;

        ssize_t n = read(read_end.fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            kill(pid, SIGKILL);
            wait_for_child(pid);
            throw PlugdbException(string_format("error.spawn_failed", argv.front(), strerror(errno)));
        }
        if (n == 0) break;
        result.output.append(buffer, static_cast<size_t>(n));
    }

    result.exit_code = wait_for_child(pid);
    return result;
}

PrefetchResult parse_prefetch_output(std::string_view output) {
    while (!output.empty() && (output.back() == '\n' || output.back() == '\r' || output.back() == ' ')) {
        output.remove_suffix(1);
    }
    const size_t newline = output.find('\n');
    if (newline == std::string_view::npos) {
        throw PlugdbException(string_format("error.invalid_prefetch_output", std::string(output)));
    }
    std::string_view hash = output.substr(0, newline);
    std::string_view path = output.substr(newline + 1);
    if (hash.empty() || path.empty() || path.find('\n') != std::string_view::npos) {
        throw PlugdbException(string_format("error.invalid_prefetch_output", std::string(output)));
    }
    return PrefetchResult{std::string(hash), std::string(path)};
}

std::string nix32_to_base64(std::string_view nix32) {
    if (nix32.empty()) {
        throw PlugdbException(string_format("error.invalid_nix32", std::string(nix32)));
    }
    const size_t len = nix32.size() * 5 / 8;
    std::vector<unsigned char> bytes(len, 0);

    // The last character holds the least significant five bits.
    for (size_t n = 0; n < nix32.size(); ++n) {
        const char c = nix32[nix32.size() - n - 1];
        const size_t digit = NIX32_ALPHABET.find(c);
        if (digit == std::string_view::npos) {
            throw PlugdbException(string_format("error.invalid_nix32", std::string(nix32)));
        }
        const size_t b = n * 5;
        const size_t i = b / 8;
        const size_t j = b % 8;
        const unsigned int shifted = static_cast<unsigned int>(digit) << j;
        if (i < len) {
            bytes[i] |= static_cast<unsigned char>(shifted & 0xff);
        } else if (shifted & 0xff) {
            throw PlugdbException(string_format("error.invalid_nix32", std::string(nix32)));
        }
        const unsigned int carry = shifted >> 8;
        if (i + 1 < len) {
            bytes[i + 1] |= static_cast<unsigned char>(carry);
        } else if (carry) {
            throw PlugdbException(string_format("error.invalid_nix32", std::string(nix32)));
        }
    }

    std::string encoded(4 * ((len + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()), bytes.data(), static_cast<int>(len));
    if (written < 0) {
        throw PlugdbException(string_format("error.invalid_nix32", std::string(nix32)));
    }
    encoded.resize(static_cast<size_t>(written));
    return encoded;
}

NixPrefetchTool::NixPrefetchTool(std::filesystem::path prefetch_url, std::filesystem::path store)
    : prefetch_url_(std::move(prefetch_url)), store_(std::move(store)) {}

PrefetchResult NixPrefetchTool::prefetch(const std::string& name, const std::string& url, bool unpack, bool executable,
                                         const TaskContext& ctx) {
    std::vector<std::string> argv = {prefetch_url_.string(), "--print-path", "--type", "sha256", "--name", name};
    if (unpack) argv.emplace_back("--unpack");
    if (executable) argv.emplace_back("--executable");
    argv.push_back(url);

    ProcessResult result = run_process(argv, ctx);
    if (result.exit_code != 0) {
        throw PlugdbException(string_format("error.prefetch_failed", url, result.exit_code));
    }
    return parse_prefetch_output(result.output);
}

void NixPrefetchTool::forget(const std::string& store_path, const TaskContext& ctx) {
    ProcessResult result = run_process({store_.string(), "--delete", store_path}, ctx);
    if (result.exit_code != 0) {
        throw PlugdbException(string_format("error.store_delete_failed", store_path, result.exit_code));
    }
}
