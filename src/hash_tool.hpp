#pragma once

#include "supervisor.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

struct PrefetchResult {
    // sha256 in Nix base-32
    std::string nix32_hash;
    std::string store_path;
};

// External content-addressing tool.
class HashTool {
public:
    virtual ~HashTool() = default;
    virtual PrefetchResult prefetch(const std::string& name, const std::string& url, bool unpack, bool executable,
                                    const TaskContext& ctx) = 0;
    // Removes the temporary store entry created by prefetch. Bounded by the
    // task deadline like prefetch itself.
    virtual void forget(const std::string& store_path, const TaskContext& ctx) = 0;
};

// nix-prefetch-url / nix-store
class NixPrefetchTool : public HashTool {
public:
    NixPrefetchTool(std::filesystem::path prefetch_url, std::filesystem::path store);

    PrefetchResult prefetch(const std::string& name, const std::string& url, bool unpack, bool executable,
                            const TaskContext& ctx) override;
    void forget(const std::string& store_path, const TaskContext& ctx) override;

private:
    std::filesystem::path prefetch_url_;
    std::filesystem::path store_;
};

struct ProcessResult {
    int exit_code = -1;
    std::string output;
};

// Runs argv[0] with the given arguments and captures stdout. The child is
// killed when the task is cancelled or its deadline passes.
ProcessResult run_process(const std::vector<std::string>& argv, const TaskContext& ctx);

// Parses "<hash>\n<store path>\n" as printed by nix-prefetch-url --print-path.
PrefetchResult parse_prefetch_output(std::string_view output);

// Re-encodes a Nix base-32 digest as standard base64.
std::string nix32_to_base64(std::string_view nix32);
