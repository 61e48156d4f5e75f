#include <gtest/gtest.h>
#include "../src/config.hpp"
#include "../src/exception.hpp"
#include "../src/localization.hpp"

#include <sys/stat.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_root;
    Config config;

    void SetUp() override {
        init_localization();
        test_root = fs::absolute("tmp_config_test");
        if (fs::exists(test_root)) fs::remove_all(test_root);
        fs::create_directories(test_root);
    }

    void TearDown() override {
        if (fs::exists(test_root)) fs::remove_all(test_root);
    }

    fs::path write_config(const std::string& content) {
        fs::path p = test_root / "plugdb.conf";
        std::ofstream f(p);
        f << content;
        return p;
    }
};

TEST_F(ConfigTest, Defaults) {
    EXPECT_EQ(config.jobs, 16u);
    EXPECT_EQ(config.max_retries, 3);
    EXPECT_EQ(config.backoff_base, std::chrono::milliseconds(250));
    EXPECT_EQ(config.task_timeout, std::chrono::seconds(1200));
    EXPECT_EQ(config.plugin_indices.size(), 2u);
}

TEST_F(ConfigTest, LoadsSettings) {
    auto p = write_config(
        "# Crawl settings\n"
        "jobs = 4\n"
        "\n"
        "retries=0\n"
        "backoff_ms=10\n"
        "task_timeout_s = 60\n"
        "http_timeout_s = 30\n"
        "version_prefixes = 2025., 2026.,,\n"
        "nix_prefetch_url = /opt/nix/bin/nix-prefetch-url\n");
    load_config_file(p, config);

    EXPECT_EQ(config.jobs, 4u);
    EXPECT_EQ(config.max_retries, 0);
    EXPECT_EQ(config.backoff_base, std::chrono::milliseconds(10));
    EXPECT_EQ(config.task_timeout, std::chrono::seconds(60));
    EXPECT_EQ(config.http_timeout, std::chrono::seconds(30));
    EXPECT_EQ(config.version_prefixes, (std::vector<std::string>{"2025.", "2026."}));
    EXPECT_EQ(config.nix_prefetch_url, fs::path("/opt/nix/bin/nix-prefetch-url"));
    EXPECT_TRUE(config.nix_store.empty());
}

TEST_F(ConfigTest, InvalidFiles) {
    EXPECT_THROW(load_config_file(test_root / "missing.conf", config), PlugdbException);
    EXPECT_THROW(load_config_file(write_config("jobs 4\n"), config), PlugdbException);
    EXPECT_THROW(load_config_file(write_config("jobs=0\n"), config), PlugdbException);
    EXPECT_THROW(load_config_file(write_config("jobs=four\n"), config), PlugdbException);
    EXPECT_THROW(load_config_file(write_config("retries=-1\n"), config), PlugdbException);
    EXPECT_THROW(load_config_file(write_config("colour=blue\n"), config), PlugdbException);
}

TEST_F(ConfigTest, AllowedIdeVersions) {
    EXPECT_TRUE(allowed_ide_version(config, "2025.1"));
    EXPECT_TRUE(allowed_ide_version(config, "2024.3.5"));
    EXPECT_FALSE(allowed_ide_version(config, "2024.2.1"));
    EXPECT_FALSE(allowed_ide_version(config, "2024.3"));
    EXPECT_FALSE(allowed_ide_version(config, "2023.1"));
}

TEST_F(ConfigTest, ResolveToolPaths) {
    for (const char* name : {"nix-prefetch-url", "nix-store"}) {
        fs::path p = test_root / name;
        std::ofstream(p) << "#!/bin/sh\n";
        chmod(p.c_str(), 0755);
    }

    const char* old_path = getenv("PATH");
    const std::string saved = old_path ? old_path : "";
    setenv("PATH", ("/nonexistent:" + test_root.string()).c_str(), 1);

    config.nix_store = "/custom/nix-store";
    resolve_tool_paths(config);
    EXPECT_EQ(config.nix_prefetch_url, test_root / "nix-prefetch-url");
    EXPECT_EQ(config.nix_store, fs::path("/custom/nix-store"));

    Config missing;
    setenv("PATH", "/nonexistent", 1);
    EXPECT_THROW(resolve_tool_paths(missing), PlugdbException);

    setenv("PATH", saved.c_str(), 1);
}
