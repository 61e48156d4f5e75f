#pragma once

#include "ide.hpp"

#include <compare>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

// Identity of one published plugin release.
struct PluginKey {
    static constexpr std::string_view SEPARATOR = "/--/";

    std::string id;
    std::string version;

    // "<id>/--/<version>", the persisted form
    std::string flatten() const;
    // Splits at the first separator. Throws PlugdbException if there is none.
    static PluginKey parse(std::string_view flat);

    auto operator<=>(const PluginKey&) const = default;
};

// Content address of a plugin artifact: download path relative to the
// marketplace prefix and the base64 sha256 of its (unpacked) contents.
struct PluginEntry {
    std::string path;
    std::string hash;

    bool operator==(const PluginEntry&) const = default;
};

// Entries are owned by one table; per-IDE tables refer to them by key only.
// All member functions are thread-safe.
class PluginDatabase {
public:
    using EntryMap = std::map<PluginKey, PluginEntry>;
    // plugin id -> version
    using IdeMapping = std::map<std::string, std::string>;
    using IdeTables = std::map<IdeIdentity, IdeMapping>;

    PluginDatabase() = default;
    explicit PluginDatabase(EntryMap entries);
    PluginDatabase(PluginDatabase&& other) noexcept;
    PluginDatabase& operator=(PluginDatabase&& other) noexcept;
    PluginDatabase(const PluginDatabase&) = delete;
    PluginDatabase& operator=(const PluginDatabase&) = delete;

    std::optional<PluginEntry> find_entry(const PluginKey& key) const;

    // Records that `ide` uses `version` of plugin `id`. The entry is stored
    // only if the key is new; returns true in that case.
    bool insert(const IdeIdentity& ide, const std::string& id, const std::string& version, const PluginEntry& entry);

    // Replaces the whole mapping of one IDE (used when loading from disk).
    void set_ide_mapping(const IdeIdentity& ide, IdeMapping mapping);

    // Drops every entry no IDE table refers to. Only valid with every IDE
    // table loaded. Returns the number of removed entries.
    size_t garbage_collect();

    EntryMap entries() const;
    IdeTables ides() const;
    size_t entry_count() const;

private:
    mutable std::mutex mtx;
    EntryMap entries_;
    IdeTables ides_;
};
