#include "plugin_db.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <set>

std::string PluginKey::flatten() const {
    std::string flat;
    flat.reserve(id.size() + SEPARATOR.size() + version.size());
    flat += id;
    flat += SEPARATOR;
    flat += version;
    return flat;
}

PluginKey PluginKey::parse(std::string_view flat) {
    const size_t pos = flat.find(SEPARATOR);
    if (pos == std::string_view::npos) {
        throw PlugdbException(string_format("error.invalid_plugin_key", std::string(flat)));
    }
    return PluginKey{std::string(flat.substr(0, pos)), std::string(flat.substr(pos + SEPARATOR.size()))};
}

PluginDatabase::PluginDatabase(EntryMap entries) : entries_(std::move(entries)) {}

PluginDatabase::PluginDatabase(PluginDatabase&& other) noexcept {
    std::lock_guard<std::mutex> lock(other.mtx);
    entries_ = std::move(other.entries_);
    ides_ = std::move(other.ides_);
}

PluginDatabase& PluginDatabase::operator=(PluginDatabase&& other) noexcept {
    if (this != &other) {
        std::scoped_lock lock(mtx, other.mtx);
        entries_ = std::move(other.entries_);
        ides_ = std::move(other.ides_);
    }
    return *this;
}

std::optional<PluginEntry> PluginDatabase::find_entry(const PluginKey& key) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = entries_.find(key);
    if (it != entries_.end()) return it->second;
    return std::nullopt;
}

bool PluginDatabase::insert(const IdeIdentity& ide, const std::string& id, const std::string& version, const PluginEntry& entry) {
    std::lock_guard<std::mutex> lock(mtx);
    auto [it, inserted] = entries_.try_emplace(PluginKey{id, version}, entry);
    if (!inserted && it->second != entry) {
        // Same release, different artifact: upstream replaced a published file.
        log_warning(string_format("warning.entry_mismatch", it->first.flatten(), it->second.hash, entry.hash));
    }
    ides_[ide][id] = version;
    return inserted;
}

void PluginDatabase::set_ide_mapping(const IdeIdentity& ide, IdeMapping mapping) {
    std::lock_guard<std::mutex> lock(mtx);
    ides_[ide] = std::move(mapping);
}

size_t PluginDatabase::garbage_collect() {
    std::lock_guard<std::mutex> lock(mtx);
    std::set<PluginKey> used_keys;
    for (const auto& [ide, mapping] : ides_) {
        for (const auto& [id, version] : mapping) {
            used_keys.insert(PluginKey{id, version});
        }
    }

    size_t removed = std::erase_if(entries_, [&](const auto& item) {
        return !used_keys.contains(item.first);
    });
    return removed;
}

PluginDatabase::EntryMap PluginDatabase::entries() const {
    std::lock_guard<std::mutex> lock(mtx);
    return entries_;
}

PluginDatabase::IdeTables PluginDatabase::ides() const {
    std::lock_guard<std::mutex> lock(mtx);
    return ides_;
}

size_t PluginDatabase::entry_count() const {
    std::lock_guard<std::mutex> lock(mtx);
    return entries_.size();
}
