#include "storage.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <utility>
#include <vector>

using json = nlohmann::json;

namespace {

json parse_json_file(const fs::path& path) {
    try {
        return json::parse(read_text_file(path));
    } catch (const json::exception& e) {
        throw PlugdbException(string_format("error.parse_json_failed", path.string(), e.what()));
    }
}

PluginDatabase::EntryMap entries_from_json(const json& doc, const fs::path& path) {
    if (!doc.is_object()) {
        throw PlugdbException(string_format("error.parse_json_failed", path.string(), "expected an object"));
    }
    PluginDatabase::EntryMap entries;
    try {
        for (const auto& [flat_key, value] : doc.items()) {
            entries.emplace(PluginKey::parse(flat_key), PluginEntry{
                value.at("p").get<std::string>(),
                value.at("h").get<std::string>(),
            });
        }
    } catch (const json::exception& e) {
        throw PlugdbException(string_format("error.parse_json_failed", path.string(), e.what()));
    }
    return entries;
}

PluginDatabase::IdeMapping mapping_from_json(const json& doc, const fs::path& path) {
    // get<map> would also accept an array of [key, value] pairs
    if (!doc.is_object()) {
        throw PlugdbException(string_format("error.parse_json_failed", path.string(), "expected an object"));
    }
    try {
        return doc.get<PluginDatabase::IdeMapping>();
    } catch (const json::exception& e) {
        throw PlugdbException(string_format("error.parse_json_failed", path.string(), e.what()));
    }
}

} // anonymous namespace

PluginDatabase db_load(const fs::path& out_dir) {
    const fs::path file = out_dir / ALL_PLUGINS_JSON;
    if (!fs::exists(file)) {
        log_info(string_format("info.no_existing_db", file.string()));
        return PluginDatabase();
    }
    PluginDatabase db(entries_from_json(parse_json_file(file), file));
    log_info(string_format("info.loaded_entries", db.entry_count(), file.string()));
    return db;
}

PluginDatabase db_load_full(const fs::path& out_dir) {
    PluginDatabase db = db_load(out_dir);

    const fs::path ides_dir = out_dir / IDES_DIR;
    if (!fs::is_directory(ides_dir)) {
        throw PlugdbException(string_format("error.missing_ides_dir", ides_dir.string()));
    }

    size_t count = 0;
    for (const auto& file : fs::directory_iterator(ides_dir)) {
        if (!file.is_regular_file()) continue;
        auto ide = IdeIdentity::from_json_filename(file.path().filename().string());
        if (!ide) {
            log_warning(string_format("warning.invalid_ide_file", file.path().string()));
            continue;
        }
        db.set_ide_mapping(*ide, mapping_from_json(parse_json_file(file.path()), file.path()));
        ++count;
    }
    log_info(string_format("info.loaded_ide_tables", count));
    return db;
}

void db_save(const fs::path& out_dir, const PluginDatabase& db) {
    const fs::path ides_dir = out_dir / IDES_DIR;
    ensure_dir_exists(ides_dir);

    std::vector<std::pair<fs::path, fs::path>> pending;
    try {
        json all_plugins = json::object();
        for (const auto& [key, entry] : db.entries()) {
            all_plugins[key.flatten()] = {{"p", entry.path}, {"h", entry.hash}};
        }
        const fs::path all_plugins_path = out_dir / ALL_PLUGINS_JSON;
        log_debug(string_format("debug.writing_file", all_plugins_path.string()));
        pending.emplace_back(write_tmp_file(all_plugins_path, all_plugins.dump(2)), all_plugins_path);

        for (const auto& [ide, mapping] : db.ides()) {
            const fs::path ide_path = ides_dir / ide.to_json_filename();
            log_debug(string_format("debug.writing_file", ide_path.string()));
            pending.emplace_back(write_tmp_file(ide_path, json(mapping).dump(2)), ide_path);
        }
    } catch (const std::exception&) {
        for (const auto& [tmp, target] : pending) {
            std::error_code ec;
            fs::remove(tmp, ec);
        }
        throw;
    }

    for (const auto& [tmp, target] : pending) {
        commit_file(tmp, target);
    }
    log_info(string_format("info.saved_db", db.entry_count(), pending.size() - 1, out_dir.string()));
}
