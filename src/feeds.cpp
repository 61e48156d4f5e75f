#include "feeds.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <nlohmann/json.hpp>

#include <future>
#include <memory>
#include <mutex>
#include <set>

using json = nlohmann::json;

namespace {

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const {
        if (doc) {
            xmlFreeDoc(doc);
        }
    }
};
using XmlDocHandle = std::unique_ptr<xmlDoc, XmlDocDeleter>;

XmlDocHandle parse_xml(std::string_view xml) {
    static std::once_flag init_flag;
    std::call_once(init_flag, [] { xmlInitParser(); });

    XmlDocHandle doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), nullptr, nullptr,
                                   XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc || !xmlDocGetRootElement(doc.get())) {
        throw PlugdbException(get_string("error.parse_xml_failed"));
    }
    return doc;
}

bool is_element(const xmlNode* node, std::string_view name) {
    return node->type == XML_ELEMENT_NODE && name == reinterpret_cast<const char*>(node->name);
}

std::vector<const xmlNode*> children(const xmlNode* parent, std::string_view name) {
    std::vector<const xmlNode*> result;
    for (const xmlNode* child = parent->children; child; child = child->next) {
        if (is_element(child, name)) result.push_back(child);
    }
    return result;
}

const xmlNode* first_child(const xmlNode* parent, std::string_view name) {
    for (const xmlNode* child = parent->children; child; child = child->next) {
        if (is_element(child, name)) return child;
    }
    return nullptr;
}

std::optional<std::string> attribute(const xmlNode* node, const char* name) {
    xmlChar* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name));
    if (!value) return std::nullopt;
    std::string result(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return result;
}

std::string text(const xmlNode* node) {
    xmlChar* content = xmlNodeGetContent(node);
    if (!content) return {};
    std::string result(reinterpret_cast<const char*>(content));
    xmlFree(content);
    const auto first = result.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    return result.substr(first, result.find_last_not_of(" \t\r\n") - first + 1);
}

std::optional<std::string> non_empty(std::optional<std::string> value) {
    if (value && value->empty()) return std::nullopt;
    return value;
}

} // anonymous namespace

std::optional<std::vector<PluginRelease>> parse_plugin_details(std::string_view xml) {
    XmlDocHandle doc = parse_xml(xml);
    const xmlNode* root = xmlDocGetRootElement(doc.get());

    const xmlNode* category = first_child(root, "category");
    if (!category) return std::nullopt;

    std::vector<PluginRelease> releases;
    for (const xmlNode* plugin : children(category, "idea-plugin")) {
        const xmlNode* version = first_child(plugin, "version");
        if (!version) {
            throw PlugdbException(string_format("error.details_missing_field", "version"));
        }
        PluginRelease release;
        release.version = text(version);
        if (const xmlNode* idea_version = first_child(plugin, "idea-version")) {
            release.since_build = non_empty(attribute(idea_version, "since-build"));
            release.until_build = non_empty(attribute(idea_version, "until-build"));
        }
        releases.push_back(std::move(release));
    }
    return releases;
}

std::vector<IdeIdentity> parse_jetbrains_updates(std::string_view xml, const Config& config) {
    XmlDocHandle doc = parse_xml(xml);
    const xmlNode* root = xmlDocGetRootElement(doc.get());

    std::set<IdeProduct> already_processed;
    std::vector<IdeIdentity> versions;

    for (const xmlNode* product : children(root, "product")) {
        for (const xmlNode* code : children(product, "code")) {
            auto ide = product_from_code(text(code));
            if (!ide || !already_processed.insert(*ide).second) continue;

            for (const xmlNode* channel : children(product, "channel")) {
                auto id = attribute(channel, "id");
                if (!id || !id->ends_with("RELEASE-licensing-RELEASE")) continue;

                for (const xmlNode* build : children(channel, "build")) {
                    auto version = attribute(build, "version");
                    auto number = attribute(build, "number");
                    if (!version || !number) {
                        throw PlugdbException(string_format("error.updates_missing_field", std::string(product_key(*ide))));
                    }
                    if (!allowed_ide_version(config, *version)) {
                        log_warning(string_format("warning.ide_too_old", std::string(product_key(*ide)), *version));
                        continue;
                    }
                    auto full_number = non_empty(attribute(build, "fullNumber"));
                    versions.push_back(IdeIdentity{*ide, *version, full_number ? *full_number : *number});
                }
            }
        }
    }
    return versions;
}

std::vector<IdeIdentity> parse_android_studio_releases(std::string_view json_text, const Config& config) {
    std::vector<IdeIdentity> versions;
    const std::string_view key = product_key(IdeProduct::AndroidStudio);
    try {
        const json body = json::parse(json_text);
        for (const auto& item : body.at("content").at("item")) {
            auto version = item.at("version").get<std::string>();
            auto build = item.at("build").get<std::string>();
            if (!build.starts_with("AI-")) {
                throw PlugdbException(string_format("error.unexpected_product_code", build));
            }
            // Every channel is accepted: all of them are packaged downstream.
            if (!allowed_ide_version(config, version)) {
                log_warning(string_format("warning.ide_too_old", std::string(key), version));
                continue;
            }
            versions.push_back(IdeIdentity{IdeProduct::AndroidStudio, version, item.at("platformBuild").get<std::string>()});
        }
    } catch (const json::exception& e) {
        throw PlugdbException(string_format("error.parse_json_failed", config.android_studio_releases_url, e.what()));
    }
    return versions;
}

std::vector<std::string> parse_plugin_index(std::string_view json_text) {
    try {
        return json::parse(json_text).get<std::vector<std::string>>();
    } catch (const json::exception& e) {
        throw PlugdbException(string_format("error.parse_json_failed", "plugin index", e.what()));
    }
}

namespace {

std::string fetch_text(const std::string& url, HttpClient& http) {
    HttpResponse response = http.get(url, TaskContext::unbounded());
    if (!response.ok()) {
        throw PlugdbException(string_format("error.http_status", url, response.status));
    }
    return std::move(response.body);
}

} // anonymous namespace

std::vector<IdeIdentity> collect_ides(const Config& config, HttpClient& http) {
    auto jetbrains = std::async(std::launch::async, [&] {
        return parse_jetbrains_updates(fetch_text(config.jetbrains_updates_url, http), config);
    });
    auto android_studio = std::async(std::launch::async, [&] {
        return parse_android_studio_releases(fetch_text(config.android_studio_releases_url, http), config);
    });

    std::vector<IdeIdentity> versions = jetbrains.get();
    auto more = android_studio.get();
    versions.insert(versions.end(), more.begin(), more.end());
    return versions;
}

std::vector<std::string> fetch_plugin_index(const std::string& url, HttpClient& http) {
    return parse_plugin_index(fetch_text(url, http));
}
