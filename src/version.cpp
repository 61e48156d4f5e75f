#include "version.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <algorithm>
#include <cctype>

namespace {

constexpr std::string_view WILDCARD_LOW = "0";
constexpr std::string_view WILDCARD_HIGH = "99999999";

struct BuildPart {
    bool numeric;
    std::string_view text;
};

bool is_separator(char c) {
    return c == '.' || c == '-' || c == '_' || c == '+';
}

std::vector<BuildPart> split_build(std::string_view build) {
    std::vector<BuildPart> parts;
    size_t start = 0;
    while (start <= build.size()) {
        size_t end = start;
        while (end < build.size() && !is_separator(build[end])) ++end;
        std::string_view part = build.substr(start, end - start);
        if (!part.empty()) {
            bool numeric = std::all_of(part.begin(), part.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
            parts.push_back({numeric, part});
        }
        start = end + 1;
    }
    return parts;
}

// Numeric comparison without overflow: strip leading zeros, then longer is larger.
int compare_numbers(std::string_view a, std::string_view b) {
    auto strip = [](std::string_view s) {
        size_t i = s.find_first_not_of('0');
        return i == std::string_view::npos ? std::string_view{} : s.substr(i);
    };
    a = strip(a);
    b = strip(b);
    if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
    int c = a.compare(b);
    return (c > 0) - (c < 0);
}

int compare_parts(const BuildPart* a, const BuildPart* b) {
    static constexpr BuildPart zero{true, "0"};
    // A missing part equals zero against a number and wins against text
    // ("231" == "231.0", "231" > "231.EAP").
    if (!a) {
        if (b->numeric) a = &zero;
        else return 1;
    }
    if (!b) {
        if (a->numeric) b = &zero;
        else return -1;
    }
    if (a->numeric && b->numeric) return compare_numbers(a->text, b->text);
    if (a->numeric != b->numeric) return a->numeric ? -1 : 1;
    int c = a->text.compare(b->text);
    return (c > 0) - (c < 0);
}

std::string replace_wildcards(std::string_view bound, std::string_view replacement) {
    std::string result;
    size_t start = 0;
    while (start <= bound.size()) {
        size_t end = bound.find('.', start);
        if (end == std::string_view::npos) end = bound.size();
        std::string_view segment = bound.substr(start, end - start);
        if (start > 0) result += '.';
        result += (segment == "*") ? replacement : segment;
        start = end + 1;
    }
    return result;
}

} // anonymous namespace

int compare_build_numbers(std::string_view a, std::string_view b) {
    const auto pa = split_build(a);
    const auto pb = split_build(b);
    if (pa.empty() || pb.empty()) {
        throw PlugdbException(string_format("error.invalid_build_number", std::string(pa.empty() ? a : b)));
    }

    const size_t len = std::max(pa.size(), pb.size());
    for (size_t i = 0; i < len; ++i) {
        int c = compare_parts(i < pa.size() ? &pa[i] : nullptr, i < pb.size() ? &pb[i] : nullptr);
        if (c != 0) return c;
    }
    return 0;
}

std::string lower_bound_build(std::string_view since) {
    return replace_wildcards(since, WILDCARD_LOW);
}

std::string upper_bound_build(std::string_view until) {
    return replace_wildcards(until, WILDCARD_HIGH);
}

bool build_in_range(std::string_view build, const PluginRelease& release) {
    if (release.since_build && compare_build_numbers(build, lower_bound_build(*release.since_build)) < 0) {
        return false;
    }
    if (release.until_build && compare_build_numbers(build, upper_bound_build(*release.until_build)) > 0) {
        return false;
    }
    return true;
}

std::optional<PluginRelease> supported_release(const IdeIdentity& ide, const std::vector<PluginRelease>& releases) {
    if (ide.build_number.empty()) {
        throw PlugdbException(string_format("error.missing_build_number", ide.display_name()));
    }
    for (const auto& release : releases) {
        if (build_in_range(ide.build_number, release)) {
            return release;
        }
    }
    return std::nullopt;
}
