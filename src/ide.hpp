#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

enum class IdeProduct {
    IntelliJIdea,
    PhpStorm,
    WebStorm,
    PyCharm,
    RubyMine,
    CLion,
    GoLand,
    DataGrip,
    DataSpell,
    Rider,
    AndroidStudio,
    RustRover,
    Aqua,
    Writerside,
    Mps,
};

// Upstream product code, e.g. "IU"
std::optional<IdeProduct> product_from_code(std::string_view code);
std::string_view product_code(IdeProduct product);

// Canonical short key used in file names, e.g. "idea"
std::optional<IdeProduct> product_from_key(std::string_view key);
std::string_view product_key(IdeProduct product);

// Identity of one IDE release. Equality, ordering and hashing use product and
// version only; the build number is only needed while resolving compatibility.
struct IdeIdentity {
    IdeProduct product;
    std::string version;
    std::string build_number;

    std::string to_json_filename() const;
    std::string display_name() const;

    // Build number is left empty.
    static std::optional<IdeIdentity> from_json_filename(std::string_view filename);
};

bool operator==(const IdeIdentity& a, const IdeIdentity& b);
bool operator<(const IdeIdentity& a, const IdeIdentity& b);

struct IdeIdentityHash {
    size_t operator()(const IdeIdentity& ide) const;
};
