#include "ide.hpp"

#include <array>
#include <functional>
#include <tuple>

namespace {

struct ProductInfo {
    IdeProduct product;
    std::string_view code;
    std::string_view key;
};

constexpr std::array<ProductInfo, 15> PRODUCTS = {{
    {IdeProduct::IntelliJIdea, "IU", "idea"},
    {IdeProduct::PhpStorm, "PS", "phpstorm"},
    {IdeProduct::WebStorm, "WS", "webstorm"},
    {IdeProduct::PyCharm, "PY", "pycharm"},
    {IdeProduct::RubyMine, "RM", "ruby-mine"},
    {IdeProduct::CLion, "CL", "clion"},
    {IdeProduct::GoLand, "GO", "goland"},
    {IdeProduct::DataGrip, "DB", "datagrip"},
    {IdeProduct::DataSpell, "DS", "dataspell"},
    {IdeProduct::Rider, "RD", "rider"},
    {IdeProduct::AndroidStudio, "AI", "android-studio"},
    {IdeProduct::RustRover, "RR", "rust-rover"},
    {IdeProduct::Aqua, "QA", "aqua"},
    {IdeProduct::Writerside, "WRS", "writerside"},
    {IdeProduct::Mps, "MPS", "mps"},
}};

const ProductInfo& info(IdeProduct product) {
    for (const auto& p : PRODUCTS) {
        if (p.product == product) return p;
    }
    // Every enumerator is listed above.
    return PRODUCTS.front();
}

} // anonymous namespace

std::optional<IdeProduct> product_from_code(std::string_view code) {
    for (const auto& p : PRODUCTS) {
        if (p.code == code) return p.product;
    }
    return std::nullopt;
}

std::string_view product_code(IdeProduct product) {
    return info(product).code;
}

std::optional<IdeProduct> product_from_key(std::string_view key) {
    for (const auto& p : PRODUCTS) {
        if (p.key == key) return p.product;
    }
    return std::nullopt;
}

std::string_view product_key(IdeProduct product) {
    return info(product).key;
}

std::string IdeIdentity::to_json_filename() const {
    return std::string(product_key(product)) + "-" + version + ".json";
}

std::string IdeIdentity::display_name() const {
    return std::string(product_key(product)) + " " + version;
}

std::optional<IdeIdentity> IdeIdentity::from_json_filename(std::string_view filename) {
    constexpr std::string_view suffix = ".json";
    if (!filename.ends_with(suffix)) return std::nullopt;
    filename.remove_suffix(suffix.size());

    const size_t dash = filename.rfind('-');
    if (dash == std::string_view::npos) return std::nullopt;

    auto product = product_from_key(filename.substr(0, dash));
    if (!product || dash + 1 == filename.size()) return std::nullopt;

    return IdeIdentity{*product, std::string(filename.substr(dash + 1)), ""};
}

bool operator==(const IdeIdentity& a, const IdeIdentity& b) {
    return a.product == b.product && a.version == b.version;
}

bool operator<(const IdeIdentity& a, const IdeIdentity& b) {
    return std::tie(a.product, a.version) < std::tie(b.product, b.version);
}

size_t IdeIdentityHash::operator()(const IdeIdentity& ide) const {
    size_t h = std::hash<int>{}(static_cast<int>(ide.product));
    return h ^ (std::hash<std::string>{}(ide.version) + 0x9e3779b9 + (h << 6) + (h >> 2));
}
