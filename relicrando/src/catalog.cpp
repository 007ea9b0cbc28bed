// catalog.cpp - Built-in relic table and default lock table

#include "relicrando/catalog.hpp"

#include <algorithm>
#include <cctype>

namespace relicrando {
namespace catalog {

namespace {

std::string lowercase(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

LocationSpec base(const char* relic, std::vector<LockSpec> locks) {
    return LocationSpec{relic, LocationKind::Base, ExtensionMode::None, relic, std::move(locks)};
}

LocationSpec extension(const char* item, ExtensionMode tier, std::vector<LockSpec> locks) {
    return LocationSpec{item, LocationKind::Extension, tier, item, std::move(locks)};
}

} // namespace

const std::vector<RelicEntry>& relics() {
    static const std::vector<RelicEntry> table = {
        {"B", "Soul of Bat"},
        {"f", "Fire of Bat"},
        {"E", "Echo of Bat"},
        {"e", "Force of Echo"},
        {"W", "Soul of Wolf"},
        {"p", "Power of Wolf"},
        {"s", "Skill of Wolf"},
        {"M", "Form of Mist"},
        {"P", "Power of Mist"},
        {"c", "Gas Cloud"},
        {"z", "Cube of Zoe"},
        {"o", "Spirit Orb"},
        {"V", "Gravity Boots"},
        {"L", "Leap Stone"},
        {"y", "Holy Symbol"},
        {"a", "Faerie Scroll"},
        {"J", "Jewel of Open"},
        {"U", "Merman Statue"},
        {"b", "Bat Card"},
        {"g", "Ghost Card"},
        {"F", "Faerie Card"},
        {"d", "Demon Card"},
        {"S", "Sword Card"},
        {"H", "Heart of Vlad"},
        {"T", "Tooth of Vlad"},
        {"R", "Rib of Vlad"},
        {"G", "Ring of Vlad"},
        {"Y", "Eye of Vlad"},
    };
    return table;
}

// Flight is Soul of Bat, or Gravity Boots with Leap Stone for high ledges.
// Mist passages need Form of Mist; doors need Jewel of Open.
const std::vector<LocationSpec>& base_locations() {
    static const std::vector<LocationSpec> table = {
        base("B", {{"M"}, {"V", "L"}}),
        base("f", {{"B"}}),
        base("E", {{"B"}}),
        base("e", {{"E"}}),
        base("W", {{"B"}, {"V"}}),
        base("p", {{"W"}}),
        base("s", {{"W", "B"}, {"W", "V"}}),
        base("M", {{"J"}}),
        base("P", {{"M", "B"}, {"M", "V", "L"}}),
        base("c", {{"M", "B"}, {"M", "V"}}),
        base("z", {}),
        base("o", {}),
        base("V", {{"J"}}),
        base("L", {{"J"}, {"B"}}),
        base("y", {{"U"}}),
        base("a", {}),
        base("J", {}),
        base("U", {{"J"}, {"B"}}),
        base("b", {}),
        base("g", {{"B"}}),
        base("F", {{"J"}}),
        base("d", {{"J", "B"}, {"J", "M"}}),
        base("S", {{"B", "E"}}),
        base("H", {{"B", "M"}, {"B", "c"}}),
        base("T", {{"B"}}),
        base("R", {{"B", "J"}}),
        base("G", {{"B", "y"}}),
        base("Y", {{"B", "U"}}),
    };
    return table;
}

const std::vector<LocationSpec>& extension_locations() {
    static const std::vector<LocationSpec> table = {
        extension("Crystal cloak", ExtensionMode::Guarded, {{"J"}}),
        extension("Mormegil", ExtensionMode::Guarded, {{"J", "B"}}),
        extension("Dark Blade", ExtensionMode::Guarded, {{"B"}}),
        extension("Ring of Arcana", ExtensionMode::Guarded, {{"B", "E"}}),
        extension("Trio", ExtensionMode::Guarded, {{"B", "M"}}),
        extension("Holy mail", ExtensionMode::Guarded, {{"J"}}),
        extension("Jewel sword", ExtensionMode::Guarded, {{"W", "M"}}),
        extension("Gold ring", ExtensionMode::Guarded, {{"B", "U"}}),
        extension("Basilard", ExtensionMode::Equipment, {}),
        extension("Sunglasses", ExtensionMode::Equipment, {{"B"}}),
        extension("Cloth cape", ExtensionMode::Equipment, {{"J"}}),
        extension("Mystic pendant", ExtensionMode::Equipment, {{"B"}}),
        extension("Ankh of Life", ExtensionMode::Equipment, {{"B", "J"}}),
        extension("Goggles", ExtensionMode::Equipment, {}),
    };
    return table;
}

std::vector<LocationSpec> build_locations(ExtensionMode mode) {
    return relicrando::build_locations(base_locations(), extension_locations(), mode);
}

std::optional<RelicEntry> relic_from_name(const std::string& name) {
    const std::string wanted = lowercase(name);
    for (const auto& relic : relics()) {
        if (lowercase(relic.name) == wanted) return relic;
    }
    return relic_from_id(name);
}

std::optional<RelicEntry> relic_from_id(const std::string& id) {
    for (const auto& relic : relics()) {
        if (id == relic.id) return relic;
    }
    return std::nullopt;
}

std::string location_from_name(const std::string& name) {
    if (auto relic = relic_from_name(name)) {
        return relic->id;
    }
    return name;
}

std::string token_from_name(const std::string& name) {
    if (auto relic = relic_from_name(name)) {
        return relic->id;
    }
    return name;
}

ModelBuilder make_builder(ExtensionMode mode) {
    ModelBuilder builder;
    for (const auto& relic : relics()) {
        builder.add_token(relic.id, relic.name);
    }
    for (const auto& spec : build_locations(mode)) {
        builder.add_location(spec);
        if (spec.kind == LocationKind::Extension) {
            builder.add_token(spec.vanilla_token);
        }
    }
    return builder;
}

} // namespace catalog
} // namespace relicrando
