#ifndef RELICRANDO_CATALOG_HPP
#define RELICRANDO_CATALOG_HPP

#include <relicrando/accessibility_model.hpp>
#include <optional>
#include <string>
#include <vector>

namespace relicrando {
namespace catalog {

struct RelicEntry {
    const char* id;    // Ability token id
    const char* name;  // In-game relic name
};

// Every randomizable relic, in vanilla pickup order
const std::vector<RelicEntry>& relics();

// One base location per relic, identified by the relic's id, with the
// default lock table
const std::vector<LocationSpec>& base_locations();

// Guarded and equipment tier locations, identified by the item they replace
const std::vector<LocationSpec>& extension_locations();

// Base locations plus the extension locations enabled by mode
std::vector<LocationSpec> build_locations(ExtensionMode mode);

// Accepts either the relic id or its name (case-insensitive)
std::optional<RelicEntry> relic_from_name(const std::string& name);
std::optional<RelicEntry> relic_from_id(const std::string& id);

// Relic names map to the relic's location id, anything else is taken as an
// extension location name
std::string location_from_name(const std::string& name);

// Relic names map to their id, anything else is kept as given
std::string token_from_name(const std::string& name);

// Registers tokens and locations for mode with their default locks.
// Each extension location contributes the item it replaces as a token.
ModelBuilder make_builder(ExtensionMode mode);

} // namespace catalog
} // namespace relicrando

#endif // RELICRANDO_CATALOG_HPP
