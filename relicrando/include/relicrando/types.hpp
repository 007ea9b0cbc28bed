#ifndef RELICRANDO_TYPES_HPP
#define RELICRANDO_TYPES_HPP

#include <cstdint>

namespace relicrando {

// Dense indices into the model's token and location tables.
using TokenId = uint32_t;
using LocationId = uint32_t;

// Attempt counter handed out by the orchestrator.
using Nonce = uint64_t;

constexpr uint32_t INVALID_ID = UINT32_MAX;

enum class LocationKind {
    Base,       // Always present, identified by the ability normally found there
    Extension   // Present only with an extension mode, identified by the item it replaces
};

enum class ExtensionMode {
    None,
    Guarded,
    Equipment   // Includes the guarded locations
};

} // namespace relicrando

#endif // RELICRANDO_TYPES_HPP
