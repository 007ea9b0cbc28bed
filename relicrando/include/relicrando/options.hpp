#ifndef RELICRANDO_OPTIONS_HPP
#define RELICRANDO_OPTIONS_HPP

#include <relicrando/accessibility_model.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace relicrando {

/**
 * Already-parsed randomizer options.
 *
 * Tokens and locations may be given by relic name or id; extension locations
 * by the item name they replace. Overrides replace the catalog defaults for
 * the named location.
 */
struct RandomizerOptions {
    struct Goal {
        uint32_t min_depth = 0;
        std::optional<uint32_t> max_depth;
        std::vector<LockSpec> locks;
    };

    // When false every token is pinned to its vanilla location
    bool relic_locations = true;
    ExtensionMode extension = ExtensionMode::Guarded;

    std::map<std::string, std::vector<LockSpec>> locks;    // location -> access locks
    std::map<std::string, std::vector<LockSpec>> escapes;  // location -> escape locks
    std::map<std::string, std::string> placed;             // location -> token
    std::optional<Goal> goal;
};

// Catalog model with the options merged in. Throws ModelError.
std::shared_ptr<const AccessibilityModel> build_model(const RandomizerOptions& options);

// Canonical text form of the options, independent of how they were written
std::string options_fingerprint(const RandomizerOptions& options);

// Seed for one attempt's private random stream.
// Identical (version, options, seed, nonce) always yield the same value.
uint64_t salt_seed(const std::string& version, const std::string& options_fingerprint,
                   const std::string& seed, uint64_t nonce);

// Three quarters of the cores, at least one
size_t worker_count_from_cores(size_t cores);

} // namespace relicrando

#endif // RELICRANDO_OPTIONS_HPP
