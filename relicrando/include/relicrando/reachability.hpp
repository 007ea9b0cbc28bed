#ifndef RELICRANDO_REACHABILITY_HPP
#define RELICRANDO_REACHABILITY_HPP

#include <relicrando/accessibility_model.hpp>
#include <relicrando/assignment.hpp>
#include <relicrando/proof.hpp>
#include <relicrando/token_set.hpp>
#include <optional>
#include <string>
#include <vector>

namespace relicrando {

/**
 * Outcome of a forward simulation.
 * Wave 0 holds the unconditional locations; a location opens in wave w when
 * one of its locks is covered by tokens collected in waves before w. A token
 * collected in wave w needs a dependency chain of w + 1 steps.
 */
struct Reachability {
    TokenSet collected;
    std::vector<uint32_t> token_wave;     // INVALID_ID when never collected
    std::vector<uint32_t> location_wave;  // INVALID_ID when never opened
    uint32_t waves = 0;

    bool reached(LocationId location) const { return location_wave[location] != INVALID_ID; }
    bool collected_all(size_t num_tokens) const { return collected.count() == num_tokens; }

    // Longest shortest chain over all collected tokens
    uint32_t max_depth() const;
};

// Starts with no tokens and opens locations until nothing changes.
// Open slots of a partial assignment open but yield nothing; excluded
// locations never open.
Reachability simulate(const AccessibilityModel& model, const Assignment& assignment,
                      const std::vector<LocationId>& excluded = {});

/**
 * Tokens a player is certain to hold when entering location through route.
 * That is route itself plus every token without which route cannot be
 * collected. Returns nullopt when route cannot be collected without the
 * location.
 */
std::optional<TokenSet> guaranteed_tokens(const AccessibilityModel& model, const Assignment& assignment,
                                          LocationId location, const TokenSet& route);

// Every route into a location with escape locks must cover one escape lock.
// offending receives the first failing location id.
bool escapes_satisfied(const AccessibilityModel& model, const Assignment& assignment,
                       std::string* offending = nullptr);

// Shortest chain reaching any goal lock; nullopt without a goal or when no
// goal lock is collectable
std::optional<uint32_t> goal_depth(const AccessibilityModel& model, const Reachability& reach);

// Raw proof DAG of a fully reachable assignment. Each node keeps the locks
// whose tokens were all collected in earlier waves.
ProofGraph build_proof(const AccessibilityModel& model, const Assignment& assignment,
                       const Reachability& reach);

} // namespace relicrando

#endif // RELICRANDO_REACHABILITY_HPP
