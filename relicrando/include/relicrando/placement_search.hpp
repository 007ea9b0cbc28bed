#ifndef RELICRANDO_PLACEMENT_SEARCH_HPP
#define RELICRANDO_PLACEMENT_SEARCH_HPP

#include <relicrando/accessibility_model.hpp>
#include <relicrando/assignment.hpp>
#include <relicrando/proof.hpp>
#include <relicrando/types.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>

namespace relicrando {

// Everything a worker needs to reproduce an attempt
struct SearchContext {
    std::shared_ptr<const AccessibilityModel> model;
    std::string version;
    std::string options;  // Options fingerprint
    std::string seed;
};

struct PlacementResult {
    Assignment assignment;
    ProofGraph proof;
    Nonce nonce = 0;
    uint32_t complexity = 0;  // Goal depth, or the deepest chain without a goal
};

/**
 * Randomized forward fill with verification.
 *
 * Each try opens the unconditional locations, then repeatedly puts a random
 * pool token into a random open location reachable with what has been
 * collected so far. Pinned tokens start in place. A try succeeds when every
 * token is collectable, every escape rule holds and the goal depth is in
 * range.
 */
class PlacementSearch {
public:
    explicit PlacementSearch(std::shared_ptr<const AccessibilityModel> model);

    // Throws SearchError when no assignment can ever satisfy the model
    void check_feasible() const;

    // One forward fill; nullopt on a dead end
    std::optional<Assignment> fill(std::mt19937_64& rng) const;

    // Full check of a complete assignment
    std::optional<PlacementResult> verify(const Assignment& assignment, Nonce nonce) const;

    // Up to rounds tries on the stream derived from (context, nonce)
    std::optional<PlacementResult> attempt(const SearchContext& context, Nonce nonce,
                                           uint32_t rounds) const;

    const AccessibilityModel& model() const { return *model_; }

private:
    std::shared_ptr<const AccessibilityModel> model_;
    std::vector<TokenId> pool_;  // Tokens not pinned anywhere
};

// =============================================================================
// Worker interface
// =============================================================================

/**
 * One logical search worker. bootstrap() is called once per search with the
 * full context before the first attempt. Implementations raise SearchError
 * for internal contradictions; any other exception is reported as well.
 */
class PlacementWorker {
public:
    virtual ~PlacementWorker() = default;

    virtual void bootstrap(const SearchContext& context) = 0;
    virtual std::optional<PlacementResult> attempt(Nonce nonce, uint32_t rounds) = 0;
};

class PlacementSearchWorker : public PlacementWorker {
public:
    void bootstrap(const SearchContext& context) override;
    std::optional<PlacementResult> attempt(Nonce nonce, uint32_t rounds) override;

private:
    std::optional<SearchContext> context_;
    std::unique_ptr<PlacementSearch> search_;
};

// Creates the worker with the given index
using PlacementWorkerFactory = std::function<std::unique_ptr<PlacementWorker>(size_t)>;

} // namespace relicrando

#endif // RELICRANDO_PLACEMENT_SEARCH_HPP
