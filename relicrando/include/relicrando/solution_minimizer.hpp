#ifndef RELICRANDO_SOLUTION_MINIMIZER_HPP
#define RELICRANDO_SOLUTION_MINIMIZER_HPP

#include <relicrando/proof.hpp>
#include <relicrando/token_set.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

namespace relicrando {

/**
 * Cost of one alternative: the deepest requirement, the summed requirement
 * depths, and the number of requirements (average = weight / count).
 */
struct SolutionScore {
    uint32_t depth = 0;
    uint64_t weight = 0;
    uint64_t count = 0;

    // Lexicographic (depth, weight, average) ascending.
    // Averages compare as weight * other.count < other.weight * count.
    bool better_than(const SolutionScore& other) const;
};

struct MinimizedProof {
    std::vector<Solution> solutions;
    uint32_t depth = 0;  // Depth of the chosen proof target alternative
};

/**
 * Reduces a raw proof DAG to the simplest explanation:
 *   1. pick the cheapest alternative for every node,
 *   2. drop requirements whose ability closure is already covered by the
 *      deeper requirements beside them,
 *   3. collapse single-requirement chains.
 * The top-level target lock is kept whole. Throws ProofError on a malformed
 * graph.
 */
class SolutionMinimizer {
public:
    MinimizedProof minimize(const ProofGraph& graph);

private:
    struct Choice {
        size_t lock_index = 0;
        SolutionScore score;
        bool in_progress = true;
    };

    struct Requirement;

    struct Minified {
        SolutionScore score;
        std::vector<Requirement> requirements;
    };

    struct Requirement {
        TokenId token = INVALID_ID;
        uint32_t depth = 1;
        std::unique_ptr<Minified> solution;  // Null for a leaf
    };

    // Requirement depth of node: 1 for a leaf, else 1 + its best lock depth
    uint32_t requirement_depth(const ProofNode* node);
    SolutionScore score_lock(const ProofLock& lock);
    const Choice& choose(const ProofNode* node);

    Requirement materialize(const ProofNode* node);
    Minified materialize_lock(const ProofLock& lock);

    const TokenSet& closure(const Requirement& requirement);
    void prune_subsets(Requirement& requirement);

    static Solution collapse(const Requirement& requirement);

    std::unordered_map<const ProofNode*, Choice> choices_;
    std::unordered_map<TokenId, TokenSet> closures_;
};

} // namespace relicrando

#endif // RELICRANDO_SOLUTION_MINIMIZER_HPP
