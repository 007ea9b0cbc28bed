#ifndef RELICRANDO_PROOF_HPP
#define RELICRANDO_PROOF_HPP

#include <relicrando/types.hpp>
#include <memory>
#include <variant>
#include <vector>

namespace relicrando {

// =============================================================================
// Raw proof DAG
// =============================================================================
// Produced by the placement search. A node states that its token is obtainable;
// each entry of locks is one alternative, an AND-set of nodes that must all be
// obtainable first. A node without locks sits at an unconditional location.
// Nodes are shared between alternatives, so the structure is a DAG.

struct ProofNode;
using ProofNodePtr = std::shared_ptr<const ProofNode>;
using ProofLock = std::vector<ProofNodePtr>;

struct ProofNode {
    TokenId token = INVALID_ID;
    std::vector<ProofLock> locks;

    bool is_leaf() const { return locks.empty(); }
};

// solutions are the alternative ways of satisfying the proof target
struct ProofGraph {
    std::vector<ProofLock> solutions;
};

// =============================================================================
// Minimized proof tree
// =============================================================================
// Output of SolutionMinimizer. A compound lists a chain of tokens, each needing
// the next, with the requirements of the last token of the chain.

struct Solution;

struct SolutionLeaf {
    TokenId token = INVALID_ID;

    bool operator==(const SolutionLeaf& other) const { return token == other.token; }
};

struct SolutionCompound {
    std::vector<TokenId> tokens;
    std::vector<Solution> requirements;

    bool operator==(const SolutionCompound& other) const;
};

struct Solution {
    std::variant<SolutionLeaf, SolutionCompound> node;

    Solution() = default;
    Solution(SolutionLeaf leaf) : node(std::move(leaf)) {}
    Solution(SolutionCompound compound) : node(std::move(compound)) {}

    bool is_leaf() const { return std::holds_alternative<SolutionLeaf>(node); }

    // Chain tokens in order; a single token for a leaf
    std::vector<TokenId> tokens() const;

    // Requirements of the chain's last token; empty for a leaf
    const std::vector<Solution>& requirements() const;

    bool operator==(const Solution& other) const { return node == other.node; }
    bool operator!=(const Solution& other) const { return !(*this == other); }
};

inline bool SolutionCompound::operator==(const SolutionCompound& other) const {
    return tokens == other.tokens && requirements == other.requirements;
}

// Rebuilds a raw graph with a single solution from a minimized tree
ProofGraph expand_solutions(const std::vector<Solution>& solutions);

} // namespace relicrando

#endif // RELICRANDO_PROOF_HPP
