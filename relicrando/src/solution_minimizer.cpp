// solution_minimizer.cpp - Cheapest explanation of a proof DAG

#include "relicrando/solution_minimizer.hpp"
#include "relicrando/errors.hpp"

#include <algorithm>

namespace relicrando {

bool SolutionScore::better_than(const SolutionScore& other) const {
    if (depth != other.depth) return depth < other.depth;
    if (weight != other.weight) return weight < other.weight;
    return weight * other.count < other.weight * count;
}

// =============================================================================
// Scoring
// =============================================================================

uint32_t SolutionMinimizer::requirement_depth(const ProofNode* node) {
    if (!node) {
        throw ProofError("null node in lock");
    }
    if (node->is_leaf()) return 1;
    return 1 + choose(node).score.depth;
}

SolutionScore SolutionMinimizer::score_lock(const ProofLock& lock) {
    if (lock.empty()) {
        throw ProofError("empty lock");
    }
    SolutionScore score;
    for (const auto& node : lock) {
        uint32_t depth = requirement_depth(node.get());
        score.depth = std::max(score.depth, depth);
        score.weight += depth;
    }
    score.count = lock.size();
    return score;
}

const SolutionMinimizer::Choice& SolutionMinimizer::choose(const ProofNode* node) {
    auto it = choices_.find(node);
    if (it != choices_.end()) {
        if (it->second.in_progress) {
            throw ProofError("cycle through token " + std::to_string(node->token));
        }
        return it->second;
    }
    choices_.emplace(node, Choice{});

    Choice best;
    for (size_t i = 0; i < node->locks.size(); ++i) {
        SolutionScore score = score_lock(node->locks[i]);
        // Strictly better only, so the first of equal alternatives stays
        if (i == 0 || score.better_than(best.score)) {
            best.lock_index = i;
            best.score = score;
        }
    }
    best.in_progress = false;

    Choice& stored = choices_[node];
    stored = best;
    return stored;
}

// =============================================================================
// Materialization
// =============================================================================

SolutionMinimizer::Requirement SolutionMinimizer::materialize(const ProofNode* node) {
    Requirement requirement;
    requirement.token = node->token;
    if (node->is_leaf()) {
        requirement.depth = 1;
        return requirement;
    }
    const Choice& choice = choose(node);
    requirement.depth = 1 + choice.score.depth;
    requirement.solution = std::make_unique<Minified>(materialize_lock(node->locks[choice.lock_index]));
    return requirement;
}

SolutionMinimizer::Minified SolutionMinimizer::materialize_lock(const ProofLock& lock) {
    Minified minified;
    minified.score = score_lock(lock);
    minified.requirements.reserve(lock.size());
    for (const auto& node : lock) {
        minified.requirements.push_back(materialize(node.get()));
    }
    return minified;
}

// =============================================================================
// Pruning
// =============================================================================

const TokenSet& SolutionMinimizer::closure(const Requirement& requirement) {
    auto it = closures_.find(requirement.token);
    if (it != closures_.end()) return it->second;

    TokenSet abilities;
    abilities.insert(requirement.token);
    if (requirement.solution) {
        for (const auto& sub : requirement.solution->requirements) {
            abilities.insert(sub.token);
            abilities.merge(closure(sub));
        }
    }
    return closures_.emplace(requirement.token, std::move(abilities)).first->second;
}

void SolutionMinimizer::prune_subsets(Requirement& requirement) {
    if (!requirement.solution) return;

    auto& nodes = requirement.solution->requirements;
    std::stable_sort(nodes.begin(), nodes.end(), [](const Requirement& a, const Requirement& b) {
        return a.depth > b.depth;
    });

    TokenSet abilities;
    for (size_t i = 0; i < nodes.size(); ++i) {
        prune_subsets(nodes[i]);
        abilities.merge(closure(nodes[i]));
        for (size_t j = i + 1; j < nodes.size();) {
            if (closure(nodes[j]).is_subset_of(abilities)) {
                nodes.erase(nodes.begin() + static_cast<std::ptrdiff_t>(j));
            } else {
                ++j;
            }
        }
    }
}

// =============================================================================
// Collapsing
// =============================================================================

Solution SolutionMinimizer::collapse(const Requirement& requirement) {
    std::vector<TokenId> tokens;
    const Requirement* current = &requirement;
    while (current->solution && current->solution->requirements.size() == 1) {
        tokens.push_back(current->token);
        current = &current->solution->requirements.front();
    }
    tokens.push_back(current->token);

    if (current->solution) {
        SolutionCompound compound;
        compound.tokens = std::move(tokens);
        for (const auto& sub : current->solution->requirements) {
            compound.requirements.push_back(collapse(sub));
        }
        return Solution(std::move(compound));
    }
    if (tokens.size() == 1) {
        return Solution(SolutionLeaf{tokens.front()});
    }
    return Solution(SolutionCompound{std::move(tokens), {}});
}

MinimizedProof SolutionMinimizer::minimize(const ProofGraph& graph) {
    if (graph.solutions.empty()) {
        throw ProofError("proof has no solutions");
    }
    choices_.clear();
    closures_.clear();

    size_t best_index = 0;
    SolutionScore best;
    for (size_t i = 0; i < graph.solutions.size(); ++i) {
        SolutionScore score = score_lock(graph.solutions[i]);
        if (i == 0 || score.better_than(best)) {
            best_index = i;
            best = score;
        }
    }

    Minified top = materialize_lock(graph.solutions[best_index]);
    for (auto& requirement : top.requirements) {
        // Each top-level requirement is pruned against its own closures
        closures_.clear();
        prune_subsets(requirement);
    }

    MinimizedProof proof;
    proof.depth = top.score.depth;
    proof.solutions.reserve(top.requirements.size());
    for (const auto& requirement : top.requirements) {
        proof.solutions.push_back(collapse(requirement));
    }
    return proof;
}

} // namespace relicrando
