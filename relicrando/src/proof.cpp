// proof.cpp - Minimized solution helpers

#include "relicrando/proof.hpp"

namespace relicrando {

std::vector<TokenId> Solution::tokens() const {
    if (const auto* leaf = std::get_if<SolutionLeaf>(&node)) {
        return {leaf->token};
    }
    return std::get<SolutionCompound>(node).tokens;
}

const std::vector<Solution>& Solution::requirements() const {
    static const std::vector<Solution> none;
    if (const auto* compound = std::get_if<SolutionCompound>(&node)) {
        return compound->requirements;
    }
    return none;
}

namespace {

ProofNodePtr expand(const Solution& solution) {
    const std::vector<TokenId> chain = solution.tokens();

    // Build from the end of the chain: the last token carries the requirements
    auto last = std::make_shared<ProofNode>();
    last->token = chain.back();
    if (!solution.requirements().empty()) {
        ProofLock lock;
        for (const auto& requirement : solution.requirements()) {
            lock.push_back(expand(requirement));
        }
        last->locks.push_back(std::move(lock));
    }

    ProofNodePtr next = last;
    for (size_t i = chain.size() - 1; i-- > 0;) {
        auto node = std::make_shared<ProofNode>();
        node->token = chain[i];
        node->locks.push_back(ProofLock{next});
        next = node;
    }
    return next;
}

} // namespace

ProofGraph expand_solutions(const std::vector<Solution>& solutions) {
    ProofGraph graph;
    ProofLock lock;
    for (const auto& solution : solutions) {
        lock.push_back(expand(solution));
    }
    graph.solutions.push_back(std::move(lock));
    return graph;
}

} // namespace relicrando
