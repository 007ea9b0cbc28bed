// placement_search.cpp - Randomized placement attempts

#include "relicrando/placement_search.hpp"
#include "relicrando/debug_log.hpp"
#include "relicrando/errors.hpp"
#include "relicrando/options.hpp"
#include "relicrando/reachability.hpp"

namespace relicrando {

PlacementSearch::PlacementSearch(std::shared_ptr<const AccessibilityModel> model)
    : model_(std::move(model)) {
    if (!model_) {
        throw std::invalid_argument("PlacementSearch requires a model");
    }
    for (TokenId t = 0; t < model_->num_tokens(); ++t) {
        if (!model_->is_pinned(t)) pool_.push_back(t);
    }
}

void PlacementSearch::check_feasible() const {
    for (LocationId l = 0; l < model_->num_locations(); ++l) {
        const Location& location = model_->location(l);
        const TokenId pinned = model_->pinned_token(l);
        if (!location.has_escapes() || pinned == INVALID_ID) continue;

        bool all_need_pinned = true;
        for (const auto& escape : location.escapes) {
            if (!escape.contains(pinned)) {
                all_need_pinned = false;
                break;
            }
        }
        if (all_need_pinned) {
            throw SearchError("every escape lock needs the token placed there", location.id);
        }
    }

    if (const auto& goal = model_->goal()) {
        if (goal->min_depth > model_->num_tokens()) {
            throw SearchError("goal depth " + std::to_string(goal->min_depth) +
                              " exceeds the token count " + std::to_string(model_->num_tokens()));
        }
        // Every chain has at least one step
        if (goal->max_depth && *goal->max_depth == 0) {
            throw SearchError("goal maximum depth 0 can never be met");
        }
    }
}

std::optional<Assignment> PlacementSearch::fill(std::mt19937_64& rng) const {
    Assignment assignment(model_->num_locations(), model_->num_tokens());
    for (const auto& constraint : model_->placed()) {
        assignment.place(constraint.location, constraint.token);
    }

    std::vector<TokenId> pool = pool_;
    std::vector<LocationId> candidates;
    while (!pool.empty()) {
        const Reachability reach = simulate(*model_, assignment);
        candidates.clear();
        for (LocationId l = 0; l < model_->num_locations(); ++l) {
            if (reach.reached(l) && assignment.is_open(l)) {
                candidates.push_back(l);
            }
        }
        if (candidates.empty()) {
            RELICRANDO_TRACE_LOG("fill dead end with %zu tokens left", pool.size());
            return std::nullopt;
        }

        std::uniform_int_distribution<size_t> pick_location(0, candidates.size() - 1);
        std::uniform_int_distribution<size_t> pick_token(0, pool.size() - 1);
        const LocationId location = candidates[pick_location(rng)];
        const size_t index = pick_token(rng);
        assignment.place(location, pool[index]);
        pool[index] = pool.back();
        pool.pop_back();
    }
    return assignment;
}

std::optional<PlacementResult> PlacementSearch::verify(const Assignment& assignment, Nonce nonce) const {
    if (!assignment.complete()) return std::nullopt;

    const Reachability reach = simulate(*model_, assignment);
    if (!reach.collected_all(model_->num_tokens())) {
        return std::nullopt;
    }

    std::string offending;
    if (!escapes_satisfied(*model_, assignment, &offending)) {
        RELICRANDO_TRACE_LOG("nonce %llu: escape rule fails at %s",
                             static_cast<unsigned long long>(nonce), offending.c_str());
        return std::nullopt;
    }

    uint32_t complexity = reach.max_depth();
    if (const auto& goal = model_->goal()) {
        const auto depth = goal_depth(*model_, reach);
        if (!depth || !goal->accepts(*depth)) {
            RELICRANDO_TRACE_LOG("nonce %llu: goal depth %u out of range",
                                 static_cast<unsigned long long>(nonce), depth ? *depth : 0u);
            return std::nullopt;
        }
        complexity = *depth;
    }

    PlacementResult result;
    result.assignment = assignment;
    result.proof = build_proof(*model_, assignment, reach);
    result.nonce = nonce;
    result.complexity = complexity;
    return result;
}

std::optional<PlacementResult> PlacementSearch::attempt(const SearchContext& context, Nonce nonce,
                                                        uint32_t rounds) const {
    std::mt19937_64 rng(salt_seed(context.version, context.options, context.seed, nonce));
    for (uint32_t round = 0; round < rounds; ++round) {
        auto assignment = fill(rng);
        if (!assignment) continue;
        auto result = verify(*assignment, nonce);
        if (result) {
            RELICRANDO_TRACE_LOG("nonce %llu: placement found in round %u",
                                 static_cast<unsigned long long>(nonce), round);
            return result;
        }
    }
    return std::nullopt;
}

// =============================================================================
// PlacementSearchWorker
// =============================================================================

void PlacementSearchWorker::bootstrap(const SearchContext& context) {
    auto search = std::make_unique<PlacementSearch>(context.model);
    search->check_feasible();
    context_ = context;
    search_ = std::move(search);
}

std::optional<PlacementResult> PlacementSearchWorker::attempt(Nonce nonce, uint32_t rounds) {
    if (!search_) {
        throw SearchError("attempt before bootstrap");
    }
    return search_->attempt(*context_, nonce, rounds);
}

} // namespace relicrando
