// reachability.cpp - Forward simulation, escape checks and proof construction

#include "relicrando/reachability.hpp"
#include "relicrando/errors.hpp"

#include <algorithm>
#include <functional>

namespace relicrando {

uint32_t Reachability::max_depth() const {
    uint32_t depth = 0;
    for (uint32_t wave : token_wave) {
        if (wave != INVALID_ID) {
            depth = std::max(depth, wave + 1);
        }
    }
    return depth;
}

Reachability simulate(const AccessibilityModel& model, const Assignment& assignment,
                      const std::vector<LocationId>& excluded) {
    const size_t num_locations = model.num_locations();

    Reachability reach;
    reach.token_wave.assign(model.num_tokens(), INVALID_ID);
    reach.location_wave.assign(num_locations, INVALID_ID);

    std::vector<bool> skip(num_locations, false);
    for (LocationId l : excluded) {
        if (l < num_locations) skip[l] = true;
    }

    std::vector<LocationId> opened;
    for (uint32_t wave = 0;; ++wave) {
        opened.clear();
        for (LocationId l = 0; l < num_locations; ++l) {
            if (skip[l] || reach.location_wave[l] != INVALID_ID) continue;
            const Location& location = model.location(l);
            bool open = location.unconditional();
            for (const auto& lock : location.locks) {
                if (open) break;
                open = lock.is_subset_of(reach.collected);
            }
            if (open) opened.push_back(l);
        }
        if (opened.empty()) break;

        // Tokens found in this wave are usable from the next one on
        for (LocationId l : opened) {
            reach.location_wave[l] = wave;
            TokenId token = assignment.token_at(l);
            if (token != INVALID_ID) {
                reach.token_wave[token] = wave;
                reach.collected.insert(token);
            }
        }
        reach.waves = wave + 1;
    }
    return reach;
}

std::optional<TokenSet> guaranteed_tokens(const AccessibilityModel& model, const Assignment& assignment,
                                          LocationId location, const TokenSet& route) {
    const Reachability without = simulate(model, assignment, {location});
    if (!route.is_subset_of(without.collected)) {
        return std::nullopt;
    }

    TokenSet guaranteed = route;
    without.collected.for_each([&](TokenId token) {
        if (route.contains(token)) return;
        LocationId source = assignment.location_of(token);
        const Reachability lacking = simulate(model, assignment, {location, source});
        if (!route.is_subset_of(lacking.collected)) {
            guaranteed.insert(token);
        }
    });
    return guaranteed;
}

bool escapes_satisfied(const AccessibilityModel& model, const Assignment& assignment,
                       std::string* offending) {
    for (LocationId l = 0; l < model.num_locations(); ++l) {
        const Location& location = model.location(l);
        if (!location.has_escapes()) continue;

        // An unconditional location is entered with the empty route
        std::vector<TokenSet> routes = location.locks;
        if (routes.empty()) {
            routes.emplace_back();
        }

        for (const auto& route : routes) {
            auto guaranteed = guaranteed_tokens(model, assignment, l, route);
            if (!guaranteed) continue;  // Route never grants access

            bool covered = false;
            for (const auto& escape : location.escapes) {
                if (escape.is_subset_of(*guaranteed)) {
                    covered = true;
                    break;
                }
            }
            if (!covered) {
                if (offending) *offending = location.id;
                return false;
            }
        }
    }
    return true;
}

std::optional<uint32_t> goal_depth(const AccessibilityModel& model, const Reachability& reach) {
    const auto& goal = model.goal();
    if (!goal) return std::nullopt;

    std::optional<uint32_t> best;
    for (const auto& lock : goal->locks) {
        if (!lock.is_subset_of(reach.collected)) continue;
        uint32_t depth = 0;
        lock.for_each([&](TokenId token) {
            depth = std::max(depth, reach.token_wave[token] + 1);
        });
        if (!best || depth < *best) best = depth;
    }
    return best;
}

ProofGraph build_proof(const AccessibilityModel& model, const Assignment& assignment,
                       const Reachability& reach) {
    std::vector<ProofNodePtr> nodes(model.num_tokens());

    // Locks are restricted to strictly earlier waves, so recursion terminates
    std::function<ProofNodePtr(TokenId)> node_for = [&](TokenId token) -> ProofNodePtr {
        if (nodes[token]) return nodes[token];
        const uint32_t wave = reach.token_wave[token];
        if (wave == INVALID_ID) {
            throw ProofError("token \"" + model.token(token).id + "\" is not collectable");
        }

        auto node = std::make_shared<ProofNode>();
        node->token = token;
        const Location& location = model.location(assignment.location_of(token));
        for (const auto& lock : location.locks) {
            bool earlier = true;
            lock.for_each([&](TokenId required) {
                if (reach.token_wave[required] == INVALID_ID || reach.token_wave[required] >= wave) {
                    earlier = false;
                }
            });
            if (!earlier) continue;

            ProofLock alternative;
            lock.for_each([&](TokenId required) {
                alternative.push_back(node_for(required));
            });
            node->locks.push_back(std::move(alternative));
        }
        if (!location.unconditional() && node->locks.empty()) {
            throw ProofError("no lock explains token \"" + model.token(token).id + "\"");
        }
        nodes[token] = node;
        return node;
    };

    ProofGraph graph;
    if (const auto& goal = model.goal()) {
        for (const auto& lock : goal->locks) {
            if (!lock.is_subset_of(reach.collected)) continue;
            ProofLock solution;
            lock.for_each([&](TokenId token) { solution.push_back(node_for(token)); });
            graph.solutions.push_back(std::move(solution));
        }
    } else {
        ProofLock solution;
        reach.collected.for_each([&](TokenId token) { solution.push_back(node_for(token)); });
        graph.solutions.push_back(std::move(solution));
    }
    return graph;
}

} // namespace relicrando
