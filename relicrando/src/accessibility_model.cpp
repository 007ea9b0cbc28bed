// accessibility_model.cpp - Model construction and structural validation

#include "relicrando/accessibility_model.hpp"
#include "relicrando/errors.hpp"

#include <unordered_set>

namespace relicrando {

namespace {

bool tokens_in_range(const TokenSet& lock, size_t num_tokens) {
    bool ok = true;
    lock.for_each([&](TokenId token) {
        if (token >= num_tokens) ok = false;
    });
    return ok;
}

std::string join_errors(const std::vector<std::string>& errors) {
    std::string message;
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) message += "; ";
        message += errors[i];
    }
    return message;
}

} // namespace

// =============================================================================
// Location Sets
// =============================================================================

std::vector<LocationSpec> build_locations(const std::vector<LocationSpec>& base_set,
                                          const std::vector<LocationSpec>& extension_set,
                                          ExtensionMode mode) {
    std::vector<LocationSpec> locations(base_set.begin(), base_set.end());
    if (mode == ExtensionMode::None) {
        return locations;
    }

    // Guarded first, then equipment, each in catalog order
    for (const auto& spec : extension_set) {
        if (spec.tier == ExtensionMode::Guarded) {
            locations.push_back(spec);
        }
    }
    if (mode == ExtensionMode::Equipment) {
        for (const auto& spec : extension_set) {
            if (spec.tier == ExtensionMode::Equipment) {
                locations.push_back(spec);
            }
        }
    }
    return locations;
}

// =============================================================================
// AccessibilityModel
// =============================================================================

std::optional<TokenId> AccessibilityModel::find_token(const std::string& id) const {
    auto it = token_index_.find(id);
    if (it == token_index_.end()) return std::nullopt;
    return it->second;
}

std::optional<LocationId> AccessibilityModel::find_location(const std::string& id) const {
    auto it = location_index_.find(id);
    if (it == location_index_.end()) return std::nullopt;
    return it->second;
}

TokenSet AccessibilityModel::all_tokens() const {
    TokenSet all;
    for (TokenId t = 0; t < tokens_.size(); ++t) {
        all.insert(t);
    }
    return all;
}

void validate(const AccessibilityModel& model) {
    const size_t num_tokens = model.num_tokens();
    const size_t num_locations = model.num_locations();

    std::unordered_set<std::string> seen;
    for (const auto& token : model.tokens()) {
        if (!seen.insert(token.id).second) {
            throw ModelError("token \"" + token.id + "\" is defined twice");
        }
    }
    seen.clear();
    for (const auto& location : model.locations()) {
        if (!seen.insert(location.id).second) {
            throw ModelError("location \"" + location.id + "\" appears twice in the lock table");
        }
    }

    if (num_tokens != num_locations) {
        throw ModelError(std::to_string(num_tokens) + " tokens for " +
                         std::to_string(num_locations) + " locations");
    }

    for (const auto& location : model.locations()) {
        for (const auto& lock : location.locks) {
            if (!tokens_in_range(lock, num_tokens)) {
                throw ModelError("lock of location \"" + location.id + "\" references an unknown token");
            }
        }
        for (const auto& escape : location.escapes) {
            if (!tokens_in_range(escape, num_tokens)) {
                throw ModelError("escape requirement of location \"" + location.id +
                                 "\" references an unknown token");
            }
        }
    }

    std::vector<bool> token_pinned(num_tokens, false);
    std::vector<bool> location_pinned(num_locations, false);
    for (const auto& placed : model.placed()) {
        if (placed.token >= num_tokens || placed.location >= num_locations) {
            throw ModelError("placed constraint references an unknown token or location");
        }
        const auto& location = model.location(placed.location);
        const auto& token = model.token(placed.token);
        if (token_pinned[placed.token]) {
            throw ModelError("token \"" + token.id + "\" is placed twice");
        }
        if (location_pinned[placed.location]) {
            throw ModelError("location \"" + location.id + "\" has two placed tokens");
        }
        token_pinned[placed.token] = true;
        location_pinned[placed.location] = true;

        // A location whose every lock needs its own token can never open
        if (!location.unconditional()) {
            bool all_need_self = true;
            for (const auto& lock : location.locks) {
                if (!lock.contains(placed.token)) {
                    all_need_self = false;
                    break;
                }
            }
            if (all_need_self) {
                throw ModelError("token \"" + token.id + "\" is placed at \"" + location.id +
                                 "\" but every lock of that location requires it");
            }
        }
    }

    if (const auto& goal = model.goal()) {
        if (goal->max_depth && goal->min_depth > *goal->max_depth) {
            throw ModelError("complexity goal minimum " + std::to_string(goal->min_depth) +
                             " exceeds maximum " + std::to_string(*goal->max_depth));
        }
        if (goal->locks.empty()) {
            throw ModelError("complexity goal has no locks");
        }
        for (const auto& lock : goal->locks) {
            if (lock.empty()) {
                throw ModelError("complexity goal has an empty lock");
            }
            if (!tokens_in_range(lock, num_tokens)) {
                throw ModelError("complexity goal references an unknown token");
            }
        }
    }
}

// =============================================================================
// ModelBuilder
// =============================================================================

ModelBuilder::PendingLocation* ModelBuilder::find_pending(const std::string& location) {
    for (auto& pending : locations_) {
        if (pending.id == location) return &pending;
    }
    return nullptr;
}

bool ModelBuilder::has_location(const std::string& id) const {
    for (const auto& pending : locations_) {
        if (pending.id == id) return true;
    }
    return false;
}

bool ModelBuilder::has_token(const std::string& id) const {
    for (const auto& token : tokens_) {
        if (token.id == id) return true;
    }
    return false;
}

ModelBuilder& ModelBuilder::add_token(const std::string& id, const std::string& name) {
    if (has_token(id)) {
        errors_.push_back("token \"" + id + "\" is defined twice");
        return *this;
    }
    tokens_.push_back(Token{id, name.empty() ? id : name});
    return *this;
}

ModelBuilder& ModelBuilder::add_location(const std::string& id, LocationKind kind) {
    if (has_location(id)) {
        errors_.push_back("location \"" + id + "\" appears twice in the lock table");
        return *this;
    }
    locations_.push_back(PendingLocation{id, kind, {}, {}});
    return *this;
}

ModelBuilder& ModelBuilder::add_location(const LocationSpec& spec) {
    add_location(spec.id, spec.kind);
    if (PendingLocation* pending = find_pending(spec.id)) {
        pending->locks = spec.locks;
    }
    return *this;
}

ModelBuilder& ModelBuilder::set_locks(const std::string& location, const std::vector<LockSpec>& locks) {
    PendingLocation* pending = find_pending(location);
    if (!pending) {
        errors_.push_back("locks given for unknown location \"" + location + "\"");
        return *this;
    }
    pending->locks = locks;
    return *this;
}

ModelBuilder& ModelBuilder::add_lock(const std::string& location, const LockSpec& lock) {
    PendingLocation* pending = find_pending(location);
    if (!pending) {
        errors_.push_back("lock given for unknown location \"" + location + "\"");
        return *this;
    }
    pending->locks.push_back(lock);
    return *this;
}

ModelBuilder& ModelBuilder::set_escapes(const std::string& location, const std::vector<LockSpec>& escapes) {
    PendingLocation* pending = find_pending(location);
    if (!pending) {
        errors_.push_back("escape requirement given for unknown location \"" + location + "\"");
        return *this;
    }
    pending->escapes = escapes;
    return *this;
}

ModelBuilder& ModelBuilder::place(const std::string& token, const std::string& location) {
    placed_.emplace_back(token, location);
    return *this;
}

ModelBuilder& ModelBuilder::set_goal(uint32_t min_depth, std::optional<uint32_t> max_depth,
                                     const std::vector<LockSpec>& locks) {
    goal_ = PendingGoal{min_depth, max_depth, locks};
    return *this;
}

ModelBuilder& ModelBuilder::clear_goal() {
    goal_.reset();
    return *this;
}

std::shared_ptr<const AccessibilityModel> ModelBuilder::build() const {
    std::vector<std::string> errors = errors_;
    auto model = std::make_shared<AccessibilityModel>();

    model->tokens_ = tokens_;
    for (TokenId t = 0; t < model->tokens_.size(); ++t) {
        model->token_index_.emplace(model->tokens_[t].id, t);
    }

    auto resolve = [&](const LockSpec& spec, const std::string& what, TokenSet& out) {
        for (const auto& name : spec) {
            auto it = model->token_index_.find(name);
            if (it == model->token_index_.end()) {
                errors.push_back(what + " references unknown token \"" + name + "\"");
                continue;
            }
            out.insert(it->second);
        }
    };

    for (const auto& pending : locations_) {
        Location location;
        location.id = pending.id;
        location.kind = pending.kind;

        bool has_empty_lock = false;
        for (const auto& spec : pending.locks) {
            TokenSet lock;
            resolve(spec, "lock of location \"" + pending.id + "\"", lock);
            if (spec.empty()) has_empty_lock = true;
            location.locks.push_back(std::move(lock));
        }
        // An empty lock opens the location unconditionally
        if (has_empty_lock) {
            location.locks.clear();
        }

        for (const auto& spec : pending.escapes) {
            TokenSet escape;
            resolve(spec, "escape requirement of location \"" + pending.id + "\"", escape);
            location.escapes.push_back(std::move(escape));
        }

        model->location_index_.emplace(location.id, static_cast<LocationId>(model->locations_.size()));
        model->locations_.push_back(std::move(location));
    }

    for (const auto& [token, location] : placed_) {
        auto t = model->token_index_.find(token);
        auto l = model->location_index_.find(location);
        if (t == model->token_index_.end()) {
            errors.push_back("placed constraint references unknown token \"" + token + "\"");
            continue;
        }
        if (l == model->location_index_.end()) {
            errors.push_back("placed constraint references unknown location \"" + location + "\"");
            continue;
        }
        model->placed_.push_back(PlacedConstraint{t->second, l->second});
    }

    if (goal_) {
        ComplexityGoal goal;
        goal.min_depth = goal_->min_depth;
        goal.max_depth = goal_->max_depth;
        for (const auto& spec : goal_->locks) {
            TokenSet lock;
            resolve(spec, "complexity goal", lock);
            goal.locks.push_back(std::move(lock));
        }
        model->goal_ = std::move(goal);
    }

    if (!errors.empty()) {
        throw ModelError(join_errors(errors));
    }

    validate(*model);

    model->pinned_at_.assign(model->locations_.size(), INVALID_ID);
    model->pinned_location_.assign(model->tokens_.size(), INVALID_ID);
    for (const auto& placed : model->placed_) {
        model->pinned_at_[placed.location] = placed.token;
        model->pinned_location_[placed.token] = placed.location;
    }

    return model;
}

} // namespace relicrando
