#ifndef RELICRANDO_ACCESSIBILITY_MODEL_HPP
#define RELICRANDO_ACCESSIBILITY_MODEL_HPP

#include <relicrando/types.hpp>
#include <relicrando/token_set.hpp>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace relicrando {

// Lock written with token ids, resolved when the model is built
using LockSpec = std::vector<std::string>;

struct Token {
    std::string id;    // Stable identifier, e.g. "B"
    std::string name;  // Display name, e.g. "Soul of Bat"
};

/**
 * A slot that receives exactly one token.
 * locks are OR-ed, the tokens inside a lock are AND-ed.
 * No locks means the location is reachable from the start.
 */
struct Location {
    std::string id;
    LocationKind kind = LocationKind::Base;
    std::vector<TokenSet> locks;
    std::vector<TokenSet> escapes;

    bool unconditional() const { return locks.empty(); }
    bool has_escapes() const { return !escapes.empty(); }
};

struct PlacedConstraint {
    TokenId token;
    LocationId location;
};

/**
 * Win-condition depth window.
 * Satisfied when the shortest dependency chain reaching one of the goal
 * locks is at least min_depth and at most max_depth (when set).
 */
struct ComplexityGoal {
    uint32_t min_depth = 0;
    std::optional<uint32_t> max_depth;
    std::vector<TokenSet> locks;

    bool accepts(uint32_t depth) const {
        if (depth < min_depth) return false;
        return !max_depth || depth <= *max_depth;
    }
};

/**
 * Location description before interning.
 * tier is the extension mode that first includes the location;
 * vanilla_token is the token found there in the unmodified game.
 */
struct LocationSpec {
    std::string id;
    LocationKind kind = LocationKind::Base;
    ExtensionMode tier = ExtensionMode::None;
    std::string vanilla_token;
    std::vector<LockSpec> locks;
};

// Base locations in order, then the extension locations enabled by mode.
// Equipment includes the Guarded tier.
std::vector<LocationSpec> build_locations(const std::vector<LocationSpec>& base_set,
                                          const std::vector<LocationSpec>& extension_set,
                                          ExtensionMode mode);

/**
 * Immutable puzzle instance shared read-only by every search worker.
 * Built through ModelBuilder, which validates it.
 */
class AccessibilityModel {
private:
    friend class ModelBuilder;

    std::vector<Token> tokens_;
    std::vector<Location> locations_;
    std::vector<PlacedConstraint> placed_;
    std::optional<ComplexityGoal> goal_;

    std::unordered_map<std::string, TokenId> token_index_;
    std::unordered_map<std::string, LocationId> location_index_;

    // Per location: pinned token or INVALID_ID
    std::vector<TokenId> pinned_at_;
    // Per token: pinned location or INVALID_ID
    std::vector<LocationId> pinned_location_;

public:
    size_t num_tokens() const { return tokens_.size(); }
    size_t num_locations() const { return locations_.size(); }

    const Token& token(TokenId id) const { return tokens_.at(id); }
    const Location& location(LocationId id) const { return locations_.at(id); }
    const std::vector<Token>& tokens() const { return tokens_; }
    const std::vector<Location>& locations() const { return locations_; }

    const std::vector<PlacedConstraint>& placed() const { return placed_; }
    const std::optional<ComplexityGoal>& goal() const { return goal_; }

    std::optional<TokenId> find_token(const std::string& id) const;
    std::optional<LocationId> find_location(const std::string& id) const;

    TokenId pinned_token(LocationId location) const { return pinned_at_.at(location); }
    bool is_pinned(TokenId token) const { return pinned_location_.at(token) != INVALID_ID; }

    TokenSet all_tokens() const;
};

// Throws ModelError on any structural inconsistency
void validate(const AccessibilityModel& model);

/**
 * Assembles an AccessibilityModel from string identifiers.
 * Unknown identifiers and duplicates are reported by build().
 */
class ModelBuilder {
private:
    struct PendingLocation {
        std::string id;
        LocationKind kind;
        std::vector<LockSpec> locks;
        std::vector<LockSpec> escapes;
    };

    std::vector<Token> tokens_;
    std::vector<PendingLocation> locations_;
    std::vector<std::pair<std::string, std::string>> placed_;  // token, location
    std::vector<std::string> errors_;

    struct PendingGoal {
        uint32_t min_depth;
        std::optional<uint32_t> max_depth;
        std::vector<LockSpec> locks;
    };
    std::optional<PendingGoal> goal_;

    PendingLocation* find_pending(const std::string& location);

public:
    ModelBuilder& add_token(const std::string& id, const std::string& name = {});
    ModelBuilder& add_location(const std::string& id, LocationKind kind = LocationKind::Base);
    ModelBuilder& add_location(const LocationSpec& spec);

    // Replaces the location's access locks
    ModelBuilder& set_locks(const std::string& location, const std::vector<LockSpec>& locks);
    ModelBuilder& add_lock(const std::string& location, const LockSpec& lock);
    ModelBuilder& set_escapes(const std::string& location, const std::vector<LockSpec>& escapes);

    ModelBuilder& place(const std::string& token, const std::string& location);
    ModelBuilder& set_goal(uint32_t min_depth, std::optional<uint32_t> max_depth,
                           const std::vector<LockSpec>& locks);
    ModelBuilder& clear_goal();

    bool has_location(const std::string& id) const;
    bool has_token(const std::string& id) const;

    std::shared_ptr<const AccessibilityModel> build() const;
};

} // namespace relicrando

#endif // RELICRANDO_ACCESSIBILITY_MODEL_HPP
