#ifndef RELICRANDO_ASSIGNMENT_HPP
#define RELICRANDO_ASSIGNMENT_HPP

#include <relicrando/types.hpp>
#include <map>
#include <string>
#include <vector>

namespace relicrando {

class AccessibilityModel;

/**
 * Location -> token mapping, possibly partial while a placement is being
 * filled. Keeps the reverse index so both directions are O(1).
 */
class Assignment {
private:
    std::vector<TokenId> token_at_;
    std::vector<LocationId> location_of_;
    size_t filled_ = 0;

public:
    Assignment() = default;

    Assignment(size_t num_locations, size_t num_tokens)
        : token_at_(num_locations, INVALID_ID)
        , location_of_(num_tokens, INVALID_ID) {}

    // Puts token at location. Both must currently be free.
    void place(LocationId location, TokenId token);

    TokenId token_at(LocationId location) const { return token_at_.at(location); }
    LocationId location_of(TokenId token) const { return location_of_.at(token); }

    bool is_open(LocationId location) const { return token_at_.at(location) == INVALID_ID; }
    bool complete() const { return filled_ == token_at_.size(); }

    size_t num_locations() const { return token_at_.size(); }
    size_t num_filled() const { return filled_; }

    // Location id -> token id, the form the patch writer consumes
    std::map<std::string, std::string> to_named_map(const AccessibilityModel& model) const;

    bool operator==(const Assignment& other) const {
        return token_at_ == other.token_at_;
    }

    bool operator!=(const Assignment& other) const {
        return !(*this == other);
    }
};

} // namespace relicrando

#endif // RELICRANDO_ASSIGNMENT_HPP
