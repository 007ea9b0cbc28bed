// assignment.cpp - Location/token mapping

#include "relicrando/assignment.hpp"
#include "relicrando/accessibility_model.hpp"

#include <stdexcept>

namespace relicrando {

void Assignment::place(LocationId location, TokenId token) {
    if (location >= token_at_.size() || token >= location_of_.size()) {
        throw std::out_of_range("Assignment slot out of range");
    }
    if (token_at_[location] != INVALID_ID || location_of_[token] != INVALID_ID) {
        throw std::invalid_argument("Assignment slot already taken");
    }
    token_at_[location] = token;
    location_of_[token] = location;
    ++filled_;
}

std::map<std::string, std::string> Assignment::to_named_map(const AccessibilityModel& model) const {
    std::map<std::string, std::string> named;
    for (LocationId l = 0; l < token_at_.size(); ++l) {
        if (token_at_[l] != INVALID_ID) {
            named.emplace(model.location(l).id, model.token(token_at_[l]).id);
        }
    }
    return named;
}

} // namespace relicrando
