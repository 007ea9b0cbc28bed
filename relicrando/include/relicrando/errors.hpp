#ifndef RELICRANDO_ERRORS_HPP
#define RELICRANDO_ERRORS_HPP

#include <relicrando/types.hpp>
#include <stdexcept>
#include <string>

namespace relicrando {

// Base of every error the randomizer core reports
class RandomizerError : public std::runtime_error {
public:
    explicit RandomizerError(const std::string& message)
        : std::runtime_error(message) {}
};

// Malformed accessibility model. Raised before any search starts.
class ModelError : public RandomizerError {
public:
    explicit ModelError(const std::string& message)
        : RandomizerError("Model error: " + message) {}
};

// No worker found a valid placement within the dispatch limit.
// The caller may retry; next_nonce() is where the counter stopped.
class SearchExhausted : public RandomizerError {
public:
    SearchExhausted(const std::string& seed, Nonce next_nonce)
        : RandomizerError("Search exhausted for seed \"" + seed +
                          "\" (next nonce " + std::to_string(next_nonce) + ")")
        , seed_(seed)
        , next_nonce_(next_nonce) {}

    const std::string& seed() const noexcept { return seed_; }
    Nonce next_nonce() const noexcept { return next_nonce_; }

private:
    std::string seed_;
    Nonce next_nonce_;
};

/**
 * A worker hit an internal contradiction while exploring.
 * Workers raise it without context; the orchestrator re-raises it with the
 * seed and nonce so the failure can be reproduced.
 */
class SearchError : public RandomizerError {
public:
    explicit SearchError(const std::string& detail, const std::string& location = {})
        : RandomizerError(format(detail, location, nullptr, 0))
        , detail_(detail)
        , location_(location) {}

    SearchError(const std::string& detail, const std::string& location,
                const std::string& seed, Nonce nonce)
        : RandomizerError(format(detail, location, &seed, nonce))
        , detail_(detail)
        , location_(location)
        , seed_(seed)
        , nonce_(nonce)
        , has_context_(true) {}

    const std::string& detail() const noexcept { return detail_; }
    const std::string& location() const noexcept { return location_; }
    const std::string& seed() const noexcept { return seed_; }
    Nonce nonce() const noexcept { return nonce_; }
    bool has_context() const noexcept { return has_context_; }

private:
    static std::string format(const std::string& detail, const std::string& location,
                              const std::string* seed, Nonce nonce) {
        std::string message = "Search error: " + detail;
        if (!location.empty()) {
            message += " (location: " + location + ")";
        }
        if (seed) {
            message += " [seed \"" + *seed + "\", nonce " + std::to_string(nonce) + "]";
        }
        return message;
    }

    std::string detail_;
    std::string location_;
    std::string seed_;
    Nonce nonce_{0};
    bool has_context_{false};
};

// Malformed proof DAG. Always a programming error.
class ProofError : public RandomizerError {
public:
    explicit ProofError(const std::string& message)
        : RandomizerError("Proof error: " + message) {}
};

} // namespace relicrando

#endif // RELICRANDO_ERRORS_HPP
