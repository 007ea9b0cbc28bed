// options.cpp - Merging randomizer options into the catalog model

#include "relicrando/options.hpp"
#include "relicrando/catalog.hpp"

#include <algorithm>
#include <set>
#include <sstream>

namespace relicrando {

namespace {

std::vector<LockSpec> resolve_locks(const std::vector<LockSpec>& locks) {
    std::vector<LockSpec> resolved;
    resolved.reserve(locks.size());
    for (const auto& lock : locks) {
        LockSpec tokens;
        for (const auto& name : lock) {
            tokens.push_back(catalog::token_from_name(name));
        }
        resolved.push_back(std::move(tokens));
    }
    return resolved;
}

// Tokens inside a lock are unordered; sort them so equal options print equally
std::string format_locks(const std::vector<LockSpec>& locks) {
    std::vector<std::string> parts;
    for (const auto& lock : resolve_locks(locks)) {
        LockSpec sorted = lock;
        std::sort(sorted.begin(), sorted.end());
        std::string part;
        for (size_t i = 0; i < sorted.size(); ++i) {
            if (i > 0) part += "+";
            part += sorted[i];
        }
        parts.push_back(part);
    }
    std::string text;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) text += "|";
        text += parts[i];
    }
    return text;
}

const char* extension_name(ExtensionMode mode) {
    switch (mode) {
        case ExtensionMode::None: return "none";
        case ExtensionMode::Guarded: return "guarded";
        case ExtensionMode::Equipment: return "equipment";
    }
    return "none";
}

} // namespace

std::shared_ptr<const AccessibilityModel> build_model(const RandomizerOptions& options) {
    ModelBuilder builder = catalog::make_builder(options.extension);
    const auto locations = catalog::build_locations(options.extension);

    for (const auto& [location, locks] : options.locks) {
        builder.set_locks(catalog::location_from_name(location), resolve_locks(locks));
    }
    for (const auto& [location, escapes] : options.escapes) {
        builder.set_escapes(catalog::location_from_name(location), resolve_locks(escapes));
    }

    std::map<std::string, std::string> placed;
    for (const auto& [location, token] : options.placed) {
        placed[catalog::location_from_name(location)] = catalog::token_from_name(token);
    }
    if (!options.relic_locations) {
        // User placements take precedence over vanilla ones
        std::set<std::string> user_tokens;
        for (const auto& entry : placed) {
            user_tokens.insert(entry.second);
        }
        for (const auto& spec : locations) {
            if (user_tokens.count(spec.vanilla_token) == 0) {
                placed.emplace(spec.id, spec.vanilla_token);
            }
        }
    }
    for (const auto& [location, token] : placed) {
        builder.place(token, location);
    }

    if (options.goal) {
        builder.set_goal(options.goal->min_depth, options.goal->max_depth,
                         resolve_locks(options.goal->locks));
    }

    return builder.build();
}

std::string options_fingerprint(const RandomizerOptions& options) {
    std::ostringstream out;
    out << "relics:" << (options.relic_locations ? 1 : 0);
    out << ";extension:" << extension_name(options.extension);

    // Maps are already ordered; keys go through the same name resolution as
    // build_model so "Soul of Bat" and "B" fingerprint identically
    std::map<std::string, std::string> locks;
    for (const auto& [location, spec] : options.locks) {
        locks[catalog::location_from_name(location)] = format_locks(spec);
    }
    for (const auto& [location, text] : locks) {
        out << ";lock:" << location << "=" << text;
    }

    std::map<std::string, std::string> escapes;
    for (const auto& [location, spec] : options.escapes) {
        escapes[catalog::location_from_name(location)] = format_locks(spec);
    }
    for (const auto& [location, text] : escapes) {
        out << ";escape:" << location << "=" << text;
    }

    std::map<std::string, std::string> placed;
    for (const auto& [location, token] : options.placed) {
        placed[catalog::location_from_name(location)] = catalog::token_from_name(token);
    }
    for (const auto& [location, token] : placed) {
        out << ";place:" << location << "=" << token;
    }

    if (options.goal) {
        out << ";goal:" << options.goal->min_depth << "-";
        if (options.goal->max_depth) {
            out << *options.goal->max_depth;
        }
        out << "=" << format_locks(options.goal->locks);
    }
    return out.str();
}

uint64_t salt_seed(const std::string& version, const std::string& options_fingerprint,
                   const std::string& seed, uint64_t nonce) {
    std::ostringstream salt;
    salt << "{\"version\":\"" << version
         << "\",\"options\":\"" << options_fingerprint
         << "\",\"seed\":\"" << seed
         << "\",\"nonce\":" << nonce << "}";
    const std::string text = salt.str();

    // FNV-1a
    uint64_t h = 14695981039346656037ULL;
    constexpr uint64_t FNV_PRIME = 1099511628211ULL;
    for (unsigned char c : text) {
        h ^= c;
        h *= FNV_PRIME;
    }
    return h;
}

size_t worker_count_from_cores(size_t cores) {
    return std::max<size_t>(3 * cores / 4, 1);
}

} // namespace relicrando
