#ifndef RELICRANDO_TOKEN_SET_HPP
#define RELICRANDO_TOKEN_SET_HPP

#include <relicrando/types.hpp>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <vector>

namespace relicrando {

/**
 * Dense bitset over TokenIds.
 * Used for locks (AND-sets), collected inventories and ability closures.
 * Storage grows on insert; missing words read as zero.
 */
class TokenSet {
private:
    std::vector<uint64_t> words_;

    static size_t word_index(TokenId token) { return token / 64; }
    static uint64_t bit_mask(TokenId token) { return 1ULL << (token % 64); }

    uint64_t word_at(size_t index) const {
        return index < words_.size() ? words_[index] : 0;
    }

public:
    TokenSet() = default;

    TokenSet(std::initializer_list<TokenId> tokens) {
        for (TokenId token : tokens) {
            insert(token);
        }
    }

    explicit TokenSet(const std::vector<TokenId>& tokens) {
        for (TokenId token : tokens) {
            insert(token);
        }
    }

    bool contains(TokenId token) const {
        return (word_at(word_index(token)) & bit_mask(token)) != 0;
    }

    void insert(TokenId token) {
        size_t index = word_index(token);
        if (index >= words_.size()) {
            words_.resize(index + 1, 0);
        }
        words_[index] |= bit_mask(token);
    }

    void erase(TokenId token) {
        size_t index = word_index(token);
        if (index < words_.size()) {
            words_[index] &= ~bit_mask(token);
        }
    }

    void clear() {
        words_.clear();
    }

    bool empty() const {
        for (uint64_t word : words_) {
            if (word != 0) return false;
        }
        return true;
    }

    size_t count() const {
        size_t total = 0;
        for (uint64_t word : words_) {
            total += __builtin_popcountll(word);
        }
        return total;
    }

    // True when every token in this set is also in other
    bool is_subset_of(const TokenSet& other) const {
        for (size_t i = 0; i < words_.size(); ++i) {
            if ((words_[i] & ~other.word_at(i)) != 0) return false;
        }
        return true;
    }

    // In-place union
    void merge(const TokenSet& other) {
        if (other.words_.size() > words_.size()) {
            words_.resize(other.words_.size(), 0);
        }
        for (size_t i = 0; i < other.words_.size(); ++i) {
            words_[i] |= other.words_[i];
        }
    }

    // Visit tokens in ascending id order
    template<typename F>
    void for_each(F&& f) const {
        for (size_t w = 0; w < words_.size(); ++w) {
            uint64_t word = words_[w];
            while (word) {
                size_t bit = __builtin_ctzll(word);
                f(static_cast<TokenId>(w * 64 + bit));
                word &= word - 1;  // Clear lowest set bit
            }
        }
    }

    std::vector<TokenId> to_vector() const {
        std::vector<TokenId> tokens;
        tokens.reserve(count());
        for_each([&tokens](TokenId token) { tokens.push_back(token); });
        return tokens;
    }

    bool operator==(const TokenSet& other) const {
        size_t n = std::max(words_.size(), other.words_.size());
        for (size_t i = 0; i < n; ++i) {
            if (word_at(i) != other.word_at(i)) return false;
        }
        return true;
    }

    bool operator!=(const TokenSet& other) const {
        return !(*this == other);
    }
};

} // namespace relicrando

#endif // RELICRANDO_TOKEN_SET_HPP
