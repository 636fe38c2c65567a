// candidate_bitset.cpp
// Word-at-a-time scans over the candidate bitset.
// Scans skip whole zero (or all-ones) words and use the count-trailing /
// count-leading zero builtins to locate the bit inside a word.

#include "candidate_bitset.hpp"

namespace primetable {

// Mask with bits [0, b] set
static inline uint64_t low_mask(uint64_t b) {
    return b == 63 ? ~0ULL : ((1ULL << (b + 1)) - 1);
}

void CandidateBitset::grow(uint64_t new_upper) {
    if (new_upper <= upper_) return;

    uint64_t old_upper = upper_;
    words_.resize(word_idx(new_upper) + 1, 0ULL);
    upper_ = new_upper;
    set_range(old_upper + 1, new_upper);
}

void CandidateBitset::reset() {
    words_.assign(1, 0ULL);
    words_.shrink_to_fit();
    upper_ = 1;
}

void CandidateBitset::set_range(uint64_t low, uint64_t high) {
    // 0 and 1 never become candidates
    if (low < 2) low = 2;
    if (low > high) return;

    uint64_t first = word_idx(low);
    uint64_t last  = word_idx(high);

    if (first == last) {
        words_[first] |= low_mask(bit_idx(high)) & (~0ULL << bit_idx(low));
        return;
    }

    words_[first] |= ~0ULL << bit_idx(low);
    for (uint64_t w = first + 1; w < last; w++)
        words_[w] = ~0ULL;
    words_[last] |= low_mask(bit_idx(high));
}

uint64_t CandidateBitset::next_set(uint64_t from) const {
    if (from > upper_) return npos;

    uint64_t w = word_idx(from);
    uint64_t word = words_[w] & (~0ULL << bit_idx(from));

    for (;;) {
        if (word != 0)
            return w * 64 + __builtin_ctzll(word);
        if (++w == words_.size())
            return npos;
        word = words_[w];
    }
}

uint64_t CandidateBitset::prev_set(uint64_t from) const {
    if (from > upper_) from = upper_;

    uint64_t w = word_idx(from);
    uint64_t word = words_[w] & low_mask(bit_idx(from));

    for (;;) {
        if (word != 0)
            return w * 64 + 63 - __builtin_clzll(word);
        if (w == 0)
            return npos;
        word = words_[--w];
    }
}

uint64_t CandidateBitset::next_clear(uint64_t from) const {
    if (from > upper_) return npos;

    uint64_t w = word_idx(from);
    uint64_t word = ~words_[w] & (~0ULL << bit_idx(from));

    for (;;) {
        if (word != 0) {
            uint64_t n = w * 64 + __builtin_ctzll(word);
            return n <= upper_ ? n : npos;
        }
        if (++w == words_.size())
            return npos;
        word = ~words_[w];
    }
}

uint64_t CandidateBitset::count() const {
    uint64_t total = 0;
    for (uint64_t word : words_)
        total += __builtin_popcountll(word);
    return total;
}

} // namespace primetable
