// candidate_bitset.hpp
// Growable bitset of sieve candidates.
// Stores 1 bit per integer in [1, upper]. A set bit means the integer is
// still a candidate (prime so far), a cleared bit means it is known
// composite. 0 and 1 are never candidates.
//
// Encoding:
//   integer n  →  word n / 64, bit n % 64
//
// Memory usage: ~n/8 bytes for integers up to n
//   10^8  →  ~12 MB
//   2^32  →  ~512 MB

#pragma once
#include <cstdint>
#include <vector>
#include <cassert>

namespace primetable {

// -------------------------------------------------------
// CandidateBitset: candidate flags for [1, upper].
// Backed by a vector of uint64_t words. Bits above upper
// are always 0, so word scans never need to mask them.
// -------------------------------------------------------
class CandidateBitset {
public:
    // Returned by the scans when nothing is found
    static constexpr uint64_t npos = ~0ULL;

    CandidateBitset() : upper_(1), words_(1, 0ULL) {}

    // Cover integers up to new_upper. The newly covered
    // integers in (upper, new_upper] start as candidates.
    // No-op when new_upper <= upper.
    void grow(uint64_t new_upper);

    // Back to the trivial state: upper = 1, nothing set.
    void reset();

    // -------------------------------------------------------
    // Core bit operations, only valid for 2 <= n <= upper
    // -------------------------------------------------------

    // Mark n as composite
    void clear(uint64_t n) {
        assert(n >= 2 && n <= upper_ && "clear: n out of range");
        words_[word_idx(n)] &= ~(1ULL << bit_idx(n));
    }

    // Test if n is still a candidate
    bool test(uint64_t n) const {
        assert(n <= upper_ && "test: n out of range");
        return (words_[word_idx(n)] >> bit_idx(n)) & 1ULL;
    }

    // Safe variant: false for anything outside [2, upper]
    bool is_candidate(uint64_t n) const {
        if (n < 2 || n > upper_) return false;
        return test(n);
    }

    // -------------------------------------------------------
    // Scans. All return npos when there is no match.
    // -------------------------------------------------------

    // Smallest candidate >= from
    uint64_t next_set(uint64_t from) const;

    // Largest candidate <= from
    uint64_t prev_set(uint64_t from) const;

    // Smallest non-candidate >= from, not above upper
    uint64_t next_clear(uint64_t from) const;

    // Number of candidates
    uint64_t count() const;

    // -------------------------------------------------------
    // Accessors
    // -------------------------------------------------------
    uint64_t upper()       const { return upper_; }
    uint64_t word_count()  const { return words_.size(); }
    const uint64_t* data() const { return words_.data(); }

    // Memory usage in bytes
    uint64_t memory_bytes() const {
        return words_.size() * sizeof(uint64_t);
    }

private:
    uint64_t upper_;
    std::vector<uint64_t> words_;

    // Set every bit in [low, high]
    void set_range(uint64_t low, uint64_t high);

    // Which uint64_t word holds the bit for n
    static inline constexpr uint64_t word_idx(uint64_t n) {
        return n / 64;
    }

    // Which bit within that word for n
    static inline constexpr uint64_t bit_idx(uint64_t n) {
        return n % 64;
    }
};

} // namespace primetable
