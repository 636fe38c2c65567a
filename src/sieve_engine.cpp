// sieve_engine.cpp
// Growth and rank/value translation for the incremental sieve.
// Parallelization strategy for growth: divide the NEW region into
// word-aligned segments, one per thread. Each thread owns its words
// exclusively, so crossing-off needs no atomics and no locks.

#include "sieve_engine.hpp"
#include "sieve_error.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>
#include <omp.h>

namespace primetable {

static inline uint64_t isqrt(uint64_t n) {
    uint64_t r = std::sqrt((double)n);
    while (r * r > n) r--;
    while ((r + 1) * (r + 1) <= n) r++;
    return r;
}

// Clear every multiple of each base prime inside [low, high].
// Multiples below p*p were already crossed off by smaller primes.
static void mark_segment(CandidateBitset& bits, uint64_t low, uint64_t high,
                         const std::vector<uint64_t>& base_primes) {
    for (uint64_t p : base_primes) {
        uint64_t first = ((low + p - 1) / p) * p;
        if (first < p * p) first = p * p;

        for (uint64_t j = first; j <= high; j += p)
            bits.clear(j);
    }
}

SieveEngine::SieveEngine(const SieveOptions& options)
    : options_(options)
    , count_(0)
    , last_(0)
    , generation_(0)
{}

void SieveEngine::extend(uint64_t bound) {
    if (bound > options_.max_bound)
        throw capacity_exceeded("cannot extend sieve to " + std::to_string(bound) +
                                ", limit is " + std::to_string(options_.max_bound));

    if (bound <= upper()) return;

    grow(bound);
    generation_++;
}

void SieveEngine::clear() {
    bits_.reset();
    waypoints_.reset();
    count_ = 0;
    last_  = 0;
    generation_++;
}

// -------------------------------------------------------
// grow: cover (upper, bound].
//
// Step 1: make sure every sieving prime (<= sqrt(bound)) is
//         already known, growing to sqrt(bound) first if not.
// Step 2: mark the new region as candidates and cross off
//         multiples of the sieving primes.
// Step 3: walk the survivors in ascending order, feeding
//         each newly discovered prime to the waypoint index.
// -------------------------------------------------------
void SieveEngine::grow(uint64_t bound) {
    uint64_t limit = isqrt(bound);
    if (limit > upper())
        grow(limit);

    uint64_t old_upper = upper();
    bits_.grow(bound);
    cross_off(old_upper + 1, bound, limit);

    for (uint64_t p = bits_.next_set(old_upper + 1); p != npos; p = bits_.next_set(p + 1)) {
        waypoints_.record(p);
        last_ = p;
        count_++;
    }
}

void SieveEngine::cross_off(uint64_t low, uint64_t high, uint64_t limit) {
    std::vector<uint64_t> base_primes;
    for (uint64_t p = bits_.next_set(2); p != npos && p <= limit; p = bits_.next_set(p + 1))
        base_primes.push_back(p);

    if (base_primes.empty()) return;

    int nthreads = options_.threads > 0 ? options_.threads : omp_get_max_threads();

    if (nthreads <= 1 || high - low + 1 < options_.parallel_threshold) {
        mark_segment(bits_, low, high, base_primes);
        return;
    }

    // Whole words per thread, so no two threads share a word
    uint64_t first_word = low / 64;
    uint64_t last_word  = high / 64;
    uint64_t words_per_thread = (last_word - first_word + nthreads) / nthreads;

    #pragma omp parallel for schedule(static) num_threads(nthreads)
    for (int t = 0; t < nthreads; t++) {
        uint64_t seg_low  = std::max(low,  (first_word + (uint64_t)t * words_per_thread) * 64);
        uint64_t seg_high = std::min(high, (first_word + (uint64_t)(t + 1) * words_per_thread) * 64 - 1);

        if (seg_low <= seg_high)
            mark_segment(bits_, seg_low, seg_high, base_primes);  // each thread owns its own words
    }
}

// -------------------------------------------------------
// Rank → value: jump to the waypoint at or below the rank,
// then step forward rank % stride candidates.
// -------------------------------------------------------
uint64_t SieveEngine::nth(uint64_t rank) const {
    if (rank >= count_)
        throw index_out_of_range("rank " + std::to_string(rank) +
                                 " out of range for " + std::to_string(count_) + " primes");

    uint64_t p = waypoints_[rank / waypoints_.stride()];
    for (uint64_t i = 0; i < rank % waypoints_.stride(); i++)
        p = bits_.next_set(p + 1);
    return p;
}

// -------------------------------------------------------
// Value → rank: start from the first waypoint >= n (or the
// last prime when n is past every waypoint) and walk back
// to n one prime at a time.
// -------------------------------------------------------
uint64_t SieveEngine::rank_of(uint64_t n) const {
    if (!is_prime(n)) return npos;

    uint64_t p, rank;
    if (n > waypoints_.back()) {
        p    = last_;
        rank = count_ - 1;
    } else {
        size_t i = waypoints_.lower_bound(n);
        p    = waypoints_[i];
        rank = waypoints_.rank_of_entry(i);
    }

    while (p > n) {
        p = bits_.prev_set(p - 1);
        rank--;
    }
    return rank;
}

uint64_t SieveEngine::next_prime(uint64_t n) const {
    if (n < 1 || n >= upper()) return npos;
    return bits_.next_set(n + 1);
}

uint64_t SieveEngine::previous_prime(uint64_t n) const {
    if (n <= 2 || n > upper()) return npos;
    return bits_.prev_set(n - 1);
}

uint64_t SieveEngine::next_composite(uint64_t n, uint64_t limit) const {
    if (limit == npos || n >= limit) return npos;

    uint64_t c = bits_.next_clear(std::max<uint64_t>(n + 1, 2));
    return (c != npos && c <= limit) ? c : npos;
}

void SieveEngine::check_generation(uint64_t expected) const {
    if (expected != generation_)
        throw concurrent_modification("sieve was modified during iteration");
}

} // namespace primetable
