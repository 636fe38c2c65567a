// sieve_engine.hpp
// Incremental Sieve of Eratosthenes over machine-word positions.
//
// The engine owns the candidate bitset and the waypoint index and keeps
// them consistent across growth. Everything here works on plain uint64_t
// positions; the typed containers (PrimeSieve<N>, PrimeView<N>) convert
// their value type to and from positions at the boundary.
//
// Growth never re-sieves covered integers: extending from u to b only
// touches (u, b]. The crossing-off of a large new region is split across
// OpenMP threads, each owning a word-aligned slice of the bitset.

#pragma once
#include <cstdint>
#include "candidate_bitset.hpp"
#include "waypoint_index.hpp"

namespace primetable {

// -------------------------------------------------------
// Tuning and limits for one sieve.
// -------------------------------------------------------
struct SieveOptions {
    // Largest bound extend() accepts
    uint64_t max_bound = 1ULL << 32;

    // Worker threads for crossing-off; 0 means omp_get_max_threads()
    int threads = 0;

    // New regions narrower than this are crossed off on one thread
    uint64_t parallel_threshold = 1ULL << 20;
};

class SieveEngine {
public:
    static constexpr uint64_t npos = CandidateBitset::npos;

    explicit SieveEngine(const SieveOptions& options = SieveOptions());

    // -------------------------------------------------------
    // Mutation. Both bump generation() when they change state.
    // -------------------------------------------------------

    // Cover every integer <= bound. Throws capacity_exceeded when
    // bound > options().max_bound. No-op when bound <= upper().
    void extend(uint64_t bound);

    // Back to upper() == 1 with no primes
    void clear();

    // -------------------------------------------------------
    // Queries. Positions are plain integers; npos means none.
    // -------------------------------------------------------
    bool     is_prime(uint64_t n) const { return bits_.is_candidate(n); }

    // Prime of the given rank. Throws index_out_of_range
    // unless rank < count().
    uint64_t nth(uint64_t rank) const;

    // Rank of n, npos unless n is a known prime
    uint64_t rank_of(uint64_t n) const;

    // Least prime > n / greatest prime < n, for n in [1, upper()]
    uint64_t next_prime(uint64_t n) const;
    uint64_t previous_prime(uint64_t n) const;

    // Least composite > n that is <= limit
    uint64_t next_composite(uint64_t n, uint64_t limit) const;

    uint64_t first_prime() const { return count_ == 0 ? npos : 2; }
    uint64_t last_prime()  const { return count_ == 0 ? npos : last_; }

    uint64_t upper() const { return bits_.upper(); }
    uint64_t count() const { return count_; }
    bool     empty() const { return count_ == 0; }

    // -------------------------------------------------------
    // Fail-fast support
    // -------------------------------------------------------
    uint64_t generation() const { return generation_; }

    // Throws concurrent_modification if generation() != expected
    void check_generation(uint64_t expected) const;

    const SieveOptions&    options()   const { return options_; }
    const CandidateBitset& candidates() const { return bits_; }
    const WaypointIndex&   waypoints() const { return waypoints_; }

private:
    void grow(uint64_t bound);
    void cross_off(uint64_t low, uint64_t high, uint64_t limit);

    SieveOptions options_;
    CandidateBitset bits_;
    WaypointIndex waypoints_;
    uint64_t count_;
    uint64_t last_;
    uint64_t generation_;
};

} // namespace primetable
