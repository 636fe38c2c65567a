// waypoint_index.hpp
// Sparse rank → value anchors over the primes found so far.
//
// Entry i holds the prime of rank i * stride. Every prime the sieve
// discovers is offered to record() in ascending order; one in every
// `stride` is kept. When the kept population reaches capacity, stride
// and capacity double and every other entry is dropped, which leaves
// exactly the entries the new stride would have kept. Upkeep is O(1)
// amortized per prime and the index never holds more than
// capacity entries.
//
//   stride 1, capacity 4:  [2, 3, 5, 7]        → full, coarsen
//   stride 2, capacity 8:  [2, 5]
//   offer 11, 13, 17, ...: [2, 5, 11, 17, ...]

#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

namespace primetable {

class WaypointIndex {
public:
    WaypointIndex() { reset(); }

    // Offer the next prime in ascending order
    void record(uint64_t value);

    // Back to stride 1, capacity 4, nothing recorded
    void reset();

    // Index of the first waypoint >= value, population() if none
    size_t lower_bound(uint64_t value) const;

    uint64_t operator[](size_t i) const { return points_[i]; }
    uint64_t back()               const { return points_.back(); }
    bool     empty()              const { return points_.empty(); }

    // Rank of the prime stored in entry i
    uint64_t rank_of_entry(size_t i) const { return i * stride_; }

    uint64_t stride()     const { return stride_; }
    uint64_t capacity()   const { return capacity_; }
    size_t   population() const { return points_.size(); }

    // Number of primes offered since the last reset
    uint64_t offered()    const { return offered_; }

private:
    void coarsen();

    std::vector<uint64_t> points_;
    uint64_t stride_;
    uint64_t capacity_;
    uint64_t offered_;
};

} // namespace primetable
