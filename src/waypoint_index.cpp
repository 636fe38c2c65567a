// waypoint_index.cpp

#include "waypoint_index.hpp"
#include <algorithm>

namespace primetable {

static const uint64_t INITIAL_CAPACITY = 4;

void WaypointIndex::reset() {
    points_.clear();
    points_.shrink_to_fit();
    points_.reserve(INITIAL_CAPACITY);
    stride_   = 1;
    capacity_ = INITIAL_CAPACITY;
    offered_  = 0;
}

void WaypointIndex::record(uint64_t value) {
    if (offered_++ % stride_ == 0)
        points_.push_back(value);

    if (points_.size() == capacity_)
        coarsen();
}

// Keep entries 0, 2, 4, ... which are exactly the ranks that are
// multiples of the doubled stride.
void WaypointIndex::coarsen() {
    stride_   *= 2;
    capacity_ *= 2;

    size_t kept = (points_.size() + 1) / 2;
    for (size_t i = 1; i < kept; i++)
        points_[i] = points_[2 * i];
    points_.resize(kept);
    points_.reserve(capacity_);
}

size_t WaypointIndex::lower_bound(uint64_t value) const {
    return std::lower_bound(points_.begin(), points_.end(), value) - points_.begin();
}

} // namespace primetable
