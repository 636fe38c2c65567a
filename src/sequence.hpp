// sequence.hpp
// Behaviour shared by every ordered prime sequence (PrimeSieve, PrimeView).
//
// A sequence type S provides:
//   S::value_type, size(), begin(), end(),
//   first_prime(), last_prime(), next_prime(n), previous_prime(n)
// and gets equality, hashing, rendering and bulk copy from the free
// functions below instead of from a common base class.

#pragma once
#include <algorithm>
#include <cstddef>
#include <sstream>
#include <string>
#include <vector>
#include "number_traits.hpp"

namespace primetable {

// Same length and pairwise equal in iteration order. B may be any
// sized range of comparable values, e.g. std::vector<N>.
template <typename A, typename B>
bool sequence_equal(const A& a, const B& b) {
    if (a.size() != b.size()) return false;
    return std::equal(a.begin(), a.end(), b.begin());
}

// h = 1; h = 31 * h + hash(p) for each p in order
template <typename S>
size_t sequence_hash(const S& s) {
    using N = typename S::value_type;
    size_t h = 1;
    for (const N& p : s)
        h = 31 * h + NumberTraits<N>::hash(p);
    return h;
}

// "[]", "[2]", "[2, 3, 5]", or "[2, 3, ..., 23, 29]" for more than three
template <typename S>
std::string sequence_to_string(const S& s) {
    std::ostringstream out;
    out << "[";
    if (s.size() <= 3) {
        bool first = true;
        for (const auto& p : s) {
            if (!first) out << ", ";
            out << p;
            first = false;
        }
    } else {
        auto head = s.begin();
        out << *head << ", ";
        ++head;
        out << *head << ", ..., ";

        auto tail = s.rbegin();
        auto last = *tail;
        ++tail;
        out << *tail << ", " << last;
    }
    out << "]";
    return out.str();
}

template <typename S, typename Range>
bool sequence_contains_all(const S& s, const Range& values) {
    for (const auto& v : values)
        if (!s.contains(v)) return false;
    return true;
}

template <typename S>
std::vector<typename S::value_type> sequence_to_vector(const S& s) {
    std::vector<typename S::value_type> out;
    out.reserve(s.size());
    for (const auto& p : s)
        out.push_back(p);
    return out;
}

} // namespace primetable
