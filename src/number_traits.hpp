// number_traits.hpp
// Value-type adapters for the typed prime containers.
//
// The sieve works on uint64_t positions. A container over value type N
// needs exactly four things from N:
//   is_negative(n)         bounds below 0 are rejected
//   to_position(n, pos)    false when n does not fit a position
//   from_position(pos)     the value at a sieve position
//   hash(n)                element hash for the container hash
// Comparison uses N's own operators.
//
// Machine integers are specialised here; big_number.hpp adds mpz_class.

#pragma once
#include <cstdint>
#include <cstddef>
#include <functional>
#include <limits>

namespace primetable {

template <typename N>
struct NumberTraits;

template <>
struct NumberTraits<uint64_t> {
    static bool is_negative(uint64_t) { return false; }

    static bool to_position(uint64_t n, uint64_t& pos) {
        pos = n;
        return true;
    }

    static uint64_t from_position(uint64_t pos) { return pos; }

    static size_t hash(uint64_t n) { return std::hash<uint64_t>()(n); }
};

template <>
struct NumberTraits<uint32_t> {
    static bool is_negative(uint32_t) { return false; }

    static bool to_position(uint32_t n, uint64_t& pos) {
        pos = n;
        return true;
    }

    // Callers never ask for positions past the largest uint32_t:
    // PrimeSieve<uint32_t> cannot be extended beyond it.
    static uint32_t from_position(uint64_t pos) { return static_cast<uint32_t>(pos); }

    static size_t hash(uint32_t n) { return std::hash<uint32_t>()(n); }
};

template <>
struct NumberTraits<int64_t> {
    static bool is_negative(int64_t n) { return n < 0; }

    static bool to_position(int64_t n, uint64_t& pos) {
        if (n < 0) return false;
        pos = static_cast<uint64_t>(n);
        return true;
    }

    static int64_t from_position(uint64_t pos) { return static_cast<int64_t>(pos); }

    static size_t hash(int64_t n) { return std::hash<int64_t>()(n); }
};

} // namespace primetable
