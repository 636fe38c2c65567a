// prime_sieve.hpp
// PrimeSieve<N>: an append-only, random-access list of the primes up to
// a growable bound, over value type N (uint32_t, uint64_t, int64_t, or
// mpz_class via big_number.hpp).
//
// The only ways to change a sieve are extend_to() and clear(). Per-element
// insert/erase/replace always throw unsupported_operation. Iterators and
// composite ranges are fail-fast: they throw concurrent_modification on
// use after the sieve has been extended or cleared.
//
// Usage:
//   PrimeSieve<uint64_t> primes(30);
//   primes.at(9);          // 29
//   primes.index_of(17);   // 6
//   primes.extend_to(100); // keeps everything sieved so far

#pragma once
#include <cstdint>
#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include "composite_range.hpp"
#include "number_traits.hpp"
#include "prime_iterator.hpp"
#include "prime_view.hpp"
#include "sequence.hpp"
#include "sieve_engine.hpp"
#include "sieve_error.hpp"

namespace primetable {

template <typename N>
class PrimeSieve {
public:
    using value_type             = N;
    using size_type              = size_t;
    using const_iterator         = PrimeIterator<N>;
    using iterator               = const_iterator;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;
    using reverse_iterator       = const_reverse_iterator;
    using view_type              = PrimeView<N>;

    static constexpr uint64_t DEFAULT_BOUND = 1ULL << 14;

    PrimeSieve() : PrimeSieve(NumberTraits<N>::from_position(DEFAULT_BOUND)) {}

    // Sieve every integer <= bound
    explicit PrimeSieve(const N& bound, const SieveOptions& options = SieveOptions())
        : engine_(options)
    {
        extend_to(bound);
    }

    // -------------------------------------------------------
    // Mutation
    // -------------------------------------------------------

    // Cover every integer <= bound. Throws invalid_bound for a
    // negative bound, capacity_exceeded past options().max_bound.
    // A bound at or below the current one changes nothing and
    // leaves live iterators valid.
    void extend_to(const N& bound) {
        if (NumberTraits<N>::is_negative(bound))
            throw invalid_bound("cannot extend sieve to a negative bound");

        uint64_t pos;
        if (!NumberTraits<N>::to_position(bound, pos))
            throw capacity_exceeded("bound does not fit a sieve position");

        engine_.extend(pos);
    }

    void clear() { engine_.clear(); }

    // -------------------------------------------------------
    // Size and membership
    // -------------------------------------------------------
    size_type size()  const { return engine_.count(); }
    bool      empty() const { return engine_.empty(); }

    bool contains(const N& n) const {
        uint64_t pos;
        return NumberTraits<N>::to_position(n, pos) && engine_.is_prime(pos);
    }

    template <typename Range>
    bool contains_all(const Range& values) const {
        return sequence_contains_all(*this, values);
    }

    // -------------------------------------------------------
    // Rank ↔ value
    // -------------------------------------------------------

    // Throws index_out_of_range unless rank < size()
    N at(size_type rank) const {
        return NumberTraits<N>::from_position(engine_.nth(rank));
    }

    N operator[](size_type rank) const { return at(rank); }

    // The prime of that rank, or nothing once rank >= size()
    std::optional<N> try_at(size_type rank) const {
        if (rank >= size()) return std::nullopt;
        return at(rank);
    }

    std::optional<size_type> index_of(const N& n) const {
        uint64_t pos;
        if (!NumberTraits<N>::to_position(n, pos)) return std::nullopt;

        uint64_t rank = engine_.rank_of(pos);
        if (rank == SieveEngine::npos) return std::nullopt;
        return rank;
    }

    // Primes are distinct, so this is index_of()
    std::optional<size_type> last_index_of(const N& n) const { return index_of(n); }

    // -------------------------------------------------------
    // Bounds and neighbours
    // -------------------------------------------------------
    N first_prime() const {
        if (empty()) throw empty_container("first_prime() on a sieve with no primes");
        return NumberTraits<N>::from_position(engine_.first_prime());
    }

    N last_prime() const {
        if (empty()) throw empty_container("last_prime() on a sieve with no primes");
        return NumberTraits<N>::from_position(engine_.last_prime());
    }

    // Closed interval of integers sieved so far: [1, upper]
    std::pair<N, N> bounds() const {
        return std::make_pair(NumberTraits<N>::from_position(1),
                              NumberTraits<N>::from_position(engine_.upper()));
    }

    // Least prime > n, if n lies in bounds() and such a prime was sieved
    std::optional<N> next_prime(const N& n) const {
        return neighbour(n, &SieveEngine::next_prime);
    }

    // Greatest prime < n, if n lies in bounds() and such a prime exists
    std::optional<N> previous_prime(const N& n) const {
        return neighbour(n, &SieveEngine::previous_prime);
    }

    // -------------------------------------------------------
    // Iteration
    // -------------------------------------------------------
    const_iterator begin() const {
        if (empty()) return end();
        return const_iterator(&engine_, engine_.first_prime(), 0, engine_.last_prime());
    }

    const_iterator end() const {
        return const_iterator(&engine_, SieveEngine::npos, size(), engine_.last_prime());
    }

    const_iterator cbegin() const { return begin(); }
    const_iterator cend()   const { return end(); }

    const_reverse_iterator rbegin() const { return const_reverse_iterator(end()); }
    const_reverse_iterator rend()   const { return const_reverse_iterator(begin()); }

    // Iterator at `rank`; rank == size() gives end()
    const_iterator iterator_at(size_type rank) const {
        if (rank > size())
            throw index_out_of_range("iterator rank " + std::to_string(rank) +
                                     " out of range for " + std::to_string(size()) + " primes");
        if (rank == size()) return end();
        return const_iterator(&engine_, engine_.nth(rank), rank, engine_.last_prime());
    }

    // Composites between the first and last prime, ascending
    CompositeRange<N> composites() const {
        return CompositeRange<N>(&engine_, engine_.first_prime(), engine_.last_prime());
    }

    // Window over ranks [from, to). Throws invalid_range when
    // the window is empty or runs past size().
    view_type sub_range(size_type from, size_type to) const {
        return view_type(*this, from, to);
    }

    std::vector<N> to_vector() const { return sequence_to_vector(*this); }
    std::string    to_string() const { return sequence_to_string(*this); }
    size_t         hash()      const { return sequence_hash(*this); }

    // -------------------------------------------------------
    // No per-element edits
    // -------------------------------------------------------
    void insert(size_type, const N&)  { throw unsupported_operation("prime sieve does not support insert"); }
    void erase(size_type)             { throw unsupported_operation("prime sieve does not support erase"); }
    void replace(size_type, const N&) { throw unsupported_operation("prime sieve does not support replace"); }
    void push_back(const N&)          { throw unsupported_operation("prime sieve does not support push_back"); }

    // -------------------------------------------------------
    // Accessors
    // -------------------------------------------------------
    uint64_t            generation() const { return engine_.generation(); }
    const SieveOptions& options()    const { return engine_.options(); }
    const SieveEngine&  engine()     const { return engine_; }

private:
    std::optional<N> neighbour(const N& n, uint64_t (SieveEngine::*step)(uint64_t) const) const {
        uint64_t pos;
        if (!NumberTraits<N>::to_position(n, pos)) return std::nullopt;

        uint64_t p = (engine_.*step)(pos);
        if (p == SieveEngine::npos) return std::nullopt;
        return NumberTraits<N>::from_position(p);
    }

    SieveEngine engine_;
};

// -------------------------------------------------------
// Equality across sieves and windows: same length and
// the same primes in the same order.
// -------------------------------------------------------
template <typename N>
bool operator==(const PrimeSieve<N>& a, const PrimeSieve<N>& b) { return sequence_equal(a, b); }

template <typename N>
bool operator==(const PrimeView<N>& a, const PrimeView<N>& b) { return sequence_equal(a, b); }

template <typename N>
bool operator==(const PrimeSieve<N>& a, const PrimeView<N>& b) { return sequence_equal(a, b); }

template <typename N>
bool operator==(const PrimeView<N>& a, const PrimeSieve<N>& b) { return sequence_equal(a, b); }

template <typename N>
bool operator!=(const PrimeSieve<N>& a, const PrimeSieve<N>& b) { return !(a == b); }

template <typename N>
bool operator!=(const PrimeView<N>& a, const PrimeView<N>& b) { return !(a == b); }

template <typename N>
bool operator!=(const PrimeSieve<N>& a, const PrimeView<N>& b) { return !(a == b); }

template <typename N>
bool operator!=(const PrimeView<N>& a, const PrimeSieve<N>& b) { return !(a == b); }

template <typename N>
std::ostream& operator<<(std::ostream& out, const PrimeSieve<N>& s) { return out << s.to_string(); }

template <typename N>
std::ostream& operator<<(std::ostream& out, const PrimeView<N>& v) { return out << v.to_string(); }

} // namespace primetable

namespace std {

template <typename N>
struct hash<primetable::PrimeSieve<N>> {
    size_t operator()(const primetable::PrimeSieve<N>& s) const { return s.hash(); }
};

template <typename N>
struct hash<primetable::PrimeView<N>> {
    size_t operator()(const primetable::PrimeView<N>& v) const { return v.hash(); }
};

} // namespace std
