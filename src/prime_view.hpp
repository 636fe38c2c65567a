// prime_view.hpp
// A fixed window [from, to) of the primes in a PrimeSieve.
//
// The window pins the first and last prime VALUES when it is created and
// never re-validates them; every query is forwarded to the parent sieve
// and filtered to [first, last]. Once the parent is cleared below the
// window's last rank, value queries answer none or false and anything
// that walks the window throws concurrent_modification. A view cannot be extended, cleared or
// edited. Windowing a view yields another view over the same parent,
// never a view of a view.
//
// The parent must outlive the view and must not be moved while the view
// is in use.

#pragma once
#include <cstdint>
#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "composite_range.hpp"
#include "number_traits.hpp"
#include "prime_iterator.hpp"
#include "sequence.hpp"
#include "sieve_error.hpp"

namespace primetable {

template <typename N>
class PrimeSieve;

template <typename N>
class PrimeView {
public:
    using value_type             = N;
    using size_type              = size_t;
    using const_iterator         = PrimeIterator<N>;
    using iterator               = const_iterator;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;
    using reverse_iterator       = const_reverse_iterator;

    // Throws invalid_range unless from < to <= parent.size()
    PrimeView(const PrimeSieve<N>& parent, size_type from, size_type to)
        : parent_(&parent), from_(from), to_(to)
    {
        if (from >= to || to > parent.size())
            throw invalid_range("cannot take window [" + std::to_string(from) + ", " +
                                std::to_string(to) + ") of " +
                                std::to_string(parent.size()) + " primes");

        first_pos_ = parent.engine().nth(from);
        last_pos_  = to - from > 1 ? parent.engine().nth(to - 1) : first_pos_;
        first_ = NumberTraits<N>::from_position(first_pos_);
        last_  = NumberTraits<N>::from_position(last_pos_);
    }

    // -------------------------------------------------------
    // Size and membership
    // -------------------------------------------------------
    size_type size()  const { return to_ - from_; }
    bool      empty() const { return false; }

    bool contains(const N& n) const {
        return in_bounds(n) && parent_->contains(n);
    }

    template <typename Range>
    bool contains_all(const Range& values) const {
        return sequence_contains_all(*this, values);
    }

    // -------------------------------------------------------
    // Rank ↔ value, relative to the window
    // -------------------------------------------------------
    N at(size_type rank) const {
        if (rank >= size())
            throw index_out_of_range("rank " + std::to_string(rank) +
                                     " out of range for window of " +
                                     std::to_string(size()) + " primes");
        check_attached();
        return parent_->at(rank + from_);
    }

    N operator[](size_type rank) const { return at(rank); }

    std::optional<N> try_at(size_type rank) const {
        if (rank >= size()) return std::nullopt;
        return parent_->try_at(rank + from_);
    }

    std::optional<size_type> index_of(const N& n) const {
        if (!in_bounds(n)) return std::nullopt;
        std::optional<size_type> rank = parent_->index_of(n);
        if (!rank || *rank < from_ || *rank >= to_) return std::nullopt;
        return *rank - from_;
    }

    std::optional<size_type> last_index_of(const N& n) const { return index_of(n); }

    // -------------------------------------------------------
    // Bounds and neighbours, all confined to [first, last]
    // -------------------------------------------------------
    N first_prime() const { return first_; }
    N last_prime()  const { return last_; }

    std::pair<N, N> bounds() const { return std::make_pair(first_, last_); }

    std::optional<N> next_prime(const N& n) const {
        if (!in_bounds(n)) return std::nullopt;
        std::optional<N> p = parent_->next_prime(n);
        if (p && in_bounds(*p)) return p;
        return std::nullopt;
    }

    std::optional<N> previous_prime(const N& n) const {
        if (!in_bounds(n)) return std::nullopt;
        std::optional<N> p = parent_->previous_prime(n);
        if (p && in_bounds(*p)) return p;
        return std::nullopt;
    }

    // -------------------------------------------------------
    // Iteration
    // -------------------------------------------------------
    const_iterator begin() const {
        check_attached();
        return const_iterator(&parent_->engine(), first_pos_, 0, last_pos_);
    }

    const_iterator end() const {
        check_attached();
        return const_iterator(&parent_->engine(), SieveEngine::npos, size(), last_pos_);
    }

    const_iterator cbegin() const { return begin(); }
    const_iterator cend()   const { return end(); }

    const_reverse_iterator rbegin() const { return const_reverse_iterator(end()); }
    const_reverse_iterator rend()   const { return const_reverse_iterator(begin()); }

    // Iterator at window rank `rank`; rank == size() gives end()
    const_iterator iterator_at(size_type rank) const {
        if (rank > size())
            throw index_out_of_range("iterator rank " + std::to_string(rank) +
                                     " out of range for window of " +
                                     std::to_string(size()) + " primes");
        if (rank == size()) return end();
        check_attached();
        return const_iterator(&parent_->engine(), parent_->engine().nth(rank + from_),
                              rank, last_pos_);
    }

    CompositeRange<N> composites() const {
        check_attached();
        return CompositeRange<N>(&parent_->engine(), first_pos_, last_pos_);
    }

    // A window over the parent, offset by this window's start
    PrimeView sub_range(size_type from, size_type to) const {
        if (from >= to || to > size())
            throw invalid_range("cannot take window [" + std::to_string(from) + ", " +
                                std::to_string(to) + ") of " +
                                std::to_string(size()) + " primes");
        return PrimeView(*parent_, from + from_, to + from_);
    }

    std::vector<N> to_vector() const { return sequence_to_vector(*this); }
    std::string    to_string() const { return sequence_to_string(*this); }
    size_t         hash()      const { return sequence_hash(*this); }

    const PrimeSieve<N>& parent() const { return *parent_; }
    size_type from_rank() const { return from_; }
    size_type to_rank()   const { return to_; }

    // -------------------------------------------------------
    // Views never change
    // -------------------------------------------------------
    void extend_to(const N&) { throw unsupported_operation("cannot extend a prime window"); }
    void clear()             { throw unsupported_operation("cannot clear a prime window"); }

    void insert(size_type, const N&)  { throw unsupported_operation("prime window does not support insert"); }
    void erase(size_type)             { throw unsupported_operation("prime window does not support erase"); }
    void replace(size_type, const N&) { throw unsupported_operation("prime window does not support replace"); }
    void push_back(const N&)          { throw unsupported_operation("prime window does not support push_back"); }

private:
    // The parent no longer holds this window after a clear
    void check_attached() const {
        if (parent_->size() < to_)
            throw concurrent_modification("parent sieve was cleared under window [" +
                                          std::to_string(from_) + ", " +
                                          std::to_string(to_) + ")");
    }

    bool in_bounds(const N& n) const {
        return !(n < first_) && !(last_ < n);
    }

    const PrimeSieve<N>* parent_;
    size_type from_;
    size_type to_;
    N first_;
    N last_;
    uint64_t first_pos_;
    uint64_t last_pos_;
};

} // namespace primetable
