// prime_iterator.hpp
// Fail-fast bidirectional iterator over a window of a sieve.
//
// The iterator remembers the sieve generation it was created under and
// re-checks it on every dereference and every step, throwing
// concurrent_modification once the sieve has been extended or cleared.
// A whole sieve is just the window ending at its last prime.
//
// Values are produced on the fly from bit positions, so `reference` is
// the value type itself (as with std::vector<bool>).

#pragma once
#include <cstdint>
#include <cstddef>
#include <iterator>
#include "number_traits.hpp"
#include "sieve_engine.hpp"
#include "sieve_error.hpp"

namespace primetable {

template <typename N>
class PrimeIterator {
public:
    using iterator_category = std::bidirectional_iterator_tag;
    using value_type        = N;
    using difference_type   = std::ptrdiff_t;
    using pointer           = void;
    using reference         = N;

    PrimeIterator()
        : engine_(nullptr), position_(SieveEngine::npos), index_(0)
        , last_(SieveEngine::npos), generation_(0) {}

    // Positioned at `position` (npos for one past the end), which has
    // window-relative rank `index`. The window ends at position `last`.
    PrimeIterator(const SieveEngine* engine, uint64_t position, uint64_t index, uint64_t last)
        : engine_(engine), position_(position), index_(index)
        , last_(last), generation_(engine->generation()) {}

    N operator*() const {
        engine_->check_generation(generation_);
        if (position_ == SieveEngine::npos)
            throw index_out_of_range("dereferencing past-the-end prime iterator");
        return NumberTraits<N>::from_position(position_);
    }

    PrimeIterator& operator++() {
        engine_->check_generation(generation_);
        if (position_ == SieveEngine::npos)
            throw index_out_of_range("advancing past-the-end prime iterator");

        uint64_t p = position_ == last_ ? SieveEngine::npos : engine_->next_prime(position_);
        position_ = (p != SieveEngine::npos && p <= last_) ? p : SieveEngine::npos;
        index_++;
        return *this;
    }

    PrimeIterator operator++(int) {
        PrimeIterator old = *this;
        ++*this;
        return old;
    }

    PrimeIterator& operator--() {
        engine_->check_generation(generation_);
        if (index_ == 0)
            throw index_out_of_range("decrementing prime iterator before the first prime");

        position_ = position_ == SieveEngine::npos ? last_ : engine_->previous_prime(position_);
        index_--;
        return *this;
    }

    PrimeIterator operator--(int) {
        PrimeIterator old = *this;
        --*this;
        return old;
    }

    // Window-relative rank of the element this iterator points at
    uint64_t index() const { return index_; }

    friend bool operator==(const PrimeIterator& a, const PrimeIterator& b) {
        return a.engine_ == b.engine_ && a.index_ == b.index_ && a.position_ == b.position_;
    }

    friend bool operator!=(const PrimeIterator& a, const PrimeIterator& b) {
        return !(a == b);
    }

private:
    const SieveEngine* engine_;
    uint64_t position_;
    uint64_t index_;
    uint64_t last_;
    uint64_t generation_;
};

} // namespace primetable
