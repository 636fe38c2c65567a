// composite_range.hpp
// Lazy, fail-fast enumeration of the composites inside a sieve window.
//
// Nothing is materialised: each step asks the engine for the next
// non-candidate bit. The range captures the sieve generation when it is
// created; any dereference or step after the sieve has been extended or
// cleared throws concurrent_modification.

#pragma once
#include <cstdint>
#include <cstddef>
#include <iterator>
#include "number_traits.hpp"
#include "sieve_engine.hpp"
#include "sieve_error.hpp"

namespace primetable {

template <typename N>
class CompositeRange {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = N;
        using difference_type   = std::ptrdiff_t;
        using pointer           = void;
        using reference         = N;

        iterator()
            : engine_(nullptr), position_(SieveEngine::npos)
            , last_(SieveEngine::npos), generation_(0) {}

        N operator*() const {
            engine_->check_generation(generation_);
            if (position_ == SieveEngine::npos)
                throw index_out_of_range("dereferencing past-the-end composite iterator");
            return NumberTraits<N>::from_position(position_);
        }

        iterator& operator++() {
            engine_->check_generation(generation_);
            if (position_ == SieveEngine::npos)
                throw index_out_of_range("advancing past-the-end composite iterator");
            position_ = engine_->next_composite(position_, last_);
            return *this;
        }

        iterator operator++(int) {
            iterator old = *this;
            ++*this;
            return old;
        }

        friend bool operator==(const iterator& a, const iterator& b) {
            return a.position_ == b.position_;
        }

        friend bool operator!=(const iterator& a, const iterator& b) {
            return a.position_ != b.position_;
        }

    private:
        friend class CompositeRange;

        iterator(const CompositeRange& range, uint64_t position)
            : engine_(range.engine_), position_(position)
            , last_(range.last_), generation_(range.generation_) {}

        const SieveEngine* engine_;
        uint64_t position_;
        uint64_t last_;
        uint64_t generation_;
    };

    // Composites in [first, last]; first == npos gives an empty range
    CompositeRange(const SieveEngine* engine, uint64_t first, uint64_t last)
        : engine_(engine), first_(first), last_(last), generation_(engine->generation()) {}

    iterator begin() const {
        if (first_ == SieveEngine::npos) return end();
        return iterator(*this, engine_->next_composite(first_ - 1, last_));
    }

    iterator end() const { return iterator(*this, SieveEngine::npos); }

private:
    const SieveEngine* engine_;
    uint64_t first_;
    uint64_t last_;
    uint64_t generation_;
};

} // namespace primetable
