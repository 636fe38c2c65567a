// big_number.hpp
// Arbitrary-precision values for the prime containers, backed by GMP.
// PrimeSieve<mpz_class> stores the same bitset as the machine-word
// sieves; only the values handed in and out are big integers, so a
// bound that does not fit a uint64_t position is reported as
// capacity_exceeded rather than silently truncated.

#pragma once
#include <gmpxx.h>
#include <cstdint>
#include <functional>
#include "number_traits.hpp"

namespace primetable {

template <>
struct NumberTraits<mpz_class> {
    static bool is_negative(const mpz_class& n) { return sgn(n) < 0; }

    static bool to_position(const mpz_class& n, uint64_t& pos) {
        if (sgn(n) < 0 || !n.fits_ulong_p()) return false;
        pos = n.get_ui();
        return true;
    }

    static mpz_class from_position(uint64_t pos) {
        return mpz_class(static_cast<unsigned long>(pos));
    }

    // Order-sensitive fold over the limbs, seeded with the sign
    static size_t hash(const mpz_class& n) {
        mpz_srcptr z = n.get_mpz_t();
        size_t h = std::hash<int>()(mpz_sgn(z));
        for (size_t i = 0; i < mpz_size(z); i++)
            h = h * 31 + std::hash<mp_limb_t>()(mpz_getlimbn(z, i));
        return h;
    }
};

} // namespace primetable
