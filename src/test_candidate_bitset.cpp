// test_candidate_bitset.cpp
// Validates CandidateBitset growth and the word-level scans.

#include <iostream>
#include <vector>
#include <cstdint>
#include "candidate_bitset.hpp"

using namespace primetable;

static bool all_passed = true;

static void check(const char* name, bool pass) {
    std::cout << name << ": " << (pass ? "PASS" : "FAIL") << "\n";
    all_passed &= pass;
}

int main() {
    const uint64_t npos = CandidateBitset::npos;

    // -------------------------------------------------------
    // Test 1: Fresh bitset covers nothing
    // -------------------------------------------------------
    {
        CandidateBitset bits;
        check("Test 1a (fresh upper is 1)", bits.upper() == 1);
        check("Test 1b (fresh count is 0)", bits.count() == 0);
        check("Test 1c (fresh next_set)",   bits.next_set(0) == npos);
        check("Test 1d (fresh prev_set)",   bits.prev_set(1) == npos);
    }

    // -------------------------------------------------------
    // Test 2: Growth marks the new region, never 0 or 1
    // -------------------------------------------------------
    {
        CandidateBitset bits;
        bits.grow(100);
        check("Test 2a (count after grow(100))", bits.count() == 99);
        check("Test 2b (1 is not a candidate)",  !bits.is_candidate(1));
        check("Test 2c (100 is a candidate)",    bits.is_candidate(100));
        check("Test 2d (101 is out of range)",   !bits.is_candidate(101));
        check("Test 2e (next_set(0) is 2)",      bits.next_set(0) == 2);

        bits.grow(50);
        check("Test 2f (shrinking grow is a no-op)", bits.upper() == 100 && bits.count() == 99);
    }

    // -------------------------------------------------------
    // Test 3: Scans across word boundaries
    // -------------------------------------------------------
    {
        CandidateBitset bits;
        bits.grow(200);
        for (uint64_t n = 60; n <= 130; n++)
            bits.clear(n);

        check("Test 3a (next_set skips cleared words)", bits.next_set(60) == 131);
        check("Test 3b (prev_set skips cleared words)", bits.prev_set(130) == 59);
        check("Test 3c (next_clear from 2)",            bits.next_clear(2) == 60);
        check("Test 3d (next_clear inside run)",        bits.next_clear(100) == 100);
        check("Test 3e (next_clear past run)",          bits.next_clear(131) == npos);
        check("Test 3f (count after clears)",           bits.count() == 199 - 71);
        check("Test 3g (prev_set clamps to upper)",     bits.prev_set(1000) == 200);
    }

    // -------------------------------------------------------
    // Test 4: Growing twice keeps earlier clears
    // -------------------------------------------------------
    {
        CandidateBitset bits;
        bits.grow(63);
        bits.clear(63);
        bits.grow(64);
        check("Test 4a (63 stays cleared)", !bits.is_candidate(63));
        check("Test 4b (64 is new)",        bits.is_candidate(64));

        bits.grow(1000);
        check("Test 4c (next_set(63) is 64)", bits.next_set(63) == 64);
        check("Test 4d (prev_set(63) is 62)", bits.prev_set(63) == 62);
        check("Test 4e (next_set at upper)",  bits.next_set(1000) == 1000);
        check("Test 4f (next_set past upper)", bits.next_set(1001) == npos);
    }

    // -------------------------------------------------------
    // Test 5: Bits above upper never leak into scans
    // -------------------------------------------------------
    {
        CandidateBitset bits;
        bits.grow(100);
        check("Test 5 (next_clear with all set)", bits.next_clear(2) == npos);
    }

    // -------------------------------------------------------
    // Test 6: Reset
    // -------------------------------------------------------
    {
        CandidateBitset bits;
        bits.grow(5000);
        bits.reset();
        check("Test 6a (reset upper)", bits.upper() == 1);
        check("Test 6b (reset count)", bits.count() == 0);

        bits.grow(10);
        check("Test 6c (grow after reset)", bits.count() == 9);
    }

    std::cout << "\n" << (all_passed ? "All tests passed." : "SOME TESTS FAILED.") << "\n";
    return all_passed ? 0 : 1;
}
