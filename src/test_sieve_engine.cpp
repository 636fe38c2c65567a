// test_sieve_engine.cpp
// Validates incremental growth against known prime counts, the
// rank/value translation, and the parallel crossing-off path.

#include <iostream>
#include <vector>
#include <string>
#include <algorithm>
#include <cstdint>
#include "sieve_engine.hpp"
#include "sieve_error.hpp"

using namespace primetable;

static bool all_passed = true;

static void check(const std::string& name, bool pass) {
    std::cout << name << ": " << (pass ? "PASS" : "FAIL") << "\n";
    all_passed &= pass;
}

static bool same_bits(const SieveEngine& a, const SieveEngine& b) {
    const CandidateBitset& x = a.candidates();
    const CandidateBitset& y = b.candidates();
    if (x.upper() != y.upper() || x.word_count() != y.word_count()) return false;
    for (uint64_t w = 0; w < x.word_count(); w++)
        if (x.data()[w] != y.data()[w]) return false;
    return true;
}

int main() {
    const uint64_t npos = SieveEngine::npos;

    // -------------------------------------------------------
    // Test 1: Known prime counts (pi(n)), one extension each
    // -------------------------------------------------------
    struct TestCase { uint64_t n; uint64_t expected; };
    TestCase cases[] = {
        {10,            4},
        {100,           25},
        {1'000,         168},
        {10'000,        1'229},
        {100'000,       9'592},
        {1'000'000,     78'498},
        {10'000'000,    664'579},
    };

    for (auto& [n, expected] : cases) {
        SieveEngine engine;
        engine.extend(n);
        uint64_t count = engine.count();
        check("pi(" + std::to_string(n) + ") = " + std::to_string(count), count == expected);
    }

    // -------------------------------------------------------
    // Test 2: The same counts reached by growing step by step
    // -------------------------------------------------------
    {
        SieveEngine engine;
        bool pass = true;
        uint64_t bound = 1;
        for (auto& [n, expected] : cases) {
            while (bound < n) {
                bound = std::min(n, bound * 3 + 7);
                engine.extend(bound);
            }
            pass &= engine.count() == expected;
        }
        check("Test 2 (stepwise growth matches pi(n))", pass);

        SieveEngine direct;
        direct.extend(bound);
        check("Test 2b (stepwise bitset equals direct bitset)", same_bits(engine, direct));
    }

    // -------------------------------------------------------
    // Test 3: Rank ↔ value inverse for every prime below 2*10^5
    // -------------------------------------------------------
    {
        SieveEngine engine;
        engine.extend(200'000);

        bool pass = true;
        uint64_t p = 2;
        for (uint64_t rank = 0; rank < engine.count(); rank++) {
            pass &= engine.nth(rank) == p;
            pass &= engine.rank_of(p) == rank;
            p = engine.next_prime(p);
        }
        check("Test 3a (nth/rank_of inverse)", pass);
        check("Test 3b (rank_of composite)",   engine.rank_of(199'998) == npos);
        check("Test 3c (rank_of past upper)",  engine.rank_of(200'003) == npos);

        bool threw = false;
        try { engine.nth(engine.count()); } catch (const index_out_of_range&) { threw = true; }
        check("Test 3d (nth(count) throws)", threw);
    }

    // -------------------------------------------------------
    // Test 4: Neighbours and composites at the edges
    // -------------------------------------------------------
    {
        SieveEngine engine;
        engine.extend(30);
        check("Test 4a (next_prime(7))",      engine.next_prime(7) == 11);
        check("Test 4b (previous_prime(11))", engine.previous_prime(11) == 7);
        check("Test 4c (next_prime(29))",     engine.next_prime(29) == npos);
        check("Test 4d (next_prime(0))",      engine.next_prime(0) == npos);
        check("Test 4e (previous_prime(2))",  engine.previous_prime(2) == npos);
        check("Test 4f (previous_prime(31))", engine.previous_prime(31) == npos);
        check("Test 4g (next_composite(1))",  engine.next_composite(1, 29) == 4);
        check("Test 4h (next_composite(28))", engine.next_composite(28, 29) == npos);
        check("Test 4i (last_prime)",         engine.last_prime() == 29);
    }

    // -------------------------------------------------------
    // Test 5: Capacity, no-op extension and clear
    // -------------------------------------------------------
    {
        SieveOptions options;
        options.max_bound = 1000;
        SieveEngine engine(options);
        engine.extend(1000);

        bool threw = false;
        try { engine.extend(1001); } catch (const capacity_exceeded&) { threw = true; }
        check("Test 5a (extend past max_bound throws)", threw && engine.upper() == 1000);

        uint64_t generation = engine.generation();
        engine.extend(500);
        check("Test 5b (no-op extend keeps generation)", engine.generation() == generation);

        engine.clear();
        check("Test 5c (clear bumps generation)", engine.generation() == generation + 1);
        check("Test 5d (clear empties)", engine.empty() && engine.upper() == 1 &&
                                         engine.waypoints().empty());
        check("Test 5e (first_prime on empty)", engine.first_prime() == npos);

        engine.extend(2);
        check("Test 5f (extend after clear)", engine.count() == 1 && engine.nth(0) == 2);
    }

    // -------------------------------------------------------
    // Test 6: Parallel crossing-off gives the serial result
    // -------------------------------------------------------
    {
        SieveOptions serial_options;
        serial_options.threads = 1;

        SieveOptions parallel_options;
        parallel_options.threads = 4;
        parallel_options.parallel_threshold = 1;

        SieveEngine serial(serial_options);
        SieveEngine parallel(parallel_options);
        for (uint64_t bound : {1'000ULL, 1'003ULL, 65'537ULL, 2'000'000ULL}) {
            serial.extend(bound);
            parallel.extend(bound);
        }
        check("Test 6a (parallel bitset equals serial)", same_bits(serial, parallel));
        check("Test 6b (parallel count)", parallel.count() == 148'933);
    }

    std::cout << "\n" << (all_passed ? "All tests passed." : "SOME TESTS FAILED.") << "\n";
    return all_passed ? 0 : 1;
}
