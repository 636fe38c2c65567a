// test_waypoint_index.cpp
// Validates stride doubling and resampling in WaypointIndex.

#include <iostream>
#include <vector>
#include <cstdint>
#include "waypoint_index.hpp"

using namespace primetable;

static bool all_passed = true;

static void check(const char* name, bool pass) {
    std::cout << name << ": " << (pass ? "PASS" : "FAIL") << "\n";
    all_passed &= pass;
}

// Trial division is plenty for a reference list this short
static std::vector<uint64_t> first_primes(size_t count) {
    std::vector<uint64_t> primes;
    for (uint64_t n = 2; primes.size() < count; n++) {
        bool is_prime = true;
        for (uint64_t p : primes) {
            if (p * p > n) break;
            if (n % p == 0) { is_prime = false; break; }
        }
        if (is_prime) primes.push_back(n);
    }
    return primes;
}

int main() {
    // -------------------------------------------------------
    // Test 1: First coarsening
    // -------------------------------------------------------
    {
        WaypointIndex index;
        for (uint64_t p : {2, 3, 5})
            index.record(p);
        check("Test 1a (stride 1 before capacity)", index.stride() == 1 && index.population() == 3);

        index.record(7);
        check("Test 1b (stride doubles at capacity)", index.stride() == 2 && index.capacity() == 8);
        check("Test 1c (even entries kept)",
              index.population() == 2 && index[0] == 2 && index[1] == 5);

        index.record(11);
        index.record(13);
        check("Test 1d (next kept rank is 4)", index.population() == 3 && index.back() == 11);
    }

    // -------------------------------------------------------
    // Test 2: Entry i always holds the prime of rank i * stride
    // -------------------------------------------------------
    {
        auto primes = first_primes(5000);
        WaypointIndex index;
        bool pass = true;

        for (size_t n = 0; n < primes.size(); n++) {
            index.record(primes[n]);

            pass &= index.population() < index.capacity();
            pass &= index.offered() == n + 1;
            for (size_t i = 0; i < index.population(); i++)
                pass &= index[i] == primes[index.rank_of_entry(i)];
        }
        check("Test 2 (entries match ranks through 5000 primes)", pass);
        std::cout << "  final stride " << index.stride()
                  << ", population " << index.population() << "\n";
    }

    // -------------------------------------------------------
    // Test 3: lower_bound
    // -------------------------------------------------------
    {
        WaypointIndex index;
        for (uint64_t p : first_primes(10))  // keeps 2, 5, 11, 17, 23
            index.record(p);

        check("Test 3a (exact hit)",       index.lower_bound(11) == 2);
        check("Test 3b (between entries)", index.lower_bound(13) == 3);
        check("Test 3c (before first)",    index.lower_bound(1) == 0);
        check("Test 3d (past last)",       index.lower_bound(29) == index.population());
    }

    // -------------------------------------------------------
    // Test 4: Reset
    // -------------------------------------------------------
    {
        WaypointIndex index;
        for (uint64_t p : first_primes(100))
            index.record(p);
        index.reset();
        check("Test 4 (reset)",
              index.empty() && index.stride() == 1 && index.capacity() == 4 && index.offered() == 0);
    }

    std::cout << "\n" << (all_passed ? "All tests passed." : "SOME TESTS FAILED.") << "\n";
    return all_passed ? 0 : 1;
}
