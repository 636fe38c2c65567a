// prime_table.cpp
// Builds a prime table incrementally and answers rank queries.
// The table is grown in three steps (bound/4, bound/2, bound) so the
// timings show what each extension costs on top of the last.
//
// Usage:
//   ./prime_table                           (table up to 10^7)
//   ./prime_table 1000000 0 10 78497        (bound, then ranks to look up)
//   ./prime_table --big 1000000 0 78497     (same table, GMP values)

#include "prime_sieve.hpp"
#include "big_number.hpp"
#include <gmpxx.h>
#include <iostream>
#include <vector>
#include <string>
#include <chrono>
#include <cstdint>
#include <iterator>
#include <omp.h>

using namespace primetable;

static double elapsed_ms(std::chrono::high_resolution_clock::time_point t0) {
    auto t1 = std::chrono::high_resolution_clock::now();
    return std::chrono::duration<double, std::milli>(t1 - t0).count();
}

// -------------------------------------------------------
// Build, summarise and query one table. N is the value
// type handed out by the table.
// -------------------------------------------------------
template <typename N>
int run_table(const N& bound, const std::vector<uint64_t>& ranks) {
    std::cout << "Building prime table up to " << bound
              << " using " << omp_get_max_threads() << " threads...\n";

    PrimeSieve<N> table(N(1));
    double total_ms = 0;

    std::vector<N> steps = { N(bound / 4), N(bound / 2), bound };
    for (const N& step : steps) {
        auto t0 = std::chrono::high_resolution_clock::now();
        table.extend_to(step);
        double ms = elapsed_ms(t0);
        total_ms += ms;

        std::cout << "  extended to " << step << ": "
                  << table.size() << " primes in " << ms << " ms\n";
    }

    std::cout << "\n--- Summary ---\n";
    std::cout << "Primes          : " << table.size() << "\n";
    std::cout << "Table           : " << table << "\n";
    std::cout << "Bitset memory   : " << table.engine().candidates().memory_bytes() / 1024 << " KB\n";
    std::cout << "Waypoints       : " << table.engine().waypoints().population()
              << " (stride " << table.engine().waypoints().stride() << ")\n";
    std::cout << "Build time      : " << total_ms << " ms\n";

    if (!table.empty()) {
        // The last (up to) 100 primes as a window
        size_t from = table.size() > 100 ? table.size() - 100 : 0;
        auto tail = table.sub_range(from, table.size());
        auto composites = tail.composites();

        std::cout << "Last window     : " << tail << "\n";
        std::cout << "Composites in it: "
                  << std::distance(composites.begin(), composites.end()) << "\n";
    }

    if (!ranks.empty()) {
        std::cout << "\n--- Queries ---\n";
        for (uint64_t rank : ranks) {
            auto p = table.try_at(rank);
            if (!p) {
                std::cout << "rank " << rank << ": beyond the table\n";
                continue;
            }
            std::cout << "rank " << rank << ": " << *p
                      << " (index_of → " << *table.index_of(*p) << ")\n";
        }
    }

    return 0;
}

int main(int argc, char* argv[]) {
    bool big = false;
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--big") big = true;
        else args.push_back(arg);
    }

    std::string bound_str = args.empty() ? "10000000" : args[0];

    try {
        std::vector<uint64_t> ranks;
        for (size_t i = 1; i < args.size(); i++)
            ranks.push_back(std::stoull(args[i]));

        if (big) {
            mpz_class bound;
            if (bound.set_str(bound_str, 10) != 0) {
                std::cerr << "Error: invalid number string\n";
                return 1;
            }
            return run_table(bound, ranks);
        }

        return run_table<uint64_t>(std::stoull(bound_str), ranks);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
