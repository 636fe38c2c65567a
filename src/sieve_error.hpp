// sieve_error.hpp
// Exception types thrown by the prime table.
// Each derives from the closest standard exception so callers can catch
// either the specific type or the std:: family it belongs to.

#pragma once
#include <stdexcept>
#include <string>

namespace primetable {

// extend_to() with a negative bound
class invalid_bound : public std::invalid_argument {
public:
    explicit invalid_bound(const std::string& what) : std::invalid_argument(what) {}
};

// sub_range() with an empty or out-of-range [from, to)
class invalid_range : public std::invalid_argument {
public:
    explicit invalid_range(const std::string& what) : std::invalid_argument(what) {}
};

// Requested bound is larger than the sieve may grow
class capacity_exceeded : public std::length_error {
public:
    explicit capacity_exceeded(const std::string& what) : std::length_error(what) {}
};

// Rank access outside [0, size), or stepping an iterator off either end
class index_out_of_range : public std::out_of_range {
public:
    explicit index_out_of_range(const std::string& what) : std::out_of_range(what) {}
};

// first_prime() / last_prime() on a table holding no primes
class empty_container : public std::out_of_range {
public:
    explicit empty_container(const std::string& what) : std::out_of_range(what) {}
};

// An iterator or enumeration saw the sieve change underneath it
class concurrent_modification : public std::runtime_error {
public:
    explicit concurrent_modification(const std::string& what) : std::runtime_error(what) {}
};

// Per-element insert/erase/replace, or growing a view
class unsupported_operation : public std::logic_error {
public:
    explicit unsupported_operation(const std::string& what) : std::logic_error(what) {}
};

} // namespace primetable
