#ifndef UNROLL_RANDOM_UTILS_HPP
#define UNROLL_RANDOM_UTILS_HPP

#include <random>
#include <string>

/**
 * @brief Thread-local random helpers for unique scratch names.
 *
 * The underlying generator (std::mt19937_64) is thread-local and seeded from
 * std::random_device, so concurrent requests never share state.
 */
namespace RandomUtils {

    /**
     * @brief Generates a random 64-bit unsigned integer.
     */
    unsigned long long next_u64();

    /**
     * @brief Generates a 16 character lowercase hex suffix.
     */
    std::string random_suffix();

} // namespace RandomUtils

#endif // UNROLL_RANDOM_UTILS_HPP
