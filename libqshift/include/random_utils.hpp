/**
 * @file random_utils.hpp
 * @brief Thread-local random suffixes for temporary artifact names.
 */

#ifndef QSHIFT_RANDOM_UTILS_HPP
#define QSHIFT_RANDOM_UTILS_HPP

#include <string>

namespace qshift::RandomUtils {

    /**
     * @brief Generates a random 64-bit unsigned integer.
     *
     * The generator is a thread-local std::mt19937_64, so workers never
     * contend on it.
     */
    unsigned long long next_u64();

    /**
     * @brief Generates a 16-digit hexadecimal suffix for unique file names.
     */
    std::string random_suffix();

} // namespace qshift::RandomUtils

#endif // QSHIFT_RANDOM_UTILS_HPP
