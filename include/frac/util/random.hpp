#pragma once

#include <cstdint>
#include <limits>
#include <random>

#include <frac/core/detail/digits.hpp>

namespace frac::util {

inline int random_radix(std::mt19937_64& generator) {
    static std::uniform_int_distribution<int> radix_dist(core::detail::MIN_RADIX,
                                                         core::detail::MAX_RADIX);
    return radix_dist(generator);
}

inline unsigned random_frac(std::mt19937_64& generator, unsigned max_frac = 20) {
    std::uniform_int_distribution<unsigned> frac_dist(0, max_frac);
    return frac_dist(generator);
}

// Mixes full-range values with small ones so that short fractions and values
// whose magnitude is below radix^frac both show up regularly.
inline std::int64_t random_scaled(std::mt19937_64& generator) {
    static std::uniform_int_distribution<std::int64_t> full_dist(
        std::numeric_limits<std::int64_t>::min(), std::numeric_limits<std::int64_t>::max());
    static std::uniform_int_distribution<int> shift_dist(0, 62);
    const std::int64_t sample = full_dist(generator);
    const int shift = shift_dist(generator);
    return sample >> shift;
}

} // namespace frac::util
