#ifndef COLORCPP_APPROX_HPP
#define COLORCPP_APPROX_HPP

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring> // For std::memcpy
#include <limits>
#include <type_traits>

#include "colorcpp/scalar_traits.hpp"

namespace colorcpp {

/**
 * @brief Default tolerances for approximate channel comparisons.
 * Floating types default to machine epsilon and 4 ULPs, integer types compare exactly.
 */
template <typename T>
struct ApproxDefaults {
    static constexpr T epsilon() {
        if constexpr (ChannelScalarTraits<T>::is_integer) {
            return T(0);
        } else {
            return std::numeric_limits<T>::epsilon();
        }
    }
    static constexpr T max_relative() { return epsilon(); }
    static constexpr unsigned max_ulps() { return 4; }
};

template <typename T>
bool abs_diff_eq(T a, T b, T epsilon) {
    if constexpr (ChannelScalarTraits<T>::is_integer) {
        const long long diff = static_cast<long long>(a) - static_cast<long long>(b);
        return (diff < 0 ? -diff : diff) <= static_cast<long long>(epsilon);
    } else {
        return std::abs(a - b) <= epsilon;
    }
}

/**
 * @brief Relative comparison: equal within @p epsilon absolutely, or within
 * @p max_relative of the larger magnitude. Infinities only compare equal to themselves.
 */
template <typename T>
bool relative_eq(T a, T b, T epsilon, T max_relative) {
    if constexpr (ChannelScalarTraits<T>::is_integer) {
        (void)max_relative;
        return abs_diff_eq(a, b, epsilon);
    } else {
        if (a == b) {
            return true;
        }
        if (std::isinf(a) || std::isinf(b)) {
            return false;
        }
        const T abs_diff = std::abs(a - b);
        if (abs_diff <= epsilon) {
            return true;
        }
        const T largest = std::max(std::abs(a), std::abs(b));
        return abs_diff <= largest * max_relative;
    }
}

/**
 * @brief Comparison by distance in units in the last place.
 * Values of opposite sign are never equal unless within @p epsilon of each other.
 */
template <typename T>
bool ulps_eq(T a, T b, T epsilon, unsigned max_ulps) {
    if constexpr (ChannelScalarTraits<T>::is_integer) {
        (void)max_ulps;
        return abs_diff_eq(a, b, epsilon);
    } else {
        if (abs_diff_eq(a, b, epsilon)) {
            return true;
        }
        if (std::isnan(a) || std::isnan(b)) {
            return false;
        }
        if (std::signbit(a) != std::signbit(b)) {
            return false;
        }
        using bits_type = std::conditional_t<sizeof(T) == 4, std::int32_t, std::int64_t>;
        bits_type bits_a;
        bits_type bits_b;
        std::memcpy(&bits_a, &a, sizeof(T));
        std::memcpy(&bits_b, &b, sizeof(T));
        const bits_type distance = bits_a > bits_b ? bits_a - bits_b : bits_b - bits_a;
        return distance <= static_cast<bits_type>(max_ulps);
    }
}

} // namespace colorcpp

#endif // COLORCPP_APPROX_HPP
