// File: include/colorcpp/scalar_traits.hpp
// Purpose: Numeric capabilities of the storage types a color channel can hold.

#ifndef COLORCPP_SCALAR_TRAITS_HPP
#define COLORCPP_SCALAR_TRAITS_HPP

#include <opencv2/core.hpp> // For cv::saturate_cast
#include <cmath>
#include <cstdint>
#include <limits>
#include <type_traits>

namespace colorcpp {

template <typename T> struct is_channel_scalar : std::false_type {};
template <> struct is_channel_scalar<std::uint8_t> : std::true_type {};
template <> struct is_channel_scalar<std::int8_t> : std::true_type {};
template <> struct is_channel_scalar<std::uint16_t> : std::true_type {};
template <> struct is_channel_scalar<std::int16_t> : std::true_type {};
template <> struct is_channel_scalar<std::uint32_t> : std::true_type {};
template <> struct is_channel_scalar<std::int32_t> : std::true_type {};
template <> struct is_channel_scalar<float> : std::true_type {};
template <> struct is_channel_scalar<double> : std::true_type {};

/**
 * @brief Range and cast rules for one channel storage type.
 *
 * Integer types use their full representable range for every channel kind.
 * Floating point types use [0, 1] for unit (bounded and positive-normalized)
 * channels and [-1, 1] for bipolar channels.
 * All computations go through double; casts back into T saturate and, for
 * integer targets, round to nearest.
 */
template <typename T>
struct ChannelScalarTraits {
    static_assert(is_channel_scalar<T>::value,
                  "Channel storage must be an 8/16/32-bit integer, float or double");

    static constexpr bool is_integer = std::numeric_limits<T>::is_integer;

    static constexpr T unit_min() {
        if constexpr (is_integer) {
            return std::numeric_limits<T>::min();
        } else {
            return T(0);
        }
    }

    static constexpr T unit_max() {
        if constexpr (is_integer) {
            return std::numeric_limits<T>::max();
        } else {
            return T(1);
        }
    }

    static constexpr T bipolar_min() {
        if constexpr (is_integer) {
            return std::numeric_limits<T>::min();
        } else {
            return T(-1);
        }
    }

    static constexpr T bipolar_max() { return unit_max(); }

    // Value a bipolar channel holds for "no chroma": 128 for uint8_t, 0 for signed and float.
    static constexpr T bipolar_zero() {
        if constexpr (is_integer) {
            const long long lo = static_cast<long long>(std::numeric_limits<T>::min());
            const long long hi = static_cast<long long>(std::numeric_limits<T>::max());
            return static_cast<T>(lo + (hi - lo + 1) / 2);
        } else {
            return T(0);
        }
    }

    static double to_double(T value) { return static_cast<double>(value); }

    static T from_double(double value) { return cv::saturate_cast<T>(value); }
};

/**
 * @brief Linear interpolation of two scalars, left + (right - left) * pos.
 *
 * Integer storage: the offset (right - left) * pos is rounded to the nearest
 * integer with ties going toward zero, i.e. toward @p left, and the sum is
 * saturated into T. lerp(0, 255, 0.5) therefore yields 127.
 */
template <typename T, typename Position>
T lerp_scalar(T left, T right, Position pos) {
    static_assert(std::is_floating_point<Position>::value, "Interpolation position must be floating point");
    if constexpr (ChannelScalarTraits<T>::is_integer) {
        const double offset = (static_cast<double>(right) - static_cast<double>(left)) * static_cast<double>(pos);
        const double rounded = std::copysign(std::ceil(std::abs(offset) - 0.5), offset);
        return ChannelScalarTraits<T>::from_double(static_cast<double>(left) + rounded);
    } else {
        return left + (right - left) * static_cast<T>(pos);
    }
}

} // namespace colorcpp

#endif // COLORCPP_SCALAR_TRAITS_HPP
