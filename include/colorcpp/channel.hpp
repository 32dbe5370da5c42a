// File: include/colorcpp/channel.hpp
// Purpose: Bounded scalar wrapper used for every color component.

#ifndef COLORCPP_CHANNEL_HPP
#define COLORCPP_CHANNEL_HPP

#include <algorithm>
#include <ostream>
#include <type_traits>

#include "colorcpp/approx.hpp"
#include "colorcpp/scalar_traits.hpp"

namespace colorcpp {

// --- Channel kinds ---
// A kind fixes the canonical range of a channel for a given storage type.

struct BoundedKind {
    template <typename T> static constexpr T min_value() { return ChannelScalarTraits<T>::unit_min(); }
    template <typename T> static constexpr T max_value() { return ChannelScalarTraits<T>::unit_max(); }
};

// Luma-like channels: canonical range [0, 1] for floats.
struct PosNormalKind {
    template <typename T> static constexpr T min_value() { return ChannelScalarTraits<T>::unit_min(); }
    template <typename T> static constexpr T max_value() { return ChannelScalarTraits<T>::unit_max(); }
};

// Chroma-like channels: canonical range [-1, 1] for floats.
struct BipolarKind {
    template <typename T> static constexpr T min_value() { return ChannelScalarTraits<T>::bipolar_min(); }
    template <typename T> static constexpr T max_value() { return ChannelScalarTraits<T>::bipolar_max(); }
};

/**
 * @brief A single color component of storage type T with the range semantics of Kind.
 *
 * Every operation is total: out-of-range values are clamped, never rejected,
 * and results always stay representable in T.
 */
template <typename T, typename Kind>
class Channel {
public:
    using value_type = T;
    using kind_type = Kind;

    constexpr Channel() : value_() {}
    constexpr explicit Channel(T value) : value_(value) {}

    static constexpr T min_bound() { return Kind::template min_value<T>(); }
    static constexpr T max_bound() { return Kind::template max_value<T>(); }

    T value() const { return value_; }
    T& value() { return value_; }
    void set_value(T value) { value_ = value; }

    Channel clamp(T min, T max) const {
        return Channel(std::min(std::max(value_, min), max));
    }

    /**
     * @brief Mirrors the value inside the canonical range: max - (v - min).
     * 1 - v for [0, 1], -v for [-1, 1], 255 - v for uint8_t.
     * Unsigned integer ranges have an even number of values, so a bipolar zero
     * does not map onto itself: 128 inverts to 127 for uint8_t.
     */
    Channel invert() const {
        if constexpr (ChannelScalarTraits<T>::is_integer) {
            const long long inverted = static_cast<long long>(max_bound())
                - (static_cast<long long>(value_) - static_cast<long long>(min_bound()));
            return Channel(static_cast<T>(inverted));
        } else {
            return Channel(max_bound() - (value_ - min_bound()));
        }
    }

    Channel normalize() const { return clamp(min_bound(), max_bound()); }

    bool is_normalized() const { return min_bound() <= value_ && value_ <= max_bound(); }

    template <typename Position>
    Channel lerp(const Channel& right, Position pos) const {
        return Channel(lerp_scalar(value_, right.value_, pos));
    }

    /**
     * @brief Rescales the value from this kind's range in T to the same kind's range in U.
     * Bipolar channels are scaled separately on each side of their zero point, so
     * the zero of T (128 for uint8_t) lands exactly on the zero of U.
     * Integer targets are rounded to nearest and saturated.
     */
    template <typename U>
    Channel<U, Kind> cast() const {
        if constexpr (std::is_same<T, U>::value) {
            return *this;
        } else if constexpr (std::is_same<Kind, BipolarKind>::value) {
            const double v = static_cast<double>(value_);
            const double src_zero = static_cast<double>(ChannelScalarTraits<T>::bipolar_zero());
            const double dst_zero = static_cast<double>(ChannelScalarTraits<U>::bipolar_zero());
            double scaled = dst_zero;
            if (v > src_zero) {
                scaled += (v - src_zero) / (static_cast<double>(max_bound()) - src_zero)
                    * (static_cast<double>(Channel<U, Kind>::max_bound()) - dst_zero);
            } else if (v < src_zero) {
                scaled += (v - src_zero) / (src_zero - static_cast<double>(min_bound()))
                    * (dst_zero - static_cast<double>(Channel<U, Kind>::min_bound()));
            }
            return Channel<U, Kind>(ChannelScalarTraits<U>::from_double(scaled));
        } else {
            const double src_min = static_cast<double>(min_bound());
            const double src_max = static_cast<double>(max_bound());
            const double dst_min = static_cast<double>(Channel<U, Kind>::min_bound());
            const double dst_max = static_cast<double>(Channel<U, Kind>::max_bound());
            const double scaled = (static_cast<double>(value_) - src_min) / (src_max - src_min)
                * (dst_max - dst_min) + dst_min;
            return Channel<U, Kind>(ChannelScalarTraits<U>::from_double(scaled));
        }
    }

    bool relative_eq(const Channel& other, T epsilon, T max_relative) const {
        return colorcpp::relative_eq(value_, other.value_, epsilon, max_relative);
    }

    bool ulps_eq(const Channel& other, T epsilon, unsigned max_ulps) const {
        return colorcpp::ulps_eq(value_, other.value_, epsilon, max_ulps);
    }

    friend bool operator==(const Channel& lhs, const Channel& rhs) { return lhs.value_ == rhs.value_; }
    friend bool operator!=(const Channel& lhs, const Channel& rhs) { return !(lhs == rhs); }
    friend bool operator<(const Channel& lhs, const Channel& rhs) { return lhs.value_ < rhs.value_; }

    // Unary plus promotes 8-bit storage so it prints as a number.
    friend std::ostream& operator<<(std::ostream& os, const Channel& channel) {
        return os << +channel.value_;
    }

private:
    T value_;
};

template <typename T> using BoundedChannel = Channel<T, BoundedKind>;
template <typename T> using PosNormalChannel = Channel<T, PosNormalKind>;
template <typename T> using BipolarChannel = Channel<T, BipolarKind>;

} // namespace colorcpp

#endif // COLORCPP_CHANNEL_HPP
