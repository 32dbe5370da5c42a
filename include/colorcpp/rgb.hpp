// File: include/colorcpp/rgb.hpp
// Purpose: Three-channel RGB color with chroma and hue extraction.

#ifndef COLORCPP_RGB_HPP
#define COLORCPP_RGB_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <ostream>
#include <tuple>
#include <type_traits>
#include <utility> // For std::swap
#include <vector>

#include <opencv2/core.hpp>

#include "colorcpp/angle.hpp"
#include "colorcpp/channel.hpp"
#include "colorcpp/color.hpp"

namespace colorcpp {

/**
 * @brief RGB color over storage type T. All three channels are bounded:
 * full integer range for integer T, [0, 1] for floating T.
 * Channel order everywhere is (red, green, blue).
 */
template <typename T>
class Rgb {
public:
    using tag_type = RgbTag;
    using value_type = T;
    using channel_type = BoundedChannel<T>;
    using channels_tuple = std::tuple<T, T, T>;

    Rgb() = default;

    static Rgb from_channels(T red, T green, T blue) {
        return Rgb(channel_type(red), channel_type(green), channel_type(blue));
    }

    static constexpr unsigned num_channels() { return 3; }

    static Rgb from_tuple(const channels_tuple& values) {
        return from_channels(std::get<0>(values), std::get<1>(values), std::get<2>(values));
    }

    channels_tuple to_tuple() const { return detail::channel_values(channels_); }

    /**
     * @brief Builds a color from a contiguous sequence of num_channels() values.
     * @throws std::invalid_argument if @p count is not num_channels()
     */
    static Rgb from_slice(const T* values, std::size_t count) {
        detail::check_slice_length("Rgb", num_channels(), count);
        return from_channels(values[0], values[1], values[2]);
    }

    static Rgb from_slice(const std::vector<T>& values) {
        return from_slice(values.data(), values.size());
    }

    cv::Vec<T, 3> as_slice() const { return cv::Vec<T, 3>(red(), green(), blue()); }

    static Rgb broadcast(T value) { return from_channels(value, value, value); }

    Rgb clamp(T min, T max) const {
        return Rgb(detail::map_channels(channels_, [min, max](const channel_type& c) { return c.clamp(min, max); }));
    }

    T red() const { return std::get<0>(channels_).value(); }
    T green() const { return std::get<1>(channels_).value(); }
    T blue() const { return std::get<2>(channels_).value(); }

    T& red_mut() { return std::get<0>(channels_).value(); }
    T& green_mut() { return std::get<1>(channels_).value(); }
    T& blue_mut() { return std::get<2>(channels_).value(); }

    void set_red(T value) { std::get<0>(channels_).set_value(value); }
    void set_green(T value) { std::get<1>(channels_).set_value(value); }
    void set_blue(T value) { std::get<2>(channels_).set_value(value); }

    Rgb invert() const {
        return Rgb(detail::map_channels(channels_, [](const channel_type& c) { return c.invert(); }));
    }

    Rgb normalize() const {
        return Rgb(detail::map_channels(channels_, [](const channel_type& c) { return c.normalize(); }));
    }

    bool is_normalized() const {
        return detail::all_channels(channels_, [](const channel_type& c) { return c.is_normalized(); });
    }

    template <typename Position>
    Rgb lerp(const Rgb& right, Position pos) const {
        return Rgb(detail::zip_channels(channels_, right.channels_,
            [pos](const channel_type& l, const channel_type& r) { return l.lerp(r, pos); }));
    }

    bool relative_eq(const Rgb& other,
                     T epsilon = ApproxDefaults<T>::epsilon(),
                     T max_relative = ApproxDefaults<T>::max_relative()) const {
        return detail::all_channels(channels_, other.channels_,
            [epsilon, max_relative](const channel_type& l, const channel_type& r) {
                return l.relative_eq(r, epsilon, max_relative);
            });
    }

    bool ulps_eq(const Rgb& other,
                 T epsilon = ApproxDefaults<T>::epsilon(),
                 unsigned max_ulps = ApproxDefaults<T>::max_ulps()) const {
        return detail::all_channels(channels_, other.channels_,
            [epsilon, max_ulps](const channel_type& l, const channel_type& r) {
                return l.ulps_eq(r, epsilon, max_ulps);
            });
    }

    /**
     * @brief Difference between the largest and smallest channel.
     * Uses a fixed three-compare sorting network. Exact for unsigned and floating
     * storage; for signed storage a spread larger than T's maximum saturates.
     */
    T get_chroma() const {
        T c1 = red();
        T c2 = green();
        T c3 = blue();
        if (c2 < c3) {
            std::swap(c2, c3);
        }
        if (c1 < c2) {
            std::swap(c1, c2);
        }
        if (c2 < c3) {
            std::swap(c2, c3);
        }
        return ChannelScalarTraits<T>::from_double(static_cast<double>(c1) - static_cast<double>(c3));
    }

    /**
     * @brief Hue of the color as a fraction of a full turn: red 0, green 1/3, blue 2/3.
     *
     * Orders the channels with two swaps while tracking a signed offset, which
     * replaces the six-way "which channel is largest" switch of the usual HSV
     * formula. The 1e-10 term keeps achromatic colors (chroma 0) finite.
     *
     * @tparam Angle Unit of the result: Turns<T> (default), Degrees<T> or Radians<T>.
     */
    template <typename Angle = Turns<T>>
    Angle get_hue() const {
        static_assert(std::is_floating_point<T>::value, "Hue extraction requires floating point channels");
        const T epsilon = static_cast<T>(1e-10);

        T scaling_factor = T(0);
        T c1 = red();
        T c2 = green();
        T c3 = blue();
        if (c2 < c3) {
            std::swap(c2, c3);
            scaling_factor = T(-1);
        }
        T min_chan = c3;
        if (c1 < c2) {
            std::swap(c1, c2);
            scaling_factor = static_cast<T>(-1.0 / 3.0) - scaling_factor;
            min_chan = std::min(c2, c3);
        }

        const T hue = scaling_factor + (c2 - c3) / (T(6) * (c1 - min_chan) + epsilon);
        return angle_cast<Angle>(Turns<T>{std::abs(hue)});
    }

    // Rescales every channel from T's range to U's range.
    template <typename U>
    Rgb<U> color_cast() const {
        return Rgb<U>::from_channels(std::get<0>(channels_).template cast<U>().value(),
                                     std::get<1>(channels_).template cast<U>().value(),
                                     std::get<2>(channels_).template cast<U>().value());
    }

    friend bool operator==(const Rgb& lhs, const Rgb& rhs) { return lhs.channels_ == rhs.channels_; }
    friend bool operator!=(const Rgb& lhs, const Rgb& rhs) { return !(lhs == rhs); }

    friend std::ostream& operator<<(std::ostream& os, const Rgb& color) {
        return os << "Rgb(" << std::get<0>(color.channels_) << ", " << std::get<1>(color.channels_)
                  << ", " << std::get<2>(color.channels_) << ")";
    }

private:
    using channels_type = std::tuple<channel_type, channel_type, channel_type>;

    Rgb(const channel_type& red, const channel_type& green, const channel_type& blue)
        : channels_(red, green, blue) {}
    explicit Rgb(const channels_type& channels) : channels_(channels) {}

    channels_type channels_;
};

} // namespace colorcpp

#endif // COLORCPP_RGB_HPP
