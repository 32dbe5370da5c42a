// File: include/colorcpp/ycbcr.hpp
// Purpose: Y'CbCr color and its conversion to and from RGB through a model.

#ifndef COLORCPP_YCBCR_HPP
#define COLORCPP_YCBCR_HPP

#include <cstddef>
#include <ostream>
#include <tuple>
#include <vector>

#include <opencv2/core.hpp>

#include "colorcpp/channel.hpp"
#include "colorcpp/color.hpp"
#include "colorcpp/rgb.hpp"
#include "colorcpp/ycbcr_model.hpp"

namespace colorcpp {

// What to_rgb does with results outside the RGB channel range.
enum class OutOfGamutMode {
    Preserve, // keep the values as cast
    Clip      // normalize every channel into its canonical range
};

template <typename T, typename Model> class YCbCr;

/**
 * @brief Y'CbCr color without an attached model.
 * Luma is a positive-normalized channel, cb and cr are bipolar channels.
 * Channel order everywhere is (luma, cb, cr).
 */
template <typename T>
class BareYCbCr {
public:
    using tag_type = YCbCrTag;
    using value_type = T;
    using luma_channel_type = PosNormalChannel<T>;
    using chroma_channel_type = BipolarChannel<T>;
    using channels_tuple = std::tuple<T, T, T>;

    BareYCbCr() = default;

    static BareYCbCr from_channels(T luma, T cb, T cr) {
        return BareYCbCr(channels_type(luma_channel_type(luma), chroma_channel_type(cb), chroma_channel_type(cr)));
    }

    static constexpr unsigned num_channels() { return 3; }

    static BareYCbCr from_tuple(const channels_tuple& values) {
        return from_channels(std::get<0>(values), std::get<1>(values), std::get<2>(values));
    }

    channels_tuple to_tuple() const { return detail::channel_values(channels_); }

    /**
     * @throws std::invalid_argument if @p count is not num_channels()
     */
    static BareYCbCr from_slice(const T* values, std::size_t count) {
        detail::check_slice_length("BareYCbCr", num_channels(), count);
        return from_channels(values[0], values[1], values[2]);
    }

    static BareYCbCr from_slice(const std::vector<T>& values) {
        return from_slice(values.data(), values.size());
    }

    cv::Vec<T, 3> as_slice() const { return cv::Vec<T, 3>(luma(), cb(), cr()); }

    T luma() const { return std::get<0>(channels_).value(); }
    T cb() const { return std::get<1>(channels_).value(); }
    T cr() const { return std::get<2>(channels_).value(); }

    T& luma_mut() { return std::get<0>(channels_).value(); }
    T& cb_mut() { return std::get<1>(channels_).value(); }
    T& cr_mut() { return std::get<2>(channels_).value(); }

    void set_luma(T value) { std::get<0>(channels_).set_value(value); }
    void set_cb(T value) { std::get<1>(channels_).set_value(value); }
    void set_cr(T value) { std::get<2>(channels_).set_value(value); }

    BareYCbCr invert() const {
        return BareYCbCr(detail::map_channels(channels_, [](const auto& c) { return c.invert(); }));
    }

    BareYCbCr normalize() const {
        return BareYCbCr(detail::map_channels(channels_, [](const auto& c) { return c.normalize(); }));
    }

    bool is_normalized() const {
        return detail::all_channels(channels_, [](const auto& c) { return c.is_normalized(); });
    }

    template <typename Position>
    BareYCbCr lerp(const BareYCbCr& right, Position pos) const {
        return BareYCbCr(detail::zip_channels(channels_, right.channels_,
            [pos](const auto& l, const auto& r) { return l.lerp(r, pos); }));
    }

    bool relative_eq(const BareYCbCr& other,
                     T epsilon = ApproxDefaults<T>::epsilon(),
                     T max_relative = ApproxDefaults<T>::max_relative()) const {
        return detail::all_channels(channels_, other.channels_,
            [epsilon, max_relative](const auto& l, const auto& r) { return l.relative_eq(r, epsilon, max_relative); });
    }

    bool ulps_eq(const BareYCbCr& other,
                 T epsilon = ApproxDefaults<T>::epsilon(),
                 unsigned max_ulps = ApproxDefaults<T>::max_ulps()) const {
        return detail::all_channels(channels_, other.channels_,
            [epsilon, max_ulps](const auto& l, const auto& r) { return l.ulps_eq(r, epsilon, max_ulps); });
    }

    // Rescales luma over [0, 1]-style ranges and chroma over [-1, 1]-style ranges.
    template <typename U>
    BareYCbCr<U> color_cast() const {
        return BareYCbCr<U>::from_channels(std::get<0>(channels_).template cast<U>().value(),
                                           std::get<1>(channels_).template cast<U>().value(),
                                           std::get<2>(channels_).template cast<U>().value());
    }

    /**
     * @brief RGB -> Y'CbCr: forward * rgb + shift, computed in double and cast into T.
     * Integer results are rounded to nearest and saturated.
     */
    template <typename Model>
    static BareYCbCr from_rgb_and_model(const Rgb<T>& from, const Model& model) {
        const cv::Matx33d& transform = model.forward_transform();
        const cv::Vec3d& shift = model.shift();

        const cv::Vec3d rgb(static_cast<double>(from.red()),
                            static_cast<double>(from.green()),
                            static_cast<double>(from.blue()));
        const cv::Vec3d ycbcr = transform * rgb;

        return from_channels(ChannelScalarTraits<T>::from_double(ycbcr[0] + shift[0]),
                             ChannelScalarTraits<T>::from_double(ycbcr[1] + shift[1]),
                             ChannelScalarTraits<T>::from_double(ycbcr[2] + shift[2]));
    }

    /**
     * @brief Y'CbCr -> RGB: inverse * (ycbcr - shift), computed in double.
     * @param out_of_gamut_mode Preserve keeps the cast values (floating results may
     *        leave [0, 1]); Clip normalizes them.
     */
    template <typename Model>
    Rgb<T> to_rgb(const Model& model, OutOfGamutMode out_of_gamut_mode) const {
        const cv::Matx33d& transform = model.inverse_transform();
        const cv::Vec3d& shift = model.shift();

        const cv::Vec3d shifted(static_cast<double>(luma()) - shift[0],
                                static_cast<double>(cb()) - shift[1],
                                static_cast<double>(cr()) - shift[2]);
        const cv::Vec3d rgb = transform * shifted;

        const Rgb<T> out = Rgb<T>::from_channels(ChannelScalarTraits<T>::from_double(rgb[0]),
                                                 ChannelScalarTraits<T>::from_double(rgb[1]),
                                                 ChannelScalarTraits<T>::from_double(rgb[2]));
        switch (out_of_gamut_mode) {
            case OutOfGamutMode::Clip:
                return out.normalize();
            case OutOfGamutMode::Preserve:
            default:
                return out;
        }
    }

    template <typename Model>
    YCbCr<T, Model> with_model(const Model& model) const {
        return YCbCr<T, Model>(*this, model);
    }

    friend bool operator==(const BareYCbCr& lhs, const BareYCbCr& rhs) { return lhs.channels_ == rhs.channels_; }
    friend bool operator!=(const BareYCbCr& lhs, const BareYCbCr& rhs) { return !(lhs == rhs); }

    friend std::ostream& operator<<(std::ostream& os, const BareYCbCr& color) {
        return os << "YCbCr(" << std::get<0>(color.channels_) << ", " << std::get<1>(color.channels_)
                  << ", " << std::get<2>(color.channels_) << ")";
    }

private:
    using channels_type = std::tuple<luma_channel_type, chroma_channel_type, chroma_channel_type>;

    explicit BareYCbCr(const channels_type& channels) : channels_(channels) {}

    channels_type channels_;
};

/**
 * @brief A Y'CbCr color bundled with the model its values are expressed in.
 * Owns a copy of the model so the color can be converted back without extra arguments.
 */
template <typename T, typename Model = YCbCrModel<T>>
class YCbCr {
public:
    YCbCr(const BareYCbCr<T>& color, const Model& model) : color_(color), model_(model) {}

    static YCbCr from_rgb(const Rgb<T>& rgb, const Model& model) {
        return YCbCr(BareYCbCr<T>::from_rgb_and_model(rgb, model), model);
    }

    Rgb<T> to_rgb(OutOfGamutMode out_of_gamut_mode) const {
        return color_.to_rgb(model_, out_of_gamut_mode);
    }

    const BareYCbCr<T>& color() const { return color_; }
    BareYCbCr<T>& color() { return color_; }
    const Model& model() const { return model_; }

    T luma() const { return color_.luma(); }
    T cb() const { return color_.cb(); }
    T cr() const { return color_.cr(); }

    friend std::ostream& operator<<(std::ostream& os, const YCbCr& color) {
        return os << color.color_;
    }

private:
    BareYCbCr<T> color_;
    Model model_;
};

} // namespace colorcpp

#endif // COLORCPP_YCBCR_HPP
