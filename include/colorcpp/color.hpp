// File: include/colorcpp/color.hpp
// Purpose: Shared pieces of the color contract: family tags and helpers that
//          apply one operation across a color's channel tuple.

#ifndef COLORCPP_COLOR_HPP
#define COLORCPP_COLOR_HPP

#include <cstddef>
#include <string>
#include <stdexcept>
#include <tuple>
#include <type_traits>
#include <utility>

namespace colorcpp {

// Family tags. Two colors with the same arity but different tags never mix.
struct RgbTag {};
struct YCbCrTag {};

/*
 * Every color type C in this library provides:
 *   C::tag_type, C::value_type, C::channels_tuple
 *   static constexpr unsigned num_channels()
 *   static C from_tuple(const channels_tuple&) / channels_tuple to_tuple() const
 *   static C from_slice(const value_type*, std::size_t) / cv::Vec<value_type, N> as_slice() const
 * Colors whose channels all share one kind (Rgb) also provide broadcast() and clamp().
 */

template <typename C1, typename C2>
constexpr bool same_color_family_v = std::is_same<typename C1::tag_type, typename C2::tag_type>::value;

namespace detail {

template <typename Tuple, typename F, std::size_t... I>
auto map_channels_impl(const Tuple& channels, const F& f, std::index_sequence<I...>) {
    return std::make_tuple(f(std::get<I>(channels))...);
}

template <typename Tuple, typename F, std::size_t... I>
auto zip_channels_impl(const Tuple& lhs, const Tuple& rhs, const F& f, std::index_sequence<I...>) {
    return std::make_tuple(f(std::get<I>(lhs), std::get<I>(rhs))...);
}

template <typename Tuple, typename F, std::size_t... I>
bool all_channels_impl(const Tuple& lhs, const Tuple& rhs, const F& pred, std::index_sequence<I...>) {
    return (pred(std::get<I>(lhs), std::get<I>(rhs)) && ...);
}

template <typename Tuple, typename F, std::size_t... I>
bool all_channels_impl(const Tuple& channels, const F& pred, std::index_sequence<I...>) {
    return (pred(std::get<I>(channels)) && ...);
}

// f(channel) for every channel, collected into a new tuple.
template <typename Tuple, typename F>
auto map_channels(const Tuple& channels, const F& f) {
    return map_channels_impl(channels, f, std::make_index_sequence<std::tuple_size<Tuple>::value>{});
}

// f(lhs_channel, rhs_channel) pairwise, collected into a new tuple.
template <typename Tuple, typename F>
auto zip_channels(const Tuple& lhs, const Tuple& rhs, const F& f) {
    return zip_channels_impl(lhs, rhs, f, std::make_index_sequence<std::tuple_size<Tuple>::value>{});
}

template <typename Tuple, typename F>
bool all_channels(const Tuple& lhs, const Tuple& rhs, const F& pred) {
    return all_channels_impl(lhs, rhs, pred, std::make_index_sequence<std::tuple_size<Tuple>::value>{});
}

template <typename Tuple, typename F>
bool all_channels(const Tuple& channels, const F& pred) {
    return all_channels_impl(channels, pred, std::make_index_sequence<std::tuple_size<Tuple>::value>{});
}

// Raw storage values of a channel tuple.
template <typename Tuple>
auto channel_values(const Tuple& channels) {
    return map_channels(channels, [](const auto& channel) { return channel.value(); });
}

inline void check_slice_length(const char* color_name, std::size_t expected, std::size_t actual) {
    if (expected != actual) {
        throw std::invalid_argument(std::string(color_name) + "::from_slice expects "
            + std::to_string(expected) + " values, got " + std::to_string(actual) + ".");
    }
}

} // namespace detail

} // namespace colorcpp

#endif // COLORCPP_COLOR_HPP
