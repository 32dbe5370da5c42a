#ifndef COLORCPP_ANGLE_HPP
#define COLORCPP_ANGLE_HPP

#include <type_traits>

namespace colorcpp {

// Angle units for hue values. Each unit knows how many of itself make a full revolution.

template <typename T>
struct Turns {
    using scalar_type = T;
    static constexpr double full_turn() { return 1.0; }
    T value;
};

template <typename T>
struct Degrees {
    using scalar_type = T;
    static constexpr double full_turn() { return 360.0; }
    T value;
};

template <typename T>
struct Radians {
    using scalar_type = T;
    static constexpr double full_turn() { return 6.283185307179586476925286766559; }
    T value;
};

/**
 * @brief Converts an angle between units.
 * @tparam To Target unit, e.g. Degrees<float>.
 */
template <typename To, typename From>
To angle_cast(const From& from) {
    static_assert(std::is_floating_point<typename To::scalar_type>::value, "Angles must be floating point");
    using scalar_type = typename To::scalar_type;
    const double turns = static_cast<double>(from.value) / From::full_turn();
    return To{static_cast<scalar_type>(turns * To::full_turn())};
}

template <typename To>
To from_turns(typename To::scalar_type turns) {
    return angle_cast<To>(Turns<typename To::scalar_type>{turns});
}

} // namespace colorcpp

#endif // COLORCPP_ANGLE_HPP
